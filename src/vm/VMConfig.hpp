//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/VMConfig.hpp
// Purpose: Defines compile-time configuration flags for the VM subsystem.
// Key invariants: Hooks expand to statements usable inside the dispatch loop.
// Ownership/Lifetime: Shared header; no owning object or runtime state.
//
//===----------------------------------------------------------------------===//

#pragma once

// -----------------------------------------------------------------------------
// Dispatch hook macros (compiled away by default)
//
// Invoked immediately before and after each handler runs.  VM is the executing
// VM and OPCODE the opcode byte.  Embedders may override either with -D.
// -----------------------------------------------------------------------------
#ifndef REGVM_VM_DISPATCH_BEFORE
#define REGVM_VM_DISPATCH_BEFORE(VM, OPCODE)                                                       \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif

#ifndef REGVM_VM_DISPATCH_AFTER
#define REGVM_VM_DISPATCH_AFTER(VM, OPCODE)                                                        \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif

// -----------------------------------------------------------------------------
// Opcode execution counters (compile-time + runtime toggle)
// -----------------------------------------------------------------------------
#ifndef REGVM_VM_OPCOUNTS
#define REGVM_VM_OPCOUNTS 1
#endif

#if REGVM_VM_OPCOUNTS
#undef REGVM_VM_DISPATCH_BEFORE
#define REGVM_VM_DISPATCH_BEFORE(VM, OPCODE)                                                       \
    do                                                                                             \
    {                                                                                              \
        if ((VM).enableOpcodeCounts)                                                               \
            ++((VM).opCounts_[static_cast<size_t>(OPCODE)]);                                       \
    } while (0)
#endif
