//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/OpHandlers_Control.hpp
// Purpose: Declare control-flow opcode handlers.
// Key invariants: Jumps land inside [0, streamLength]; call/return use the
//                 single REG_BACKUP slot.
// Ownership/Lifetime: Handlers mutate registers of the supplied VM only.
//
//===----------------------------------------------------------------------===//

#pragma once

namespace regvm::vm
{
class VM;
} // namespace regvm::vm

namespace regvm::vm::detail::control
{
void handleCondJump(VM &vm);
void handleCallBcFunc(VM &vm);
void handleReturnBcFunc(VM &vm);
void handleExit(VM &vm);
} // namespace regvm::vm::detail::control
