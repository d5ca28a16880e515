//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/OpHandlers_Host.hpp
// Purpose: Declare host interop opcode handlers.
// Key invariants: HostError raised by host code becomes a trap; any other
//                 exception passes through to the embedder.
// Ownership/Lifetime: Handlers borrow host handles held in registers.
//
//===----------------------------------------------------------------------===//

#pragma once

namespace regvm::vm
{
class VM;
} // namespace regvm::vm

namespace regvm::vm::detail::host
{
void handlePropAccess(VM &vm);
void handleFuncCall(VM &vm);
void handleEval(VM &vm);
} // namespace regvm::vm::detail::host
