//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/OpHandlers_Data.hpp
// Purpose: Declare data movement and literal loading opcode handlers.
// Key invariants: Each handler consumes exactly its encoded operands.
// Ownership/Lifetime: Handlers mutate registers of the supplied VM only.
//
//===----------------------------------------------------------------------===//

#pragma once

namespace regvm::vm
{
class VM;
} // namespace regvm::vm

namespace regvm::vm::detail::data
{
void handleLoadNum(VM &vm);
void handleLoadLongNum(VM &vm);
void handleLoadFloatNum(VM &vm);
void handleLoadString(VM &vm);
void handleCopy(VM &vm);
} // namespace regvm::vm::detail::data
