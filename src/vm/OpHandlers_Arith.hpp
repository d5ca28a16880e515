//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/OpHandlers_Arith.hpp
// Purpose: Declare arithmetic and comparison opcode handlers.
// Key invariants: Arithmetic updates its destination in place; comparisons
//                 write number 1 or 0.  Kind mismatches trap with TypeMismatch.
// Ownership/Lifetime: Handlers mutate registers of the supplied VM only.
//
//===----------------------------------------------------------------------===//

#pragma once

namespace regvm::vm
{
class VM;
} // namespace regvm::vm

namespace regvm::vm::detail::arith
{
void handleAdd(VM &vm);
void handleSub(VM &vm);
void handleMul(VM &vm);
void handleDiv(VM &vm);

void handleCompEq(VM &vm);
void handleCompNe(VM &vm);
void handleCompStrictEq(VM &vm);
void handleCompStrictNe(VM &vm);
void handleCompLt(VM &vm);
void handleCompGt(VM &vm);
void handleCompLe(VM &vm);
void handleCompGe(VM &vm);
} // namespace regvm::vm::detail::arith
