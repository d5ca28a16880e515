//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the arithmetic and comparison opcode handlers.  The value rules
// themselves live in vm/ValueOps.cpp; the handlers decode operands, apply the
// rule and translate a kind mismatch into a TypeMismatch trap.
//
//===----------------------------------------------------------------------===//

#include "vm/OpHandlers_Arith.hpp"

#include "vm/VM.hpp"
#include "vm/ValueOps.hpp"

#include <string>

namespace regvm::vm::detail::arith
{

namespace
{
[[noreturn]] void trapOperands(VM &vm, const char *what, const Value &lhs, const Value &rhs)
{
    vm.raise(TrapKind::TypeMismatch,
             std::string("cannot ") + what + ' ' + std::string(kindName(lhs.kind())) + " and " +
                 std::string(kindName(rhs.kind())));
}

/// @brief Shared body of SUB/MUL/DIV: reg[dst] = reg[dst] op reg[src].
void applyInPlace(VM &vm, ArithOp op, const char *what)
{
    const RegIndex dst = vm.nextByte();
    const RegIndex src = vm.nextByte();
    Value result;
    if (!arithValues(op, vm.reg(dst), vm.reg(src), result))
        trapOperands(vm, what, vm.reg(dst), vm.reg(src));
    vm.setReg(dst, std::move(result));
}

/// @brief Decode `dst, a, b` for a comparison and store the 1/0 result.
template <typename Pred> void applyCompare(VM &vm, Pred pred)
{
    const RegIndex dst = vm.nextByte();
    const RegIndex a = vm.nextByte();
    const RegIndex b = vm.nextByte();
    const bool result = pred(vm.reg(a), vm.reg(b));
    vm.setReg(dst, Value::boolean(result));
}

void applyRelational(VM &vm, RelOp op)
{
    applyCompare(vm,
                 [&vm, op](const Value &lhs, const Value &rhs)
                 {
                     bool out = false;
                     if (!compareValues(op, lhs, rhs, out))
                         trapOperands(vm, "compare", lhs, rhs);
                     return out;
                 });
}
} // namespace

/// @brief ADD dst, src: numeric addition or string concatenation.
void handleAdd(VM &vm)
{
    const RegIndex dst = vm.nextByte();
    const RegIndex src = vm.nextByte();
    Value result;
    if (!addValues(vm.reg(dst), vm.reg(src), result))
        trapOperands(vm, "add", vm.reg(dst), vm.reg(src));
    vm.setReg(dst, std::move(result));
}

void handleSub(VM &vm)
{
    applyInPlace(vm, ArithOp::Sub, "subtract");
}

void handleMul(VM &vm)
{
    applyInPlace(vm, ArithOp::Mul, "multiply");
}

/// @brief DIV dst, src.  Division by zero follows IEEE-754 and does not trap.
void handleDiv(VM &vm)
{
    applyInPlace(vm, ArithOp::Div, "divide");
}

void handleCompEq(VM &vm)
{
    applyCompare(vm, [](const Value &a, const Value &b) { return looseEquals(a, b); });
}

void handleCompNe(VM &vm)
{
    applyCompare(vm, [](const Value &a, const Value &b) { return !looseEquals(a, b); });
}

void handleCompStrictEq(VM &vm)
{
    applyCompare(vm, [](const Value &a, const Value &b) { return strictEquals(a, b); });
}

void handleCompStrictNe(VM &vm)
{
    applyCompare(vm, [](const Value &a, const Value &b) { return !strictEquals(a, b); });
}

void handleCompLt(VM &vm)
{
    applyRelational(vm, RelOp::Lt);
}

void handleCompGt(VM &vm)
{
    applyRelational(vm, RelOp::Gt);
}

void handleCompLe(VM &vm)
{
    applyRelational(vm, RelOp::Le);
}

void handleCompGe(VM &vm)
{
    applyRelational(vm, RelOp::Ge);
}

} // namespace regvm::vm::detail::arith
