//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/host/ExprEvaluator.cpp
// Purpose: Tree-walking evaluation of parsed expressions.
// Key invariants: Operators share the VM's value rules (vm/ValueOps.hpp), so
//                 `a + b` here and ADD in bytecode always agree.
// Ownership/Lifetime: Each evaluate() call owns its syntax tree.
//
//===----------------------------------------------------------------------===//

#include "host/ExprEvaluator.hpp"

#include "host/ExprParser.hpp"
#include "vm/ValueOps.hpp"

#include <utility>

namespace regvm::host
{

using vm::Value;
using vm::ValueArray;

EvalError::EvalError(const std::string &message, size_t offset)
    : vm::HostError(message + " at offset " + std::to_string(offset)), offset_(offset)
{
}

namespace
{
using expr::Expr;
using expr::TokenKind;

std::string kindOf(const Value &v)
{
    return std::string(vm::kindName(v.kind()));
}

class Interpreter
{
  public:
    explicit Interpreter(const vm::ObjectRef &env) : env_(env) {}

    Value eval(const Expr &e)
    {
        switch (e.kind)
        {
            case Expr::Kind::Number:
                return Value::number(e.number);
            case Expr::Kind::String:
                return Value(e.text);
            case Expr::Kind::Undefined:
                return Value();
            case Expr::Kind::Ident:
                return lookup(e);
            case Expr::Kind::Unary:
                return unary(e);
            case Expr::Kind::Binary:
                return binary(e);
            case Expr::Kind::Logical:
            {
                Value lhs = eval(*e.lhs);
                const bool truthy = vm::isTruthy(lhs);
                if (e.op == TokenKind::AndAnd ? !truthy : truthy)
                    return lhs;
                return eval(*e.rhs);
            }
            case Expr::Kind::Member:
                return member(eval(*e.lhs), Value(e.text), e.offset);
            case Expr::Kind::Index:
            {
                Value receiver = eval(*e.lhs);
                return member(receiver, eval(*e.rhs), e.offset);
            }
            case Expr::Kind::Call:
                return call(e);
        }
        throw EvalError("unsupported expression", e.offset);
    }

  private:
    Value lookup(const Expr &e)
    {
        Value v = env_ ? env_->get(e.text) : Value();
        if (v.isVoid())
            throw EvalError(e.text + " is not defined", e.offset);
        return v;
    }

    Value member(const Value &receiver, const Value &key, size_t offset)
    {
        Value out;
        if (!vm::readProperty(receiver, key, out))
        {
            throw EvalError("cannot read property '" + vm::toDisplayString(key) + "' of " +
                                kindOf(receiver),
                            offset);
        }
        return out;
    }

    Value unary(const Expr &e)
    {
        const Value operand = eval(*e.lhs);
        if (e.op == TokenKind::Bang)
            return Value::boolean(!vm::isTruthy(operand));
        if (e.op == TokenKind::Minus)
        {
            if (!operand.isNumber())
                throw EvalError("cannot negate " + kindOf(operand), e.offset);
            return Value::number(-operand.asNumber());
        }
        double n = 0.0;
        if (!vm::toNumber(operand, n))
            throw EvalError("cannot convert " + kindOf(operand) + " to number", e.offset);
        return Value::number(n);
    }

    Value binary(const Expr &e)
    {
        const Value lhs = eval(*e.lhs);
        const Value rhs = eval(*e.rhs);
        Value out;
        bool flag = false;
        switch (e.op)
        {
            case TokenKind::Plus:
                if (!vm::addValues(lhs, rhs, out))
                    break;
                return out;
            case TokenKind::Minus:
                if (!vm::arithValues(vm::ArithOp::Sub, lhs, rhs, out))
                    break;
                return out;
            case TokenKind::Star:
                if (!vm::arithValues(vm::ArithOp::Mul, lhs, rhs, out))
                    break;
                return out;
            case TokenKind::Slash:
                if (!vm::arithValues(vm::ArithOp::Div, lhs, rhs, out))
                    break;
                return out;
            case TokenKind::Percent:
                if (!vm::arithValues(vm::ArithOp::Mod, lhs, rhs, out))
                    break;
                return out;
            case TokenKind::EqEq:
                return Value::boolean(vm::looseEquals(lhs, rhs));
            case TokenKind::NotEq:
                return Value::boolean(!vm::looseEquals(lhs, rhs));
            case TokenKind::EqEqEq:
                return Value::boolean(vm::strictEquals(lhs, rhs));
            case TokenKind::NotEqEq:
                return Value::boolean(!vm::strictEquals(lhs, rhs));
            case TokenKind::Less:
                if (!vm::compareValues(vm::RelOp::Lt, lhs, rhs, flag))
                    break;
                return Value::boolean(flag);
            case TokenKind::Greater:
                if (!vm::compareValues(vm::RelOp::Gt, lhs, rhs, flag))
                    break;
                return Value::boolean(flag);
            case TokenKind::LessEq:
                if (!vm::compareValues(vm::RelOp::Le, lhs, rhs, flag))
                    break;
                return Value::boolean(flag);
            case TokenKind::GreaterEq:
                if (!vm::compareValues(vm::RelOp::Ge, lhs, rhs, flag))
                    break;
                return Value::boolean(flag);
            default:
                break;
        }
        throw EvalError("operator not applicable to " + kindOf(lhs) + " and " + kindOf(rhs),
                        e.offset);
    }

    Value call(const Expr &e)
    {
        // Method calls bind the receiver as `this`.
        Value self;
        Value callee;
        if (e.lhs->kind == Expr::Kind::Member || e.lhs->kind == Expr::Kind::Index)
        {
            self = eval(*e.lhs->lhs);
            const Value key = e.lhs->kind == Expr::Kind::Member ? Value(e.lhs->text)
                                                                : eval(*e.lhs->rhs);
            callee = member(self, key, e.lhs->offset);
        }
        else
        {
            callee = eval(*e.lhs);
        }

        ValueArray args;
        args.reserve(e.args.size());
        for (const auto &arg : e.args)
            args.push_back(eval(*arg));

        if (!callee.isFunction())
            throw EvalError(kindOf(callee) + " is not a function", e.offset);
        return callee.asFunction()->call(self, args);
    }

    const vm::ObjectRef &env_;
};
} // namespace

ExprEvaluator::ExprEvaluator(vm::ObjectRef env) : env_(std::move(env)) {}

Value ExprEvaluator::evaluate(std::string_view source)
{
    expr::Parser parser(expr::tokenize(source));
    expr::ExprPtr root = parser.parseProgram();
    Interpreter interp(env_);
    return interp.eval(*root);
}

} // namespace regvm::host
