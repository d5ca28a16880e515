//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/ValueOps.hpp
// Purpose: Shared value semantics for opcode handlers and the expression
//          engine: truthiness, string conversion, arithmetic, comparison and
//          property reads.
// Key invariants: Helpers never throw on kind mismatches; they return false
//                 and leave the output untouched so callers choose how to
//                 report the failure.
// Ownership/Lifetime: Stateless free functions.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "regvm/vm/Value.hpp"

#include <string>
#include <string_view>

namespace regvm::vm
{

/// @brief Binary numeric operators other than addition.
enum class ArithOp
{
    Sub,
    Mul,
    Div,
    Mod,
};

/// @brief Relational operators.
enum class RelOp
{
    Lt,
    Gt,
    Le,
    Ge,
};

/// @brief Truthiness used by COND_JUMP and logical operators.
/// @return False for void, 0, NaN and ""; true otherwise.
[[nodiscard]] bool isTruthy(const Value &v);

/// @brief Render a number the way it is printed and concatenated.
std::string formatNumber(double n);

/// @brief Convert any value to its display string.
std::string toDisplayString(const Value &v);

/// @brief Numeric interpretation of a value.
/// @details Numbers map to themselves, strings are parsed after trimming
///          whitespace (empty string is 0, unparsable text is NaN), void is NaN.
/// @return False when the value kind has no numeric interpretation.
bool toNumber(const Value &v, double &out);

/// @brief Addition with string concatenation.
/// @return False when neither a numeric nor a string operand pair applies.
bool addValues(const Value &lhs, const Value &rhs, Value &out);

/// @brief Numeric binary operation; both operands must be numbers.
bool arithValues(ArithOp op, const Value &lhs, const Value &rhs, Value &out);

/// @brief Same kind and same value; handles compare by identity.
[[nodiscard]] bool strictEquals(const Value &lhs, const Value &rhs);

/// @brief Strict equality plus numeric comparison of number/string pairs.
[[nodiscard]] bool looseEquals(const Value &lhs, const Value &rhs);

/// @brief Relational comparison of number pairs or string pairs.
/// @return False when the operand kinds are not comparable.
bool compareValues(RelOp op, const Value &lhs, const Value &rhs, bool &out);

/// @brief Dynamic property read.
/// @details Host objects delegate to HostObject::get.  Arrays and strings
///          expose integer indices and @c length.  Missing properties yield
///          void.
/// @return False when @p receiver does not support property access.
bool readProperty(const Value &receiver, const Value &key, Value &out);

} // namespace regvm::vm
