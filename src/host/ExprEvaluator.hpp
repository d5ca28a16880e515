//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/host/ExprEvaluator.hpp
// Purpose: Built-in host evaluator for the EVAL opcode: a small expression
//          language over host values.
// Key invariants: Identifiers resolve only through the environment root; the
//                 evaluator has no other access to host state.
// Ownership/Lifetime: Shares ownership of the environment root.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "regvm/vm/Value.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace regvm::host
{

/// @brief Failure to lex, parse or evaluate an expression.
/// @details Derives from HostError so the VM reports it as a
///          HostEvaluationFailure trap.
class EvalError : public vm::HostError
{
  public:
    EvalError(const std::string &message, size_t offset);

    /// @brief Byte offset into the source where the failure was detected.
    size_t offset() const
    {
        return offset_;
    }

  private:
    size_t offset_;
};

/// @brief Expression engine evaluating source against an environment root.
///
/// Grammar, loosest binding first:
/// @code
///   expr    := or
///   or      := and ('||' and)*
///   and     := eq ('&&' eq)*
///   eq      := rel (('==' | '!=' | '===' | '!==') rel)*
///   rel     := add (('<' | '>' | '<=' | '>=') add)*
///   add     := mul (('+' | '-') mul)*
///   mul     := unary (('*' | '/' | '%') unary)*
///   unary   := ('!' | '-' | '+') unary | postfix
///   postfix := primary ('.' name | '[' expr ']' | '(' args ')')*
///   primary := number | string | 'true' | 'false' | 'undefined'
///            | identifier | '(' expr ')'
/// @endcode
class ExprEvaluator : public vm::HostEvaluator
{
  public:
    explicit ExprEvaluator(vm::ObjectRef env);

    /// @throws EvalError on malformed source or a failing operation.
    /// @throws HostError propagated from host functions called by the source.
    vm::Value evaluate(std::string_view source) override;

  private:
    vm::ObjectRef env_;
};

} // namespace regvm::host
