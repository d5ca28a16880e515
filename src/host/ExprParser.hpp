//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/host/ExprParser.hpp
// Purpose: Lexer, syntax tree and Pratt parser for the built-in expression
//          language.
// Key invariants: Every node records the byte offset of its first token. Trees
//                 never exceed Parser::kMaxDepth levels.
// Ownership/Lifetime: Nodes own their children through unique_ptr.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace regvm::host::expr
{

enum class TokenKind
{
    Number,
    String,
    Identifier,
    Plus,
    Minus,
    Star,
    Slash,
    Percent,
    Bang,
    EqEq,
    NotEq,
    EqEqEq,
    NotEqEq,
    Less,
    Greater,
    LessEq,
    GreaterEq,
    AndAnd,
    OrOr,
    LParen,
    RParen,
    LBracket,
    RBracket,
    Dot,
    Comma,
    End,
};

struct Token
{
    TokenKind kind = TokenKind::End;
    size_t offset = 0;
    std::string text; ///< Identifier name or decoded string literal.
    double number = 0.0;
};

/// @brief Split @p source into tokens terminated by an End token.
/// @throws EvalError on an unexpected character or unterminated string.
std::vector<Token> tokenize(std::string_view source);

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

/// @brief Syntax tree node.
struct Expr
{
    enum class Kind
    {
        Number,    ///< number
        String,    ///< text
        Undefined, ///< void literal
        Ident,     ///< text = name
        Unary,     ///< op lhs
        Binary,    ///< lhs op rhs
        Logical,   ///< lhs (&& | ||) rhs, short-circuit
        Member,    ///< lhs.text
        Index,     ///< lhs[rhs]
        Call,      ///< lhs(args)
    };

    Kind kind = Kind::Undefined;
    size_t offset = 0;
    TokenKind op = TokenKind::End;
    double number = 0.0;
    std::string text;
    ExprPtr lhs;
    ExprPtr rhs;
    std::vector<ExprPtr> args;
    int height = 1; ///< Levels in the subtree rooted here.
};

/// @brief Pratt parser over a token vector.
class Parser
{
  public:
    /// @brief Limit on parser recursion and on the height of any tree built.
    static constexpr int kMaxDepth = 200;

    explicit Parser(std::vector<Token> tokens);

    /// @brief Parse a complete expression; trailing tokens are an error.
    /// @throws EvalError on a syntax error.
    ExprPtr parseProgram();

  private:
    ExprPtr parseExpression(int minPrec);
    ExprPtr parseUnary();
    ExprPtr parsePostfix(ExprPtr base);
    ExprPtr parsePrimary();
    ExprPtr seal(ExprPtr node) const;

    const Token &peek() const;
    Token consume();
    void expect(TokenKind kind, const char *what);

    std::vector<Token> tokens_;
    size_t pos_ = 0;
    int depth_ = 0;
};

} // namespace regvm::host::expr
