//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/host/ExprParser.cpp
// Purpose: Tokenizer and Pratt parser for the built-in expression language.
// Key invariants: Binary operators are left-associative; unary operators bind
//                 tighter than any binary operator; postfix binds tightest.
// Ownership/Lifetime: The parser owns its token vector and hands out trees.
//
//===----------------------------------------------------------------------===//

#include "host/ExprParser.hpp"

#include "host/ExprEvaluator.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <string>

namespace regvm::host::expr
{
namespace
{
struct InfixParselet
{
    TokenKind kind;
    int lbp;
    bool logical;
};

/// Binding powers; higher binds tighter.  Unary operators use kUnaryBp.
constexpr std::array<InfixParselet, 15> infixParselets{
    InfixParselet{TokenKind::Star, 6, false},
    InfixParselet{TokenKind::Slash, 6, false},
    InfixParselet{TokenKind::Percent, 6, false},
    InfixParselet{TokenKind::Plus, 5, false},
    InfixParselet{TokenKind::Minus, 5, false},
    InfixParselet{TokenKind::Less, 4, false},
    InfixParselet{TokenKind::Greater, 4, false},
    InfixParselet{TokenKind::LessEq, 4, false},
    InfixParselet{TokenKind::GreaterEq, 4, false},
    InfixParselet{TokenKind::EqEq, 3, false},
    InfixParselet{TokenKind::NotEq, 3, false},
    InfixParselet{TokenKind::EqEqEq, 3, false},
    InfixParselet{TokenKind::NotEqEq, 3, false},
    InfixParselet{TokenKind::AndAnd, 2, true},
    InfixParselet{TokenKind::OrOr, 1, true},
};

constexpr int kUnaryBp = 7;

inline const InfixParselet *findInfix(TokenKind kind)
{
    const auto it =
        std::find_if(infixParselets.begin(),
                     infixParselets.end(),
                     [kind](const InfixParselet &parselet) { return parselet.kind == kind; });
    return it == infixParselets.end() ? nullptr : &*it;
}

bool isIdentStart(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool isIdentChar(char c)
{
    return isIdentStart(c) || std::isdigit(static_cast<unsigned char>(c));
}

/// @brief Lex a numeric literal starting at @p i (decimal or 0x hex).
size_t lexNumber(std::string_view src, size_t i, Token &tok)
{
    const size_t start = i;
    if (src[i] == '0' && i + 1 < src.size() && (src[i + 1] == 'x' || src[i + 1] == 'X'))
    {
        i += 2;
        const size_t digits = i;
        while (i < src.size() && std::isxdigit(static_cast<unsigned char>(src[i])))
            ++i;
        if (i == digits)
            throw EvalError("malformed hex literal", start);
        double value = 0.0;
        for (size_t k = digits; k < i; ++k)
        {
            const unsigned char d = static_cast<unsigned char>(src[k]);
            value = value * 16.0 + (std::isdigit(d) ? d - '0' : std::tolower(d) - 'a' + 10);
        }
        tok.number = value;
        return i;
    }

    while (i < src.size() && std::isdigit(static_cast<unsigned char>(src[i])))
        ++i;
    if (i < src.size() && src[i] == '.')
    {
        ++i;
        while (i < src.size() && std::isdigit(static_cast<unsigned char>(src[i])))
            ++i;
    }
    if (i < src.size() && (src[i] == 'e' || src[i] == 'E'))
    {
        size_t j = i + 1;
        if (j < src.size() && (src[j] == '+' || src[j] == '-'))
            ++j;
        if (j < src.size() && std::isdigit(static_cast<unsigned char>(src[j])))
        {
            i = j;
            while (i < src.size() && std::isdigit(static_cast<unsigned char>(src[i])))
                ++i;
        }
    }
    if (i < src.size() && isIdentStart(src[i]))
        throw EvalError("identifier directly after number", i);
    tok.number = std::strtod(std::string(src.substr(start, i - start)).c_str(), nullptr);
    return i;
}

/// @brief Lex a quoted string starting at the quote at @p i.
size_t lexString(std::string_view src, size_t i, Token &tok)
{
    const size_t start = i;
    const char quote = src[i++];
    std::string text;
    while (i < src.size() && src[i] != quote)
    {
        char c = src[i++];
        if (c == '\\')
        {
            if (i >= src.size())
                break;
            const char esc = src[i++];
            switch (esc)
            {
                case 'n':
                    c = '\n';
                    break;
                case 't':
                    c = '\t';
                    break;
                default:
                    // \\ \' \" and any other escaped character stand for themselves.
                    c = esc;
                    break;
            }
        }
        text.push_back(c);
    }
    if (i >= src.size())
        throw EvalError("unterminated string literal", start);
    tok.text = std::move(text);
    return i + 1;
}
} // namespace

std::vector<Token> tokenize(std::string_view src)
{
    std::vector<Token> tokens;
    size_t i = 0;
    while (true)
    {
        while (i < src.size() && std::isspace(static_cast<unsigned char>(src[i])))
            ++i;
        Token tok;
        tok.offset = i;
        if (i >= src.size())
        {
            tokens.push_back(std::move(tok));
            return tokens;
        }

        const char c = src[i];
        const auto next = [&](size_t k) { return i + k < src.size() ? src[i + k] : '\0'; };

        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && std::isdigit(static_cast<unsigned char>(next(1)))))
        {
            tok.kind = TokenKind::Number;
            i = lexNumber(src, i, tok);
        }
        else if (c == '"' || c == '\'')
        {
            tok.kind = TokenKind::String;
            i = lexString(src, i, tok);
        }
        else if (isIdentStart(c))
        {
            const size_t start = i;
            while (i < src.size() && isIdentChar(src[i]))
                ++i;
            tok.kind = TokenKind::Identifier;
            tok.text = std::string(src.substr(start, i - start));
        }
        else
        {
            size_t len = 1;
            switch (c)
            {
                case '+':
                    tok.kind = TokenKind::Plus;
                    break;
                case '-':
                    tok.kind = TokenKind::Minus;
                    break;
                case '*':
                    tok.kind = TokenKind::Star;
                    break;
                case '/':
                    tok.kind = TokenKind::Slash;
                    break;
                case '%':
                    tok.kind = TokenKind::Percent;
                    break;
                case '(':
                    tok.kind = TokenKind::LParen;
                    break;
                case ')':
                    tok.kind = TokenKind::RParen;
                    break;
                case '[':
                    tok.kind = TokenKind::LBracket;
                    break;
                case ']':
                    tok.kind = TokenKind::RBracket;
                    break;
                case '.':
                    tok.kind = TokenKind::Dot;
                    break;
                case ',':
                    tok.kind = TokenKind::Comma;
                    break;
                case '!':
                case '=':
                {
                    const bool bang = c == '!';
                    if (next(1) != '=')
                    {
                        if (!bang)
                            throw EvalError("assignment is not supported", i);
                        tok.kind = TokenKind::Bang;
                        break;
                    }
                    const bool strict = next(2) == '=';
                    len = strict ? 3 : 2;
                    if (bang)
                        tok.kind = strict ? TokenKind::NotEqEq : TokenKind::NotEq;
                    else
                        tok.kind = strict ? TokenKind::EqEqEq : TokenKind::EqEq;
                    break;
                }
                case '<':
                    tok.kind = next(1) == '=' ? TokenKind::LessEq : TokenKind::Less;
                    len = next(1) == '=' ? 2 : 1;
                    break;
                case '>':
                    tok.kind = next(1) == '=' ? TokenKind::GreaterEq : TokenKind::Greater;
                    len = next(1) == '=' ? 2 : 1;
                    break;
                case '&':
                    if (next(1) != '&')
                        throw EvalError("unexpected character '&'", i);
                    tok.kind = TokenKind::AndAnd;
                    len = 2;
                    break;
                case '|':
                    if (next(1) != '|')
                        throw EvalError("unexpected character '|'", i);
                    tok.kind = TokenKind::OrOr;
                    len = 2;
                    break;
                default:
                    throw EvalError(std::string("unexpected character '") + c + "'", i);
            }
            i += len;
        }
        tokens.push_back(std::move(tok));
    }
}

//===----------------------------------------------------------------------===//
// Parser
//===----------------------------------------------------------------------===//

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens))
{
    if (tokens_.empty() || tokens_.back().kind != TokenKind::End)
        tokens_.push_back(Token{});
}

const Token &Parser::peek() const
{
    return tokens_[pos_];
}

Token Parser::consume()
{
    Token tok = tokens_[pos_];
    if (tok.kind != TokenKind::End)
        ++pos_;
    return tok;
}

void Parser::expect(TokenKind kind, const char *what)
{
    if (peek().kind != kind)
        throw EvalError(std::string("expected ") + what, peek().offset);
    consume();
}

ExprPtr Parser::parseProgram()
{
    if (peek().kind == TokenKind::End)
        throw EvalError("empty expression", peek().offset);
    ExprPtr root = parseExpression(0);
    if (peek().kind != TokenKind::End)
        throw EvalError("unexpected token after expression", peek().offset);
    return root;
}

/// @brief Record the height of a freshly built interior @p node.
/// @details Operator and postfix chains grow the tree without recursing in the
///          parser, so the height is checked here as well as in depth_.
ExprPtr Parser::seal(ExprPtr node) const
{
    int below = 0;
    if (node->lhs)
        below = std::max(below, node->lhs->height);
    if (node->rhs)
        below = std::max(below, node->rhs->height);
    for (const auto &arg : node->args)
        below = std::max(below, arg->height);
    node->height = below + 1;
    if (node->height > kMaxDepth)
        throw EvalError("expression nested too deeply", node->offset);
    return node;
}

/// @brief Climb infix operators whose binding power exceeds @p minPrec.
ExprPtr Parser::parseExpression(int minPrec)
{
    if (++depth_ > kMaxDepth)
        throw EvalError("expression nested too deeply", peek().offset);

    ExprPtr left = parseUnary();
    while (const InfixParselet *infix = findInfix(peek().kind))
    {
        if (infix->lbp <= minPrec)
            break;
        const Token opTok = consume();
        auto node = std::make_unique<Expr>();
        node->kind = infix->logical ? Expr::Kind::Logical : Expr::Kind::Binary;
        node->offset = opTok.offset;
        node->op = opTok.kind;
        node->lhs = std::move(left);
        node->rhs = parseExpression(infix->lbp);
        left = seal(std::move(node));
    }

    --depth_;
    return left;
}

ExprPtr Parser::parseUnary()
{
    const TokenKind kind = peek().kind;
    if (kind == TokenKind::Bang || kind == TokenKind::Minus || kind == TokenKind::Plus)
    {
        const Token opTok = consume();
        auto node = std::make_unique<Expr>();
        node->kind = Expr::Kind::Unary;
        node->offset = opTok.offset;
        node->op = opTok.kind;
        node->lhs = parseExpression(kUnaryBp - 1);
        return seal(std::move(node));
    }
    return parsePostfix(parsePrimary());
}

ExprPtr Parser::parsePostfix(ExprPtr base)
{
    while (true)
    {
        const Token &tok = peek();
        if (tok.kind == TokenKind::Dot)
        {
            const size_t offset = consume().offset;
            if (peek().kind != TokenKind::Identifier)
                throw EvalError("expected property name after '.'", peek().offset);
            auto node = std::make_unique<Expr>();
            node->kind = Expr::Kind::Member;
            node->offset = offset;
            node->text = consume().text;
            node->lhs = std::move(base);
            base = seal(std::move(node));
        }
        else if (tok.kind == TokenKind::LBracket)
        {
            auto node = std::make_unique<Expr>();
            node->kind = Expr::Kind::Index;
            node->offset = consume().offset;
            node->lhs = std::move(base);
            node->rhs = parseExpression(0);
            expect(TokenKind::RBracket, "']'");
            base = seal(std::move(node));
        }
        else if (tok.kind == TokenKind::LParen)
        {
            auto node = std::make_unique<Expr>();
            node->kind = Expr::Kind::Call;
            node->offset = consume().offset;
            node->lhs = std::move(base);
            if (peek().kind != TokenKind::RParen)
            {
                node->args.push_back(parseExpression(0));
                while (peek().kind == TokenKind::Comma)
                {
                    consume();
                    node->args.push_back(parseExpression(0));
                }
            }
            expect(TokenKind::RParen, "')'");
            base = seal(std::move(node));
        }
        else
        {
            return base;
        }
    }
}

ExprPtr Parser::parsePrimary()
{
    const Token tok = consume();
    auto node = std::make_unique<Expr>();
    node->offset = tok.offset;
    switch (tok.kind)
    {
        case TokenKind::Number:
            node->kind = Expr::Kind::Number;
            node->number = tok.number;
            return node;
        case TokenKind::String:
            node->kind = Expr::Kind::String;
            node->text = tok.text;
            return node;
        case TokenKind::Identifier:
            if (tok.text == "true" || tok.text == "false")
            {
                node->kind = Expr::Kind::Number;
                node->number = tok.text == "true" ? 1.0 : 0.0;
            }
            else if (tok.text == "undefined")
            {
                node->kind = Expr::Kind::Undefined;
            }
            else
            {
                node->kind = Expr::Kind::Ident;
                node->text = tok.text;
            }
            return node;
        case TokenKind::LParen:
        {
            ExprPtr inner = parseExpression(0);
            expect(TokenKind::RParen, "')'");
            return inner;
        }
        case TokenKind::End:
            throw EvalError("unexpected end of expression", tok.offset);
        default:
            throw EvalError("unexpected token", tok.offset);
    }
}

} // namespace regvm::host::expr
