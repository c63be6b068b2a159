/*
  Copyright (C) 2017 The ParamExpr project

  This file is part of ParamExpr.

  ParamExpr is free software: you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation, either version 3 of the License, or
  (at your option) any later version.

  ParamExpr is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "ParseError.hpp"
#include "Parser.hpp"
#include "Tokenizer.hpp"

namespace ParamExpr
{

namespace
{

/* Counts one level of recursion for as long as it lives. */
class DepthGuard
{
    std::size_t &m_depth;
public:
    DepthGuard(std::size_t &depth, std::size_t max_depth, Token const &token)
        : m_depth(depth)
    {
        if (m_depth >= max_depth) {
            throw ParseError(ParseErrorKind::NestingTooDeep, token.position, token.text,
                             "expression is nested deeper than " +
                                 std::to_string(max_depth) + " levels");
        }
        ++m_depth;
    }

    ~DepthGuard() { --m_depth; }

    DepthGuard(DepthGuard const &) = delete;
    DepthGuard &operator=(DepthGuard const &) = delete;
};

class RecursiveDescent
{
    std::vector<Token> const &m_tokens;
    FunctionTable const &m_functions;
    std::size_t const m_max_depth;
    std::size_t m_current = 0;
    std::size_t m_depth = 0;
public:
    RecursiveDescent(std::vector<Token> const &tokens, FunctionTable const &functions,
                     std::size_t max_depth)
        : m_tokens(tokens), m_functions(functions), m_max_depth(max_depth)
    {
        if (m_tokens.empty() || m_tokens.back().type != TokenType::End) {
            throw std::invalid_argument("Token sequence is not terminated");
        }
    }

    Term run()
    {
        if (at_end()) {
            throw ParseError(ParseErrorKind::EmptyExpression, peek().position, "",
                             "nothing to parse");
        }

        auto root = expression();

        if (!at_end()) {
            throw ParseError(ParseErrorKind::UnexpectedToken, peek().position,
                             peek().text,
                             "'" + peek().text + "' after complete expression");
        }
        return root;
    }

private:
    Token const &peek() const { return m_tokens[m_current]; }

    bool at_end() const { return peek().type == TokenType::End; }

    bool match(TokenType type)
    {
        if (peek().type == type && !at_end()) {
            ++m_current;
            return true;
        }
        return false;
    }

    Token const &previous() const { return m_tokens[m_current - 1]; }

    /* expr := term (('+'|'-') term)* */
    Term expression()
    {
        auto node = term();
        while (true) {
            if (match(TokenType::Plus)) {
                node = add(std::move(node), term());
            } else if (match(TokenType::Minus)) {
                node = subtract(std::move(node), term());
            } else {
                return node;
            }
        }
    }

    /* term := power (('*'|'/') power)* */
    Term term()
    {
        auto node = power_of();
        while (true) {
            if (match(TokenType::Star)) {
                node = multiply(std::move(node), power_of());
            } else if (match(TokenType::Slash)) {
                node = divide(std::move(node), power_of());
            } else {
                return node;
            }
        }
    }

    /* power := unary ('^' power)? */
    Term power_of()
    {
        DepthGuard const guard(m_depth, m_max_depth, peek());
        auto base = unary();
        if (match(TokenType::Caret)) {
            return power(std::move(base), power_of());
        }
        return base;
    }

    /* unary := ('-'|'+') unary | atom */
    Term unary()
    {
        if (match(TokenType::Minus)) {
            DepthGuard const guard(m_depth, m_max_depth, previous());
            return negate(unary());
        }
        if (match(TokenType::Plus)) {
            DepthGuard const guard(m_depth, m_max_depth, previous());
            return unary();
        }
        return atom();
    }

    Term atom()
    {
        if (match(TokenType::Number)) {
            return constant(previous().value);
        }
        if (match(TokenType::Parameter)) {
            return parameter();
        }
        if (match(TokenType::Identifier)) {
            return function_call(previous());
        }
        if (match(TokenType::LParen)) {
            auto const &open = previous();
            auto node = expression();
            close(open);
            return node;
        }

        if (at_end()) {
            throw ParseError(ParseErrorKind::UnexpectedToken, peek().position, "",
                             "unexpected end of expression");
        }
        throw ParseError(ParseErrorKind::UnexpectedToken, peek().position,
                         peek().text, "expected an operand, got '" + peek().text + "'");
    }

    Term function_call(Token const &name)
    {
        if (peek().type != TokenType::LParen) {
            auto const detail = m_functions.contains(name.text)
                                    ? "function '" + name.text + "' needs an argument in parentheses"
                                    : "unknown symbol '" + name.text + "'";
            throw ParseError(ParseErrorKind::UnexpectedToken, name.position,
                             name.text, detail);
        }
        if (!m_functions.contains(name.text)) {
            throw ParseError(ParseErrorKind::UnknownFunction, name.position,
                             name.text, "'" + name.text + "' is not a known function");
        }

        auto const &open = peek();
        ++m_current;
        auto argument = expression();
        close(open);
        return m_functions.make(name.text, std::move(argument));
    }

    void close(Token const &open)
    {
        if (match(TokenType::RParen)) {
            return;
        }
        if (at_end()) {
            throw ParseError(ParseErrorKind::UnmatchedParenthesis, open.position,
                             open.text, "'(' is never closed");
        }
        throw ParseError(ParseErrorKind::UnexpectedToken, peek().position,
                         peek().text, "expected ')', got '" + peek().text + "'");
    }
};

} // namespace

Term parse(std::vector<Token> const &tokens, FunctionTable const &functions,
           std::size_t max_depth)
{
    return RecursiveDescent(tokens, functions, max_depth).run();
}

Term parse(std::string const &expression, ParserOptions const &options)
{
    return parse(tokenize(expression, options.parameter), options.functions,
                 options.max_depth);
}

} // namespace ParamExpr
