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
#ifndef CORE_EXPRESSION_PARSER_HPP
#define CORE_EXPRESSION_PARSER_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "FunctionTable.hpp"
#include "Term.hpp"
#include "Token.hpp"

namespace ParamExpr
{

/** Default limit on the nesting of parentheses, signs and powers. */
constexpr std::size_t default_max_depth = 1000;

/** @brief Settings for turning strings into terms */
struct ParserOptions
{
    /** Name of the free variable, matched case-insensitively. */
    std::string parameter = "t";
    /** Functions the expression may call. */
    FunctionTable functions = FunctionTable::builtin();
    /** Deepest nesting accepted before ParseErrorKind::NestingTooDeep. */
    std::size_t max_depth = default_max_depth;
};

/** @brief Build a term from a token sequence
 *
 * Recursive descent over the grammar
 *
 *     expr  := term (('+'|'-') term)*
 *     term  := power (('*'|'/') power)*
 *     power := unary ('^' power)?
 *     unary := ('-'|'+') unary | atom
 *     atom  := number | parameter | name '(' expr ')' | '(' expr ')'
 *
 * so '^' binds tighter than '*' and is right-associative.  There is no
 * implicit multiplication, "2t" is rejected.
 *
 * Every parenthesized group, sign and exponent opens one level of
 * recursion.  Input nested deeper than @p max_depth levels is rejected
 * so that the parser stack stays bounded.
 *
 * @param[in] tokens    Sequence terminated by TokenType::End
 * @param[in] functions Functions that may be called
 * @param[in] max_depth Deepest nesting accepted
 *
 * @throws ParseError, a partial tree is never returned
 */
Term parse(std::vector<Token> const &tokens, FunctionTable const &functions,
           std::size_t max_depth = default_max_depth);

/** @brief Tokenize and parse an expression */
Term parse(std::string const &expression,
           ParserOptions const &options = ParserOptions());

} // namespace ParamExpr

#endif // CORE_EXPRESSION_PARSER_HPP
