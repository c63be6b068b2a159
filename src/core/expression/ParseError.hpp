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
#ifndef CORE_EXPRESSION_PARSE_ERROR_HPP
#define CORE_EXPRESSION_PARSE_ERROR_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace ParamExpr
{

enum class ParseErrorKind
{
    InvalidToken,
    UnknownFunction,
    UnmatchedParenthesis,
    UnexpectedToken,
    EmptyExpression,
    NestingTooDeep
};

char const *to_string(ParseErrorKind kind);

/** @brief Error raised while turning an expression string into a Term
 *
 * All errors are detected before a Term exists; evaluation of a
 * successfully parsed Term never throws.
 */
class ParseError : public std::runtime_error
{
    ParseErrorKind m_kind;
    std::size_t m_position;
    std::string m_token;
public:
    /** @brief Constructor
     *
     * @param[in] kind     The error category
     * @param[in] position Character offset into the input
     * @param[in] token    The offending lexeme (may be empty at end of input)
     * @param[in] detail   Additional human readable description
     */
    ParseError(ParseErrorKind kind, std::size_t position,
               std::string const &token, std::string const &detail);

    ParseErrorKind kind() const { return m_kind; }
    std::size_t position() const { return m_position; }
    std::string const &token() const { return m_token; }
};

} // namespace ParamExpr

#endif // CORE_EXPRESSION_PARSE_ERROR_HPP
