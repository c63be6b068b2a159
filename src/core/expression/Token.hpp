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
#ifndef CORE_EXPRESSION_TOKEN_HPP
#define CORE_EXPRESSION_TOKEN_HPP

#include <cstddef>
#include <string>

namespace ParamExpr
{

enum class TokenType
{
    Number,
    Parameter,
    Plus,
    Minus,
    Star,
    Slash,
    Caret,
    LParen,
    RParen,
    Identifier,
    End
};

/** @brief A single lexeme of an expression
 *
 * @c value is only meaningful for numbers, @c text holds the lexeme
 * (lower case for identifiers) and @c position its character offset.
 */
struct Token
{
    TokenType type;
    double value;
    std::string text;
    std::size_t position;
};

} // namespace ParamExpr

#endif // CORE_EXPRESSION_TOKEN_HPP
