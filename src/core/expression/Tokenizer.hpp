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
#ifndef CORE_EXPRESSION_TOKENIZER_HPP
#define CORE_EXPRESSION_TOKENIZER_HPP

#include <string>
#include <vector>

#include "Token.hpp"

namespace ParamExpr
{

/** @brief Split an expression into tokens
 *
 * Whitespace is skipped and identifiers are matched case-insensitively.
 * The identifier equal to @p parameter becomes a TokenType::Parameter,
 * every other identifier a TokenType::Identifier.  Numeric literals are
 * delimited with Boost.Spirit, whose templates are kept out of this
 * header, and converted with correct rounding.  An exponent marker must
 * be followed by digits.  The returned sequence always ends with a
 * TokenType::End token.
 *
 * @param[in] input     The expression given as a std::string
 * @param[in] parameter Name of the free variable
 *
 * @throws ParseError of kind InvalidToken on unknown characters,
 *         malformed number literals and numbers out of range
 */
std::vector<Token> tokenize(std::string const &input,
                            std::string const &parameter = "t");

} // namespace ParamExpr

#endif // CORE_EXPRESSION_TOKENIZER_HPP
