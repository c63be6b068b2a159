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
#include <string>

#include "ParseError.hpp"

namespace ParamExpr
{

namespace
{

std::string format_message(ParseErrorKind kind, std::size_t position,
                           std::string const &detail)
{
    return std::string(to_string(kind)) + " at position " +
           std::to_string(position) + ": " + detail;
}

} // namespace

char const *to_string(ParseErrorKind kind)
{
    switch (kind) {
    case ParseErrorKind::InvalidToken:
        return "invalid token";
    case ParseErrorKind::UnknownFunction:
        return "unknown function";
    case ParseErrorKind::UnmatchedParenthesis:
        return "unmatched parenthesis";
    case ParseErrorKind::UnexpectedToken:
        return "unexpected token";
    case ParseErrorKind::EmptyExpression:
        return "empty expression";
    case ParseErrorKind::NestingTooDeep:
        return "nesting too deep";
    }
    return "parse error";
}

ParseError::ParseError(ParseErrorKind kind, std::size_t position,
                       std::string const &token, std::string const &detail)
    : std::runtime_error(format_message(kind, position, detail)),
      m_kind(kind), m_position(position), m_token(token)
{}

} // namespace ParamExpr
