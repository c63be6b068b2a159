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
#ifndef CORE_EXPRESSION_FUNCTION_TABLE_HPP
#define CORE_EXPRESSION_FUNCTION_TABLE_HPP

#include <map>
#include <string>
#include <vector>

#include <boost/variant/variant.hpp>

#include "Term.hpp"

namespace ParamExpr
{

/** @brief Whitelist of functions an expression may call
 *
 * Names are stored in lower case and looked up case-insensitively.
 * A name maps either to one of the built-in functions or to a user
 * supplied function pointer.  Registering an existing name replaces
 * the previous entry.
 */
class FunctionTable
{
    using Entry = boost::variant<Function, UnaryFunction>;
    std::map<std::string, Entry> m_functions;
public:
    /** @brief Constructor, creates an empty table */
    FunctionTable() = default;

    /** @brief The built-in functions
     *
     * sin, cos, tan, asin, acos, atan, sinh, cosh, tanh, sqrt, cbrt,
     * abs, exp, ln, log10, floor and ceil.
     */
    static FunctionTable builtin();

    /** @brief Register a user function
     *
     * @param[in] name Identifier used in expressions
     * @param[in] fn   The function
     *
     * @throws std::invalid_argument if @p name is not an identifier or
     *         @p fn is null
     */
    void add(std::string const &name, UnaryFunction fn);

    /** @brief Register a built-in function under an arbitrary name */
    void add(std::string const &name, Function fn);

    bool contains(std::string const &name) const;

    std::vector<std::string> names() const;

    /** @brief Build the term applying function @p name to @p operand
     *
     * @throws std::out_of_range if @p name is not registered
     */
    Term make(std::string const &name, Term operand) const;
};

} // namespace ParamExpr

#endif // CORE_EXPRESSION_FUNCTION_TABLE_HPP
