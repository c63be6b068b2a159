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
#ifndef CORE_PARAMETRIZER_HPP
#define CORE_PARAMETRIZER_HPP

#include <string>

#include "expression/Parser.hpp"
#include "expression/Term.hpp"

namespace ParamExpr
{

/** @brief A parametric function of a single variable
 *
 * The expression is parsed once at construction into a Term which is
 * then evaluated for as many parameter values as needed.  There are no
 * mutating member functions, a constructed object can be evaluated
 * from several threads at the same time.
 *
 * Parse errors are reported by the constructor only.  Evaluation
 * never fails: undefined operations yield NaN or infinity.
 */
class Parametrizer
{
    Term m_term;
    std::string m_expression;
    std::string m_parameter;
public:
    /** @brief Constructor, the function is constantly zero */
    Parametrizer();

    /** @brief Parse a mathematical expression
     *
     * @param[in] expression The expression given as a std::string
     * @param[in] options    Parameter name and callable functions
     *
     * @throws ParseError if @p expression is malformed
     */
    explicit Parametrizer(std::string const &expression,
                          ParserOptions const &options = ParserOptions());

    /** @brief Wrap a term that was built in code */
    explicit Parametrizer(Term term);

    /** @brief Evaluate the function
     *
     * @param[in] x Value of the parameter
     */
    double evaluate(double x) const { return ParamExpr::evaluate(m_term, x); }

    Term const &term() const { return m_term; }

    /** @brief The source text, or the rendered term if built in code */
    std::string const &expression() const { return m_expression; }

    std::string const &parameter() const { return m_parameter; }
};

} // namespace ParamExpr

#endif // CORE_PARAMETRIZER_HPP
