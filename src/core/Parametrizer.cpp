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
#include <utility>

#include <boost/log/trivial.hpp>

#include "Parametrizer.hpp"
#include "expression/ParseError.hpp"

namespace ParamExpr
{

namespace
{

Term parse_logged(std::string const &expression, ParserOptions const &options)
{
    try {
        auto term = parse(expression, options);
        BOOST_LOG_TRIVIAL(trace) << "Parsed '" << expression << "' as "
                                 << to_string(term, options.parameter);
        return term;
    } catch (ParseError const &e) {
        BOOST_LOG_TRIVIAL(trace) << "Failed to parse '" << expression
                                 << "': " << e.what();
        throw;
    }
}

} // namespace

Parametrizer::Parametrizer()
    : m_term(constant(0.0)), m_expression{"0"}, m_parameter{"t"}
{}

Parametrizer::Parametrizer(std::string const &expression,
                           ParserOptions const &options)
    : m_term(parse_logged(expression, options)), m_expression{expression},
      m_parameter{options.parameter}
{}

Parametrizer::Parametrizer(Term term)
    : m_term(std::move(term)), m_expression{to_string(m_term)}, m_parameter{"t"}
{}

} // namespace ParamExpr
