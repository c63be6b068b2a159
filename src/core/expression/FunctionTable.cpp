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
#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/variant/apply_visitor.hpp>
#include <boost/variant/static_visitor.hpp>

#include "FunctionTable.hpp"

namespace ParamExpr
{

namespace
{

bool is_identifier(std::string const &name)
{
    if (name.empty() ||
        !(std::isalpha(static_cast<unsigned char>(name.front())) || name.front() == '_')) {
        return false;
    }
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_'))
            return false;
    }
    return true;
}

std::string checked_name(std::string const &name)
{
    if (!is_identifier(name)) {
        throw std::invalid_argument("Not a valid function name: '" + name + "'");
    }
    return boost::algorithm::to_lower_copy(name);
}

class TermFactory : public boost::static_visitor<Term>
{
    std::string const &m_name;
    Term &m_operand;
public:
    TermFactory(std::string const &name, Term &operand)
        : m_name(name), m_operand(operand)
    {}

    Term operator()(Function fn) const
    {
        return apply(fn, std::move(m_operand));
    }

    Term operator()(UnaryFunction fn) const
    {
        return call(m_name, fn, std::move(m_operand));
    }
};

} // namespace

FunctionTable FunctionTable::builtin()
{
    FunctionTable table;
    for (auto fn : {Function::Sin, Function::Cos, Function::Tan,
                    Function::Asin, Function::Acos, Function::Atan,
                    Function::Sinh, Function::Cosh, Function::Tanh,
                    Function::Sqrt, Function::Cbrt, Function::Abs,
                    Function::Exp, Function::Ln, Function::Log10,
                    Function::Floor, Function::Ceil}) {
        table.add(to_string(fn), fn);
    }
    return table;
}

void FunctionTable::add(std::string const &name, UnaryFunction fn)
{
    if (!fn) {
        throw std::invalid_argument("No function given for '" + name + "'");
    }
    m_functions[checked_name(name)] = fn;
}

void FunctionTable::add(std::string const &name, Function fn)
{
    m_functions[checked_name(name)] = fn;
}

bool FunctionTable::contains(std::string const &name) const
{
    return m_functions.count(boost::algorithm::to_lower_copy(name)) != 0;
}

std::vector<std::string> FunctionTable::names() const
{
    std::vector<std::string> result;
    result.reserve(m_functions.size());
    for (auto const &entry : m_functions) {
        result.push_back(entry.first);
    }
    return result;
}

Term FunctionTable::make(std::string const &name, Term operand) const
{
    auto const key = boost::algorithm::to_lower_copy(name);
    return boost::apply_visitor(TermFactory(key, operand), m_functions.at(key));
}

} // namespace ParamExpr
