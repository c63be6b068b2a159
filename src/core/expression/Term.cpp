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
#include <cmath>
#include <iterator>
#include <limits>
#include <ostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/lexical_cast.hpp>
#include <boost/variant/apply_visitor.hpp>
#include <boost/variant/static_visitor.hpp>

#include "Term.hpp"

namespace ParamExpr
{

namespace
{

class Evaluator : public boost::static_visitor<double>
{
    double m_x;
public:
    explicit Evaluator(double x) : m_x(x) {}

    double operator()(Constant const &c) const { return c.value; }

    double operator()(Parameter const &) const { return m_x; }

    double operator()(BinaryOp const &node) const
    {
        double const lhs = boost::apply_visitor(*this, node.lhs);
        double const rhs = boost::apply_visitor(*this, node.rhs);

        switch (node.op) {
        case Operator::Add:
            return lhs + rhs;
        case Operator::Sub:
            return lhs - rhs;
        case Operator::Mul:
            return lhs * rhs;
        case Operator::Div:
            return lhs / rhs;
        case Operator::Pow:
            return std::pow(lhs, rhs);
        }
        return std::numeric_limits<double>::quiet_NaN();
    }

    double operator()(UnaryOp const &node) const
    {
        return compute(node.fn, boost::apply_visitor(*this, node.operand));
    }

    double operator()(FunctionCall const &node) const
    {
        return node.fn(boost::apply_visitor(*this, node.operand));
    }

    double operator()(Piecewise const &node) const
    {
        if (node.parts.empty()) {
            return 0.0;
        }

        double t = m_x;
        if (node.cycle && t > *node.cycle) {
            t = std::fmod(t, *node.cycle);
        }

        auto selected = node.parts.begin();
        for (auto it = std::next(selected); it != node.parts.end() && t >= it->first; ++it) {
            selected = it;
        }
        return boost::apply_visitor(Evaluator(t), selected->second);
    }
};

/* Writes terms fully parenthesized. Non-finite constants are spelled as
   divisions so that the output stays parseable. */
class Printer : public boost::static_visitor<void>
{
    std::ostream &m_os;
    std::string const &m_parameter;
public:
    Printer(std::ostream &os, std::string const &parameter)
        : m_os(os), m_parameter(parameter)
    {}

    void operator()(Constant const &c) const
    {
        if (std::isnan(c.value)) {
            m_os << "(0/0)";
        } else if (std::isinf(c.value)) {
            m_os << (c.value > 0 ? "(1/0)" : "(-1/0)");
        } else if (std::signbit(c.value)) {
            m_os << "(-" << boost::lexical_cast<std::string>(-c.value) << ')';
        } else {
            m_os << boost::lexical_cast<std::string>(c.value);
        }
    }

    void operator()(Parameter const &) const { m_os << m_parameter; }

    void operator()(BinaryOp const &node) const
    {
        m_os << '(';
        boost::apply_visitor(*this, node.lhs);
        m_os << ' ' << to_char(node.op) << ' ';
        boost::apply_visitor(*this, node.rhs);
        m_os << ')';
    }

    void operator()(UnaryOp const &node) const
    {
        if (node.fn == Function::Neg) {
            m_os << "(-";
            boost::apply_visitor(*this, node.operand);
            m_os << ')';
        } else {
            m_os << to_string(node.fn) << '(';
            boost::apply_visitor(*this, node.operand);
            m_os << ')';
        }
    }

    void operator()(FunctionCall const &node) const
    {
        m_os << node.name << '(';
        boost::apply_visitor(*this, node.operand);
        m_os << ')';
    }

    void operator()(Piecewise const &node) const
    {
        m_os << "piecewise";
        if (node.cycle) {
            m_os << '[' << boost::lexical_cast<std::string>(*node.cycle) << ']';
        }
        m_os << '{';
        for (auto it = node.parts.begin(); it != node.parts.end(); ++it) {
            if (it != node.parts.begin()) {
                m_os << ", ";
            }
            m_os << boost::lexical_cast<std::string>(it->first) << ": ";
            boost::apply_visitor(*this, it->second);
        }
        m_os << '}';
    }
};

/* Gathers the names of user functions and notes piecewise nodes. */
class Inventory : public boost::static_visitor<void>
{
public:
    std::set<std::string> functions;
    bool piecewise = false;

    void operator()(Constant const &) {}

    void operator()(Parameter const &) {}

    void operator()(BinaryOp const &node)
    {
        boost::apply_visitor(*this, node.lhs);
        boost::apply_visitor(*this, node.rhs);
    }

    void operator()(UnaryOp const &node) { boost::apply_visitor(*this, node.operand); }

    void operator()(FunctionCall const &node)
    {
        functions.insert(node.name);
        boost::apply_visitor(*this, node.operand);
    }

    void operator()(Piecewise const &node)
    {
        piecewise = true;
        for (auto const &part : node.parts) {
            boost::apply_visitor(*this, part.second);
        }
    }
};

Inventory take_inventory(Term const &term)
{
    Inventory inventory;
    boost::apply_visitor(inventory, term);
    return inventory;
}

} // namespace

Term constant(double value)
{
    return Constant{value};
}

Term parameter()
{
    return Parameter{};
}

Term binary(Operator op, Term lhs, Term rhs)
{
    return BinaryOp{op, std::move(lhs), std::move(rhs)};
}

Term add(Term lhs, Term rhs)
{
    return binary(Operator::Add, std::move(lhs), std::move(rhs));
}

Term subtract(Term lhs, Term rhs)
{
    return binary(Operator::Sub, std::move(lhs), std::move(rhs));
}

Term multiply(Term lhs, Term rhs)
{
    return binary(Operator::Mul, std::move(lhs), std::move(rhs));
}

Term divide(Term lhs, Term rhs)
{
    return binary(Operator::Div, std::move(lhs), std::move(rhs));
}

Term power(Term base, Term exponent)
{
    return binary(Operator::Pow, std::move(base), std::move(exponent));
}

Term apply(Function fn, Term operand)
{
    return UnaryOp{fn, std::move(operand)};
}

Term negate(Term operand)
{
    return apply(Function::Neg, std::move(operand));
}

Term call(std::string const &name, UnaryFunction fn, Term operand)
{
    if (!fn) {
        throw std::invalid_argument("No function given for '" + name + "'");
    }
    return FunctionCall{name, fn, std::move(operand)};
}

Term piecewise(std::vector<std::pair<double, Term>> parts,
               boost::optional<double> cycle)
{
    if (cycle && !(std::isfinite(*cycle) && *cycle > 0.0)) {
        throw std::invalid_argument("Piecewise cycle must be positive and finite");
    }
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (!std::isfinite(parts[i].first)) {
            throw std::invalid_argument("Piecewise interval starts must be finite");
        }
        if (i > 0 && parts[i].first < parts[i - 1].first) {
            throw std::invalid_argument("Piecewise intervals must be sorted by start");
        }
    }
    return Piecewise{std::move(parts), cycle};
}

double evaluate(Term const &term, double x)
{
    return boost::apply_visitor(Evaluator(x), term);
}

double compute(Function fn, double x)
{
    switch (fn) {
    case Function::Neg:
        return -x;
    case Function::Sin:
        return std::sin(x);
    case Function::Cos:
        return std::cos(x);
    case Function::Tan:
        return std::tan(x);
    case Function::Asin:
        return std::asin(x);
    case Function::Acos:
        return std::acos(x);
    case Function::Atan:
        return std::atan(x);
    case Function::Sinh:
        return std::sinh(x);
    case Function::Cosh:
        return std::cosh(x);
    case Function::Tanh:
        return std::tanh(x);
    case Function::Sqrt:
        return std::sqrt(x);
    case Function::Cbrt:
        return std::cbrt(x);
    case Function::Abs:
        return std::fabs(x);
    case Function::Exp:
        return std::exp(x);
    case Function::Ln:
        return std::log(x);
    case Function::Log10:
        return std::log10(x);
    case Function::Floor:
        return std::floor(x);
    case Function::Ceil:
        return std::ceil(x);
    }
    return std::numeric_limits<double>::quiet_NaN();
}

char const *to_string(Function fn)
{
    switch (fn) {
    case Function::Neg:
        return "neg";
    case Function::Sin:
        return "sin";
    case Function::Cos:
        return "cos";
    case Function::Tan:
        return "tan";
    case Function::Asin:
        return "asin";
    case Function::Acos:
        return "acos";
    case Function::Atan:
        return "atan";
    case Function::Sinh:
        return "sinh";
    case Function::Cosh:
        return "cosh";
    case Function::Tanh:
        return "tanh";
    case Function::Sqrt:
        return "sqrt";
    case Function::Cbrt:
        return "cbrt";
    case Function::Abs:
        return "abs";
    case Function::Exp:
        return "exp";
    case Function::Ln:
        return "ln";
    case Function::Log10:
        return "log10";
    case Function::Floor:
        return "floor";
    case Function::Ceil:
        return "ceil";
    }
    return "";
}

char to_char(Operator op)
{
    switch (op) {
    case Operator::Add:
        return '+';
    case Operator::Sub:
        return '-';
    case Operator::Mul:
        return '*';
    case Operator::Div:
        return '/';
    case Operator::Pow:
        return '^';
    }
    return '?';
}

std::string to_string(Term const &term, std::string const &parameter)
{
    std::ostringstream os;
    boost::apply_visitor(Printer(os, parameter), term);
    return os.str();
}

std::ostream &operator<<(std::ostream &os, Term const &term)
{
    boost::apply_visitor(Printer(os, "t"), term);
    return os;
}

bool has_expression_syntax(Term const &term)
{
    return !take_inventory(term).piecewise;
}

std::vector<std::string> user_functions(Term const &term)
{
    auto const inventory = take_inventory(term);
    return {inventory.functions.begin(), inventory.functions.end()};
}

} // namespace ParamExpr
