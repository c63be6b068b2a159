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
#ifndef CORE_EXPRESSION_TERM_HPP
#define CORE_EXPRESSION_TERM_HPP

#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

#include <boost/optional.hpp>
#include <boost/variant/recursive_wrapper.hpp>
#include <boost/variant/variant.hpp>

namespace ParamExpr
{

enum class Operator
{
    Add,
    Sub,
    Mul,
    Div,
    Pow
};

/** @brief Built-in unary functions, negation included */
enum class Function
{
    Neg,
    Sin,
    Cos,
    Tan,
    Asin,
    Acos,
    Atan,
    Sinh,
    Cosh,
    Tanh,
    Sqrt,
    Cbrt,
    Abs,
    Exp,
    Ln,
    Log10,
    Floor,
    Ceil
};

/** Signature of functions that can be applied to a term. */
using UnaryFunction = double (*)(double);

struct Constant
{
    double value;
};

/** The free variable, bound at evaluation time. */
struct Parameter
{
};

struct BinaryOp;
struct UnaryOp;
struct FunctionCall;
struct Piecewise;

/** @brief Node of an expression tree
 *
 * Children are held by value through boost::recursive_wrapper, so every
 * subterm is exclusively owned by its parent and copying a Term copies
 * the whole tree.  There are no mutating operations on a tree once it
 * has been built.
 */
using Term = boost::variant<Constant,
                            Parameter,
                            boost::recursive_wrapper<BinaryOp>,
                            boost::recursive_wrapper<UnaryOp>,
                            boost::recursive_wrapper<FunctionCall>,
                            boost::recursive_wrapper<Piecewise>>;

struct BinaryOp
{
    Operator op;
    Term lhs;
    Term rhs;
};

struct UnaryOp
{
    Function fn;
    Term operand;
};

/** Application of a user supplied function. */
struct FunctionCall
{
    std::string name;
    UnaryFunction fn;
    Term operand;
};

/** @brief A function defined by intervals of the parameter
 *
 * Each part pairs the lower bound of an interval with the term that
 * applies from there on.  The first part also covers everything below
 * its bound.  With a cycle @c c, parameter values larger than @c c are
 * reduced to their remainder modulo @c c before the lookup, and the
 * selected term sees the reduced value.
 */
struct Piecewise
{
    std::vector<std::pair<double, Term>> parts;
    boost::optional<double> cycle;
};

/** @name Programmatic construction
 *  Build terms directly, bypassing the string syntax.
 */
///@{
Term constant(double value);
Term parameter();
Term binary(Operator op, Term lhs, Term rhs);
Term add(Term lhs, Term rhs);
Term subtract(Term lhs, Term rhs);
Term multiply(Term lhs, Term rhs);
Term divide(Term lhs, Term rhs);
Term power(Term base, Term exponent);
Term apply(Function fn, Term operand);
Term negate(Term operand);

/** @throws std::invalid_argument if @p fn is null */
Term call(std::string const &name, UnaryFunction fn, Term operand);

/** @brief Piecewise function, constantly zero without parts
 *
 * @param[in] parts Pairs of interval start and term, by increasing start
 * @param[in] cycle Period after which the parameter wraps around
 *
 * @throws std::invalid_argument if the starts are not sorted or not
 *         finite, or if @p cycle is not a positive finite number
 */
Term piecewise(std::vector<std::pair<double, Term>> parts,
               boost::optional<double> cycle = boost::none);
///@}

/** @brief Evaluate a term for a given parameter value
 *
 * Evaluation is total: undefined operations such as a division by zero
 * or the square root of a negative number give IEEE infinities or NaN
 * rather than an error.
 *
 * @param[in] term The expression tree
 * @param[in] x    Value bound to the parameter
 */
double evaluate(Term const &term, double x);

/** Apply a built-in function to a value. */
double compute(Function fn, double x);

/** Name of a built-in function as it is spelled in expressions. */
char const *to_string(Function fn);
char to_char(Operator op);

/** @brief Render a term in expression syntax
 *
 * Binary operations are fully parenthesized, hence parsing the result
 * again yields a term with the same value everywhere.  Piecewise terms
 * have no expression syntax; they are written for display as
 * @c piecewise[c]{a: f, b: g} and such output does not parse.
 */
std::string to_string(Term const &term, std::string const &parameter = "t");
std::ostream &operator<<(std::ostream &os, Term const &term);

/** Whether to_string() of @p term can be parsed again. */
bool has_expression_syntax(Term const &term);

/** Sorted names of the user functions called somewhere in @p term. */
std::vector<std::string> user_functions(Term const &term);

} // namespace ParamExpr

#endif // CORE_EXPRESSION_TERM_HPP
