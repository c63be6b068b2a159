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

#define BOOST_TEST_MODULE Function table test
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "expression/FunctionTable.hpp"
#include "expression/Term.hpp"

using namespace ParamExpr;

namespace {
double square(double x) { return x * x; }
double natural_log(double x) { return std::log(x); }
} // namespace

BOOST_AUTO_TEST_CASE(builtin_names) {
    auto const table = FunctionTable::builtin();

    for (auto name : {"sin", "cos", "tan", "sqrt", "abs", "exp", "ln", "log10"}) {
        BOOST_CHECK_MESSAGE(table.contains(name), name);
    }
    BOOST_CHECK(table.contains("Sin"));
    BOOST_CHECK(!table.contains("neg"));
    BOOST_CHECK(!table.contains("foo"));

    auto const names = table.names();
    BOOST_CHECK_EQUAL(names.size(), 17);
    BOOST_CHECK(std::is_sorted(names.begin(), names.end()));
}

BOOST_AUTO_TEST_CASE(add_user_functions) {
    auto table = FunctionTable::builtin();
    table.add("Square", square);
    table.add("log", natural_log);

    BOOST_CHECK(table.contains("square"));
    BOOST_CHECK_EQUAL(evaluate(table.make("SQUARE", parameter()), 3.), 9.);
    BOOST_CHECK_EQUAL(evaluate(table.make("log", constant(7.)), 0.), std::log(7.));
    BOOST_CHECK_EQUAL(to_string(table.make("square", parameter())), "square(t)");
}

BOOST_AUTO_TEST_CASE(override_builtin) {
    auto table = FunctionTable::builtin();
    table.add("sin", square);

    BOOST_CHECK_EQUAL(evaluate(table.make("sin", parameter()), 3.), 9.);

    table.add("sine", Function::Sin);
    BOOST_CHECK_EQUAL(evaluate(table.make("sine", parameter()), 3.), std::sin(3.));
}

BOOST_AUTO_TEST_CASE(invalid_registrations) {
    FunctionTable table;

    BOOST_CHECK_THROW(table.add("", square), std::invalid_argument);
    BOOST_CHECK_THROW(table.add("2x", square), std::invalid_argument);
    BOOST_CHECK_THROW(table.add("a-b", square), std::invalid_argument);
    BOOST_CHECK_THROW(table.add("f", static_cast<UnaryFunction>(nullptr)),
                      std::invalid_argument);
    BOOST_CHECK_THROW(table.make("sin", parameter()), std::out_of_range);
}
