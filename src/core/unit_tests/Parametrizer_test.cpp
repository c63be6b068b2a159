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

#define BOOST_TEST_MODULE Parametrizer test
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include <cmath>
#include <cstring>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

#include "Parametrizer.hpp"
#include "expression/ParseError.hpp"

using namespace ParamExpr;

namespace {
bool is_kind(ParseError const &e, ParseErrorKind kind) { return e.kind() == kind; }
double natural_log(double x) { return std::log(x); }

struct QuietLog {
    QuietLog() {
        boost::log::core::get()->set_filter(boost::log::trivial::severity >=
                                            boost::log::trivial::warning);
    }
};
} // namespace

BOOST_GLOBAL_FIXTURE(QuietLog);

BOOST_AUTO_TEST_CASE(integration1) {
    std::string expr = "cbrt(t/2 + sqrt(t^2/4 + 1/24))";
    double t = 2.0;

    Parametrizer parser(expr);

    double result = 0;
    BOOST_CHECK_NO_THROW(result = parser.evaluate(t));

    double expected = std::cbrt(t/2. + std::sqrt(std::pow(t,2.)/4. + 1./24.));
    BOOST_CHECK_CLOSE_FRACTION(result, expected, std::numeric_limits<double>::epsilon());
}

BOOST_AUTO_TEST_CASE(integration2) {
    std::string expr = "(";

    // Parsing should fail
    BOOST_CHECK_THROW(Parametrizer{expr}, std::runtime_error);
}

BOOST_AUTO_TEST_CASE(integration3) {
    Parametrizer parser;

    // Missing expression evaluates to zero
    BOOST_CHECK_EQUAL(parser.evaluate(5.), 0);
    BOOST_CHECK_EQUAL(parser.expression(), "0");
}

BOOST_AUTO_TEST_CASE(constants_and_parameter) {
    Parametrizer const c("1.35");
    Parametrizer const t("t");

    for (double x : {-7.5, 0.0, 2.0, 3.4, 1e300}) {
        BOOST_CHECK_EQUAL(c.evaluate(x), 1.35);
        BOOST_CHECK_EQUAL(t.evaluate(x), x);
    }
}

BOOST_AUTO_TEST_CASE(case_and_spaces) {
    BOOST_CHECK_EQUAL(Parametrizer("6 + T").evaluate(2.), 8.);
    BOOST_CHECK_EQUAL(Parametrizer(" Sin( t ) ").evaluate(1.), std::sin(1.));
}

BOOST_AUTO_TEST_CASE(specification_examples) {
    BOOST_CHECK_EQUAL(Parametrizer("2+3*4").evaluate(0.), 14.);
    BOOST_CHECK_EQUAL(Parametrizer("2^3^2").evaluate(0.), 512.);
    BOOST_CHECK_EQUAL(Parametrizer("(2+3)*4").evaluate(0.), 20.);
    BOOST_CHECK_EQUAL(Parametrizer("1/0").evaluate(0.),
                      std::numeric_limits<double>::infinity());
    BOOST_CHECK(std::isnan(Parametrizer("sqrt(-1)").evaluate(0.)));
}

BOOST_AUTO_TEST_CASE(composed_term_matches_parsed) {
    auto const t = parameter();
    Parametrizer const composed(
        add(constant(1.), multiply(multiply(constant(2.), t), t)));
    Parametrizer const parsed("1+2*t*t");

    BOOST_CHECK_EQUAL(composed.evaluate(3.), 19.);
    BOOST_CHECK_EQUAL(parsed.evaluate(3.), 19.);
    BOOST_CHECK_EQUAL(composed.expression(), "(1 + ((2 * t) * t))");
    BOOST_CHECK_EQUAL(parsed.expression(), "1+2*t*t");
}

BOOST_AUTO_TEST_CASE(printed_term_parses_back) {
    Parametrizer const original("-sin(t)^2 / (1 - 2.5*t) + exp(-t/3)");
    Parametrizer const reparsed(to_string(original.term()));

    for (double x : {-2.0, -0.5, 0.0, 0.1, 1.7, 9.0}) {
        BOOST_CHECK_EQUAL(original.evaluate(x), reparsed.evaluate(x));
    }
}

BOOST_AUTO_TEST_CASE(printed_constants_keep_every_digit) {
    for (double value : {-97570.19231092371, 123456789012345678., 0.1, 1e-300,
                         1.7976931348623157e308, 2.2250738585072014e-308}) {
        Parametrizer const p(constant(value));
        Parametrizer const q(p.expression());
        BOOST_CHECK_EQUAL(q.evaluate(0.), value);
    }

    BOOST_CHECK_EQUAL(Parametrizer("123456789012345678").evaluate(0.),
                      123456789012345678.);

    std::mt19937 generator(20170101);
    std::uniform_real_distribution<double> distribution(-1e6, 1e6);
    for (int i = 0; i < 10000; ++i) {
        double const a = distribution(generator);
        double const b = distribution(generator);
        Parametrizer const p(add(multiply(constant(a), parameter()), constant(b)));
        Parametrizer const q(p.expression());
        BOOST_REQUIRE_EQUAL(q.evaluate(0.5), p.evaluate(0.5));
        BOOST_REQUIRE_EQUAL(q.evaluate(-3.), p.evaluate(-3.));
    }
}

BOOST_AUTO_TEST_CASE(piecewise_term) {
    std::vector<std::pair<double, Term>> parts;
    parts.emplace_back(0., constant(2.));
    parts.emplace_back(2., constant(4.));
    parts.emplace_back(6., multiply(constant(2.), parameter()));
    Parametrizer const p(piecewise(std::move(parts)));

    BOOST_CHECK_EQUAL(p.evaluate(1.), 2.);
    BOOST_CHECK_EQUAL(p.evaluate(5.), 4.);
    BOOST_CHECK_EQUAL(p.evaluate(9.), 18.);
    BOOST_CHECK_EQUAL(p.expression(), "piecewise{0: 2, 2: 4, 6: (2 * t)}");
    // The display form is not an expression
    BOOST_CHECK_THROW(Parametrizer{p.expression()}, ParseError);
}

BOOST_AUTO_TEST_CASE(malformed_input) {
    BOOST_CHECK_EXCEPTION(Parametrizer{""}, ParseError,
        [](ParseError const &e) { return is_kind(e, ParseErrorKind::EmptyExpression); });
    BOOST_CHECK_EXCEPTION(Parametrizer{"(1+2"}, ParseError,
        [](ParseError const &e) { return is_kind(e, ParseErrorKind::UnmatchedParenthesis); });
    BOOST_CHECK_EXCEPTION(Parametrizer{"1+"}, ParseError,
        [](ParseError const &e) { return is_kind(e, ParseErrorKind::UnexpectedToken); });
    BOOST_CHECK_EXCEPTION(Parametrizer{"1 2"}, ParseError,
        [](ParseError const &e) { return is_kind(e, ParseErrorKind::UnexpectedToken); });
    BOOST_CHECK_EXCEPTION(Parametrizer{"foo(1)"}, ParseError,
        [](ParseError const &e) { return is_kind(e, ParseErrorKind::UnknownFunction); });
    BOOST_CHECK_EXCEPTION(Parametrizer{"1 ? 2"}, ParseError,
        [](ParseError const &e) { return is_kind(e, ParseErrorKind::InvalidToken); });
}

BOOST_AUTO_TEST_CASE(user_defined_functions) {
    ParserOptions options;
    options.functions.add("LOG", natural_log);
    options.functions.add("square", [](double x) { return x * x; });

    Parametrizer const p("Log( square(t) + 3 )", options);

    BOOST_CHECK_EQUAL(p.evaluate(2.), std::log(7.));
    BOOST_CHECK_EQUAL(p.evaluate(5.), std::log(28.));
}

BOOST_AUTO_TEST_CASE(repeated_evaluation_is_bit_identical) {
    Parametrizer const p("sin(t)^2 + cos(t)^2 - t/7");

    double const first = p.evaluate(0.123);
    for (int i = 0; i < 100; ++i) {
        double const again = p.evaluate(0.123);
        BOOST_CHECK_EQUAL(std::memcmp(&first, &again, sizeof(double)), 0);
    }
}

BOOST_AUTO_TEST_CASE(concurrent_evaluation) {
    Parametrizer const p("1 + 5*t + 25*t*t");
    std::vector<double> results(8, 0.);

    std::vector<std::thread> workers;
    for (std::size_t i = 0; i < results.size(); ++i) {
        workers.emplace_back([&p, &results, i]() {
            double sum = 0.;
            for (int k = 0; k < 1000; ++k)
                sum += p.evaluate(0.001 * k);
            results[i] = sum;
        });
    }
    for (auto &worker : workers)
        worker.join();

    for (auto const r : results)
        BOOST_CHECK_EQUAL(r, results.front());
}
