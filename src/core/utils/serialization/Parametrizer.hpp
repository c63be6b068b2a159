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
#ifndef SERIALIZATION_PARAMETRIZER_HPP
#define SERIALIZATION_PARAMETRIZER_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include <boost/serialization/split_free.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#include "Parametrizer.hpp"
#include "expression/ParseError.hpp"
#include "expression/Tokenizer.hpp"

/* Only the expression text, the parameter name and the names of the
   called user functions are stored, the term is rebuilt by parsing on
   load.  Function pointers cannot be archived, so loading knows the
   built-in functions only and throws ParamExpr::ParseError if the
   expression called user functions, including user overrides of
   built-in names.  Piecewise terms have no expression text and cannot
   be saved. */
namespace boost {
namespace serialization {
template <typename Archive>
void load(Archive &ar, ParamExpr::Parametrizer &p,
          const unsigned int /* file_version */) {
  std::string expression;
  std::string parameter;
  std::vector<std::string> functions;
  ar >> expression;
  ar >> parameter;
  ar >> functions;

  if (!functions.empty()) {
    auto const &name = functions.front();
    std::size_t position = 0;
    for (auto const &token : ParamExpr::tokenize(expression, parameter)) {
      if (token.type == ParamExpr::TokenType::Identifier &&
          token.text == name) {
        position = token.position;
        break;
      }
    }
    throw ParamExpr::ParseError(ParamExpr::ParseErrorKind::UnknownFunction,
                                position, name,
                                "user function '" + name +
                                    "' cannot be restored from an archive");
  }

  ParamExpr::ParserOptions options;
  options.parameter = parameter;

  p = ParamExpr::Parametrizer(expression, options);
}

template <typename Archive>
void save(Archive &ar, ParamExpr::Parametrizer const &p,
          const unsigned int /* file_version */) {
  if (!ParamExpr::has_expression_syntax(p.term())) {
    throw std::invalid_argument("Cannot save '" + p.expression() +
                                "', it has no expression syntax");
  }
  std::vector<std::string> const functions =
      ParamExpr::user_functions(p.term());
  ar << p.expression();
  ar << p.parameter();
  ar << functions;
}

template <class Archive>
void serialize(Archive &ar, ParamExpr::Parametrizer &p,
               const unsigned int file_version) {
  split_free(ar, p, file_version);
}
}
}

#endif
