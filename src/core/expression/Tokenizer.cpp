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
#include <string>
#include <vector>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/spirit/home/x3.hpp>

#include "ParseError.hpp"
#include "Tokenizer.hpp"

namespace ParamExpr
{

namespace
{

namespace x3 = boost::spirit::x3;

/* Lexeme grammar of numeric literals.  Spirit only delimits the literal,
   boost::lexical_cast converts it with correct rounding. */
auto const mantissa = (+x3::digit >> -('.' >> *x3::digit)) | ('.' >> +x3::digit);
auto const exponent = x3::char_("eE") >> -x3::char_("+-") >> +x3::digit;

bool is_identifier_start(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_identifier_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

class Lexer
{
    std::string const &m_source;
    std::string const m_parameter;
    std::string::const_iterator m_pos;
public:
    Lexer(std::string const &source, std::string const &parameter)
        : m_source(source), m_parameter(boost::algorithm::to_lower_copy(parameter)),
          m_pos(source.begin())
    {}

    std::vector<Token> run()
    {
        std::vector<Token> tokens;
        while (skip_whitespace()) {
            tokens.push_back(next());
        }
        tokens.push_back({TokenType::End, 0.0, "", offset()});
        return tokens;
    }

private:
    std::size_t offset() const
    {
        return static_cast<std::size_t>(m_pos - m_source.begin());
    }

    /* Returns false once the input is exhausted. */
    bool skip_whitespace()
    {
        while (m_pos != m_source.end() &&
               std::isspace(static_cast<unsigned char>(*m_pos))) {
            ++m_pos;
        }
        return m_pos != m_source.end();
    }

    Token single(TokenType type)
    {
        Token token{type, 0.0, std::string(1, *m_pos), offset()};
        ++m_pos;
        return token;
    }

    Token next()
    {
        switch (*m_pos) {
        case '+':
            return single(TokenType::Plus);
        case '-':
            return single(TokenType::Minus);
        case '*':
            return single(TokenType::Star);
        case '/':
            return single(TokenType::Slash);
        case '^':
            return single(TokenType::Caret);
        case '(':
            return single(TokenType::LParen);
        case ')':
            return single(TokenType::RParen);
        default:
            break;
        }

        if (std::isdigit(static_cast<unsigned char>(*m_pos)) || *m_pos == '.') {
            return number();
        }
        if (is_identifier_start(*m_pos)) {
            return identifier();
        }

        throw ParseError(ParseErrorKind::InvalidToken, offset(),
                         std::string(1, *m_pos),
                         "unrecognized character '" + std::string(1, *m_pos) + "'");
    }

    /* Extent of a rejected literal, for the error message. */
    std::string::const_iterator malformed_end(std::string::const_iterator last) const
    {
        while (last != m_source.end()) {
            char const c = *last;
            bool const sign = (c == '+' || c == '-') &&
                              (*(last - 1) == 'e' || *(last - 1) == 'E');
            if (!(std::isdigit(static_cast<unsigned char>(c)) || c == '.' ||
                  c == 'e' || c == 'E' || sign)) {
                break;
            }
            ++last;
        }
        return last;
    }

    Token number()
    {
        auto const start = offset();
        auto last = m_pos;

        bool ok = x3::parse(last, m_source.end(), mantissa);
        if (ok && last != m_source.end() && (*last == 'e' || *last == 'E')) {
            ok = x3::parse(last, m_source.end(), exponent);
        }
        /* A second decimal point directly after the literal, as in "1.2.3",
           means the literal as a whole is malformed. */
        if (!ok || (last != m_source.end() && *last == '.')) {
            auto const text = std::string(m_pos, malformed_end(last));
            throw ParseError(ParseErrorKind::InvalidToken, start, text,
                             "malformed number literal '" + text + "'");
        }

        auto const text = std::string(m_pos, last);
        double value = 0.0;
        try {
            value = boost::lexical_cast<double>(text);
        } catch (boost::bad_lexical_cast const &) {
            throw ParseError(ParseErrorKind::InvalidToken, start, text,
                             "number literal '" + text + "' is out of range");
        }

        m_pos = last;
        return {TokenType::Number, value, text, start};
    }

    Token identifier()
    {
        auto const start = offset();
        auto last = m_pos;
        while (last != m_source.end() && is_identifier_char(*last)) {
            ++last;
        }

        auto name = boost::algorithm::to_lower_copy(std::string(m_pos, last));
        m_pos = last;

        if (name == m_parameter) {
            return {TokenType::Parameter, 0.0, name, start};
        }
        return {TokenType::Identifier, 0.0, name, start};
    }
};

} // namespace

std::vector<Token> tokenize(std::string const &input, std::string const &parameter)
{
    return Lexer(input, parameter).run();
}

} // namespace ParamExpr
