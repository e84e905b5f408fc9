/*
 * Isomorph - Deep structural equality for dynamically typed values
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#pragma once

#include "isomorph/value.hpp"
#include "isomorph/exceptions.hpp"
#include "isomorph/source_location.hpp"
#include "isomorph/stl/unordered_map.hpp"
#include "isomorph/stl/vector.hpp"

#include <istream>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file literal_parser.hpp
 * Reader of the literal notation
 *
 * \ingroup literal
 */


namespace iso {

/**
 * Parser of values written in literal notation (the notation produced by
 * iso::write())
 *
 * Datum labels (`#N=` / `#N#`) are scoped to a single parsed value. Functions
 * (`#fn<name>`) are interned per parser: the same name read twice by one
 * parser yields the same function, so that two inputs read by one parser can
 * share callables.
 *
 * \ingroup literal
 */
class literal_parser {
  public:
  /**
   * Parse exactly one value
   *
   * \throws iso::parse_error On malformed input or trailing text
   */
  value
  parse(std::string_view input, std::string_view source_name = "<string>");

  value
  parse(std::istream &input, std::string_view source_name = "<stream>");

  /**
   * Parse a sequence of values
   */
  stl::vector<value>
  parse_all(std::string_view input, std::string_view source_name = "<string>");

  stl::vector<value>
  parse_all(std::istream &input, std::string_view source_name = "<stream>");

  /**
   * Token representation for the lexical analyzer
   *
   * \ingroup literal
   */
  struct token {
    enum class type {
      LBRACKET,   // [
      RBRACKET,   // ]
      LBRACE,     // {
      RBRACE,     // }
      LPAREN,     // (
      RPAREN,     // )
      COMMA,      // ,
      COLON,      // :
      ARROW,      // =>
      STRING,     // "text" (value holds the unescaped text)
      NUMBER,     // 1.5, -0, 0x10, -Infinity
      BIGINT,     // 42n (value holds the digits without the suffix)
      IDENTIFIER, // undefined, NaN, property names
      DIRECTIVE,  // #set, #map, #sym.for, ... (value holds the word)
      FUNCTION,   // #fn<name> (value holds the name)
      LABEL_DEF,  // #0= (value holds the number)
      LABEL_REF,  // #0# (value holds the number)
      REGEXP,     // /source/flags
      END,        // end of input
    };
    type type;
    std::string value;
    source_location location;
  };

  /**
   * Split input into tokens; the last token is always END
   */
  std::vector<token>
  tokenize(std::string_view input, std::string_view source_name = "<string>");

  private:
  value
  _parse_value(const std::vector<token> &tokens, size_t &pos);

  value
  _parse_array(const std::vector<token> &tokens, size_t &pos, long label);

  value
  _parse_object(const std::vector<token> &tokens, size_t &pos,
                const prototype *proto, long label);

  void
  _parse_properties(const std::vector<token> &tokens, size_t &pos, value o);

  value
  _parse_key(const std::vector<token> &tokens, size_t &pos);

  value
  _parse_directive(const std::vector<token> &tokens, size_t &pos, long label);

  value
  _parse_typed_array(const std::vector<token> &tokens, size_t &pos,
                     element_kind kind);

  value
  _parse_scalar(const token &tok);

  value
  _parse_number(const token &tok);

  value
  _parse_bigint(const token &tok);

  const token&
  _expect(const std::vector<token> &tokens, size_t &pos, enum token::type type,
          std::string_view what);

  void
  _define_label(long label, const token &tok, value val);

  [[noreturn]] void
  _throw(const source_location &location, std::string_view message) const;

  std::string m_text;
  stl::unordered_map<size_t, object*> m_labels;
  stl::unordered_map<std::string, object*> m_functions;
}; // class iso::literal_parser


/**
 * Malformed literal notation
 *
 * \ingroup literal
 */
struct parse_error: public bad_value {
  parse_error(std::string_view what, source_location location,
              std::string line_text)
  : bad_value {what},
    m_location {std::move(location)},
    m_line_text {std::move(line_text)}
  { }

  [[nodiscard]] const source_location&
  location() const noexcept
  { return m_location; }

  using bad_value::display;

  void
  display(std::ostream &os) const noexcept override;

  private:
  source_location m_location;
  std::string m_line_text;
}; // struct iso::parse_error

} // namespace iso
