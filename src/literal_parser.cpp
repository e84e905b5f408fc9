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


#include "isomorph/literal_parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <iterator>
#include <limits>


namespace {

/**
 * Character cursor keeping track of line and column
 */
struct scanner {
  std::string_view text;
  std::string_view source;
  size_t offset = 0;
  size_t line = 1;
  size_t column = 1;

  bool
  eof() const noexcept
  { return offset >= text.size(); }

  char
  peek(size_t ahead = 0) const noexcept
  { return offset + ahead < text.size() ? text[offset + ahead] : '\0'; }

  char
  get() noexcept
  {
    const char c = text[offset++];
    if (c == '\n')
    {
      line += 1;
      column = 1;
    }
    else
      column += 1;
    return c;
  }

  iso::source_location
  location() const
  { return {std::string(source), offset, line, column}; }
}; // struct scanner


bool
_is_identifier_start(char c) noexcept
{ return std::isalpha(static_cast<unsigned char>(c)) or c == '_' or c == '$'; }

bool
_is_identifier_char(char c) noexcept
{ return std::isalnum(static_cast<unsigned char>(c)) or c == '_' or c == '$'; }

bool
_is_digit(char c) noexcept
{ return c >= '0' and c <= '9'; }

int
_hex_digit(char c) noexcept
{
  if (c >= '0' and c <= '9') return c - '0';
  if (c >= 'a' and c <= 'f') return c - 'a' + 10;
  if (c >= 'A' and c <= 'F') return c - 'A' + 10;
  return -1;
}


/**
 * Parse a decimal, hexadecimal or infinite number literal
 */
bool
_read_double(std::string_view text, double &result)
{
  bool negative = false;
  if (not text.empty() and (text[0] == '-' or text[0] == '+'))
  {
    negative = text[0] == '-';
    text.remove_prefix(1);
  }
  if (text.empty())
    return false;

  double magnitude;
  if (text == "Infinity")
    magnitude = std::numeric_limits<double>::infinity();
  else if (text.starts_with("0x") or text.starts_with("0X"))
  {
    text.remove_prefix(2);
    if (text.empty())
      return false;
    magnitude = 0;
    for (const char c : text)
    {
      const int digit = _hex_digit(c);
      if (digit < 0)
        return false;
      magnitude = magnitude * 16 + digit;
    }
  }
  else
  {
    // from_chars would also take "inf" and "nan"
    if (not (_is_digit(text[0]) or text[0] == '.'))
      return false;
    const char *end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, magnitude);
    if (ec != std::errc {} or ptr != end)
      return false;
  }

  result = negative ? -magnitude : magnitude;
  return true;
}

} // anonymous namespace


void
iso::parse_error::display(std::ostream &os) const noexcept
{
  os << display_location(m_location, m_line_text, "\e[38;5;1;1m") << '\n'
     << what();
}


[[noreturn]] void
iso::literal_parser::_throw(const source_location &location,
                            std::string_view message) const
{
  // Text of the line containing the location
  size_t begin = std::min(location.offset, m_text.size());
  while (begin > 0 and m_text[begin - 1] != '\n')
    begin -= 1;
  size_t end = m_text.find('\n', begin);
  if (end == std::string::npos)
    end = m_text.size();
  throw parse_error {message, location, m_text.substr(begin, end - begin)};
}


std::vector<iso::literal_parser::token>
iso::literal_parser::tokenize(std::string_view input,
                              std::string_view source_name)
{
  m_text = input;

  std::vector<token> tokens;
  scanner s {input, source_name};

  auto push = [&](enum token::type type, std::string text,
                  const source_location &loc) {
    tokens.push_back({type, std::move(text), loc});
  };

  while (not s.eof())
  {
    const char c = s.peek();

    // Skip whitespace
    if (std::isspace(static_cast<unsigned char>(c)))
    {
      s.get();
      continue;
    }

    // Handle comments (semicolon to end of line)
    if (c == ';')
    {
      while (not s.eof() and s.peek() != '\n')
        s.get();
      continue;
    }

    const source_location loc = s.location();

    // Punctuation
    switch (c)
    {
      case '[': s.get(); push(token::type::LBRACKET, "[", loc); continue;
      case ']': s.get(); push(token::type::RBRACKET, "]", loc); continue;
      case '{': s.get(); push(token::type::LBRACE, "{", loc); continue;
      case '}': s.get(); push(token::type::RBRACE, "}", loc); continue;
      case '(': s.get(); push(token::type::LPAREN, "(", loc); continue;
      case ')': s.get(); push(token::type::RPAREN, ")", loc); continue;
      case ',': s.get(); push(token::type::COMMA, ",", loc); continue;
      case ':': s.get(); push(token::type::COLON, ":", loc); continue;
      default: break;
    }

    if (c == '=' and s.peek(1) == '>')
    {
      s.get();
      s.get();
      push(token::type::ARROW, "=>", loc);
      continue;
    }

    // Handle strings
    if (c == '"')
    {
      s.get();
      std::string text;
      while (true)
      {
        if (s.eof() or s.peek() == '\n')
          _throw(loc, "unterminated string literal");

        const char ch = s.get();
        if (ch == '"')
          break;
        if (ch != '\\')
        {
          text += ch;
          continue;
        }

        const source_location escloc = s.location();
        if (s.eof())
          _throw(loc, "unterminated string literal");
        switch (const char esc = s.get())
        {
          case 'n': text += '\n'; break;
          case 't': text += '\t'; break;
          case 'r': text += '\r'; break;
          case '0': text += '\0'; break;
          case '"':
          case '\\':
          case '/':
            text += esc;
            break;
          case 'x': {
            const int hi = _hex_digit(s.peek());
            const int lo = _hex_digit(s.peek(1));
            if (hi < 0 or lo < 0)
              _throw(escloc, "invalid \\x escape");
            s.get();
            s.get();
            text += static_cast<char>(hi * 16 + lo);
            break;
          }
          default:
            _throw(escloc, std::format("unknown escape sequence '\\{}'", esc));
        }
      }
      push(token::type::STRING, std::move(text), loc);
      continue;
    }

    // Handle regular expressions
    if (c == '/')
    {
      s.get();
      std::string text {"/"};
      bool in_class = false;
      while (true)
      {
        if (s.eof() or s.peek() == '\n')
          _throw(loc, "unterminated regular expression");
        const char ch = s.get();
        text += ch;
        if (ch == '\\')
        {
          if (s.eof() or s.peek() == '\n')
            _throw(loc, "unterminated regular expression");
          text += s.get();
        }
        else if (ch == '[')
          in_class = true;
        else if (ch == ']')
          in_class = false;
        else if (ch == '/' and not in_class)
          break;
      }
      while (std::isalpha(static_cast<unsigned char>(s.peek())))
        text += s.get();
      push(token::type::REGEXP, std::move(text), loc);
      continue;
    }

    // Handle labels, functions and directives
    if (c == '#')
    {
      s.get();
      if (_is_digit(s.peek()))
      {
        std::string number;
        while (_is_digit(s.peek()))
          number += s.get();
        if (s.peek() == '=')
        {
          s.get();
          push(token::type::LABEL_DEF, std::move(number), loc);
        }
        else if (s.peek() == '#')
        {
          s.get();
          push(token::type::LABEL_REF, std::move(number), loc);
        }
        else
          _throw(s.location(), "expected '=' or '#' after datum label");
        continue;
      }

      std::string word;
      while (_is_identifier_char(s.peek()) or
             (s.peek() == '.' and _is_identifier_start(s.peek(1))))
        word += s.get();
      if (word.empty())
        _throw(loc, "expected a directive after '#'");

      if (word == "fn")
      {
        if (s.peek() != '<')
          _throw(s.location(), "expected '<' after #fn");
        s.get();
        std::string name;
        while (not s.eof() and s.peek() != '>' and s.peek() != '\n')
          name += s.get();
        if (s.peek() != '>')
          _throw(loc, "unterminated function name");
        s.get();
        push(token::type::FUNCTION, std::move(name), loc);
        continue;
      }

      push(token::type::DIRECTIVE, std::move(word), loc);
      continue;
    }

    // Handle numbers and big integers
    if (_is_digit(c) or
        (c == '.' and _is_digit(s.peek(1))) or
        ((c == '-' or c == '+') and
         (_is_digit(s.peek(1)) or s.peek(1) == '.' or s.peek(1) == 'I')))
    {
      std::string text;
      text += s.get();
      if ((text[0] == '-' or text[0] == '+') and s.peek() == 'I')
      {
        // Signed infinity
        while (_is_identifier_char(s.peek()))
          text += s.get();
        push(token::type::NUMBER, std::move(text), loc);
        continue;
      }

      const bool hex = s.peek() == 'x' or s.peek() == 'X' or
                       (s.peek() == '0' and (s.peek(1) == 'x' or s.peek(1) == 'X'));
      while (true)
      {
        const char ch = s.peek();
        const char prev = text.back();
        if (_is_identifier_char(ch) or ch == '.')
          text += s.get();
        else if ((ch == '+' or ch == '-') and not hex and
                 (prev == 'e' or prev == 'E'))
          text += s.get();
        else
          break;
      }

      if (text.back() == 'n')
      {
        text.pop_back();
        push(token::type::BIGINT, std::move(text), loc);
      }
      else
        push(token::type::NUMBER, std::move(text), loc);
      continue;
    }

    // Handle identifiers
    if (_is_identifier_start(c))
    {
      std::string word;
      while (_is_identifier_char(s.peek()))
        word += s.get();
      push(token::type::IDENTIFIER, std::move(word), loc);
      continue;
    }

    _throw(loc, std::format("unexpected character '{}'", c));
  }

  push(token::type::END, "", s.location());
  return tokens;
}


const iso::literal_parser::token&
iso::literal_parser::_expect(const std::vector<token> &tokens, size_t &pos,
                             enum token::type type, std::string_view what)
{
  const token &tok = tokens[pos];
  if (tok.type != type)
  {
    if (tok.type == token::type::END)
      _throw(tok.location, std::format("expected {}, got end of input", what));
    _throw(tok.location, std::format("expected {}, got '{}'", what, tok.value));
  }
  pos += 1;
  return tok;
}


void
iso::literal_parser::_define_label(long label, const token &tok, value val)
{
  if (label < 0)
    return;
  if (not m_labels.emplace(size_t(label), &*val).second)
    _throw(tok.location, std::format("datum label #{} is already defined", label));
}


iso::value
iso::literal_parser::_parse_number(const token &tok)
{
  double result;
  if (not _read_double(tok.value, result))
    _throw(tok.location, std::format("invalid number '{}'", tok.value));
  return num(result);
}


iso::value
iso::literal_parser::_parse_bigint(const token &tok)
{
  try
  {
    return bigint(tok.value);
  }
  catch (const bad_value&)
  {
    _throw(tok.location, std::format("invalid big integer '{}n'", tok.value));
  }
}


iso::value
iso::literal_parser::_parse_scalar(const token &tok)
{
  switch (tok.type)
  {
    case token::type::STRING: return str(tok.value);
    case token::type::NUMBER: return _parse_number(tok);
    case token::type::BIGINT: return _parse_bigint(tok);
    default: break;
  }

  if (tok.value == "undefined") return undefined;
  if (tok.value == "null") return null;
  if (tok.value == "true") return True;
  if (tok.value == "false") return False;
  if (tok.value == "NaN") return num(std::numeric_limits<double>::quiet_NaN());
  if (tok.value == "Infinity") return num(std::numeric_limits<double>::infinity());
  _throw(tok.location, std::format("unexpected identifier '{}'", tok.value));
}


iso::value
iso::literal_parser::_parse_array(const std::vector<token> &tokens,
                                  size_t &pos, long label)
{
  const value result = make_array(0);
  _define_label(label, tokens[pos - 1], result);

  while (tokens[pos].type != token::type::RBRACKET)
  {
    if (tokens[pos].type == token::type::COMMA)
    {
      // Empty slot
      pos += 1;
      array_resize(result, array_length(result) + 1);
      continue;
    }

    array_push(result, _parse_value(tokens, pos));
    if (tokens[pos].type == token::type::RBRACKET)
      break;
    _expect(tokens, pos, token::type::COMMA, "',' or ']'");
  }
  pos += 1;
  return result;
}


iso::value
iso::literal_parser::_parse_key(const std::vector<token> &tokens, size_t &pos)
{
  const token &tok = tokens[pos];
  switch (tok.type)
  {
    case token::type::IDENTIFIER:
    case token::type::STRING:
    case token::type::NUMBER:
      pos += 1;
      return str(tok.value);

    case token::type::LBRACKET: {
      pos += 1;
      const value key = _parse_value(tokens, pos);
      if (not iskey(key))
        _throw(tok.location, "computed property key must be a string or a symbol");
      _expect(tokens, pos, token::type::RBRACKET, "']'");
      return key;
    }

    default:
      _expect(tokens, pos, token::type::IDENTIFIER, "property name");
      return undefined; // unreachable
  }
}


void
iso::literal_parser::_parse_properties(const std::vector<token> &tokens,
                                       size_t &pos, value o)
{
  _expect(tokens, pos, token::type::LBRACE, "'{'");
  while (tokens[pos].type != token::type::RBRACE)
  {
    const value key = _parse_key(tokens, pos);
    _expect(tokens, pos, token::type::COLON, "':'");
    set_property(o, key, _parse_value(tokens, pos));
    if (tokens[pos].type == token::type::RBRACE)
      break;
    _expect(tokens, pos, token::type::COMMA, "',' or '}'");
  }
  pos += 1;
}


iso::value
iso::literal_parser::_parse_object(const std::vector<token> &tokens,
                                   size_t &pos, const prototype *proto,
                                   long label)
{
  const value result = obj({}, proto);
  _define_label(label, tokens[pos], result);
  _parse_properties(tokens, pos, result);
  return result;
}


iso::value
iso::literal_parser::_parse_typed_array(const std::vector<token> &tokens,
                                        size_t &pos, element_kind kind)
{
  _expect(tokens, pos, token::type::LBRACKET, "'['");

  std::vector<const token*> elements;
  while (tokens[pos].type != token::type::RBRACKET)
  {
    elements.push_back(&tokens[pos]);
    pos += 1;
    if (tokens[pos].type == token::type::RBRACKET)
      break;
    _expect(tokens, pos, token::type::COMMA, "',' or ']'");
  }
  pos += 1;

  const value result = typed_array(kind, elements.size());
  for (size_t i = 0; i < elements.size(); ++i)
  {
    const token &tok = *elements[i];
    if (is_bigint_kind(kind))
    {
      if (tok.type != token::type::BIGINT)
        _throw(tok.location, "expected a big integer element");
      typed_array_set_bigint(result, i, _parse_bigint(tok));
    }
    else
    {
      double x;
      if (tok.type == token::type::IDENTIFIER and tok.value == "NaN")
        x = std::numeric_limits<double>::quiet_NaN();
      else if (tok.type == token::type::IDENTIFIER and tok.value == "Infinity")
        x = std::numeric_limits<double>::infinity();
      else if (tok.type == token::type::NUMBER)
        x = num_val(_parse_number(tok));
      else
        _throw(tok.location, "expected a number element");
      typed_array_set(result, i, x);
    }
  }
  return result;
}


iso::value
iso::literal_parser::_parse_directive(const std::vector<token> &tokens,
                                      size_t &pos, long label)
{
  const token &tok = tokens[pos++];
  const std::string &word = tok.value;

  if (word == "null")
    return _parse_object(tokens, pos, nullptr, label);

  if (word == "class")
  {
    _expect(tokens, pos, token::type::LPAREN, "'('");
    const token &name = _expect(tokens, pos, token::type::IDENTIFIER, "class name");
    _expect(tokens, pos, token::type::RPAREN, "')'");
    return _parse_object(tokens, pos, named_prototype(name.value), label);
  }

  if (word == "set")
  {
    const value result = set();
    _define_label(label, tok, result);
    _expect(tokens, pos, token::type::LBRACKET, "'['");
    while (tokens[pos].type != token::type::RBRACKET)
    {
      set_add(result, _parse_value(tokens, pos));
      if (tokens[pos].type == token::type::RBRACKET)
        break;
      _expect(tokens, pos, token::type::COMMA, "',' or ']'");
    }
    pos += 1;
    return result;
  }

  if (word == "map")
  {
    const value result = map();
    _define_label(label, tok, result);
    _expect(tokens, pos, token::type::LBRACE, "'{'");
    while (tokens[pos].type != token::type::RBRACE)
    {
      const value key = _parse_value(tokens, pos);
      _expect(tokens, pos, token::type::ARROW, "'=>'");
      map_set(result, key, _parse_value(tokens, pos));
      if (tokens[pos].type == token::type::RBRACE)
        break;
      _expect(tokens, pos, token::type::COMMA, "',' or '}'");
    }
    pos += 1;
    return result;
  }

  if (word == "date")
  {
    _expect(tokens, pos, token::type::LPAREN, "'('");
    const token &ms = _expect(tokens, pos, token::type::NUMBER, "milliseconds");
    _expect(tokens, pos, token::type::RPAREN, "')'");

    std::string_view digits = ms.value;
    if (digits.starts_with('+'))
      digits.remove_prefix(1);
    std::int64_t epoch_ms;
    const char *end = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(digits.data(), end, epoch_ms);
    if (ec != std::errc {} or ptr != end)
      _throw(ms.location, std::format("invalid date '{}'", ms.value));

    const value result = date(epoch_ms);
    _define_label(label, tok, result);
    return result;
  }

  if (word == "box")
  {
    _expect(tokens, pos, token::type::LPAREN, "'('");
    const size_t primpos = pos;
    const value primitive = _parse_value(tokens, pos);
    _expect(tokens, pos, token::type::RPAREN, "')'");
    if (not (isstr(primitive) or isnum(primitive) or isbool(primitive)))
      _throw(tokens[primpos].location, "only strings, numbers and booleans can be boxed");

    const value result = box(primitive);
    _define_label(label, tok, result);
    if (tokens[pos].type == token::type::LBRACE)
      _parse_properties(tokens, pos, result);
    return result;
  }

  if (word == "sym" or word == "sym.for")
  {
    _expect(tokens, pos, token::type::LPAREN, "'('");
    std::string description;
    if (tokens[pos].type != token::type::RPAREN)
      description = _expect(tokens, pos, token::type::STRING, "symbol description").value;
    _expect(tokens, pos, token::type::RPAREN, "')'");

    const value result = word == "sym" ? sym(description) : sym_for(description);
    _define_label(label, tok, result);
    return result;
  }

  element_kind kind;
  if (parse_element_kind(word, kind))
  {
    const value result = _parse_typed_array(tokens, pos, kind);
    _define_label(label, tok, result);
    return result;
  }

  _throw(tok.location, std::format("unknown directive '#{}'", word));
}


iso::value
iso::literal_parser::_parse_value(const std::vector<token> &tokens, size_t &pos)
{
  long label = -1;
  if (tokens[pos].type == token::type::LABEL_DEF)
  {
    const token &def = tokens[pos];
    if (def.value.size() > 9)
      _throw(def.location, "datum label is too large");
    label = std::stol(def.value);
    pos += 1;
    if (tokens[pos].type == token::type::LABEL_DEF or
        tokens[pos].type == token::type::LABEL_REF)
      _throw(tokens[pos].location, "expected a value after datum label");
  }

  const token &tok = tokens[pos];
  switch (tok.type)
  {
    case token::type::LBRACKET:
      pos += 1;
      return _parse_array(tokens, pos, label);

    case token::type::LBRACE:
      return _parse_object(tokens, pos, &object_prototype, label);

    case token::type::DIRECTIVE:
      return _parse_directive(tokens, pos, label);

    case token::type::LABEL_REF: {
      pos += 1;
      if (tok.value.size() > 9)
        _throw(tok.location, "datum label is too large");
      const auto it = m_labels.find(std::stoul(tok.value));
      if (it == m_labels.end())
        _throw(tok.location, std::format("undefined datum label #{}#", tok.value));
      return value {it->second};
    }

    case token::type::FUNCTION: {
      pos += 1;
      auto it = m_functions.find(tok.value);
      if (it == m_functions.end())
        it = m_functions.emplace(tok.value, &*fn(tok.value)).first;
      const value result {it->second};
      _define_label(label, tok, result);
      return result;
    }

    case token::type::REGEXP: {
      pos += 1;
      const size_t slash = tok.value.rfind('/');
      const std::string_view text = tok.value;
      try
      {
        const value result = regexp(text.substr(1, slash - 1), text.substr(slash + 1));
        _define_label(label, tok, result);
        return result;
      }
      catch (const bad_value &exn)
      {
        _throw(tok.location, exn.what());
      }
    }

    case token::type::STRING:
    case token::type::NUMBER:
    case token::type::BIGINT:
    case token::type::IDENTIFIER: {
      pos += 1;
      const value result = _parse_scalar(tok);
      _define_label(label, tok, result);
      return result;
    }

    case token::type::END:
      _throw(tok.location, "expected a value, got end of input");

    default:
      _throw(tok.location, std::format("unexpected '{}'", tok.value));
  }
}


iso::value
iso::literal_parser::parse(std::string_view input, std::string_view source_name)
{
  const std::vector<token> tokens = tokenize(input, source_name);
  size_t pos = 0;
  m_labels.clear();
  const value result = _parse_value(tokens, pos);
  if (tokens[pos].type != token::type::END)
    _throw(tokens[pos].location, "unexpected text after value");
  return result;
}


iso::value
iso::literal_parser::parse(std::istream &input, std::string_view source_name)
{
  const std::string text {std::istreambuf_iterator<char> {input}, {}};
  return parse(text, source_name);
}


iso::stl::vector<iso::value>
iso::literal_parser::parse_all(std::string_view input,
                               std::string_view source_name)
{
  const std::vector<token> tokens = tokenize(input, source_name);
  size_t pos = 0;

  stl::vector<value> result;
  while (tokens[pos].type != token::type::END)
  {
    m_labels.clear();
    result.push_back(_parse_value(tokens, pos));
  }
  return result;
}


iso::stl::vector<iso::value>
iso::literal_parser::parse_all(std::istream &input,
                               std::string_view source_name)
{
  const std::string text {std::istreambuf_iterator<char> {input}, {}};
  return parse_all(text, source_name);
}
