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


#include "isomorph/value.hpp"
#include "isomorph/ordered_table.hpp"
#include "isomorph/stl/unordered_map.hpp"

#include <cctype>
#include <cmath>
#include <format>
#include <sstream>


namespace {

using namespace iso;

/**
 * Writer of the literal notation
 *
 * Runs in two passes: the first one counts how many times each object is
 * reached, the second one prints, labeling objects reached more than once.
 */
class literal_writer {
  public:
  explicit literal_writer(std::ostream &os): m_os {os} { }

  void
  count_references(value x);

  void
  write(value x);

  private:
  void
  _write_number(double x);

  void
  _write_string(std::string_view text);

  void
  _write_key(value key);

  void
  _write_properties(const ordered_table &props);

  void
  _write_element(element_kind kind, value typed, size_t i);

  void
  _write_unlabeled(value x);

  std::ostream &m_os;
  stl::unordered_map<const object*, size_t> m_references;
  stl::unordered_map<const object*, size_t> m_labels;
}; // class literal_writer


/**
 * Whether sharing of \p x must be spelled out to survive reading it back
 */
bool
_has_identity(value x)
{
  if (issym(x))
    return not sym_registered(x);
  return not isprimitive(x);
}


bool
_is_identifier(std::string_view text)
{
  if (text.empty())
    return false;
  const auto alpha = [](char c) { return std::isalpha(static_cast<unsigned char>(c)); };
  const auto alnum = [](char c) { return std::isalnum(static_cast<unsigned char>(c)); };
  if (not (alpha(text[0]) or text[0] == '_' or text[0] == '$'))
    return false;
  for (const char c : text)
  {
    if (not (alnum(c) or c == '_' or c == '$'))
      return false;
  }
  return true;
}


void
literal_writer::count_references(value x)
{
  if (not _has_identity(x))
    return;

  if (m_references[&*x]++ > 0)
    return;

  switch (x->t)
  {
    case tag::array:
      for (object *slot : x->array->slots)
      {
        if (slot)
          count_references(value {slot});
      }
      break;

    case tag::set:
      for (const auto &entry : *x->set)
        count_references(value {entry.key});
      break;

    case tag::map:
      for (const auto &entry : *x->map)
      {
        count_references(value {entry.key});
        count_references(value {entry.val});
      }
      break;

    case tag::boxed:
    case tag::object:
      for (const auto &entry : isboxed(x) ? *x->boxed.props : *x->props)
      {
        count_references(value {entry.key});
        count_references(value {entry.val});
      }
      break;

    default:
      break;
  }
}


void
literal_writer::write(value x)
{
  if (_has_identity(x))
  {
    const auto it = m_labels.find(&*x);
    if (it != m_labels.end())
    {
      m_os << '#' << it->second << '#';
      return;
    }

    if (m_references[&*x] > 1)
    {
      const size_t label = m_labels.size();
      m_labels.emplace(&*x, label);
      m_os << '#' << label << '=';
    }
  }

  _write_unlabeled(x);
}


void
literal_writer::_write_number(double x)
{
  if (std::isnan(x))
    m_os << "NaN";
  else if (std::isinf(x))
    m_os << (x < 0 ? "-Infinity" : "Infinity");
  else if (x == 0 and std::signbit(x))
    m_os << "-0";
  else
    m_os << std::format("{}", x);
}


void
literal_writer::_write_string(std::string_view text)
{
  m_os.put('"');
  for (const char c : text)
  {
    switch (c)
    {
      case '"':
      case '\\':
        m_os.put('\\');
        m_os.put(c);
        break;

      case '\n': m_os << "\\n"; break;
      case '\t': m_os << "\\t"; break;
      case '\r': m_os << "\\r"; break;

      default:
        if (static_cast<unsigned char>(c) < 0x20 or c == 0x7f)
          m_os << std::format("\\x{:02x}", int(c));
        else
          m_os.put(c);
    }
  }
  m_os.put('"');
}


void
literal_writer::_write_key(value key)
{
  if (isstr(key) and _is_identifier(str_view(key)))
    m_os << str_view(key);
  else if (isstr(key))
    _write_string(str_view(key));
  else
  {
    m_os << '[';
    write(key);
    m_os << ']';
  }
}


void
literal_writer::_write_properties(const ordered_table &props)
{
  m_os << '{';
  bool first = true;
  for (const auto &entry : props)
  {
    if (not first)
      m_os << ", ";
    first = false;
    _write_key(value {entry.key});
    m_os << ": ";
    write(value {entry.val});
  }
  m_os << '}';
}


void
literal_writer::_write_element(element_kind kind, value typed, size_t i)
{
  if (is_bigint_kind(kind))
    m_os << bigint_digits(typed_array_get_bigint(typed, i)) << 'n';
  else
    _write_number(typed_array_get(typed, i));
}


void
literal_writer::_write_unlabeled(value x)
{
  switch (x->t)
  {
    case tag::undefined: m_os << "undefined"; break;
    case tag::null: m_os << "null"; break;
    case tag::boolean: m_os << (x->boolean ? "true" : "false"); break;
    case tag::num: _write_number(x->num); break;
    case tag::str: _write_string(str_view(x)); break;
    case tag::bigint: m_os << bigint_digits(x) << 'n'; break;

    case tag::sym:
      m_os << (sym_registered(x) ? "#sym.for(" : "#sym(");
      _write_string(sym_description(x));
      m_os << ')';
      break;

    case tag::function:
      m_os << "#fn<" << function_name(x) << '>';
      break;

    case tag::array: {
      const auto &slots = x->array->slots;
      m_os << '[';
      for (size_t i = 0; i < slots.size(); ++i)
      {
        if (i > 0)
          m_os << ", ";
        if (slots[i])
          write(value {slots[i]});
      }
      // A trailing hole needs its own comma
      if (not slots.empty() and slots.back() == nullptr)
        m_os << ',';
      m_os << ']';
      break;
    }

    case tag::date:
      m_os << "#date(" << x->date << ')';
      break;

    case tag::regexp:
      m_os << '/' << regexp_source(x) << '/' << regexp_flags(x);
      break;

    case tag::typed_array: {
      const element_kind kind = typed_array_kind(x);
      m_os << '#' << element_kind_name(kind) << '[';
      const size_t length = typed_array_length(x);
      for (size_t i = 0; i < length; ++i)
      {
        if (i > 0)
          m_os << ", ";
        _write_element(kind, x, i);
      }
      m_os << ']';
      break;
    }

    case tag::set: {
      m_os << "#set[";
      bool first = true;
      for (const auto &entry : *x->set)
      {
        if (not first)
          m_os << ", ";
        first = false;
        write(value {entry.key});
      }
      m_os << ']';
      break;
    }

    case tag::map: {
      m_os << "#map{";
      bool first = true;
      for (const auto &entry : *x->map)
      {
        if (not first)
          m_os << ", ";
        first = false;
        write(value {entry.key});
        m_os << " => ";
        write(value {entry.val});
      }
      m_os << '}';
      break;
    }

    case tag::boxed:
      m_os << "#box(";
      write(value {x->boxed.primitive});
      m_os << ')';
      if (not x->boxed.props->empty())
        _write_properties(*x->boxed.props);
      break;

    case tag::object:
      if (x->proto == nullptr)
        m_os << "#null";
      else if (x->proto != &object_prototype)
        m_os << "#class(" << x->proto->name << ')';
      _write_properties(*x->props);
      break;
  }
}

} // anonymous namespace


void
iso::write(std::ostream &os, value val)
{
  literal_writer writer {os};
  writer.count_references(val);
  writer.write(val);
}

std::string
iso::to_string(value val)
{
  std::ostringstream buf;
  write(buf, val);
  return buf.str();
}
