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
#include "isomorph/exceptions.hpp"
#include "isomorph/ordered_table.hpp"
#include "isomorph/stl/unordered_map.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <format>

using boost::multiprecision::cpp_int;


static std::string_view
_tag_name(iso::tag t) noexcept
{
  using iso::tag;
  switch (t)
  {
    case tag::undefined: return "undefined";
    case tag::null: return "null";
    case tag::boolean: return "boolean";
    case tag::num: return "number";
    case tag::str: return "string";
    case tag::sym: return "symbol";
    case tag::bigint: return "bigint";
    case tag::function: return "function";
    case tag::array: return "array";
    case tag::date: return "date";
    case tag::regexp: return "regexp";
    case tag::typed_array: return "typed-array";
    case tag::set: return "set";
    case tag::map: return "map";
    case tag::boxed: return "boxed";
    case tag::object: return "object";
  }
  return "unknown";
}


////////////////////////////////////////////////////////////////////////////////
//
//                            Element kinds
//
static constexpr struct {
  iso::element_kind kind;
  std::string_view name;
  size_t size;
} g_element_kinds[] = {
  {iso::element_kind::int8, "i8", 1},
  {iso::element_kind::uint8, "u8", 1},
  {iso::element_kind::uint8_clamped, "u8c", 1},
  {iso::element_kind::int16, "i16", 2},
  {iso::element_kind::uint16, "u16", 2},
  {iso::element_kind::int32, "i32", 4},
  {iso::element_kind::uint32, "u32", 4},
  {iso::element_kind::float32, "f32", 4},
  {iso::element_kind::float64, "f64", 8},
  {iso::element_kind::bigint64, "i64", 8},
  {iso::element_kind::biguint64, "u64", 8},
};

size_t
iso::element_size(element_kind kind) noexcept
{ return g_element_kinds[static_cast<size_t>(kind)].size; }

std::string_view
iso::element_kind_name(element_kind kind) noexcept
{ return g_element_kinds[static_cast<size_t>(kind)].name; }

bool
iso::parse_element_kind(std::string_view name, element_kind &kind) noexcept
{
  for (const auto &entry : g_element_kinds)
  {
    if (entry.name == name)
    {
      kind = entry.kind;
      return true;
    }
  }
  return false;
}


////////////////////////////////////////////////////////////////////////////////
//
//                              Primitives
//
static iso::value
_make_symbol(std::string_view description, bool registered)
{
  const std::string_view copy = iso::copy_string(description);
  iso::value ret {iso::make<iso::object>(iso::tag::sym)};
  ret->sym.data = const_cast<char*>(copy.data());
  ret->sym.len = copy.size();
  ret->sym.registered = registered;
  return ret;
}

iso::value
iso::sym(std::string_view description)
{ return _make_symbol(description, false); }


static iso::stl::unordered_map<std::string_view, iso::object*> g_symbol_registry;

iso::value
iso::sym_for(std::string_view key)
{
  const auto it = g_symbol_registry.find(key);
  if (it != g_symbol_registry.end())
    return value {it->second};

  const value ret = _make_symbol(key, true);
  g_symbol_registry.emplace(sym_description(ret), &*ret);
  return ret;
}


static iso::value
_make_bigint(const cpp_int &n)
{
  const std::string_view digits = iso::copy_string(n.str());
  iso::value ret {iso::make<iso::object>(iso::tag::bigint)};
  ret->bigint.data = const_cast<char*>(digits.data());
  ret->bigint.len = digits.size();
  return ret;
}

static cpp_int
_bigint_val(iso::value x)
{ return cpp_int {std::string {iso::bigint_digits(x)}.c_str()}; }

iso::value
iso::bigint(std::string_view literal)
{
  std::string_view text = literal;
  bool negative = false;
  if (not text.empty() and (text[0] == '-' or text[0] == '+'))
  {
    negative = text[0] == '-';
    text.remove_prefix(1);
  }

  // cpp_int reads a leading zero as an octal prefix; integer literals here
  // are decimal or hexadecimal only
  std::string digits;
  if (text.starts_with("0x") or text.starts_with("0X"))
  {
    if (text.size() == 2 or text.find_first_not_of("0123456789abcdefABCDEF", 2)
                                != std::string_view::npos)
      throw bad_value {std::format("invalid bigint literal '{}'", literal)};
    digits = "0x";
    digits += text.substr(2);
  }
  else
  {
    if (text.empty() or text.find_first_not_of("0123456789") != std::string_view::npos)
      throw bad_value {std::format("invalid bigint literal '{}'", literal)};
    const size_t first = text.find_first_not_of('0');
    digits = first == std::string_view::npos ? "0" : std::string {text.substr(first)};
  }

  cpp_int n {digits.c_str()};
  if (negative)
    n = -n;
  return _make_bigint(n);
}

iso::value
iso::bigint(long long val)
{ return _make_bigint(cpp_int {val}); }


bool
iso::strict_equals(value a, value b) noexcept
{
  if (is(a, b))
    return true;
  if (a->t != b->t)
    return false;

  switch (a->t)
  {
    case tag::num:
      return a->num == b->num;
    case tag::str:
      return str_view(a) == str_view(b);
    case tag::bigint:
      return bigint_digits(a) == bigint_digits(b);
    default:
      // Singletons, symbols and objects have identity
      return false;
  }
}

bool
iso::same_value_zero(value a, value b) noexcept
{
  if (isnum(a) and isnum(b) and std::isnan(a->num) and std::isnan(b->num))
    return true;
  return strict_equals(a, b);
}


////////////////////////////////////////////////////////////////////////////////
//
//                              Functions
//
iso::value
iso::fn(std::string_view name)
{
  const std::string_view copy = copy_string(name);
  value ret {make<object>(tag::function, &function_prototype)};
  ret->function = make<function_data>(copy.data(), copy.size());
  return ret;
}


////////////////////////////////////////////////////////////////////////////////
//
//                               Arrays
//
static iso::value
_make_array()
{
  iso::value ret {iso::make<iso::object>(iso::tag::array, &iso::array_prototype)};
  ret->array = iso::make<iso::array_data>();
  return ret;
}

static iso::array_data&
_array(iso::value x, const char *who)
{
  if (not iso::isarray(x))
    throw std::invalid_argument {std::format("{}() - not an array", who)};
  return *x->array;
}

iso::value
iso::array(std::initializer_list<array_slot> slots)
{
  const value ret = _make_array();
  ret->array->slots.reserve(slots.size());
  for (const array_slot &slot : slots)
    ret->array->slots.push_back(slot.ptr);
  return ret;
}

iso::value
iso::make_array(size_t length)
{
  const value ret = _make_array();
  ret->array->slots.resize(length, nullptr);
  return ret;
}

void
iso::array_set(value x, size_t i, value val)
{
  array_data &data = _array(x, "array_set");
  if (i >= data.slots.size())
    data.slots.resize(i + 1, nullptr);
  data.slots[i] = &*val;
}

void
iso::array_push(value x, value val)
{ _array(x, "array_push").slots.push_back(&*val); }

void
iso::array_delete(value x, size_t i)
{
  array_data &data = _array(x, "array_delete");
  if (i < data.slots.size())
    data.slots[i] = nullptr;
}

void
iso::array_resize(value x, size_t length)
{ _array(x, "array_resize").slots.resize(length, nullptr); }


////////////////////////////////////////////////////////////////////////////////
//
//                         Regular expressions
//
static constexpr std::string_view g_regexp_flags = "dgimsuvy";

iso::value
iso::regexp(std::string_view source, std::string_view flags)
{
  // Canonical flag order, each flag at most once
  bool present[g_regexp_flags.size()] = { };
  for (const char c : flags)
  {
    const size_t idx = g_regexp_flags.find(c);
    if (idx == std::string_view::npos)
      throw bad_value {std::format("invalid regexp flag '{}'", c)};
    if (present[idx])
      throw bad_value {std::format("repeated regexp flag '{}'", c)};
    present[idx] = true;
  }
  if (present[g_regexp_flags.find('u')] and present[g_regexp_flags.find('v')])
    throw bad_value {"regexp flags 'u' and 'v' are mutually exclusive"};

  std::string canonflags;
  for (size_t i = 0; i < g_regexp_flags.size(); ++i)
  {
    if (present[i])
      canonflags += g_regexp_flags[i];
  }

  // Escape the source the way a literal prints it
  std::string escaped;
  bool inclass = false;
  for (size_t i = 0; i < source.size(); ++i)
  {
    const char c = source[i];
    if (c == '\\' and i + 1 < source.size())
    {
      escaped += c;
      escaped += source[++i];
      continue;
    }
    if (c == '[')
      inclass = true;
    else if (c == ']')
      inclass = false;
    else if (c == '/' and not inclass)
      escaped += '\\';
    else if (c == '\n')
    {
      escaped += "\\n";
      continue;
    }
    escaped += c;
  }
  if (escaped.empty())
    escaped = "(?:)";

  const std::string_view srccopy = copy_string(escaped);
  const std::string_view flagscopy = copy_string(canonflags);
  value ret {make<object>(tag::regexp, &regexp_prototype)};
  ret->regexp = make<regexp_data>(srccopy.data(), srccopy.size(),
                                  flagscopy.data(), flagscopy.size());
  return ret;
}


////////////////////////////////////////////////////////////////////////////////
//
//                             Typed arrays
//
static iso::value
_make_typed_array(iso::element_kind kind, std::byte *storage, size_t offset,
                  size_t length)
{
  iso::value ret {iso::make<iso::object>(iso::tag::typed_array,
                                         &iso::typed_array_prototype)};
  ret->buffer = iso::make<iso::buffer_data>(kind, storage, offset, length);
  return ret;
}

iso::value
iso::typed_array(element_kind kind, size_t length)
{
  const size_t nbytes = length * element_size(kind);
  std::byte *storage = static_cast<std::byte*>(allocate_atomic(nbytes));
  std::memset(storage, 0, nbytes);
  return _make_typed_array(kind, storage, 0, nbytes);
}

iso::value
iso::typed_array(element_kind kind, std::span<const std::byte> bytes)
{
  if (bytes.size() % element_size(kind) != 0)
  {
    throw bad_value {std::format("byte length {} is not a multiple of {} element "
                                 "size {}", bytes.size(), element_kind_name(kind),
                                 element_size(kind))};
  }
  std::byte *storage = static_cast<std::byte*>(allocate_atomic(bytes.size()));
  if (not bytes.empty())
    std::memcpy(storage, bytes.data(), bytes.size());
  return _make_typed_array(kind, storage, 0, bytes.size());
}

iso::value
iso::typed_array_view(value source, element_kind kind, size_t byte_offset,
                      size_t length)
{
  if (not istypedarray(source))
    throw std::invalid_argument {"typed_array_view() - not a typed array"};
  const buffer_data &src = *source->buffer;
  const size_t offset = src.offset + byte_offset;
  const size_t nbytes = length * element_size(kind);
  if (offset % element_size(kind) != 0)
  {
    throw bad_value {std::format("{} view at byte offset {} is misaligned",
                                 element_kind_name(kind), offset), source};
  }
  if (byte_offset > src.length or nbytes > src.length - byte_offset)
  {
    throw bad_value {std::format("view of {} bytes at offset {} exceeds {} bytes",
                                 nbytes, byte_offset, src.length), source};
  }
  return _make_typed_array(kind, src.storage, offset, nbytes);
}

static std::byte*
_element_ptr(iso::value x, size_t i, const char *who)
{
  if (not iso::istypedarray(x))
    throw std::invalid_argument {std::format("{}() - not a typed array", who)};
  if (i >= iso::typed_array_length(x))
  {
    throw iso::bad_value {std::format("{}() - index {} out of range", who, i), x};
  }
  return x->buffer->storage + x->buffer->offset
       + i * iso::element_size(x->buffer->kind);
}

template <typename T>
static T
_load(const std::byte *ptr) noexcept
{
  T x;
  std::memcpy(&x, ptr, sizeof(T));
  return x;
}

template <typename T>
static void
_store(std::byte *ptr, T x) noexcept
{ std::memcpy(ptr, &x, sizeof(T)); }

double
iso::typed_array_get(value x, size_t i)
{
  const std::byte *ptr = _element_ptr(x, i, "typed_array_get");
  switch (x->buffer->kind)
  {
    case element_kind::int8: return _load<std::int8_t>(ptr);
    case element_kind::uint8:
    case element_kind::uint8_clamped: return _load<std::uint8_t>(ptr);
    case element_kind::int16: return _load<std::int16_t>(ptr);
    case element_kind::uint16: return _load<std::uint16_t>(ptr);
    case element_kind::int32: return _load<std::int32_t>(ptr);
    case element_kind::uint32: return _load<std::uint32_t>(ptr);
    case element_kind::float32: return _load<float>(ptr);
    case element_kind::float64: return _load<double>(ptr);
    case element_kind::bigint64:
    case element_kind::biguint64:
      break;
  }
  throw bad_value {"typed_array_get() - bigint elements, use "
                   "typed_array_get_bigint()", x};
}

iso::value
iso::typed_array_get_bigint(value x, size_t i)
{
  const std::byte *ptr = _element_ptr(x, i, "typed_array_get_bigint");
  switch (x->buffer->kind)
  {
    case element_kind::bigint64:
      return _make_bigint(cpp_int {_load<std::int64_t>(ptr)});
    case element_kind::biguint64:
      return _make_bigint(cpp_int {_load<std::uint64_t>(ptr)});
    default:
      throw bad_value {"typed_array_get_bigint() - not a bigint typed array", x};
  }
}

// ToIntN/ToUintN: truncate, then wrap modulo 2^bits
static std::uint64_t
_wrap(double val, int bits) noexcept
{
  if (not std::isfinite(val))
    return 0;
  const double modulus = std::ldexp(1.0, bits);
  double m = std::fmod(std::trunc(val), modulus);
  if (m < 0)
    m += modulus;
  return static_cast<std::uint64_t>(m);
}

void
iso::typed_array_set(value x, size_t i, double val)
{
  std::byte *ptr = _element_ptr(x, i, "typed_array_set");
  switch (x->buffer->kind)
  {
    case element_kind::int8:
      return _store(ptr, static_cast<std::int8_t>(_wrap(val, 8)));
    case element_kind::uint8:
      return _store(ptr, static_cast<std::uint8_t>(_wrap(val, 8)));
    case element_kind::uint8_clamped: {
      // nearbyint() rounds half to even in the default rounding mode
      const double clamped = std::isnan(val) ? 0.0 : std::clamp(val, 0.0, 255.0);
      return _store(ptr, static_cast<std::uint8_t>(std::nearbyint(clamped)));
    }
    case element_kind::int16:
      return _store(ptr, static_cast<std::int16_t>(_wrap(val, 16)));
    case element_kind::uint16:
      return _store(ptr, static_cast<std::uint16_t>(_wrap(val, 16)));
    case element_kind::int32:
      return _store(ptr, static_cast<std::int32_t>(_wrap(val, 32)));
    case element_kind::uint32:
      return _store(ptr, static_cast<std::uint32_t>(_wrap(val, 32)));
    case element_kind::float32:
      return _store(ptr, static_cast<float>(val));
    case element_kind::float64:
      return _store(ptr, val);
    case element_kind::bigint64:
    case element_kind::biguint64:
      break;
  }
  throw bad_value {"typed_array_set() - bigint elements, use "
                   "typed_array_set_bigint()", x};
}

void
iso::typed_array_set_bigint(value x, size_t i, value val)
{
  std::byte *ptr = _element_ptr(x, i, "typed_array_set_bigint");
  if (not is_bigint_kind(x->buffer->kind))
    throw bad_value {"typed_array_set_bigint() - not a bigint typed array", x};
  if (not isbigint(val))
    throw bad_value {"typed_array_set_bigint() - not a bigint", val};

  const cpp_int modulus = cpp_int {1} << 64;
  cpp_int n = _bigint_val(val) % modulus;
  if (n < 0)
    n += modulus;
  // Both kinds share the two's complement bit pattern
  _store(ptr, n.convert_to<std::uint64_t>());
}


////////////////////////////////////////////////////////////////////////////////
//
//                            Sets and maps
//
static iso::ordered_table&
_table(iso::value x, iso::tag t, const char *who)
{
  if (x->t != t)
  {
    throw std::invalid_argument {
        std::format("{}() - not a {}", who, _tag_name(t))};
  }
  return t == iso::tag::set ? *x->set : *x->map;
}

iso::value
iso::set(std::initializer_list<value> elements)
{
  value ret {make<object>(tag::set, &set_prototype)};
  ret->set = make<ordered_table>();
  for (const value x : elements)
    ret->set->insert_or_assign(x, x);
  return ret;
}

size_t
iso::set_size(value s)
{ return _table(s, tag::set, "set_size").size(); }

bool
iso::set_has(value s, value x)
{ return _table(s, tag::set, "set_has").contains(x); }

bool
iso::set_add(value s, value x)
{
  ordered_table &table = _table(s, tag::set, "set_add");
  if (table.contains(x))
    return false;
  return table.insert_or_assign(x, x);
}

bool
iso::set_delete(value s, value x)
{ return _table(s, tag::set, "set_delete").erase(x); }

iso::stl::vector<iso::value>
iso::set_values(value s)
{
  const ordered_table &table = _table(s, tag::set, "set_values");
  stl::vector<value> result;
  result.reserve(table.size());
  for (const auto &entry : table)
    result.emplace_back(entry.key);
  return result;
}

iso::value
iso::map(std::initializer_list<std::pair<value, value>> entries)
{
  value ret {make<object>(tag::map, &map_prototype)};
  ret->map = make<ordered_table>();
  for (const auto &[key, val] : entries)
    ret->map->insert_or_assign(key, val);
  return ret;
}

size_t
iso::map_size(value m)
{ return _table(m, tag::map, "map_size").size(); }

bool
iso::map_has(value m, value key)
{ return _table(m, tag::map, "map_has").contains(key); }

iso::value
iso::map_get(value m, value key)
{
  const ordered_table::entry *entry = _table(m, tag::map, "map_get").find(key);
  return entry ? value {entry->val} : undefined;
}

void
iso::map_set(value m, value key, value val)
{ _table(m, tag::map, "map_set").insert_or_assign(key, val); }

bool
iso::map_delete(value m, value key)
{ return _table(m, tag::map, "map_delete").erase(key); }

iso::stl::vector<std::pair<iso::value, iso::value>>
iso::map_entries(value m)
{
  const ordered_table &table = _table(m, tag::map, "map_entries");
  stl::vector<std::pair<value, value>> result;
  result.reserve(table.size());
  for (const auto &entry : table)
    result.emplace_back(value {entry.key}, value {entry.val});
  return result;
}


////////////////////////////////////////////////////////////////////////////////
//
//                   Boxed primitives and plain objects
//
iso::value
iso::box(value primitive)
{
  const prototype *proto = nullptr;
  switch (primitive->t)
  {
    case tag::str: proto = &string_prototype; break;
    case tag::num: proto = &number_prototype; break;
    case tag::boolean: proto = &boolean_prototype; break;
    default:
      throw bad_value {"box() - only strings, numbers and booleans can be boxed",
                       primitive};
  }

  value ret {make<object>(tag::boxed, proto)};
  ret->boxed.primitive = &*primitive;
  ret->boxed.props = make<ordered_table>();
  return ret;
}

iso::property::property(std::string_view key, value val)
: key {&*str(key)}, val {&*val}
{ }

iso::value
iso::obj(std::initializer_list<property> props, const prototype *proto)
{
  value ret {make<object>(tag::object, proto)};
  ret->props = make<ordered_table>();
  for (const property &prop : props)
    set_property(ret, value {prop.key}, value {prop.val});
  return ret;
}

static iso::ordered_table&
_props(iso::value o, const char *who)
{
  switch (o->t)
  {
    case iso::tag::object: return *o->props;
    case iso::tag::boxed: return *o->boxed.props;
    default:
      throw std::invalid_argument {std::format("{}() - {} has no properties", who,
                                               _tag_name(o->t))};
  }
}

static void
_check_key(iso::value key)
{
  if (not iso::iskey(key))
    throw iso::bad_value {"property key must be a string or a symbol", key};
}

bool
iso::has_own_property(value o, value key)
{ return _props(o, "has_own_property").contains(key); }

bool
iso::has_own_property(value o, std::string_view key)
{ return has_own_property(o, str(key)); }

iso::value
iso::get_property(value o, value key)
{
  const ordered_table::entry *entry = _props(o, "get_property").find(key);
  return entry ? value {entry->val} : undefined;
}

iso::value
iso::get_property(value o, std::string_view key)
{ return get_property(o, str(key)); }

void
iso::set_property(value o, value key, value val)
{
  ordered_table &props = _props(o, "set_property");
  _check_key(key);
  props.insert_or_assign(key, val);
}

void
iso::set_property(value o, std::string_view key, value val)
{ set_property(o, str(key), val); }

bool
iso::delete_property(value o, value key)
{ return _props(o, "delete_property").erase(key); }

iso::stl::vector<iso::value>
iso::own_keys(value o)
{
  const ordered_table &props = _props(o, "own_keys");
  stl::vector<value> result;
  result.reserve(props.size());
  for (const auto &entry : props)
    result.emplace_back(entry.key);
  return result;
}

size_t
iso::own_key_count(value o)
{ return _props(o, "own_key_count").size(); }
