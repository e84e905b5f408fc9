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

#include "isomorph/memory.hpp"
#include "isomorph/stl/vector.hpp"

#include <cassert>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

/**
 * \file value.hpp
 * Dynamically typed value model
 *
 * A value is a handle to a garbage-collected object tagged with its runtime
 * type. Primitive values (undefined, null, booleans, numbers, strings,
 * symbols, big integers) are compared by content; everything else has object
 * identity.
 *
 * \note Handles kept in containers with the standard allocator are invisible
 * to the collector. Use the iso::stl aliases for such containers.
 *
 * \ingroup core
 */


namespace iso {

/**
 * Runtime type tag
 *
 * Tags up to and including \ref tag::bigint are primitives.
 *
 * \ingroup core
 */
enum class tag {
  undefined,
  null,
  boolean,
  num,
  str,
  sym,
  bigint,
  function,
  array,
  date,
  regexp,
  typed_array,
  set,
  map,
  boxed,
  object,
};


/**
 * Runtime type descriptor, the analogue of a prototype
 *
 * Descriptors are compared by address. Plain objects may have a null
 * prototype (a null pointer).
 *
 * \ingroup core
 */
struct prototype {
  const char *name;
};

extern const prototype object_prototype;
extern const prototype function_prototype;
extern const prototype array_prototype;
extern const prototype date_prototype;
extern const prototype regexp_prototype;
extern const prototype typed_array_prototype;
extern const prototype set_prototype;
extern const prototype map_prototype;
extern const prototype string_prototype;
extern const prototype number_prototype;
extern const prototype boolean_prototype;

/**
 * Create a fresh prototype
 *
 * Each call returns a distinct descriptor, even for equal names.
 */
[[nodiscard]] const prototype*
make_prototype(std::string_view name);

/**
 * Get the prototype registered under \p name, creating it on first use
 */
[[nodiscard]] const prototype*
named_prototype(std::string_view name);


/**
 * Element type of a typed array
 *
 * \ingroup core
 */
enum class element_kind {
  int8,
  uint8,
  uint8_clamped,
  int16,
  uint16,
  int32,
  uint32,
  float32,
  float64,
  bigint64,
  biguint64,
};

[[nodiscard]] size_t
element_size(element_kind kind) noexcept;

/**
 * Short name of an element kind as used in literal notation (`u8`, `f64`, ...)
 */
[[nodiscard]] std::string_view
element_kind_name(element_kind kind) noexcept;

/**
 * Look up an element kind by its short name
 *
 * \return False if \p name does not name an element kind
 */
[[nodiscard]] bool
parse_element_kind(std::string_view name, element_kind &kind) noexcept;

[[nodiscard]] inline bool
is_bigint_kind(element_kind kind) noexcept
{ return kind == element_kind::bigint64 or kind == element_kind::biguint64; }


struct object;
class ordered_table;
class value;

struct function_data {
  const char *name;
  size_t namelen;
};

struct array_data {
  stl::vector<object*> slots; /**< Null pointers are holes */
};

struct regexp_data {
  const char *source;
  size_t sourcelen;
  const char *flags;
  size_t flagslen;
};

struct buffer_data {
  element_kind kind;
  std::byte *storage; /**< Start of the (possibly shared) allocation */
  size_t offset; /**< Byte offset of the view into the storage */
  size_t length; /**< Byte length of the view */
};


/**
 * Value class representing a reference to an object
 *
 * \ingroup core
 */
class value {
  public:
  explicit value(object *ptr): m_ptr {ptr} { assert(ptr != nullptr); }

  /**
   * Construct undefined
   */
  value();

  constexpr object*
  operator -> () const noexcept
  { return m_ptr; }

  constexpr object&
  operator * () const noexcept
  { return *m_ptr; }

  /**
   * Deep structural equality with default options
   *
   * \see is_equal()
   */
  [[nodiscard]] bool
  operator == (value other) const;

  private:
  object *m_ptr;
}; // class iso::value


/**
 * Heap object behind a value
 *
 * \ingroup core
 */
struct object {
  object(tag tag, const prototype *proto = nullptr): t {tag}, proto {proto} { }

  tag t; /**< Type tag */
  const prototype *proto; /**< Runtime type descriptor */
  union {
    bool boolean;
    double num;
    struct { char *data; size_t len; } str;
    struct { char *data; size_t len; bool registered; } sym;
    struct { char *data; size_t len; } bigint; /**< Canonical decimal digits */
    function_data *function;
    array_data *array;
    std::int64_t date; /**< Milliseconds since the Unix epoch */
    regexp_data *regexp;
    buffer_data *buffer;
    ordered_table *set;
    ordered_table *map;
    struct { object *primitive; ordered_table *props; } boxed;
    ordered_table *props; /**< Own properties of a plain object */
  };
}; // struct iso::object


/**
 * \name Singletons
 * \{
 */

extern const value undefined;
extern const value null;
extern const value True, False;

/** \} */


/**
 * \name Type tests
 * \{
 */

[[nodiscard]] inline bool
is(value a, value b) noexcept
{ return &*a == &*b; }

[[nodiscard]] inline bool
isundefined(value x) noexcept
{ return x->t == tag::undefined; }

[[nodiscard]] inline bool
isnull(value x) noexcept
{ return x->t == tag::null; }

[[nodiscard]] inline bool
isbool(value x) noexcept
{ return x->t == tag::boolean; }

[[nodiscard]] inline bool
isnum(value x) noexcept
{ return x->t == tag::num; }

[[nodiscard]] inline bool
isstr(value x) noexcept
{ return x->t == tag::str; }

[[nodiscard]] inline bool
issym(value x) noexcept
{ return x->t == tag::sym; }

[[nodiscard]] inline bool
isbigint(value x) noexcept
{ return x->t == tag::bigint; }

[[nodiscard]] inline bool
isfunction(value x) noexcept
{ return x->t == tag::function; }

[[nodiscard]] inline bool
isarray(value x) noexcept
{ return x->t == tag::array; }

[[nodiscard]] inline bool
isdate(value x) noexcept
{ return x->t == tag::date; }

[[nodiscard]] inline bool
isregexp(value x) noexcept
{ return x->t == tag::regexp; }

[[nodiscard]] inline bool
istypedarray(value x) noexcept
{ return x->t == tag::typed_array; }

[[nodiscard]] inline bool
isset(value x) noexcept
{ return x->t == tag::set; }

[[nodiscard]] inline bool
ismap(value x) noexcept
{ return x->t == tag::map; }

[[nodiscard]] inline bool
isboxed(value x) noexcept
{ return x->t == tag::boxed; }

/**
 * Check if a value is a plain object (including class instances and objects
 * with a null prototype)
 */
[[nodiscard]] inline bool
isobject(value x) noexcept
{ return x->t == tag::object; }

[[nodiscard]] inline bool
isprimitive(value x) noexcept
{ return x->t <= tag::bigint; }

/**
 * Check if a value can be used as a property key
 */
[[nodiscard]] inline bool
iskey(value x) noexcept
{ return isstr(x) or issym(x); }

/** \} */


/**
 * \name Primitives
 * \{
 */

[[nodiscard]] inline value
boolean(bool val) noexcept
{ return val ? True : False; }

[[nodiscard]] inline value
num(double val)
{
  value ret {make_atomic<object>(tag::num)};
  ret->num = val;
  return ret;
}

[[nodiscard]] inline value
str(std::string_view text)
{
  const std::string_view copy = copy_string(text);
  value ret {make<object>(tag::str)};
  ret->str.data = const_cast<char*>(copy.data());
  ret->str.len = copy.size();
  return ret;
}

/**
 * Create a new unique symbol
 *
 * Two symbols created by separate calls are never equal, whatever their
 * descriptions.
 */
[[nodiscard]] value
sym(std::string_view description = "");

/**
 * Get the registered symbol for \p key
 *
 * Repeated calls with equal keys return the same symbol.
 */
[[nodiscard]] value
sym_for(std::string_view key);

/**
 * Create a big integer from a literal
 *
 * Accepts an optional sign followed by decimal digits or by `0x` and hex
 * digits.
 *
 * \throws iso::bad_value If \p literal is not an integer literal
 */
[[nodiscard]] value
bigint(std::string_view literal);

[[nodiscard]] value
bigint(long long val);

[[nodiscard]] inline double
num_val(value x)
{
  if (not isnum(x))
    throw std::invalid_argument {"num_val() - not a number"};
  return x->num;
}

[[nodiscard]] inline std::string_view
str_view(value x)
{
  if (not isstr(x))
    throw std::invalid_argument {"str_view() - not a string"};
  return {x->str.data, x->str.len};
}

[[nodiscard]] inline std::string_view
sym_description(value x)
{
  if (not issym(x))
    throw std::invalid_argument {"sym_description() - not a symbol"};
  return {x->sym.data, x->sym.len};
}

/**
 * Check if a symbol was obtained from sym_for()
 */
[[nodiscard]] inline bool
sym_registered(value x)
{
  if (not issym(x))
    throw std::invalid_argument {"sym_registered() - not a symbol"};
  return x->sym.registered;
}

/**
 * Get canonical decimal representation of a big integer (without suffix)
 */
[[nodiscard]] inline std::string_view
bigint_digits(value x)
{
  if (not isbigint(x))
    throw std::invalid_argument {"bigint_digits() - not a bigint"};
  return {x->bigint.data, x->bigint.len};
}

/**
 * Strict primitive equality
 *
 * Numbers compare numerically (so `0` equals `-0` and NaN differs from
 * everything), strings and big integers by content, everything else by
 * identity.
 */
[[nodiscard]] bool
strict_equals(value a, value b) noexcept;

/**
 * SameValueZero equality, used for set membership and map keys
 *
 * Same as strict_equals() except that NaN equals NaN.
 */
[[nodiscard]] bool
same_value_zero(value a, value b) noexcept;

/** \} */


/**
 * \name Functions
 * \{
 */

[[nodiscard]] value
fn(std::string_view name);

[[nodiscard]] inline std::string_view
function_name(value x)
{
  if (not isfunction(x))
    throw std::invalid_argument {"function_name() - not a function"};
  return {x->function->name, x->function->namelen};
}

/** \} */


/**
 * \name Arrays
 * \{
 */

/**
 * Marker for an empty slot in array()
 */
struct hole_t { };
constexpr hole_t hole;

/**
 * Initializer element of array(): a value or a hole
 */
struct array_slot {
  array_slot(value x): ptr {&*x} { }
  array_slot(hole_t): ptr {nullptr} { }

  object *ptr;
};

[[nodiscard]] value
array(std::initializer_list<array_slot> slots = {});

/**
 * Create an array of \p length holes
 */
[[nodiscard]] value
make_array(size_t length);

[[nodiscard]] inline size_t
array_length(value x)
{
  if (not isarray(x))
    throw std::invalid_argument {"array_length() - not an array"};
  return x->array->slots.size();
}

/**
 * Check if slot \p i holds a value (as opposed to a hole or being out of range)
 */
[[nodiscard]] inline bool
array_has(value x, size_t i)
{ return i < array_length(x) and x->array->slots[i] != nullptr; }

/**
 * Read slot \p i
 *
 * \return The element, or undefined for holes and out-of-range indices
 */
[[nodiscard]] inline value
array_get(value x, size_t i)
{ return array_has(x, i) ? value {x->array->slots[i]} : undefined; }

/**
 * Store \p val at \p i, growing the array with holes if needed
 */
void
array_set(value x, size_t i, value val);

void
array_push(value x, value val);

/**
 * Turn slot \p i into a hole
 */
void
array_delete(value x, size_t i);

/**
 * Change the length; new slots are holes
 */
void
array_resize(value x, size_t length);

/** \} */


/**
 * \name Dates and regular expressions
 * \{
 */

[[nodiscard]] inline value
date(std::int64_t epoch_ms)
{
  value ret {make_atomic<object>(tag::date, &date_prototype)};
  ret->date = epoch_ms;
  return ret;
}

[[nodiscard]] inline value
date(std::chrono::sys_time<std::chrono::milliseconds> time)
{ return date(time.time_since_epoch().count()); }

[[nodiscard]] inline std::int64_t
date_ms(value x)
{
  if (not isdate(x))
    throw std::invalid_argument {"date_ms() - not a date"};
  return x->date;
}

/**
 * Create a regular expression
 *
 * The source is stored escaped the way a regexp literal prints it (an empty
 * source becomes `(?:)`, bare slashes are escaped). Flags are stored in
 * canonical order.
 *
 * \throws iso::bad_value On unknown or repeated flags
 */
[[nodiscard]] value
regexp(std::string_view source, std::string_view flags = "");

[[nodiscard]] inline std::string_view
regexp_source(value x)
{
  if (not isregexp(x))
    throw std::invalid_argument {"regexp_source() - not a regexp"};
  return {x->regexp->source, x->regexp->sourcelen};
}

[[nodiscard]] inline std::string_view
regexp_flags(value x)
{
  if (not isregexp(x))
    throw std::invalid_argument {"regexp_flags() - not a regexp"};
  return {x->regexp->flags, x->regexp->flagslen};
}

/** \} */


/**
 * \name Typed arrays
 * \{
 */

/**
 * Create a zero-filled typed array of \p length elements
 */
[[nodiscard]] value
typed_array(element_kind kind, size_t length);

/**
 * Create a typed array holding a copy of \p bytes
 *
 * \throws iso::bad_value If the byte count is not a multiple of the element
 *                        size
 */
[[nodiscard]] value
typed_array(element_kind kind, std::span<const std::byte> bytes);

/**
 * Create a typed array sharing storage with \p source
 *
 * \param source Typed array whose bytes are viewed
 * \param kind Element kind of the new view
 * \param byte_offset Offset relative to the start of \p source's view
 * \param length Number of elements of the new view
 * \throws iso::bad_value If the view is misaligned or out of range
 */
[[nodiscard]] value
typed_array_view(value source, element_kind kind, size_t byte_offset,
                 size_t length);

[[nodiscard]] inline element_kind
typed_array_kind(value x)
{
  if (not istypedarray(x))
    throw std::invalid_argument {"typed_array_kind() - not a typed array"};
  return x->buffer->kind;
}

[[nodiscard]] inline std::span<const std::byte>
typed_array_bytes(value x)
{
  if (not istypedarray(x))
    throw std::invalid_argument {"typed_array_bytes() - not a typed array"};
  return {x->buffer->storage + x->buffer->offset, x->buffer->length};
}

[[nodiscard]] inline size_t
typed_array_length(value x)
{ return typed_array_bytes(x).size() / element_size(typed_array_kind(x)); }

/**
 * Read element \p i of a non-bigint typed array
 */
[[nodiscard]] double
typed_array_get(value x, size_t i);

/**
 * Read element \p i of a bigint typed array
 */
[[nodiscard]] value
typed_array_get_bigint(value x, size_t i);

/**
 * Store a number into element \p i
 *
 * Integer kinds truncate and wrap around, `uint8_clamped` clamps to [0, 255]
 * rounding half to even, float kinds convert.
 *
 * \throws iso::bad_value For bigint kinds or out-of-range index
 */
void
typed_array_set(value x, size_t i, double val);

/**
 * Store a big integer into element \p i of a bigint typed array (modulo 2^64)
 */
void
typed_array_set_bigint(value x, size_t i, value val);

/**
 * Create a typed array from a list of numbers
 */
template <typename T>
[[nodiscard]] value
typed_array_of(element_kind kind, std::initializer_list<T> elements)
{
  static_assert(std::is_arithmetic_v<T>);
  const value ret = typed_array(kind, elements.size());
  size_t i = 0;
  for (const T x : elements)
  {
    if (is_bigint_kind(kind))
    {
      if constexpr (std::is_integral_v<T>)
        typed_array_set_bigint(ret, i++, bigint(std::to_string(x)));
      else
        throw std::invalid_argument {"typed_array_of() - bigint elements must "
                                     "be integers"};
    }
    else
      typed_array_set(ret, i++, static_cast<double>(x));
  }
  return ret;
}

/** \} */


/**
 * \name Sets and maps
 *
 * Membership is decided by same_value_zero(). Iteration follows insertion
 * order.
 * \{
 */

[[nodiscard]] value
set(std::initializer_list<value> elements = {});

[[nodiscard]] size_t
set_size(value s);

[[nodiscard]] bool
set_has(value s, value x);

/**
 * \return True if \p x was not yet a member
 */
bool
set_add(value s, value x);

/**
 * \return True if \p x was a member
 */
bool
set_delete(value s, value x);

[[nodiscard]] stl::vector<value>
set_values(value s);

[[nodiscard]] value
map(std::initializer_list<std::pair<value, value>> entries = {});

[[nodiscard]] size_t
map_size(value m);

[[nodiscard]] bool
map_has(value m, value key);

/**
 * \return Value associated with \p key, or undefined
 */
[[nodiscard]] value
map_get(value m, value key);

void
map_set(value m, value key, value val);

bool
map_delete(value m, value key);

[[nodiscard]] stl::vector<std::pair<value, value>>
map_entries(value m);

/** \} */


/**
 * \name Boxed primitives and plain objects
 * \{
 */

/**
 * Wrap a string, number or boolean into an object
 *
 * \throws iso::bad_value For other values
 */
[[nodiscard]] value
box(value primitive);

[[nodiscard]] inline value
unbox(value x)
{
  if (not isboxed(x))
    throw std::invalid_argument {"unbox() - not a boxed primitive"};
  return value {x->boxed.primitive};
}

/**
 * Initializer element of obj()
 */
struct property {
  property(std::string_view key, value val);
  property(value key, value val): key {&*key}, val {&*val} { }

  object *key;
  object *val;
};

/**
 * Create a plain object
 *
 * \param props Own properties, later keys overwrite earlier equal ones
 * \param proto Runtime type; nullptr for an object without prototype
 * \throws iso::bad_value If a key is neither a string nor a symbol
 */
[[nodiscard]] value
obj(std::initializer_list<property> props = {},
    const prototype *proto = &object_prototype);

[[nodiscard]] inline const prototype*
prototype_of(value x) noexcept
{ return x->proto; }

[[nodiscard]] bool
has_own_property(value o, value key);

[[nodiscard]] bool
has_own_property(value o, std::string_view key);

/**
 * \return Value of own property \p key, or undefined
 */
[[nodiscard]] value
get_property(value o, value key);

[[nodiscard]] value
get_property(value o, std::string_view key);

void
set_property(value o, value key, value val);

void
set_property(value o, std::string_view key, value val);

bool
delete_property(value o, value key);

/**
 * Own property keys in insertion order
 */
[[nodiscard]] stl::vector<value>
own_keys(value o);

[[nodiscard]] size_t
own_key_count(value o);

/** \} */


/**
 * \name Printing
 * \{
 */

/**
 * Write a value in literal notation
 *
 * Objects reachable more than once are labeled (`#0=` ... `#0#`), so cyclic
 * values print finitely and read back with the same shape.
 */
void
write(std::ostream &os, value val);

[[nodiscard]] std::string
to_string(value val);

/** \} */

} // namespace iso


inline std::ostream&
operator << (std::ostream &os, iso::value val)
{ iso::write(os, val); return os; }

inline
iso::value::value()
: m_ptr {&*iso::undefined}
{ }
