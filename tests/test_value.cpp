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

#include <gtest/gtest.h>

#include <array>
#include <cmath>
#include <limits>

namespace {

using namespace iso;

class ValueTest: public ::testing::Test { };

// Test singleton identity
TEST_F(ValueTest, Singletons)
{
  EXPECT_TRUE(is(value {}, undefined));
  EXPECT_TRUE(isundefined(undefined));
  EXPECT_TRUE(isnull(null));
  EXPECT_TRUE(is(boolean(true), True));
  EXPECT_TRUE(is(boolean(false), False));
  EXPECT_FALSE(is(null, undefined));
}

// Test strict equality and SameValueZero on primitives
TEST_F(ValueTest, PrimitiveEquality)
{
  const double nan = std::numeric_limits<double>::quiet_NaN();

  EXPECT_TRUE(strict_equals(num(0), num(-0.0)));
  EXPECT_FALSE(strict_equals(num(nan), num(nan)));
  EXPECT_TRUE(same_value_zero(num(nan), num(nan)));
  EXPECT_TRUE(same_value_zero(num(0), num(-0.0)));
  EXPECT_TRUE(strict_equals(str("abc"), str("abc")));
  EXPECT_FALSE(strict_equals(str("abc"), str("abd")));
  EXPECT_FALSE(strict_equals(num(1), str("1")));

  // Symbols have identity
  EXPECT_FALSE(strict_equals(sym("x"), sym("x")));
  EXPECT_TRUE(strict_equals(sym_for("x"), sym_for("x")));
}

// Test symbol registry
TEST_F(ValueTest, Symbols)
{
  const value a = sym("desc");
  EXPECT_EQ(sym_description(a), "desc");
  EXPECT_FALSE(sym_registered(a));

  const value b = sym_for("key");
  EXPECT_TRUE(sym_registered(b));
  EXPECT_TRUE(is(b, sym_for("key")));
  EXPECT_FALSE(is(b, sym("key")));
}

// Test big integer canonicalization
TEST_F(ValueTest, BigintCanonicalForm)
{
  EXPECT_EQ(bigint_digits(bigint("0x10")), "16");
  EXPECT_EQ(bigint_digits(bigint("0010")), "10");
  EXPECT_EQ(bigint_digits(bigint("-0")), "0");
  EXPECT_EQ(bigint_digits(bigint(-42)), "-42");
  EXPECT_EQ(bigint_digits(bigint("123456789012345678901234567890")),
            "123456789012345678901234567890");
  EXPECT_TRUE(strict_equals(bigint("0x2a"), bigint(42)));

  EXPECT_THROW((void)bigint("12a"), bad_value);
  EXPECT_THROW((void)bigint(""), bad_value);
  EXPECT_THROW((void)bigint("1.5"), bad_value);
}

// Test accessors on values of the wrong type
TEST_F(ValueTest, AccessorTypeErrors)
{
  EXPECT_THROW((void)num_val(str("1")), std::invalid_argument);
  EXPECT_THROW((void)str_view(num(1)), std::invalid_argument);
  EXPECT_THROW((void)array_length(obj()), std::invalid_argument);
  EXPECT_THROW((void)unbox(str("a")), std::invalid_argument);
  EXPECT_THROW((void)set_size(map()), std::invalid_argument);
  EXPECT_THROW((void)get_property(array(), "x"), std::invalid_argument);
}

// Test arrays with holes
TEST_F(ValueTest, ArrayHoles)
{
  const value a = array({num(1), hole, num(3)});
  EXPECT_EQ(array_length(a), 3);
  EXPECT_TRUE(array_has(a, 0));
  EXPECT_FALSE(array_has(a, 1));
  EXPECT_TRUE(isundefined(array_get(a, 1)));
  EXPECT_TRUE(isundefined(array_get(a, 10)));

  array_set(a, 5, str("x"));
  EXPECT_EQ(array_length(a), 6);
  EXPECT_FALSE(array_has(a, 4));
  EXPECT_EQ(str_view(array_get(a, 5)), "x");

  array_delete(a, 0);
  EXPECT_FALSE(array_has(a, 0));
  EXPECT_EQ(array_length(a), 6);

  array_resize(a, 2);
  EXPECT_EQ(array_length(a), 2);

  const value b = make_array(4);
  EXPECT_EQ(array_length(b), 4);
  EXPECT_FALSE(array_has(b, 3));
}

// Test regular expression flags
TEST_F(ValueTest, RegexpFlags)
{
  EXPECT_EQ(regexp_flags(regexp("a", "gi")), "gi");
  EXPECT_EQ(regexp_flags(regexp("a", "ig")), "gi");
  EXPECT_EQ(regexp_flags(regexp("a", "yusmigd")), "dgimsuy");
  EXPECT_EQ(regexp_source(regexp("ab+c")), "ab+c");

  EXPECT_THROW((void)regexp("a", "gg"), bad_value);
  EXPECT_THROW((void)regexp("a", "x"), bad_value);
  EXPECT_THROW((void)regexp("a", "uv"), bad_value);
}

// Test regular expression source escaping
TEST_F(ValueTest, RegexpSource)
{
  EXPECT_EQ(regexp_source(regexp("")), "(?:)");
  EXPECT_EQ(regexp_source(regexp("a/b")), "a\\/b");
  EXPECT_EQ(regexp_source(regexp("a\\/b")), "a\\/b");
  EXPECT_EQ(regexp_source(regexp("[/]")), "[/]");
}

// Test dates
TEST_F(ValueTest, Dates)
{
  using namespace std::chrono;
  const value a = date(1577836800000);
  const value b = date(sys_days {year {2020} / January / 1});
  EXPECT_EQ(date_ms(a), 1577836800000);
  EXPECT_EQ(date_ms(b), date_ms(a));
  EXPECT_EQ(prototype_of(a), &date_prototype);
}

// Test typed array element conversions
TEST_F(ValueTest, TypedArrayConversions)
{
  const value u8 = typed_array(element_kind::uint8, 3);
  typed_array_set(u8, 0, 256);
  typed_array_set(u8, 1, -1);
  typed_array_set(u8, 2, 3.9);
  EXPECT_EQ(typed_array_get(u8, 0), 0);
  EXPECT_EQ(typed_array_get(u8, 1), 255);
  EXPECT_EQ(typed_array_get(u8, 2), 3);

  const value i8 = typed_array(element_kind::int8, 2);
  typed_array_set(i8, 0, 128);
  typed_array_set(i8, 1, std::numeric_limits<double>::quiet_NaN());
  EXPECT_EQ(typed_array_get(i8, 0), -128);
  EXPECT_EQ(typed_array_get(i8, 1), 0);

  const value u8c = typed_array(element_kind::uint8_clamped, 4);
  typed_array_set(u8c, 0, 300);
  typed_array_set(u8c, 1, -5);
  typed_array_set(u8c, 2, 1.5);
  typed_array_set(u8c, 3, 2.5);
  EXPECT_EQ(typed_array_get(u8c, 0), 255);
  EXPECT_EQ(typed_array_get(u8c, 1), 0);
  EXPECT_EQ(typed_array_get(u8c, 2), 2);
  EXPECT_EQ(typed_array_get(u8c, 3), 2);

  const value f32 = typed_array_of(element_kind::float32, {0.5, 1.25});
  EXPECT_EQ(typed_array_get(f32, 1), 1.25);
  EXPECT_EQ(typed_array_bytes(f32).size(), 8);

  EXPECT_THROW(typed_array_set(u8, 3, 1), bad_value);
  EXPECT_THROW(typed_array_set(typed_array(element_kind::bigint64, 1), 0, 1),
               bad_value);
}

// Test 64-bit integer typed arrays
TEST_F(ValueTest, BigintTypedArrays)
{
  const value i64 = typed_array(element_kind::bigint64, 2);
  typed_array_set_bigint(i64, 0, bigint("18446744073709551621"));
  typed_array_set_bigint(i64, 1, bigint("-1"));
  EXPECT_EQ(bigint_digits(typed_array_get_bigint(i64, 0)), "5");
  EXPECT_EQ(bigint_digits(typed_array_get_bigint(i64, 1)), "-1");

  const value u64 = typed_array_of(element_kind::biguint64, {-1});
  EXPECT_EQ(bigint_digits(typed_array_get_bigint(u64, 0)),
            "18446744073709551615");

  EXPECT_THROW(typed_array_set_bigint(i64, 0, num(1)), bad_value);
}

// Test typed array views sharing storage
TEST_F(ValueTest, TypedArrayViews)
{
  const value base = typed_array_of(element_kind::uint8, {1, 2, 3, 4, 5, 6, 7, 8});
  const value view = typed_array_view(base, element_kind::uint8, 2, 3);
  EXPECT_EQ(typed_array_length(view), 3);
  EXPECT_EQ(typed_array_get(view, 0), 3);

  typed_array_set(view, 0, 42);
  EXPECT_EQ(typed_array_get(base, 2), 42);

  const value u16 = typed_array_view(base, element_kind::uint16, 4, 2);
  EXPECT_EQ(typed_array_bytes(u16).size(), 4);

  // Misaligned or out of range
  EXPECT_THROW((void)typed_array_view(base, element_kind::uint16, 1, 1), bad_value);
  EXPECT_THROW((void)typed_array_view(base, element_kind::uint8, 6, 3), bad_value);

  const std::array<std::byte, 3> odd { };
  EXPECT_THROW((void)typed_array(element_kind::uint16, odd), bad_value);
}

// Test SameValueZero uniqueness of set elements
TEST_F(ValueTest, SetMembership)
{
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const value s = set({num(nan), num(nan), num(0), num(-0.0), str("a"), str("a")});
  EXPECT_EQ(set_size(s), 3);
  EXPECT_TRUE(set_has(s, num(nan)));
  EXPECT_TRUE(set_has(s, num(-0.0)));

  // Objects by identity
  const value o = obj();
  EXPECT_TRUE(set_add(s, o));
  EXPECT_FALSE(set_add(s, o));
  EXPECT_TRUE(set_add(s, obj()));
  EXPECT_EQ(set_size(s), 5);

  EXPECT_TRUE(set_delete(s, str("a")));
  EXPECT_FALSE(set_has(s, str("a")));
  EXPECT_EQ(set_size(s), 4);
}

// Test insertion order of sets and maps
TEST_F(ValueTest, InsertionOrder)
{
  const value s = set({num(3), num(1), num(2)});
  const stl::vector<value> vals = set_values(s);
  ASSERT_EQ(vals.size(), 3);
  EXPECT_EQ(num_val(vals[0]), 3);
  EXPECT_EQ(num_val(vals[2]), 2);

  const value m = map({{str("b"), num(1)}, {str("a"), num(2)}});
  map_set(m, str("b"), num(3));
  const auto entries = map_entries(m);
  ASSERT_EQ(entries.size(), 2);
  EXPECT_EQ(str_view(entries[0].first), "b");
  EXPECT_EQ(num_val(entries[0].second), 3);

  EXPECT_TRUE(map_delete(m, str("b")));
  EXPECT_FALSE(map_has(m, str("b")));
  EXPECT_TRUE(isundefined(map_get(m, str("b"))));
  EXPECT_EQ(map_size(m), 1);
}

// Test boxing
TEST_F(ValueTest, BoxedPrimitives)
{
  const value b = box(str("a"));
  EXPECT_TRUE(isboxed(b));
  EXPECT_EQ(str_view(unbox(b)), "a");
  EXPECT_EQ(prototype_of(b), &string_prototype);
  EXPECT_EQ(prototype_of(box(num(1))), &number_prototype);
  EXPECT_EQ(prototype_of(box(True)), &boolean_prototype);

  set_property(b, "extra", num(1));
  EXPECT_TRUE(has_own_property(b, "extra"));

  EXPECT_THROW((void)box(null), bad_value);
  EXPECT_THROW((void)box(sym("s")), bad_value);
  EXPECT_THROW((void)box(bigint(1)), bad_value);
}

// Test plain object properties
TEST_F(ValueTest, Properties)
{
  const value key = sym("k");
  const value o = obj({{"a", num(1)}, {key, num(2)}, {"a", num(3)}});
  EXPECT_EQ(own_key_count(o), 2);
  EXPECT_EQ(num_val(get_property(o, "a")), 3);
  EXPECT_EQ(num_val(get_property(o, key)), 2);
  EXPECT_TRUE(isundefined(get_property(o, "missing")));

  const stl::vector<value> keys = own_keys(o);
  ASSERT_EQ(keys.size(), 2);
  EXPECT_EQ(str_view(keys[0]), "a");
  EXPECT_TRUE(is(keys[1], key));

  EXPECT_TRUE(delete_property(o, str("a")));
  EXPECT_FALSE(has_own_property(o, "a"));

  EXPECT_THROW(set_property(o, num(1), num(1)), bad_value);
}

// Test prototypes
TEST_F(ValueTest, Prototypes)
{
  EXPECT_EQ(prototype_of(obj()), &object_prototype);
  EXPECT_EQ(prototype_of(obj({}, nullptr)), nullptr);
  EXPECT_EQ(prototype_of(array()), &array_prototype);
  EXPECT_EQ(prototype_of(set()), &set_prototype);

  EXPECT_EQ(named_prototype("Point"), named_prototype("Point"));
  EXPECT_NE(make_prototype("Point"), make_prototype("Point"));
  EXPECT_STREQ(named_prototype("Point")->name, "Point");
}

// Test functions
TEST_F(ValueTest, Functions)
{
  const value f = fn("first");
  EXPECT_EQ(function_name(f), "first");
  EXPECT_EQ(prototype_of(f), &function_prototype);
  EXPECT_FALSE(is(f, fn("first")));

  EXPECT_THROW((void)function_name(num(1)), std::invalid_argument);
}

} // anonymous namespace
