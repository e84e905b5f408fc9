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


#include "isomorph/equality.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace {

using namespace iso;

// Test fixture for equality tests
class EqualityTest: public ::testing::Test {
  protected:
  static bool
  symmetric_equal(value a, value b, const equality_options &opts = {})
  {
    const bool ab = is_equal(a, b, opts);
    EXPECT_EQ(ab, is_equal(b, a, opts));
    return ab;
  }

  static constexpr double nan = std::numeric_limits<double>::quiet_NaN();
};

// Test equality of identical objects (is)
TEST_F(EqualityTest, IdenticalObjects)
{
  const value o = obj({{"a", num(1)}});
  EXPECT_TRUE(is(o, o));
  EXPECT_TRUE(is_equal(o, o));

  // Functions are equal only to themselves
  const value f = fn("f");
  EXPECT_TRUE(is_equal(f, f));
  EXPECT_FALSE(symmetric_equal(f, fn("f")));
}

// Test equality of primitives
TEST_F(EqualityTest, Primitives)
{
  EXPECT_TRUE(symmetric_equal(num(42), num(42)));
  EXPECT_FALSE(symmetric_equal(num(42), num(3.14)));
  EXPECT_TRUE(symmetric_equal(str("hello"), str("hello")));
  EXPECT_FALSE(symmetric_equal(str("hello"), str("world")));
  EXPECT_TRUE(symmetric_equal(bigint("0x10"), bigint(16)));
  EXPECT_TRUE(symmetric_equal(True, True));
  EXPECT_FALSE(symmetric_equal(True, False));
  EXPECT_FALSE(symmetric_equal(undefined, null));

  // Different types are never equal
  EXPECT_FALSE(symmetric_equal(num(1), str("1")));
  EXPECT_FALSE(symmetric_equal(num(1), bigint(1)));
  EXPECT_FALSE(symmetric_equal(num(0), False));
}

// Test NaN and signed zeros
TEST_F(EqualityTest, NaNAndZeros)
{
  EXPECT_TRUE(symmetric_equal(num(nan), num(nan)));
  EXPECT_TRUE(symmetric_equal(num(0), num(-0.0)));
  EXPECT_TRUE(symmetric_equal(array({num(nan)}), array({num(nan)})));
}

// Test symbols
TEST_F(EqualityTest, Symbols)
{
  const value s = sym("test");
  EXPECT_TRUE(is_equal(s, s));
  EXPECT_FALSE(symmetric_equal(s, sym("test")));
  EXPECT_TRUE(symmetric_equal(sym_for("test"), sym_for("test")));
}

// Test one primitive against an object
TEST_F(EqualityTest, PrimitiveAgainstObject)
{
  EXPECT_FALSE(symmetric_equal(num(1), array({num(1)})));
  EXPECT_FALSE(symmetric_equal(str("a"), box(str("a"))));
  EXPECT_FALSE(symmetric_equal(undefined, obj()));
}

// Test nested plain objects
TEST_F(EqualityTest, NestedObjects)
{
  const value a = obj({{"a", obj({{"b", obj({{"c", num(1)}})}})}});
  const value b = obj({{"a", obj({{"b", obj({{"c", num(1)}})}})}});
  const value c = obj({{"a", obj({{"b", obj({{"c", num(2)}})}})}});
  EXPECT_TRUE(symmetric_equal(a, b));
  EXPECT_FALSE(symmetric_equal(a, c));
  EXPECT_TRUE(a == b);
}

// Test own keys of plain objects
TEST_F(EqualityTest, ObjectKeys)
{
  // Key order does not matter
  EXPECT_TRUE(symmetric_equal(obj({{"a", num(1)}, {"b", num(2)}}),
                              obj({{"b", num(2)}, {"a", num(1)}})));

  // Extra or missing keys do
  EXPECT_FALSE(symmetric_equal(obj({{"a", num(1)}}),
                               obj({{"a", num(1)}, {"b", num(2)}})));
  EXPECT_FALSE(symmetric_equal(obj({{"a", num(1)}}), obj({{"b", num(1)}})));

  // An undefined property is still a property
  EXPECT_FALSE(symmetric_equal(obj({{"a", undefined}}), obj()));

  // Symbol keys by identity
  const value k = sym("k");
  EXPECT_TRUE(symmetric_equal(obj({{k, num(1)}}), obj({{k, num(1)}})));
  EXPECT_FALSE(symmetric_equal(obj({{k, num(1)}}), obj({{sym("k"), num(1)}})));
}

// Test category mismatch
TEST_F(EqualityTest, CategoryMismatch)
{
  EXPECT_FALSE(symmetric_equal(array({num(1), num(2)}),
                               obj({{"0", num(1)}, {"1", num(2)}})));
  EXPECT_FALSE(symmetric_equal(set(), map()));
  EXPECT_FALSE(symmetric_equal(array(), obj()));
  EXPECT_FALSE(symmetric_equal(date(0), obj()));
  EXPECT_FALSE(symmetric_equal(box(num(1)), obj()));

  // Options do not relax categories
  equality_options opts;
  opts.allow_prototype_mismatch = true;
  opts.normalize_boxed_primitives = true;
  EXPECT_FALSE(symmetric_equal(array(), obj({}), opts));
  EXPECT_FALSE(symmetric_equal(set(), map(), opts));
}

// Test arrays and holes
TEST_F(EqualityTest, SparseArrays)
{
  const value sparse = array({num(1), hole, num(3)});
  const value dense = array({num(1), undefined, num(3)});

  EXPECT_TRUE(symmetric_equal(sparse, dense));
  EXPECT_TRUE(symmetric_equal(sparse, array({num(1), hole, num(3)})));
  EXPECT_FALSE(symmetric_equal(sparse, array({num(1), hole})));

  equality_options strict;
  strict.strict_sparse_arrays = true;
  EXPECT_FALSE(symmetric_equal(sparse, dense, strict));
  EXPECT_TRUE(symmetric_equal(sparse, array({num(1), hole, num(3)}), strict));
  EXPECT_TRUE(symmetric_equal(make_array(2), make_array(2), strict));
}

// Test boxed primitives
TEST_F(EqualityTest, BoxedPrimitives)
{
  EXPECT_FALSE(symmetric_equal(box(str("a")), str("a")));
  EXPECT_TRUE(symmetric_equal(box(str("a")), box(str("a"))));
  EXPECT_FALSE(symmetric_equal(box(str("a")), box(str("b"))));
  EXPECT_FALSE(symmetric_equal(box(num(1)), box(str("1"))));
  EXPECT_TRUE(symmetric_equal(box(num(nan)), box(num(nan))));

  equality_options normalize;
  normalize.normalize_boxed_primitives = true;
  EXPECT_TRUE(symmetric_equal(box(str("a")), str("a"), normalize));
  EXPECT_TRUE(symmetric_equal(box(num(nan)), num(nan), normalize));
  EXPECT_TRUE(symmetric_equal(box(num(0)), box(num(-0.0)), normalize));
  EXPECT_FALSE(symmetric_equal(box(str("a")), str("b"), normalize));
  EXPECT_FALSE(symmetric_equal(box(num(1)), str("1"), normalize));

  // Own properties of boxes count without normalization
  const value extra = box(str("a"));
  set_property(extra, "x", num(1));
  EXPECT_FALSE(symmetric_equal(extra, box(str("a"))));
}

// Test dates
TEST_F(EqualityTest, Dates)
{
  EXPECT_TRUE(symmetric_equal(date(1577836800000), date(1577836800000)));
  EXPECT_FALSE(symmetric_equal(date(1577836800000), date(1577836800001)));
}

// Test regular expressions
TEST_F(EqualityTest, Regexps)
{
  EXPECT_TRUE(symmetric_equal(regexp("ab+c", "gi"), regexp("ab+c", "ig")));
  EXPECT_FALSE(symmetric_equal(regexp("ab+c", "g"), regexp("ab+c", "gi")));
  EXPECT_FALSE(symmetric_equal(regexp("ab+c"), regexp("ab*c")));
}

// Test typed arrays
TEST_F(EqualityTest, TypedArrays)
{
  const value a = typed_array_of(element_kind::uint8, {1, 2, 3, 4});
  const value b = typed_array_of(element_kind::uint8, {1, 2, 3, 4});
  const value c = typed_array_of(element_kind::uint8, {1, 2, 3, 5});
  const value d = typed_array_of(element_kind::int8, {1, 2, 3, 4});
  const value e = typed_array_of(element_kind::uint8_clamped, {1, 2, 3, 4});

  EXPECT_TRUE(symmetric_equal(a, b));
  EXPECT_FALSE(symmetric_equal(a, c));
  EXPECT_FALSE(symmetric_equal(a, d));
  EXPECT_FALSE(symmetric_equal(a, e));
  EXPECT_FALSE(symmetric_equal(a, typed_array_of(element_kind::uint8, {1, 2, 3})));

  // Views compare their own bytes
  const value big = typed_array_of(element_kind::uint8, {9, 1, 2, 3, 4, 9});
  EXPECT_TRUE(symmetric_equal(a, typed_array_view(big, element_kind::uint8, 1, 4)));
  EXPECT_FALSE(symmetric_equal(a, typed_array_view(big, element_kind::uint8, 0, 4)));

  // Bytes, not numbers: NaN payloads are bytes like any other
  EXPECT_TRUE(symmetric_equal(typed_array_of(element_kind::float64, {nan}),
                              typed_array_of(element_kind::float64, {nan})));
  EXPECT_FALSE(symmetric_equal(typed_array_of(element_kind::float64, {0.0}),
                               typed_array_of(element_kind::float64, {-0.0})));
}

// Test sets
TEST_F(EqualityTest, Sets)
{
  EXPECT_TRUE(symmetric_equal(set({num(1), num(2)}), set({num(2), num(1)})));
  EXPECT_FALSE(symmetric_equal(set({num(1), num(2)}), set({num(1), num(3)})));
  EXPECT_FALSE(symmetric_equal(set({num(1)}), set({num(1), num(2)})));

  // Structurally equal elements
  EXPECT_TRUE(symmetric_equal(set({obj({{"a", num(1)}}), obj({{"b", num(2)}})}),
                              set({obj({{"b", num(2)}}), obj({{"a", num(1)}})})));
  EXPECT_FALSE(symmetric_equal(set({obj({{"a", num(1)}}), obj({{"a", num(1)}})}),
                               set({obj({{"a", num(1)}}), obj({{"a", num(2)}})})));

  // Each element of b is consumed once
  EXPECT_TRUE(symmetric_equal(set({array({num(1)}), array({num(1)})}),
                              set({array({num(1)}), array({num(1)})})));
}

// Test maps
TEST_F(EqualityTest, Maps)
{
  EXPECT_TRUE(symmetric_equal(map({{str("a"), num(1)}, {str("b"), num(2)}}),
                              map({{str("b"), num(2)}, {str("a"), num(1)}})));
  EXPECT_FALSE(symmetric_equal(map({{str("a"), num(1)}}),
                               map({{str("a"), num(2)}})));
  EXPECT_FALSE(symmetric_equal(map({{str("a"), num(1)}}),
                               map({{str("b"), num(1)}})));

  // Primitive keys use SameValueZero
  EXPECT_TRUE(symmetric_equal(map({{num(nan), num(1)}}), map({{num(nan), num(1)}})));
  EXPECT_TRUE(symmetric_equal(map({{num(0), num(1)}}), map({{num(-0.0), num(1)}})));

  // Object keys are matched structurally, together with their values
  EXPECT_TRUE(symmetric_equal(
      map({{obj({{"k", num(1)}}), str("x")}, {obj({{"k", num(2)}}), str("y")}}),
      map({{obj({{"k", num(2)}}), str("y")}, {obj({{"k", num(1)}}), str("x")}})));
  EXPECT_FALSE(symmetric_equal(
      map({{obj({{"k", num(1)}}), str("x")}}),
      map({{obj({{"k", num(1)}}), str("y")}})));
}

// Test prototypes
TEST_F(EqualityTest, Prototypes)
{
  const value plain = obj({{"a", num(1)}});
  const value bare = obj({{"a", num(1)}});
  const value point = obj({{"a", num(1)}}, named_prototype("Point"));

  EXPECT_FALSE(symmetric_equal(plain, bare));
  EXPECT_FALSE(symmetric_equal(plain, point));
  EXPECT_TRUE(symmetric_equal(point, obj({{"a", num(1)}}, named_prototype("Point"))));
  EXPECT_FALSE(symmetric_equal(point, obj({{"a", num(1)}}, make_prototype("Point"))));

  equality_options relaxed;
  relaxed.allow_prototype_mismatch = true;
  EXPECT_TRUE(symmetric_equal(plain, bare, relaxed));
  EXPECT_TRUE(symmetric_equal(plain, point, relaxed));
  EXPECT_FALSE(symmetric_equal(plain, obj({{"a", num(2)}}), relaxed));
}

// Test options are independent of each other
TEST_F(EqualityTest, DefaultOptions)
{
  const equality_options opts;
  EXPECT_FALSE(opts.strict_sparse_arrays);
  EXPECT_FALSE(opts.normalize_boxed_primitives);
  EXPECT_FALSE(opts.allow_prototype_mismatch);
}

} // anonymous namespace
