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
#include "isomorph/equality.hpp"
#include "isomorph/format.hpp"
#include "isomorph/literal_parser.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <sstream>

namespace {

using namespace iso;

class PrintValueTest: public ::testing::Test {
  protected:
  // Write, read back and check the result is structurally equal
  static void
  expect_round_trip(value x)
  {
    const std::string text = to_string(x);
    const value y = literal_parser {}.parse(text);
    EXPECT_TRUE(is_equal(x, y)) << text;
    EXPECT_EQ(to_string(y), text);
  }
};

// Test printing of primitives
TEST_F(PrintValueTest, Primitives)
{
  EXPECT_EQ(to_string(undefined), "undefined");
  EXPECT_EQ(to_string(null), "null");
  EXPECT_EQ(to_string(True), "true");
  EXPECT_EQ(to_string(num(1.5)), "1.5");
  EXPECT_EQ(to_string(num(42)), "42");
  EXPECT_EQ(to_string(num(-0.0)), "-0");
  EXPECT_EQ(to_string(num(std::numeric_limits<double>::quiet_NaN())), "NaN");
  EXPECT_EQ(to_string(num(-std::numeric_limits<double>::infinity())), "-Infinity");
  EXPECT_EQ(to_string(str("a\"b\n")), R"("a\"b\n")");
  EXPECT_EQ(to_string(str(std::string_view {"\x01", 1})), R"("\x01")");
  EXPECT_EQ(to_string(bigint("0x10")), "16n");
  EXPECT_EQ(to_string(sym("d")), R"(#sym("d"))");
  EXPECT_EQ(to_string(sym_for("k")), R"(#sym.for("k"))");
}

// Test printing of composite values
TEST_F(PrintValueTest, Composites)
{
  EXPECT_EQ(to_string(array({num(1), hole, num(3)})), "[1, , 3]");
  EXPECT_EQ(to_string(array({num(1), hole})), "[1, ,]");
  EXPECT_EQ(to_string(array()), "[]");
  EXPECT_EQ(to_string(obj({{"a", num(1)}, {"b c", num(2)}})), R"({a: 1, "b c": 2})");
  EXPECT_EQ(to_string(obj({})), "#null{}");
  EXPECT_EQ(to_string(obj({{"x", num(1)}}, named_prototype("Point"))),
            "#class(Point){x: 1}");
  EXPECT_EQ(to_string(set({num(1), num(2)})), "#set[1, 2]");
  EXPECT_EQ(to_string(map({{str("a"), num(1)}})), R"(#map{"a" => 1})");
  EXPECT_EQ(to_string(date(1577836800000)), "#date(1577836800000)");
  EXPECT_EQ(to_string(regexp("ab+c", "ig")), "/ab+c/gi");
  EXPECT_EQ(to_string(typed_array_of(element_kind::uint8, {1, 2})), "#u8[1, 2]");
  EXPECT_EQ(to_string(typed_array_of(element_kind::bigint64, {1, -2})), "#i64[1n, -2n]");
  EXPECT_EQ(to_string(box(str("a"))), R"(#box("a"))");
  EXPECT_EQ(to_string(fn("f")), "#fn<f>");
}

// Test labels for shared and cyclic values
TEST_F(PrintValueTest, Labels)
{
  const value a = array({num(1)});
  array_push(a, a);
  EXPECT_EQ(to_string(a), "#0=[1, #0#]");

  const value shared = obj();
  EXPECT_EQ(to_string(array({shared, shared})), "[#0={}, #0#]");

  // Registered symbols and strings need no labels
  const value key = sym_for("k");
  const value text = str("t");
  EXPECT_EQ(to_string(array({key, key, text, text})),
            R"([#sym.for("k"), #sym.for("k"), "t", "t"])");
}

// Test reading back printed values
TEST_F(PrintValueTest, RoundTrip)
{
  expect_round_trip(obj({{"a", array({num(1), hole, str("x")})},
                         {sym_for("s"), set({num(1), bigint(7)})}}));
  expect_round_trip(map({{obj({{"k", num(1)}}), date(0)},
                         {str("re"), regexp("a/b", "g")}}));
  expect_round_trip(typed_array_of(element_kind::float32, {0.5, -1.25}));

  const value b = box(num(3));
  set_property(b, "note", str("boxed"));
  expect_round_trip(b);

  // Cycles
  const value o = obj({{"name", str("root")}});
  set_property(o, "self", o);
  set_property(o, "children", array({o, obj({{"parent", o}})}));
  expect_round_trip(o);
}

// Test std::format support
TEST_F(PrintValueTest, Format)
{
  const value a = array({num(1), num(2), num(3)});
  EXPECT_EQ(std::format("{}", a), "[1, 2, 3]");
  EXPECT_EQ(std::format("{:#4}", a), "[1, …");

  std::ostringstream os;
  os << a;
  EXPECT_EQ(os.str(), "[1, 2, 3]");
}

} // anonymous namespace
