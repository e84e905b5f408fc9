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


#include "isomorph/classify.hpp"


iso::category
iso::classify(value x) noexcept
{
  if (isundefined(x) or isnull(x))
    return category::primitive;
  if (isprimitive(x))
    return category::primitive;
  if (isfunction(x))
    return category::callable;
  if (isarray(x))
    return category::sequence;
  if (isdate(x))
    return category::instant;
  if (isregexp(x))
    return category::pattern;
  if (istypedarray(x))
    return category::fixed_buffer;
  if (isset(x))
    return category::ordered_set;
  if (ismap(x))
    return category::ordered_map;
  if (isboxed(x))
    return category::boxed_primitive;
  return category::plain_structured;
}


std::string_view
iso::category_name(category c) noexcept
{
  switch (c)
  {
    case category::primitive: return "primitive";
    case category::callable: return "callable";
    case category::sequence: return "sequence";
    case category::instant: return "instant";
    case category::pattern: return "pattern";
    case category::fixed_buffer: return "fixed-buffer";
    case category::ordered_set: return "ordered-set";
    case category::ordered_map: return "ordered-map";
    case category::boxed_primitive: return "boxed-primitive";
    case category::plain_structured: return "plain-structured";
  }
  return "unknown";
}
