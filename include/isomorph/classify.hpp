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

#include <string_view>

namespace iso {

/**
 * Semantic category of a value, selects the comparator
 *
 * \ingroup equality
 */
enum class category {
  primitive,
  callable,
  sequence,
  instant,
  pattern,
  fixed_buffer,
  ordered_set,
  ordered_map,
  boxed_primitive,
  plain_structured,
};

/**
 * Classify a value
 *
 * Checks run in the order absent/none, primitive scalar, callable, sequence,
 * instant, pattern, fixed buffer, ordered set, ordered map, boxed primitive;
 * anything else is plain structured.
 *
 * \ingroup equality
 */
[[nodiscard]] category
classify(value x) noexcept;

[[nodiscard]] std::string_view
category_name(category c) noexcept;

} // namespace iso
