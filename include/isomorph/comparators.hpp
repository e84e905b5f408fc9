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
#include "isomorph/options.hpp"
#include "isomorph/tracker.hpp"

/**
 * \file comparators.hpp
 * Per-category comparison of two non-primitive values
 *
 * Each comparator expects both operands to belong to its category; nested
 * values are compared with deep_equal() sharing the same tracker.
 *
 * \ingroup equality
 */

namespace iso {

/**
 * Arrays: equal length and element-wise deep equality
 *
 * Holes read as undefined, unless equality_options::strict_sparse_arrays is
 * set; then a hole only matches a hole.
 */
[[nodiscard]] bool
compare_sequences(value a, value b, equality_tracker &tracker,
                  const equality_options &opts);

[[nodiscard]] bool
compare_instants(value a, value b);

[[nodiscard]] bool
compare_patterns(value a, value b);

/**
 * Typed arrays: same element kind, same byte length and same bytes
 */
[[nodiscard]] bool
compare_fixed_buffers(value a, value b);

/**
 * Sets: equal size, then every element of \p a consumes one element of \p b
 *
 * A strictly equal element is preferred; otherwise the first unused deep-equal
 * element is taken. Matching is greedy and does not backtrack.
 */
[[nodiscard]] bool
compare_ordered_sets(value a, value b, equality_tracker &tracker,
                     const equality_options &opts);

/**
 * Maps: equal size, then every entry of \p a consumes one entry of \p b
 *
 * Primitive keys are looked up directly (SameValueZero); other keys are
 * matched greedily against unused entries with deep-equal key and value.
 */
[[nodiscard]] bool
compare_ordered_maps(value a, value b, equality_tracker &tracker,
                     const equality_options &opts);

/**
 * Plain objects, boxed primitives and anything unrecognized
 *
 * Prototypes must be identical unless equality_options::allow_prototype_mismatch
 * is set. Boxed primitives must wrap the same primitive. Own properties must
 * have the same keys with deep-equal values.
 */
[[nodiscard]] bool
compare_structured(value a, value b, equality_tracker &tracker,
                   const equality_options &opts);

} // namespace iso
