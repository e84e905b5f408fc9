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
 * \file equality.hpp
 * Deep structural equality
 *
 * \ingroup equality
 */

namespace iso {

/**
 * Compare two values structurally
 *
 * Uses a fresh tracker for the duration of the call.
 *
 * \ingroup equality
 */
[[nodiscard]] bool
is_equal(value a, value b, const equality_options &opts = {});

/**
 * Compare two values structurally with a caller-owned tracker
 *
 * Verdicts recorded in \p tracker by earlier calls are reused. Only reuse a
 * tracker across calls made with the same options and while the compared
 * values are not mutated.
 *
 * \ingroup equality
 */
[[nodiscard]] bool
is_equal_with_shared_tracker(value a, value b, equality_tracker &tracker,
                             const equality_options &opts = {});

/**
 * Recursive step of deep equality
 *
 * Entry point for comparators recursing into nested values.
 *
 * \ingroup equality
 */
[[nodiscard]] bool
deep_equal(value a, value b, equality_tracker &tracker,
           const equality_options &opts);

} // namespace iso
