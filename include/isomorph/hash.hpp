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

#include <functional>

namespace iso {

template <class T>
inline void
hash_combine(size_t &seed, const T &v)
{
  std::hash<T> hasher;
  seed ^= hasher(v) + 0x9e3779b9 + (seed<<6) + (seed>>2);
}

/**
 * Hash consistent with same_value_zero()
 *
 * Numbers hash by value with all NaNs and both zeros collapsed, strings and
 * big integers by content, everything else by address.
 */
struct same_value_zero_hash {
  size_t
  operator () (const object *x) const noexcept;
};

struct same_value_zero_equal {
  bool
  operator () (const object *a, const object *b) const noexcept
  { return same_value_zero(value {const_cast<object*>(a)},
                           value {const_cast<object*>(b)}); }
};

} // namespace iso

