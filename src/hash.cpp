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


#include "isomorph/hash.hpp"

#include <cmath>
#include <string_view>


size_t
iso::same_value_zero_hash::operator () (const object *x) const noexcept
{
  size_t hash = std::hash<int> {}(static_cast<int>(x->t));
  switch (x->t)
  {
    case tag::num: {
      const double d = x->num;
      if (std::isnan(d))
        return hash;
      // +0 and -0 must land in the same bucket
      hash_combine(hash, d == 0.0 ? 0.0 : d);
      return hash;
    }

    case tag::str:
      hash_combine(hash, std::string_view {x->str.data, x->str.len});
      return hash;

    case tag::bigint:
      hash_combine(hash, std::string_view {x->bigint.data, x->bigint.len});
      return hash;

    default:
      hash_combine(hash, static_cast<const void*>(x));
      return hash;
  }
}
