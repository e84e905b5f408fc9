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


#include "isomorph/comparators.hpp"
#include "isomorph/equality.hpp"
#include "isomorph/ordered_table.hpp"

#include <algorithm>
#include <vector>


bool
iso::compare_sequences(value a, value b, equality_tracker &tracker,
                       const equality_options &opts)
{
  const size_t length = array_length(a);
  if (array_length(b) != length)
    return false;

  for (size_t i = 0; i < length; ++i)
  {
    if (opts.strict_sparse_arrays)
    {
      const bool ahas = array_has(a, i);
      if (ahas != array_has(b, i))
        return false;
      if (not ahas)
        continue;
    }

    if (not deep_equal(array_get(a, i), array_get(b, i), tracker, opts))
      return false;
  }
  return true;
}


bool
iso::compare_instants(value a, value b)
{ return date_ms(a) == date_ms(b); }


bool
iso::compare_patterns(value a, value b)
{
  return regexp_source(a) == regexp_source(b) and
         regexp_flags(a) == regexp_flags(b);
}


bool
iso::compare_fixed_buffers(value a, value b)
{
  if (typed_array_kind(a) != typed_array_kind(b))
    return false;

  const std::span<const std::byte> abytes = typed_array_bytes(a);
  const std::span<const std::byte> bbytes = typed_array_bytes(b);
  return std::ranges::equal(abytes, bbytes);
}


bool
iso::compare_ordered_sets(value a, value b, equality_tracker &tracker,
                          const equality_options &opts)
{
  const size_t size = set_size(a);
  if (set_size(b) != size)
    return false;

  const stl::vector<value> bvals = set_values(b);
  std::vector<bool> used (bvals.size(), false);

  for (const value x : set_values(a))
  {
    // Identical (or strictly equal) element first
    auto it = std::find_if(bvals.begin(), bvals.end(), [&](const value &y) {
      return not used[&y - bvals.data()] and strict_equals(x, y);
    });

    if (it == bvals.end())
    {
      for (it = bvals.begin(); it != bvals.end(); ++it)
      {
        if (not used[it - bvals.begin()] and deep_equal(x, *it, tracker, opts))
          break;
      }
    }

    if (it == bvals.end())
      return false;
    used[it - bvals.begin()] = true;
  }
  return true;
}


bool
iso::compare_ordered_maps(value a, value b, equality_tracker &tracker,
                          const equality_options &opts)
{
  const ordered_table &amap = *a->map;
  const ordered_table &bmap = *b->map;
  if (amap.size() != bmap.size())
    return false;
  if (amap.empty())
    return true;

  const ordered_table::entry *bfirst = &*bmap.begin();
  std::vector<bool> used (bmap.size(), false);

  for (const ordered_table::entry &aentry : amap)
  {
    const value key {aentry.key};
    const value val {aentry.val};

    if (isprimitive(key))
    {
      const ordered_table::entry *bentry = bmap.find(key);
      if (bentry == nullptr or used[bentry - bfirst])
        return false;
      if (not deep_equal(val, value {bentry->val}, tracker, opts))
        return false;
      used[bentry - bfirst] = true;
      continue;
    }

    bool found = false;
    for (const ordered_table::entry &bentry : bmap)
    {
      const size_t idx = &bentry - bfirst;
      if (used[idx])
        continue;
      if (deep_equal(key, value {bentry.key}, tracker, opts) and
          deep_equal(val, value {bentry.val}, tracker, opts))
      {
        used[idx] = true;
        found = true;
        break;
      }
    }
    if (not found)
      return false;
  }
  return true;
}


static const iso::ordered_table*
_own_properties(iso::value x) noexcept
{
  switch (x->t)
  {
    case iso::tag::object: return x->props;
    case iso::tag::boxed: return x->boxed.props;
    default: return nullptr;
  }
}

bool
iso::compare_structured(value a, value b, equality_tracker &tracker,
                        const equality_options &opts)
{
  if (not opts.allow_prototype_mismatch and prototype_of(a) != prototype_of(b))
    return false;

  if (isboxed(a) or isboxed(b))
  {
    if (not isboxed(a) or not isboxed(b))
      return false;
    if (not same_value_zero(unbox(a), unbox(b)))
      return false;
  }

  const ordered_table *aprops = _own_properties(a);
  const ordered_table *bprops = _own_properties(b);
  const size_t asize = aprops ? aprops->size() : 0;
  const size_t bsize = bprops ? bprops->size() : 0;
  if (asize != bsize)
    return false;
  if (asize == 0)
    return true;

  for (const ordered_table::entry &aentry : *aprops)
  {
    const ordered_table::entry *bentry = bprops->find(value {aentry.key});
    if (bentry == nullptr)
      return false;
    if (not deep_equal(value {aentry.val}, value {bentry->val}, tracker, opts))
      return false;
  }
  return true;
}
