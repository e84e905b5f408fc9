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
#include "isomorph/classify.hpp"
#include "isomorph/comparators.hpp"
#include "isomorph/format.hpp"
#include "isomorph/logging.hpp"
#include "isomorph/utilities/execution_timer.hpp"

#include <cmath>


static bool
_isnan(iso::value x) noexcept
{ return iso::isnum(x) and std::isnan(iso::num_val(x)); }


static bool
_dispatch(iso::value a, iso::value b, iso::equality_tracker &tracker,
          const iso::equality_options &opts)
{
  using namespace iso;

  const category acat = classify(a);
  const category bcat = classify(b);
  if (acat != bcat)
  {
    debug("category mismatch: {} vs {}", category_name(acat),
          category_name(bcat));
    return false;
  }

  switch (acat)
  {
    case category::sequence:
      return compare_sequences(a, b, tracker, opts);

    case category::instant:
      return compare_instants(a, b);

    case category::pattern:
      return compare_patterns(a, b);

    case category::fixed_buffer:
      return compare_fixed_buffers(a, b);

    case category::ordered_set:
      return compare_ordered_sets(a, b, tracker, opts);

    case category::ordered_map:
      return compare_ordered_maps(a, b, tracker, opts);

    case category::primitive:
    case category::callable:
      // Resolved before the tracker is consulted
      return false;

    case category::boxed_primitive:
    case category::plain_structured:
      break;
  }
  return compare_structured(a, b, tracker, opts);
}


bool
iso::deep_equal(value a, value b, equality_tracker &tracker,
                const equality_options &opts)
{
  if (is(a, b))
    return true;
  if (isprimitive(a) and isprimitive(b) and strict_equals(a, b))
    return true;
  if (_isnan(a) and _isnan(b))
    return true;

  if (opts.normalize_boxed_primitives)
  {
    if (isboxed(a))
      a = unbox(a);
    if (isboxed(b))
      b = unbox(b);
    if (isprimitive(a) and isprimitive(b))
      return same_value_zero(a, b);
  }

  if (isprimitive(a) or isprimitive(b))
    return false;

  // Functions have no structure to compare
  if (isfunction(a) or isfunction(b))
    return false;

  switch (tracker.lookup(a, b))
  {
    case equality_tracker::state::in_progress:
    case equality_tracker::state::equal:
      return true;
    case equality_tracker::state::different:
      return false;
    case equality_tracker::state::absent:
      break;
  }

  debug("compare {:#60} with {:#60}", a, b);
  const equality_tracker::frame frame = tracker.enter(a, b);
  bool verdict;
  {
    indent _;
    verdict = _dispatch(a, b, tracker, opts);
  }
  debug("-> {}", verdict ? "equal" : "different");
  return tracker.leave(frame, verdict);
}


bool
iso::is_equal(value a, value b, const equality_options &opts)
{
  ISO_FUNCTION_BENCHMARK

  equality_tracker tracker;
  return deep_equal(a, b, tracker, opts);
}


bool
iso::is_equal_with_shared_tracker(value a, value b, equality_tracker &tracker,
                                  const equality_options &opts)
{
  ISO_FUNCTION_BENCHMARK

  return deep_equal(a, b, tracker, opts);
}


bool
iso::value::operator == (value other) const
{ return is_equal(*this, other); }
