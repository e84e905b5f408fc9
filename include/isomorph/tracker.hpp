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
#include "isomorph/stl/unordered_map.hpp"
#include "isomorph/stl/vector.hpp"

#include <utility>

/**
 * \file tracker.hpp
 * Cycle detection and memoization for deep equality
 */

namespace iso {

/**
 * Bookkeeping of object pairs visited by deep equality
 *
 * Each ordered pair of object identities moves from absent to in-progress
 * (optimistically equal) when its comparison starts, and to a definite verdict
 * when it ends. A cyclic reference back to an in-progress pair is answered
 * with "equal", which is what terminates recursion on cyclic values.
 *
 * A true verdict reached while some ancestor pair is in progress may rest on
 * that ancestor's optimistic assumption. Such verdicts are journaled and
 * dropped again if the ancestor resolves false, so that only verdicts that
 * hold unconditionally survive the top-level call.
 *
 * Storage is collected memory; objects referenced by a tracker stay alive
 * (and keep their addresses) for as long as the tracker does. The tracker
 * is not thread-safe.
 *
 * \ingroup equality
 */
class equality_tracker {
  public:
  enum class state {
    absent,
    in_progress,
    equal,
    different,
  };

  /**
   * Handle of a pair whose comparison is in progress
   */
  struct frame {
    const object *a;
    const object *b;
    size_t journal_mark;
  };

  [[nodiscard]] state
  lookup(value a, value b) const;

  /**
   * Mark pair \p a, \p b as in progress
   *
   * \pre lookup(a, b) == state::absent
   */
  [[nodiscard]] frame
  enter(value a, value b);

  /**
   * Record the verdict for a pair returned by enter()
   *
   * Frames must be left in reverse order of entering.
   *
   * \return \p verdict
   */
  bool
  leave(const frame &f, bool verdict);

  /**
   * Number of pairs with an entry (in progress or resolved)
   */
  [[nodiscard]] size_t
  size() const noexcept
  { return m_pairs.size(); }

  /**
   * Number of pairs currently in progress
   */
  [[nodiscard]] size_t
  depth() const noexcept
  { return m_depth; }

  /**
   * Forget everything
   *
   * \pre depth() == 0
   */
  void
  clear();

  private:
  using key_type = std::pair<const object*, const object*>;

  struct key_hash {
    size_t
    operator () (const key_type &key) const noexcept;
  };

  stl::unordered_map<key_type, state, key_hash> m_pairs;
  stl::vector<key_type> m_journal;
  size_t m_depth = 0;
}; // class iso::equality_tracker

} // namespace iso
