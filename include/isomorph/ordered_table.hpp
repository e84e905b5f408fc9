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
#include "isomorph/hash.hpp"
#include "isomorph/stl/unordered_map.hpp"
#include "isomorph/stl/vector.hpp"

/**
 * \file ordered_table.hpp
 * Insertion-ordered key/value table used for own properties, sets and maps
 */

namespace iso {

/**
 * Insertion-ordered table keyed by same_value_zero()
 *
 * Entries live in a vector in insertion order; a hash index maps keys to
 * their position. Erasing shifts later entries down, so iteration order
 * stays insertion order without tombstones.
 *
 * Sets store each element as both key and value.
 *
 * \ingroup core
 */
class ordered_table {
  public:
  struct entry {
    object *key;
    object *val;
  };

  using const_iterator = stl::vector<entry>::const_iterator;

  [[nodiscard]] size_t
  size() const noexcept
  { return m_entries.size(); }

  [[nodiscard]] bool
  empty() const noexcept
  { return m_entries.empty(); }

  /**
   * \return Entry with key equal to \p key, or nullptr
   */
  [[nodiscard]] const entry*
  find(value key) const;

  [[nodiscard]] bool
  contains(value key) const
  { return find(key) != nullptr; }

  /**
   * Insert a new entry or replace the value of an existing one
   *
   * An existing entry keeps both its position and its original key object.
   *
   * \return True if a new entry was inserted
   */
  bool
  insert_or_assign(value key, value val);

  /**
   * \return True if an entry was removed
   */
  bool
  erase(value key);

  [[nodiscard]] const_iterator
  begin() const noexcept
  { return m_entries.begin(); }

  [[nodiscard]] const_iterator
  end() const noexcept
  { return m_entries.end(); }

  private:
  stl::vector<entry> m_entries;
  stl::unordered_map<object*, size_t, same_value_zero_hash,
                     same_value_zero_equal> m_index;
}; // class iso::ordered_table

} // namespace iso
