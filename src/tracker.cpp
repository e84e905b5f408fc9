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


#include "isomorph/tracker.hpp"
#include "isomorph/hash.hpp"

#include <cassert>


size_t
iso::equality_tracker::key_hash::operator () (const key_type &key) const noexcept
{
  size_t hash = 0;
  hash_combine(hash, key.first);
  hash_combine(hash, key.second);
  return hash;
}


iso::equality_tracker::state
iso::equality_tracker::lookup(value a, value b) const
{
  const auto it = m_pairs.find({&*a, &*b});
  return it == m_pairs.end() ? state::absent : it->second;
}


iso::equality_tracker::frame
iso::equality_tracker::enter(value a, value b)
{
  [[maybe_unused]] const bool inserted =
      m_pairs.emplace(key_type {&*a, &*b}, state::in_progress).second;
  assert(inserted and "pair is already tracked");
  m_depth += 1;
  return {&*a, &*b, m_journal.size()};
}


bool
iso::equality_tracker::leave(const frame &f, bool verdict)
{
  assert(m_depth > 0);
  const key_type key {f.a, f.b};
  m_pairs[key] = verdict ? state::equal : state::different;
  m_depth -= 1;

  if (not verdict)
  {
    // Equalities found below this pair may have assumed it equal
    for (size_t i = f.journal_mark; i < m_journal.size(); ++i)
      m_pairs.erase(m_journal[i]);
    m_journal.resize(f.journal_mark);
  }
  else if (m_depth > 0)
    m_journal.push_back(key);

  if (m_depth == 0)
    m_journal.clear();
  return verdict;
}


void
iso::equality_tracker::clear()
{
  assert(m_depth == 0);
  m_pairs.clear();
  m_journal.clear();
}
