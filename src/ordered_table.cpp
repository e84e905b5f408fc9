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


#include "isomorph/ordered_table.hpp"


const iso::ordered_table::entry*
iso::ordered_table::find(value key) const
{
  const auto it = m_index.find(&*key);
  if (it == m_index.end())
    return nullptr;
  return &m_entries[it->second];
}


bool
iso::ordered_table::insert_or_assign(value key, value val)
{
  const auto [it, inserted] = m_index.emplace(&*key, m_entries.size());
  if (not inserted)
  {
    m_entries[it->second].val = &*val;
    return false;
  }

  m_entries.push_back({&*key, &*val});
  return true;
}


bool
iso::ordered_table::erase(value key)
{
  const auto it = m_index.find(&*key);
  if (it == m_index.end())
    return false;

  const size_t pos = it->second;
  m_index.erase(it);
  m_entries.erase(m_entries.begin() + pos);

  // Positions of everything after the removed entry moved down by one
  for (size_t i = pos; i < m_entries.size(); ++i)
    m_index[m_entries[i].key] = i;
  return true;
}
