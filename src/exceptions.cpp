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


#include "isomorph/exceptions.hpp"


iso::bad_value::bad_value(std::string_view what, value culprit)
: runtime_error(std::string(what)), m_culprit {to_string(culprit)}
{ }


void
iso::bad_value::display(std::ostream &os) const noexcept
{
  os << what();
  if (not m_culprit.empty())
    os << "\n  culprit: " << m_culprit;
}
