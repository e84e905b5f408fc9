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

#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>


namespace iso {

/**
 * Invalid input to a value constructor or mutator
 *
 * The offending value is kept in literal notation rather than as a handle:
 * exception objects live outside collected memory.
 */
struct bad_value: std::runtime_error {
  bad_value(std::string_view what): runtime_error(std::string(what)) { }
  bad_value(std::string_view what, value culprit);

  virtual
  ~bad_value() = default;

  /**
   * Literal notation of the offending value; empty if there is none
   */
  [[nodiscard]] const std::string&
  culprit() const noexcept
  { return m_culprit; }

  virtual void
  display(std::ostream &os) const noexcept;

  std::string
  display() const
  {
    std::ostringstream buf;
    display(buf);
    return buf.str();
  }

  private:
  std::string m_culprit;
}; // struct iso::bad_value

} // namespace iso
