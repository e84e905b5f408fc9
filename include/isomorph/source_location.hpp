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

#include <cstddef>
#include <string>
#include <string_view>

/**
 * \file source_location.hpp
 * Positions in literal-notation input
 */

namespace iso {

/**
 * Position of a token in the input
 *
 * Lines and columns count from 1; columns count bytes.
 */
struct source_location {
  std::string source; ///< Source name (filepath or "<string>")
  size_t offset = 0; ///< Byte offset in the input
  size_t line = 1;
  size_t column = 1;
};

/**
 * Render a location as `source:line:column` followed by the offending line
 * and a caret under the column
 *
 * \param location Location to display
 * \param line_text Text of the line at \p location (without newline)
 * \param hlstyle Escape sequence used to highlight the caret
 */
[[nodiscard]] std::string
display_location(const source_location &location, std::string_view line_text,
                 std::string_view hlstyle = "\e[38;5;1;1m");

} // namespace iso
