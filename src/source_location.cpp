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


#include "isomorph/source_location.hpp"

#include <algorithm>
#include <format>


std::string
iso::display_location(const source_location &location,
                      std::string_view line_text, std::string_view hlstyle)
{
  std::string result =
      std::format("{}:{}:{}", location.source, location.line, location.column);
  if (line_text.empty())
    return result;

  const std::string lineno = std::to_string(location.line);
  result += std::format("\n {} | {}\n", lineno, line_text);
  result += std::format(" {:{}} | ", "", lineno.size());

  // Keep tabs so the caret lines up with the text above it
  const size_t ncols = std::min(location.column - 1, line_text.size());
  for (size_t i = 0; i < ncols; ++i)
    result += line_text[i] == '\t' ? '\t' : ' ';
  result += std::format("{}^{}", hlstyle, hlstyle.empty() ? "" : "\e[0m");
  return result;
}
