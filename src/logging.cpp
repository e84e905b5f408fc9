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


#include "isomorph/logging.hpp"

#include <iostream>
#include <regex>
#include <sstream>


size_t iso::logging_indent = 0;

iso::loglevel iso::g_loglevel = iso::loglevel::warning;


std::string
iso::strip_escape_sequences(std::string_view input)
{
  // Escape sequences start with '\e[' and end with 'm'
  static const std::regex escape_seq_regex("\\\e\\[[^m]*m");
  return std::regex_replace(std::string {input}, escape_seq_regex, "");
}


static void
_put_indent(std::ostream &os, size_t depth)
{
  for (size_t i = 1; i < depth; ++i)
    os << "\e[2m¦\e[0m ";
  if (depth > 0)
    os << "| ";
}


void
iso::detail::write_log(std::string_view label, std::string_view message,
                       size_t max_length)
{
  std::ostringstream buf;
  std::istringstream input {std::string {message}};
  bool first = true;
  for (std::string line; std::getline(input, line); first = false)
  {
    buf << "isomorph ";
    if (first)
      buf << label << (label.empty() ? "" : " ");
    _put_indent(buf, logging_indent);

    const std::string stripped = strip_escape_sequences(line);
    if (max_length > 0 and stripped.size() > max_length)
      buf << stripped.substr(0, max_length - 1) << "…\n";
    else
      buf << line << "\n";
  }
  std::cerr << buf.str();
}
