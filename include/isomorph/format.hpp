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

#include <algorithm>
#include <format>
#include <string>

/**
 * \file format.hpp
 * std::format support for values
 *
 * `{}` formats a value in literal notation; `{:#N}` cuts the text after N
 * characters and marks the cut with an ellipsis.
 *
 * \ingroup utils
 */


namespace std {

/**
 * Formatter for iso::value
 *
 * \ingroup utils
 */
template <>
struct formatter<iso::value, char> {
  size_t n = -1;

  template <class ParseContext>
  constexpr ParseContext::iterator
  parse(ParseContext &ctx)
  {
    auto it = ctx.begin();
    if (it != ctx.end() and *it == '#')
    {
      it++;
      n = 0;
      while (it != ctx.end() and *it >= '0' and *it <= '9')
      {
        n *= 10;
        n += *it - '0';
        it += 1;
      }
    }
    if (it != ctx.end() and *it != '}')
      throw std::format_error {"Invalid format arguments for iso::value"};

    return it;
  }

  template <class FmtContext>
  FmtContext::iterator
  format(iso::value x, FmtContext &ctx) const
  {
    std::string text = iso::to_string(x);
    if (text.size() > n)
    {
      text.resize(n);
      text += "…";
    }
    return std::ranges::copy(text, ctx.out()).out;
  }
};

} // namespace std
