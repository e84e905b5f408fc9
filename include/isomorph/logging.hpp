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
#include <exception>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>


namespace iso {

enum class loglevel: int {
  silent,
  error,
  warning,
  info,
  debug,
};

inline std::string_view
loglevel_name(loglevel lvl)
{
  switch (lvl)
  {
    case loglevel::silent: return "silent";
    case loglevel::error: return "error";
    case loglevel::warning: return "warning";
    case loglevel::info: return "info";
    case loglevel::debug: return "debug";
  }
  std::terminate();
}

inline loglevel
parse_loglevel(std::string_view name)
{
  if (name == "silent")
    return loglevel::silent;
  if (name == "error")
    return loglevel::error;
  if (name == "warning")
    return loglevel::warning;
  if (name == "info")
    return loglevel::info;
  if (name == "debug")
    return loglevel::debug;
  throw std::invalid_argument {std::format("Invalid loglevel name ({})", name)};
}


inline bool
operator >= (loglevel a, loglevel b)
{ return static_cast<int>(a) >= static_cast<int>(b); }


/**
 * Current nesting depth of log messages, see iso::indent
 */
extern size_t logging_indent;

/**
 * Messages less severe than this are dropped; defaults to warning
 */
extern loglevel g_loglevel;


/**
 * Strip ANSI escape sequences from a string
 *
 * \param input The input string containing escape sequences
 * \return The string with escape sequences removed
 */
[[nodiscard]] std::string
strip_escape_sequences(std::string_view input);


namespace detail {

/**
 * Print a message to stderr
 *
 * Every line is prefixed with the program name and \p label on the first line,
 * and indented by logging_indent. Lines longer than \p max_length visible
 * characters are cut.
 */
void
write_log(std::string_view label, std::string_view message,
          size_t max_length = 150);

} // namespace iso::detail


template <typename... Args> void
debug([[maybe_unused]] std::format_string<Args...> fmt,
      [[maybe_unused]] Args &&...args)
{
#ifndef ISOMORPH_RELEASE_BUILD
  if (g_loglevel >= loglevel::debug)
  {
    detail::write_log("\e[7;1mdebug\e[0m",
                      std::format(fmt, std::forward<Args>(args)...));
  }
#endif
}


template <typename... Args> void
info(std::format_string<Args...> fmt, Args &&...args)
{
  if (g_loglevel >= loglevel::info)
    detail::write_log("", std::format(fmt, std::forward<Args>(args)...));
}


template <typename... Args> void
warning(std::format_string<Args...> fmt, Args &&...args)
{
  if (g_loglevel >= loglevel::warning)
  {
    detail::write_log("\e[38;5;3;1mwarning\e[0m",
                      std::format(fmt, std::forward<Args>(args)...));
  }
}


template <typename... Args> void
error(std::format_string<Args...> fmt, Args &&...args)
{
  if (g_loglevel >= loglevel::error)
  {
    detail::write_log("\e[38;5;1;1merror\e[0m",
                      std::format(fmt, std::forward<Args>(args)...));
  }
}


/**
 * Increase logging indentation for the lifetime of the object
 */
struct indent {
  indent(size_t inc = 1)
  : m_inc {inc}
  { logging_indent += m_inc; }

  ~indent()
  { logging_indent -= m_inc; }

  indent(const indent&) = delete;
  void operator = (const indent&) = delete;

  private:
  size_t m_inc;
}; // struct iso::indent

} // namespace iso
