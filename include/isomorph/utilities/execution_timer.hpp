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

#include <chrono>
#include <string>
#include <string_view>

/**
 * Time the enclosing function; totals are reported by
 * execution_timer::report_global_stats()
 */
#define ISO_FUNCTION_BENCHMARK \
  ::iso::execution_timer _iso_function_timer {__func__};

namespace iso {

/**
 * Scoped stopwatch accumulating per-name statistics
 */
class execution_timer {
  public:
  /**
   * \param name Name of the operation being timed
   * \param auto_start Whether to start timing immediately
   */
  explicit execution_timer(std::string_view name, bool auto_start = true);

  /**
   * Stops the timer if it is still running
   */
  ~execution_timer();

  execution_timer(const execution_timer&) = delete;
  void operator = (const execution_timer&) = delete;

  /**
   * Log total and maximum duration of every name timed so far
   */
  static void
  report_global_stats();

  /**
   * Drop all accumulated statistics
   */
  static void
  reset_global_stats();

  void
  start();

  void
  stop();

  void
  reset();

  template <typename Duration>
  Duration
  elapsed() const
  { return std::chrono::duration_cast<Duration>(m_total_duration); }

  void
  report() const;

  private:
  std::string m_name;
  bool m_running;
  std::chrono::time_point<std::chrono::steady_clock> m_start_time;
  std::chrono::nanoseconds m_total_duration;
}; // class iso::execution_timer

} // namespace iso
