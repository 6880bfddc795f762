/*
 * Blatte - text macro/markup language compiler
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

namespace blt {

/**
 * Measures the time spent in a block of code
 *
 * Timing starts on construction (unless asked otherwise) and the elapsed time
 * is added to per-name totals when the timer is stopped or destroyed.
 *
 * Usage example:
 * ```
 * {
 *   execution_timer timer {"translate"};
 *   // Code to measure
 * }
 * execution_timer::report_global_stats();
 * ```
 */
class execution_timer {
  public:
  explicit execution_timer(std::string_view name, bool auto_start = true);

  ~execution_timer();

  execution_timer(const execution_timer&) = delete;
  execution_timer& operator = (const execution_timer&) = delete;

  /**
   * Log accumulated durations of all named timers at `info` level
   */
  static void
  report_global_stats();

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

  /**
   * Log time elapsed on this timer at `info` level
   */
  void
  report() const;

  private:
  std::string m_name;
  bool m_running;
  std::chrono::time_point<std::chrono::steady_clock> m_start_time;
  std::chrono::nanoseconds m_total_duration;
}; // class blt::execution_timer

} // namespace blt
