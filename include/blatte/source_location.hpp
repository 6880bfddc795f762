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

#include "blatte/value.hpp"
#include "blatte/stl/string.hpp"

#include <string>
#include <string_view>
#include <utility>

/**
 * \file source_location.hpp
 * Source location tracking for parsed values
 * 
 * \ingroup syntax
 */

namespace blt {

/**
 * Structure representing a span in the input text
 * 
 * \ingroup syntax
 */
struct source_location {
  source_location() = default;

  source_location(const source_location &other) = default;

  source_location(std::string_view source_, size_t start, size_t end)
  : source {source_.begin(), source_.end()},
    start {start},
    end {end}
  { }

  source_location&
  operator = (const source_location &other) = default;

  bool
  operator == (const source_location &other) const
  { return source == other.source and start == other.start and end == other.end; }

  stl::string source; ///< Source name (filepath or "<string>")
  size_t start = 0; ///< Start offset in the input text
  size_t end = 0;   ///< End offset in the input text
};

/**
 * Set the source location for a value
 * 
 * \param val Value to set the location for
 * \param loc Source location
 */
void
set_location(value val, const source_location &loc);

/**
 * Get the source location for a value
 * 
 * \param val Value to get the location for
 * \param[out] location Source location if available
 * \return True if location for \p val is available
 */
[[nodiscard]] bool
get_location(value val, source_location &location);

[[nodiscard]] inline bool
has_location(value val)
{ return val->location != nullptr; }

/**
 * Copy the source location to another value
 *
 * \return True if \p from had a location
 */
bool
copy_location(blt::value from, blt::value to);

/**
 * One-based line and column of an offset in \p text
 */
[[nodiscard]] std::pair<size_t, size_t>
line_column(std::string_view text, size_t offset);

/**
 * Display a fragment of a file according to location with surrounding context
 * and highlighting of the location region
 * 
 * Locations in sources that are not files (names starting with '<') are
 * rendered as offsets.
 * 
 * \param location Source location to display
 * \param context_lines Number of context lines to show before and after the location
 * \return Formatted string with the file fragment and highlighting
 */
[[nodiscard]] std::string
display_location(const source_location &location, size_t context_lines = 2,
                 std::string_view hlstyle = "\e[38;5;1;1m",
                 std::string_view ctxstyle = "",
                 std::string_view endstyle = "\e[0m");

} // namespace blt
