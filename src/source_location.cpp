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


#include "blatte/source_location.hpp"
#include "blatte/format.hpp" // IWYU pragma: keep

#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>
#include <vector>


bool
blt::get_location(blt::value val, blt::source_location &location)
{
  if (val->location == nullptr)
    return false;

  location = *val->location;
  return true;
}

void
blt::set_location(blt::value val, const blt::source_location &loc)
{
  // nil is a shared singleton
  if (not is(val, nil))
    val->location = make<source_location>(loc);
}

bool
blt::copy_location(blt::value from, blt::value to)
{
  if (is(to, nil))
    return false;

  return bool(to->location = from->location);
}


// Offsets of the beginnings of all lines in the text
static std::vector<size_t>
_line_offsets(std::string_view text)
{
  std::vector<size_t> offsets {0};
  for (size_t i = 0; i < text.size(); ++i)
  {
    if (text[i] == '\n')
      offsets.push_back(i + 1);
  }
  return offsets;
}

// Index of the line containing the offset
static size_t
_line_of(const std::vector<size_t> &offsets, size_t offset)
{
  const auto it = std::upper_bound(offsets.begin(), offsets.end(), offset);
  return std::distance(offsets.begin(), it) - 1;
}


std::pair<size_t, size_t>
blt::line_column(std::string_view text, size_t offset)
{
  offset = std::min(offset, text.size());
  const std::vector<size_t> offsets = _line_offsets(text);
  const size_t line = _line_of(offsets, offset);
  return {line + 1, offset - offsets[line] + 1};
}


static std::string_view
_safe_substr(std::string_view str, size_t start, size_t len)
{
  start = std::min(start, str.size());
  return str.substr(start, len);
}

static std::string_view
_safe_substr(std::string_view str, size_t start)
{
  start = std::min(start, str.size());
  return str.substr(start);
}

std::string
blt::display_location(const blt::source_location &location,
                      size_t context_lines, std::string_view hlstyle,
                      std::string_view ctxstyle, std::string_view endstyle)
{
  // Strings and the terminal are not files
  if (location.source.empty() or location.source[0] == '<')
    return std::format("in {}: offset {} to {}", location.source,
                       location.start, location.end);

  std::ifstream file {location.source.c_str(), std::ios_base::binary};
  if (not file.is_open())
    return std::format("in {}: offset {} to {} (could not open file)",
                       location.source, location.start, location.end);

  const std::string content {std::istreambuf_iterator<char>(file),
                             std::istreambuf_iterator<char>()};
  file.close();

  if (location.start > content.size() or location.end > content.size())
    return std::format("<invalid location in {}>", location.source);

  const std::vector<size_t> line_offsets = _line_offsets(content);
  const size_t start_line = _line_of(line_offsets, location.start);
  const size_t end_line =
      std::max(start_line, _line_of(line_offsets, location.end));

  // Expand line range with context lines
  const size_t display_start =
      start_line > context_lines ? start_line - context_lines : 0;
  const size_t display_end =
      std::min(end_line + context_lines, line_offsets.size() - 1);

  std::ostringstream output;
  output << std::format("in {}:{}:{} to {}:{}\n", location.source,
                        start_line + 1,
                        location.start - line_offsets[start_line] + 1,
                        end_line + 1, location.end - line_offsets[end_line] + 1);

  for (size_t i = display_start; i <= display_end; ++i)
  {
    size_t line_end =
        (i + 1 < line_offsets.size()) ? line_offsets[i + 1] - 1 : content.size();
    if (line_end > line_offsets[i] and content[line_end - 1] == '\r')
      line_end--; // CRLF line endings

    const std::string_view line =
        _safe_substr(content, line_offsets[i], line_end - line_offsets[i]);

    output << std::format("{:4d} | ", i + 1) << ctxstyle;

    if (i >= start_line and i <= end_line)
    {
      // Columns of the highlighted region within this line
      const size_t from =
          i == start_line ? location.start - line_offsets[i] : 0;
      const size_t to =
          i == end_line ? location.end - line_offsets[i] : line.size();

      output << _safe_substr(line, 0, from);
      output << endstyle << hlstyle;
      output << _safe_substr(line, from, to > from ? to - from : 0);
      output << endstyle << ctxstyle;
      output << _safe_substr(line, to);
    }
    else
      output << line;

    output << endstyle << "\n";
  }

  return output.str();
}
