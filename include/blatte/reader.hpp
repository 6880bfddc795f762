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

#include "blatte/parser.hpp"
#include "blatte/stl/deque.hpp"
#include "blatte/value.hpp"

#include <string>
#include <string_view>

/**
 * \file reader.hpp
 * Incremental reader of Blatte expressions
 *
 * \ingroup syntax
 */


namespace blt {

/**
 * Utility class allowing gradual parsing of text fragments
 *
 * Fragments are accumulated until they make up complete expressions; an
 * expression cut in the middle (an open group, an unterminated string) waits
 * for more input. Whitespace left after the last expression is kept as the
 * leading whitespace of the next one.
 *
 * \ingroup syntax
 */
class reader {
  public:
  explicit reader(const parser &parser,
                  std::string_view source_name = "<stdin>");

  /**
   * Append text and parse all expressions it completes
   *
   * \throws lex_error, parse_error On errors that more input cannot fix; the
   *         pending text is discarded in this case
   */
  void
  operator << (std::string_view input);

  /**
   * Extract the next complete expression
   *
   * \return False if there are no complete expressions
   */
  bool
  operator >> (value &result);

  /**
   * Check whether there is unparsed text other than whitespace and comments
   */
  [[nodiscard]] bool
  pending() const;

  /**
   * Discard pending text and unread expressions
   */
  void
  reset();

  private:
  bool
  _is_incomplete(size_t pos) const;

  private:
  const parser &m_parser;
  std::string m_source;
  std::string m_buffer;
  stl::deque<value> m_values;
}; // class blt::reader

} // namespace blt
