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
#include "blatte/source_location.hpp"

#include <stdexcept>
#include <ostream>
#include <sstream>
#include <optional>
#include <string>
#include <string_view>

/**
 * \file exceptions.hpp
 * Errors raised while translating Blatte code
 *
 * All of them are thrown synchronously at the point of detection; a failed
 * translation of an expression produces no partial output.
 *
 * \ingroup syntax
 */


namespace blt {

/**
 * Base class for errors caused by the input code
 *
 * \ingroup syntax
 */
struct bad_code: std::runtime_error {
  bad_code(std::string_view what): runtime_error(std::string(what)) { }
  bad_code(std::string_view what, const source_location &location);
  bad_code(std::string_view what, value code);

  [[nodiscard]] const std::optional<source_location>&
  location() const noexcept
  { return m_location; }

  /**
   * Write the kind of the error, the message, and the offending source
   * fragment if the location is known
   */
  void
  display(std::ostream &os) const noexcept;

  std::string
  display() const
  {
    std::ostringstream buf;
    display(buf);
    return buf.str();
  }

  protected:
  [[nodiscard]] virtual std::string_view
  kind() const noexcept
  { return "error"; }

  private:
  std::optional<source_location> m_location;
}; // struct blt::bad_code


/**
 * Lexical error: unterminated string, dangling backslash
 *
 * \ingroup syntax
 */
struct lex_error: public bad_code {
  using bad_code::bad_code;

  protected:
  std::string_view
  kind() const noexcept override
  { return "lexical error"; }
};


/**
 * Syntax error: malformed special form, unmatched brace, invalid identifier,
 * misplaced rest parameter, malformed binding pair
 *
 * \ingroup syntax
 */
struct parse_error: public bad_code {
  using bad_code::bad_code;

  protected:
  std::string_view
  kind() const noexcept override
  { return "syntax error"; }
};


/**
 * Internal error of the code generator on a tree that passed parsing
 *
 * \ingroup syntax
 */
struct codegen_error: public bad_code {
  using bad_code::bad_code;

  protected:
  std::string_view
  kind() const noexcept override
  { return "code generation error"; }
};

} // namespace blt
