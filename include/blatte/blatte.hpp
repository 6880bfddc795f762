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
#include "blatte/perl_emitter.hpp"
#include "blatte/runtime.hpp" // IWYU pragma: export
#include "blatte/value.hpp"

#include <optional>
#include <string>
#include <string_view>

/**
 * \file blatte.hpp
 * Entry points translating Blatte text into Perl
 *
 * \ingroup syntax
 */


namespace blt {

/**
 * Parser with the default keyword table
 *
 * Constructed on first use and shared afterwards; the parser keeps no state
 * between calls, so sharing it is safe.
 *
 * \ingroup syntax
 */
[[nodiscard]] const parser&
default_parser();

/**
 * Code generator targeting the default runtime package
 *
 * \ingroup syntax
 */
[[nodiscard]] const perl_emitter&
default_emitter();

/**
 * Translate the first expression of \p input into Perl
 *
 * \return Perl code, or nothing if \p input holds no expression
 * \throws lex_error, parse_error, codegen_error
 *
 * \ingroup syntax
 */
[[nodiscard]] std::optional<std::string>
parse(std::string_view input);

/**
 * Translate the first expression of \p buffer into Perl and remove its text
 * from the front of the buffer
 *
 * The buffer is left untouched on failure, or if no expression is found.
 *
 * \ingroup syntax
 */
std::optional<std::string>
parse_front(std::string &buffer);

/**
 * Parameters of translation of a whole document
 *
 * \ingroup syntax
 */
struct translation_options {
  std::string source_name = "<string>";
  std::string package = "Blatte"; ///< Perl package of the runtime
  bool standalone = false; ///< Make a program printing the rendered document
};

/**
 * Translate all of \p text into Perl
 *
 * \throws lex_error, parse_error, codegen_error
 *
 * \ingroup syntax
 */
[[nodiscard]] std::string
translate(std::string_view text, const translation_options &options = {},
          const parser &syntax = default_parser());

} // namespace blt
