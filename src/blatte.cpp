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


#include "blatte/blatte.hpp"
#include "blatte/logging.hpp"
#include "blatte/utilities/execution_timer.hpp"


const blt::parser&
blt::default_parser()
{
  static const parser instance;
  return instance;
}


const blt::perl_emitter&
blt::default_emitter()
{
  static const perl_emitter instance;
  return instance;
}


std::optional<std::string>
blt::parse(std::string_view input)
{
  size_t pos = 0;
  const std::optional<value> expr = default_parser().read(input, pos);
  if (not expr)
    return std::nullopt;
  return default_emitter().emit(*expr);
}


std::optional<std::string>
blt::parse_front(std::string &buffer)
{
  size_t pos = 0;
  const std::optional<value> expr = default_parser().read(buffer, pos);
  if (not expr)
    return std::nullopt;

  // Translate before touching the buffer
  std::string code = default_emitter().emit(*expr);
  buffer.erase(0, pos);
  return code;
}


std::string
blt::translate(std::string_view text, const translation_options &options,
               const parser &syntax)
{
  execution_timer timer {"translate"};

  value exprs = nil;
  size_t pos = 0;
  while (const std::optional<value> expr =
             syntax.read(text, pos, options.source_name))
    exprs = cons(*expr, exprs);
  exprs = reverse(exprs);
  debug("parsed {} expressions from {}", length(exprs), options.source_name);

  const std::string trailing =
      syntax.trailing_whitespace(text, pos, options.source_name);

  if (options.package == default_emitter().package())
    return default_emitter().emit_document(exprs, trailing, options.standalone);

  const perl_emitter emitter {options.package};
  return emitter.emit_document(exprs, trailing, options.standalone);
}
