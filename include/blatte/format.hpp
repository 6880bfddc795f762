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

#include <sstream>
#include <format>
#include <algorithm>

/**
 * \file format.hpp
 * Formatting utilities
 * 
 * Allows values to be used directly as arguments of std::format() and of the
 * logging functions.
 * 
 * \ingroup utils
 */


namespace std {

/**
 * Formatter for blt::value
 *
 * `{}` prints the debugging representation, `{:w}` writes Blatte source.
 * 
 * \ingroup utils
 */
template <>
struct formatter<blt::value, char> {
  enum class style { write, print } style = style::print;

  template <class ParseContext>
  constexpr ParseContext::iterator
  parse(ParseContext &ctx)
  {
    auto it = ctx.begin();
    if (it != ctx.end() and *it == 'w')
    {
      style = style::write;
      it++;
    }
    if (it != ctx.end() and *it != '}')
      throw std::format_error {"Invalid format arguments for blt::value"};
    return it;
  }

  template <class FmtContext>
  FmtContext::iterator
  format(blt::value x, FmtContext &ctx) const
  {
    std::ostringstream buffer;
    switch (style)
    {
      case style::write: blt::write(buffer, x); break;
      case style::print: blt::print(buffer, x); break;
    }
    return std::ranges::copy(std::move(buffer).str(), ctx.out()).out;
  }
};

} // namespace std
