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


/**
 * \file match.inl
 * Template members of blt::match
 */
#pragma once

#include "blatte/match.hpp"
#include "blatte/exceptions.hpp"

#include <format>


template <blt::value_mapping Mapping>
bool
blt::match::_match_variable(value var, value expr, Mapping &result) const
{
  if (issym(var, "_"))
    return true;

  // Repeated variables must match equal sub-trees
  if (result.contains(var))
    return equal(result.at(var), expr);
  result.insert({var, expr});
  return true;
}


template <blt::value_mapping Mapping>
bool
blt::match::_match(value pat, value expr, Mapping &result) const
{
  switch (pat->t)
  {
    case tag::sym:
      if (member(pat, m_literals))
        return equal(pat, expr);
      return _match_variable(pat, expr, result);

    case tag::pair:
      if (_is_ellipsis(car(pat)))
        throw bad_code {
            std::format("ellipsis at the beginning of a pattern list: {}", pat),
            pat};
      return _match_list(pat, expr, result);

    default:
      return equal(pat, expr);
  }
}


template <blt::value_mapping Mapping>
bool
blt::match::_match_list(value pat, value expr, Mapping &result) const
{
  while (ispair(pat))
  {
    const value elt = car(pat);
    const value next = cdr(pat);

    if (ispair(next) and _is_ellipsis(car(next)))
    {
      // Greedy repetition; every match contributes one element to the lists
      // bound to the variables of `elt`
      blt::unordered_map<value, value> once;
      while (ispair(expr) and _match(elt, car(expr), once))
      {
        for (const auto &[var, val] : once)
        {
          const value acc = result.contains(var) ? result.at(var) : nil;
          result.insert_or_assign(var, append(acc, list(val)));
        }
        once.clear();
        expr = cdr(expr);
      }
      pat = cdr(next);
      continue;
    }

    if (not ispair(expr) or not _match(elt, car(expr), result))
      return false;
    pat = next;
    expr = cdr(expr);
  }

  // Dotted tail or the end of both lists
  return _match(pat, expr, result);
}
