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


#include "blatte/code_transformer.hpp"
#include "blatte/source_location.hpp"
#include "blatte/format.hpp" // IWYU pragma: keep


void
blt::code_transformer::prepend_rule(const match &matcher,
                                    const transformation &transformer)
{ m_table.emplace_front(matcher, transformer); }


void
blt::code_transformer::append_rule(const match &matcher,
                                   const transformation &transformer)
{ m_table.emplace_back(matcher, transformer); }


blt::value
blt::code_transformer::operator () (value inexpr) const
{
  // Find the first matching rule
  match_mapping matches;
  for (const auto &[matcher, transformer] : m_table)
  {
    if (matches.clear(), matcher(inexpr, matches))
    {
      const value result = transformer(matches, inexpr);
      if (not has_location(result))
        copy_location(inexpr, result);
      return result;
    }
  }

  throw codegen_error {
      std::format("no translation rule matches the expression {}", inexpr),
      inexpr};
}
