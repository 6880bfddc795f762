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
#include "blatte/hash.hpp" // IWYU pragma: export
#include "blatte/stl/unordered_map.hpp"
#include "blatte/format.hpp" // IWYU pragma: export

#include <concepts>
#include <utility>

/**
 * \file match.hpp
 * Pattern matching on syntax trees
 *
 * \ingroup syntax
 */


namespace blt {

/**
 * Mapping from pattern variables to the matched sub-trees
 *
 * \ingroup syntax
 */
template <typename T>
concept value_mapping = requires(T &x, value k)
{
  { x.contains(k) } -> std::convertible_to<bool>;
  { x.at(k) } -> std::convertible_to<value>;
  { x.insert(std::make_pair(k, k)) };
  { x.insert_or_assign(k, k) };
};


/**
 * Matcher of syntax trees against a pattern
 *
 * Symbols of the pattern are variables unless listed among the literals, in
 * which case they only match an equal symbol. The symbol `_` matches anything
 * without binding it. An element followed by `...` matches as many
 * consecutive list elements as it can; each variable inside it is bound to the
 * list of its matches (and stays unbound if there were none). A dotted tail of
 * the pattern matches the rest of the list. Other atoms are compared with
 * blt::equal().
 *
 * For instance, with `let` a literal, `(let ((var val) ...) . body)` matches
 * the tree of a `{\let ...}` form, binding `var` and `val` to the lists of
 * variables and values and `body` to the list of body expressions.
 *
 * \ingroup syntax
 */
class match {
  public:
  match(value literals, value pattern)
  : m_literals {literals}, m_pattern {pattern}
  { }

  [[nodiscard]] value
  literals() const noexcept
  { return m_literals; }

  [[nodiscard]] value
  pattern() const noexcept
  { return m_pattern; }

  /**
   * Match \p expr, adding bindings of pattern variables to \p result
   *
   * Bindings made before a failure are left in \p result.
   *
   * \throws bad_code On a pattern starting with an ellipsis
   */
  template <value_mapping Mapping>
  bool
  operator () (value expr, Mapping &result) const
  { return _match(m_pattern, expr, result); }

  bool
  operator () (value expr) const
  {
    blt::unordered_map<value, value> bindings;
    return _match(m_pattern, expr, bindings);
  }

  private:
  static bool
  _is_ellipsis(value x)
  { return issym(x, "..."); }

  template <value_mapping Mapping>
  bool
  _match(value pat, value expr, Mapping &result) const;

  template <value_mapping Mapping>
  bool
  _match_list(value pat, value expr, Mapping &result) const;

  template <value_mapping Mapping>
  bool
  _match_variable(value var, value expr, Mapping &result) const;

  private:
  value m_literals;
  value m_pattern;
}; // class blt::match

} // namespace blt

#include "blatte/match.inl"
