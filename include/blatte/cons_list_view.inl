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

#include <cstddef>
#include <iterator>
#include <ranges>


namespace blt {

/**
 * \name Ranges over cons-lists
 *
 * Used for iteration over the elements of syntax-tree nodes:
 * ```
 * for (const value item : range(items))
 *   ...
 * ```
 * Iteration stops at the first cell that is not a pair; the overload of
 * range() taking a reference stores that last cdr (nil for proper lists), so
 * dotted lists can be handled too.
 *
 * \{
 */

/**
 * Forward iterator over the elements of a cons-list
 *
 * \ingroup core
 */
class list_iterator {
  public:
  using difference_type = std::ptrdiff_t;
  using value_type = value;

  list_iterator(): m_cell {nil} { }

  explicit list_iterator(value cell): m_cell {cell} { }

  value
  operator * () const noexcept
  { return car<false>(m_cell); }

  list_iterator&
  operator ++ () noexcept
  {
    m_cell = cdr<false>(m_cell);
    return *this;
  }

  list_iterator
  operator ++ (int) noexcept
  {
    const list_iterator old = *this;
    ++*this;
    return old;
  }

  bool
  operator == (const list_iterator &other) const noexcept
  { return is(m_cell, other.m_cell); }

  [[nodiscard]] value
  cell() const noexcept
  { return m_cell; }

  private:
  value m_cell;
}; // class blt::list_iterator
static_assert(std::forward_iterator<list_iterator>);


/**
 * End of a cons-list: any cell that is not a pair
 *
 * \ingroup core
 */
class list_sentinel {
  public:
  list_sentinel() = default;

  explicit list_sentinel(value *tail): m_tail {tail} { }

  bool
  operator == (const list_iterator &it) const noexcept
  {
    if (ispair(it.cell()))
      return false;
    if (m_tail != nullptr)
      *m_tail = it.cell();
    return true;
  }

  private:
  value *m_tail = nullptr;
}; // class blt::list_sentinel
static_assert(std::sentinel_for<list_sentinel, list_iterator>);


/**
 * View of the elements of a cons-list
 *
 * \ingroup core
 */
class list_view: public std::ranges::view_interface<list_view> {
  public:
  list_view() = default;

  explicit list_view(value l, value *tail = nullptr)
  : m_list {l}, m_tail {tail}
  { }

  list_iterator
  begin() const noexcept
  { return list_iterator {m_list}; }

  list_sentinel
  end() const noexcept
  { return list_sentinel {m_tail}; }

  private:
  value m_list;
  value *m_tail = nullptr;
}; // class blt::list_view
static_assert(std::ranges::forward_range<list_view>);
static_assert(std::ranges::view<list_view>);


/**
 * Range over the elements of \p l
 *
 * \ingroup core
 */
inline list_view
range(value l)
{ return list_view {l}; }

/**
 * Range over the elements of \p l storing the terminating cdr in \p tail
 *
 * \ingroup core
 */
inline list_view
range(value l, value &tail)
{ return list_view {l, &tail}; }

/** \} */

} // namespace blt
