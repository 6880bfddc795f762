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

#include <functional>

/**
 * \file hash.hpp
 * Hashing of syntax trees and run-time values
 *
 * Lets values serve as keys of blt::unordered_map, e.g. the variable bindings
 * collected by blt::match.
 *
 * \ingroup core
 */


namespace blt {

/**
 * Fold hash \p h into \p seed
 */
[[nodiscard]] constexpr size_t
mix_hash(size_t seed, size_t h) noexcept
{ return seed ^ (h + 0x9e3779b9 + (seed << 6) + (seed >> 2)); }

template <class T>
inline void
hash_combine(size_t &seed, const T &v)
{ seed = mix_hash(seed, std::hash<T> {}(v)); }

/**
 * Structural hash consistent with blt::equal()
 *
 * Whitespace wrappers hash their text together with the wrapped value, so
 * `a` and ` a` land in different buckets. Native functions hash by their
 * procedure pointer.
 *
 * \ingroup core
 */
[[nodiscard]] size_t
hash(const value &x);

} // namespace blt


template <>
struct std::hash<blt::value> {
  size_t
  operator () (const blt::value &x) const noexcept
  { return blt::hash(x); }
};
