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


#include "blatte/value.hpp"
#include "blatte/hash.hpp"

#include <unordered_set>

using _pair_of_pointers = std::pair<void*, void*>;


namespace std {
template <>
struct hash<_pair_of_pointers> {
  size_t
  operator () (const _pair_of_pointers p) const noexcept
  {
    size_t hash = 0;
    blt::hash_combine(hash, p.first);
    blt::hash_combine(hash, p.second);
    return hash;
  }
};
}

using _memory_set = std::unordered_set<_pair_of_pointers>;


static bool
_equal(blt::value a, blt::value b, _memory_set &mem)
{
  if (is(a, b))
    return true;

  if (a->t != b->t)
    return false;

  switch (a->t)
  {
    case blt::tag::nil:
      return true;

    case blt::tag::sym:
      return sym_name(a) == sym_name(b);

    case blt::tag::str:
      return str_view(a) == str_view(b);

    case blt::tag::num:
      return num_val(a) == num_val(b);

    case blt::tag::fn:
      return a->fn.proc == b->fn.proc;

    case blt::tag::ws:
      return ws_text(a) == ws_text(b) and _equal(ws_obj(a), ws_obj(b), mem);

    case blt::tag::pair: {
      // Don't repeat test on same pairs of pairs (objects)
      if (not mem.emplace(&*a, &*b).second)
        return true;

      return _equal(car(a), car(b), mem) and _equal(cdr(a), cdr(b), mem);
    }
  }

  std::terminate();
}

bool
blt::equal(value a, value b)
{
  _memory_set mem;
  return _equal(a, b, mem);
}
