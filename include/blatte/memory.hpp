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

#include <gc.h>

#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>

/**
 * \file memory.hpp
 * Memory management utilities
 * 
 * All values of the Blatte data model live in memory managed by the Boehm GC.
 * Nodes produced by the parser as well as whitespace strings attached to them
 * are never freed explicitly.
 * 
 * \ingroup memory
 */

/**
 * \namespace blt
 * The main namespace of the Blatte compiler
 */
namespace blt {

/**
 * Create a garbage-collected object
 * 
 * \tparam T The type of object to create
 * \tparam Args Types of constructor arguments
 * \param args Constructor arguments
 * \return T* Pointer to the newly created object
 * 
 * \ingroup memory
 */
template <typename T, typename ...Args>
T*
make(Args&& ...args)
{
  T* obj = static_cast<T*>(GC_malloc(sizeof(T)));
  if (obj == nullptr)
    throw std::bad_alloc {};
  new (obj) T {std::forward<Args>(args)...};
  return obj;
}

/**
 * Allocate memory that is known not to contain pointers to
 * garbage-collected objects (text of strings and whitespace).
 * 
 * \ingroup memory
 */
inline void*
allocate_atomic(size_t size)
{
  void *p = GC_malloc_atomic(size);
  if (p == nullptr)
    throw std::bad_alloc {};
  return p;
}


/**
 * Standard allocator on top of the garbage collector
 *
 * Containers using it keep GC objects reachable for as long as the container
 * itself is.
 * 
 * \ingroup memory
 */
template <typename T>
struct gc_allocator {
  using value_type = T;
  using size_type = size_t;
  using difference_type = ptrdiff_t;
  using propagate_on_container_move_assignment = std::true_type;
  using is_always_equal = std::true_type;

  gc_allocator() noexcept = default;

  template <typename U>
  gc_allocator(const gc_allocator<U>&) noexcept
  { }

  T*
  allocate(size_type n)
  {
    void *p = GC_malloc(n * sizeof(T));
    if (p == nullptr)
      throw std::bad_alloc {};
    return static_cast<T*>(p);
  }

  void
  deallocate(T *p, [[maybe_unused]] size_type n) noexcept
  { GC_free(p); }

  template <typename U>
  bool
  operator == (const gc_allocator<U>&) const noexcept
  { return true; }
}; // struct blt::gc_allocator

} // namespace blt
