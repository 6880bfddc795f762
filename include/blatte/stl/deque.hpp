#pragma once

#include "blatte/memory.hpp"

#include <deque>


namespace blt::stl {

/**
 * Deque with storage allocated by the GC, so that values kept in it are
 * seen by the collector
 */
template <typename T>
using deque = std::deque<T, gc_allocator<T>>;

} // namespace blt::stl
