#pragma once

#include "blatte/memory.hpp"

#include <vector>


namespace blt::stl {

/**
 * Vector with storage allocated by the GC, so that values kept in it are
 * seen by the collector
 */
template <typename T>
using vector = std::vector<T, gc_allocator<T>>;

} // namespace blt::stl
