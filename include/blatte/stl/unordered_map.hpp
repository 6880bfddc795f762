#pragma once

#include "blatte/memory.hpp"

#include <unordered_map>

namespace blt {

template <
  typename Key,
  typename T,
  typename Hash = std::hash<Key>,
  typename KeyEqual = std::equal_to<Key>
>
using unordered_map = std::unordered_map<Key, T, Hash, KeyEqual,
                                         gc_allocator<std::pair<const Key, T>>>;

} // namespace blt
