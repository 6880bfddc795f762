#pragma once

#include "blatte/memory.hpp"

#include <string>


namespace blt::stl {

using string = std::basic_string<char, std::char_traits<char>, gc_allocator<char>>;

} // namespace blt::stl
