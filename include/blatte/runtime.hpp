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
#include <optional>
#include <string>
#include <string_view>

/**
 * \file runtime.hpp
 * Utilities operating on trees produced by evaluation of translated code
 *
 * A tree consists of scalars (strings and numbers), proper lists, whitespace
 * wrappers and callables. Callables are leaves: traversal never looks inside
 * of them.
 *
 * \ingroup runtime
 */


namespace blt {

/**
 * Outcome of a traversal step
 *
 * `consumed` tells whether the scalar used the whitespace handed to it; the
 * payload is returned untouched and may be anything, including a value that
 * would otherwise count as false.
 *
 * \ingroup runtime
 */
struct traverse_result {
  value result = nil;
  bool consumed = false;
};

/**
 * Callback invoked on each scalar reached by traverse()
 *
 * The first argument is the whitespace in effect for the scalar (none if no
 * wrapper and no explicit override applies).
 *
 * \ingroup runtime
 */
using traverse_callback =
    std::function<traverse_result(std::optional<std::string_view>, value)>;

/**
 * Depth-first, left-to-right walk over scalars of a tree
 *
 * An explicit \p ws is handed down to the first element of a list, and to the
 * following ones only until some scalar consumes it. Every other scalar gets
 * the whitespace of its nearest wrapper.
 *
 * \param obj Tree to traverse
 * \param callback Function invoked on scalars
 * \param ws Whitespace overriding the one of the first scalar
 * \return Result of the first consuming callback, or of the last one if none
 *         of them consumed the whitespace; `{nil, false}` for an empty list
 *
 * \ingroup runtime
 */
traverse_result
traverse(value obj, const traverse_callback &callback,
         std::optional<std::string_view> ws = std::nullopt);

/**
 * Render a tree as text
 *
 * \param obj Tree to render
 * \param ws Whitespace to use in front of the first scalar instead of its own
 *
 * \ingroup runtime
 */
[[nodiscard]] std::string
flatten(value obj, std::optional<std::string_view> ws = std::nullopt);

/**
 * Text of a scalar as it appears in the flattened output
 *
 * Numbers are rendered without trailing zeros; callables render as nothing.
 *
 * \throws std::invalid_argument If \p x is a list or a wrapper
 *
 * \ingroup runtime
 */
[[nodiscard]] std::string
scalar_text(value x);

[[nodiscard]] inline value
wrapws(std::string_view ws, value obj)
{ return blt::ws(ws, obj); }

/**
 * Strip all whitespace wrappers around \p obj
 *
 * \ingroup runtime
 */
[[nodiscard]] inline value
unwrapws(value obj)
{
  while (isws(obj))
    obj = ws_obj(obj);
  return obj;
}

/**
 * Whitespace of the outermost wrapper, or an empty string for a bare value
 *
 * \ingroup runtime
 */
[[nodiscard]] inline std::string_view
wsof(value obj)
{ return isws(obj) ? ws_text(obj) : std::string_view {}; }

/**
 * Truth value
 *
 * After unwrapping: empty list, number zero, empty string and the string "0"
 * are false; anything else is true. A non-empty list is true whatever its
 * elements are.
 *
 * \ingroup runtime
 */
[[nodiscard]] bool
is_true(value obj);

/**
 * Render text as a Blatte literal that reads back as a single word or string
 *
 * \ingroup runtime
 */
[[nodiscard]] std::string
quote(std::string_view str);

/**
 * Invoke a callable
 *
 * \param f Callable (possibly wrapped)
 * \param named Association list of named arguments
 * \param positional List of positional arguments
 * \throws std::invalid_argument If \p f is not a callable
 *
 * \ingroup runtime
 */
value
call(value f, value named, value positional);

} // namespace blt
