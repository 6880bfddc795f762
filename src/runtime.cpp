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


#include "blatte/runtime.hpp"
#include "blatte/format.hpp" // IWYU pragma: keep

#include <cmath>
#include <format>


blt::traverse_result
blt::traverse(value obj, const traverse_callback &callback,
              std::optional<std::string_view> ws)
{
  if (isws(obj))
    return traverse(ws_obj(obj), callback, ws ? ws : ws_text(obj));

  if (isnil(obj))
    return {};

  if (ispair(obj))
  {
    traverse_result result = traverse(car(obj), callback, ws);
    for (const value x : range(cdr(obj)))
    {
      const traverse_result r =
          traverse(x, callback, result.consumed ? std::nullopt : ws);
      if (not result.consumed)
        result = r;
    }
    return result;
  }

  return callback(ws, obj);
}


std::string
blt::scalar_text(value x)
{
  switch (x->t)
  {
    case tag::str:
      return std::string {str_view(x)};

    case tag::sym:
      return std::string {sym_name(x)};

    case tag::num: {
      const long double val = num_val(x);
      if (std::trunc(val) == val and std::fabs(val) < 1e18L)
        return std::format("{}", static_cast<long long>(val));
      return std::format("{}", static_cast<double>(val));
    }

    case tag::fn:
      return {};

    default:
      throw std::invalid_argument {
          std::format("scalar_text() - not a scalar: {}", x)};
  }
}


std::string
blt::flatten(value obj, std::optional<std::string_view> ws)
{
  std::string result;
  traverse(obj, [&result](std::optional<std::string_view> ws, value x) {
    if (ws)
      result += *ws;
    result += scalar_text(x);
    return traverse_result {x, true};
  }, ws);
  return result;
}


bool
blt::is_true(value obj)
{
  obj = unwrapws(obj);
  switch (obj->t)
  {
    case tag::nil:
      return false;
    case tag::num:
      return num_val(obj) != 0;
    case tag::str:
      return str_view(obj) != "" and str_view(obj) != "0";
    default:
      return true;
  }
}


std::string
blt::quote(std::string_view str)
{
  if (str.empty())
    return "\\\"\\\"";

  std::string result;
  if (str.find_first_of(" \t\n\r\f\v") != std::string_view::npos)
  {
    result = "\\\"";
    for (const char c : str)
    {
      if (c == '\\')
        result += '\\';
      result += c;
    }
    result += "\\\"";
  }
  else
  {
    for (const char c : str)
    {
      if (c == '\\' or c == '{' or c == '}')
        result += '\\';
      result += c;
    }
  }
  return result;
}


blt::value
blt::call(value f, value named, value positional)
{
  f = unwrapws(f);
  if (not isfn(f))
    throw std::invalid_argument {std::format("call() - not a callable: {}", f)};
  return f->fn.proc(named, positional);
}
