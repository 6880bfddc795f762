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
#include "blatte/runtime.hpp"

#include <format>


static void
_write(std::ostream &os, blt::value val)
{
  using namespace blt;

  switch (val->t)
  {
    case tag::nil:
      os << "{}";
      break;

    case tag::sym:
      os << '\\' << sym_name(val);
      break;

    case tag::str:
      os << quote(str_view(val));
      break;

    case tag::num:
      os << scalar_text(val);
      break;

    case tag::fn:
      os << '\\' << fn_name(val);
      break;

    case tag::ws:
      os << ws_text(val);
      _write(os, ws_obj(val));
      break;

    case tag::pair: {
      os << '{';
      bool first = true;
      value tail = nil;
      for (const value x : range(val, tail))
      {
        // Wrappers carry their own separators
        if (not first and not isws(x))
          os << ' ';
        _write(os, x);
        first = false;
      }
      if (not isnil(tail))
      {
        os << ' ';
        _write(os, tail);
      }
      os << '}';
      break;
    }
  }
}


static void
_print_escaped(std::ostream &os, std::string_view str)
{
  os << '"';
  for (const char c : str)
  {
    switch (c)
    {
      case '"':
      case '\\':
        os.put('\\');
        os.put(c);
        break;

      case '\n': os << "\\n"; break;
      case '\t': os << "\\t"; break;
      case '\r': os << "\\r"; break;

      case '\a':
      case '\b':
      case '\f':
      case '\v':
      case '\e':
        os << std::format("\\x{:02x}", int(c));
        break;

      default:
        os.put(c);
    }
  }
  os << '"';
}


static void
_print(std::ostream &os, blt::value val)
{
  using namespace blt;

  switch (val->t)
  {
    case tag::nil:
      os << "()";
      break;

    case tag::sym:
      os << sym_name(val);
      break;

    case tag::str:
      _print_escaped(os, str_view(val));
      break;

    case tag::num:
      os << scalar_text(val);
      break;

    case tag::fn:
      os << "#<fn " << fn_name(val) << '>';
      break;

    case tag::ws:
      os << "#ws<";
      _print_escaped(os, ws_text(val));
      os << ' ';
      _print(os, ws_obj(val));
      os << '>';
      break;

    case tag::pair: {
      os << '(';
      _print(os, car(val));
      value elt;
      for (elt = cdr(val); ispair(elt); elt = cdr(elt))
      {
        os << ' ';
        _print(os, car(elt));
      }
      if (not isnil(elt))
      {
        os << " . ";
        _print(os, elt);
      }
      os << ')';
      break;
    }
  }
}


void
blt::write(std::ostream &os, const blt::value &val)
{ _write(os, val); }

void
blt::print(std::ostream &os, const blt::value &val)
{ _print(os, val); }
