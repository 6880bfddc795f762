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


#include "blatte/exceptions.hpp"
#include "blatte/source_location.hpp"

#include <utility>


// Nodes built by the code generator itself carry no location
blt::bad_code::bad_code(std::string_view what, value code)
: runtime_error(std::string(what))
{
  if (source_location location; get_location(code, location))
    m_location = std::move(location);
}


blt::bad_code::bad_code(std::string_view what, const source_location &location)
: runtime_error(std::string(what)), m_location {location}
{ }


void
blt::bad_code::display(std::ostream &os) const noexcept
{
  os << kind() << ": " << what();
  if (not m_location)
    return;

  try
  { os << "\n" << display_location(*m_location); }
  catch (const std::exception &)
  {
    // Failed to read the source; the offsets still identify the place
    os << "\nin " << m_location->source << ": offset " << m_location->start
       << " to " << m_location->end;
  }
}
