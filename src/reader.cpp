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


#include "blatte/reader.hpp"
#include "blatte/lexer.hpp"
#include "blatte/logging.hpp"

#include <optional>


blt::reader::reader(const blt::parser &parser, std::string_view source_name)
: m_parser {parser}, m_source {source_name}
{ }


bool
blt::reader::_is_incomplete(size_t pos) const
{
  // An open group or a string cut by the end of the buffer
  lexer lex {m_buffer, pos, m_source};
  ssize_t depth = 0;
  try
  {
    for (token tok = lex.next(); tok.type != token::type::END; tok = lex.next())
    {
      if (tok.type == token::type::LBRACE)
        depth += 1;
      else if (tok.type == token::type::RBRACE and --depth < 0)
        return false;
    }
  }
  catch (const lex_error &exn)
  {
    return exn.location() and exn.location()->end >= m_buffer.size();
  }
  catch (const parse_error &)
  { return false; }
  return depth > 0;
}


void
blt::reader::operator << (std::string_view input)
{
  m_buffer.append(input);

  size_t pos = 0;
  try
  {
    while (const std::optional<value> expr = m_parser.read(m_buffer, pos, m_source))
      m_values.push_back(*expr);
  }
  catch (const bad_code &)
  {
    if (not _is_incomplete(pos))
    {
      m_buffer.clear();
      throw;
    }
    debug("reader: waiting for the rest of the expression");
  }

  // Erase consumed text
  m_buffer.erase(0, pos);
}


bool
blt::reader::operator >> (blt::value &result)
{
  if (m_values.empty())
    return false;
  result = m_values.front();
  m_values.pop_front();
  return true;
}


bool
blt::reader::pending() const
{
  lexer lex {m_buffer, 0, m_source};
  try
  {
    for (token tok = lex.next(); tok.type != token::type::END; tok = lex.next())
    {
      if (tok.type != token::type::WHITESPACE and
          tok.type != token::type::COMMENT and tok.type != token::type::FORGET)
        return true;
    }
    return false;
  }
  catch (const bad_code &)
  { return true; }
}


void
blt::reader::reset()
{
  m_buffer.clear();
  m_values.clear();
}
