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


#include "blatte/lexer.hpp"
#include "blatte/format.hpp" // IWYU pragma: keep

#include <algorithm>
#include <cctype>


static inline bool
_is_space(char c)
{ return std::isspace(static_cast<unsigned char>(c)); }

static inline bool
_is_letter(char c)
{ return std::isalpha(static_cast<unsigned char>(c)); }

static inline bool
_is_identifier_char(char c)
{ return std::isalnum(static_cast<unsigned char>(c)) or c == '_'; }


std::string_view
blt::token_type_name(enum token::type type)
{
  switch (type)
  {
    case token::type::WHITESPACE: return "whitespace";
    case token::type::WORD: return "word";
    case token::type::STRING: return "string";
    case token::type::VARIABLE: return "variable";
    case token::type::NAMED_ARG: return "named argument";
    case token::type::NAMED_PARAM: return "named parameter";
    case token::type::REST_PARAM: return "rest parameter";
    case token::type::LBRACE: return "'{'";
    case token::type::RBRACE: return "'}'";
    case token::type::FORGET: return "forget-whitespace marker";
    case token::type::COMMENT: return "comment";
    case token::type::END: return "end of input";
  }
  std::terminate();
}


blt::lexer::lexer(std::string_view text, size_t pos,
                  std::string_view source_name)
: m_text {text}, m_pos {pos}, m_source {source_name}
{ }


blt::token
blt::lexer::next()
{
  if (m_pos >= m_text.size())
    return {token::type::END, "", m_text.size(), m_text.size()};

  const size_t start = m_pos;
  const char c = m_text[m_pos];

  // Whitespace is kept verbatim
  if (_is_space(c))
  {
    while (m_pos < m_text.size() and _is_space(m_text[m_pos]))
      m_pos++;
    return {token::type::WHITESPACE,
            std::string {m_text.substr(start, m_pos - start)}, start, m_pos};
  }

  if (c == '{')
  {
    m_pos++;
    return {token::type::LBRACE, "{", start, m_pos};
  }

  if (c == '}')
  {
    m_pos++;
    return {token::type::RBRACE, "}", start, m_pos};
  }

  if (c != '\\')
    return _lex_word();

  // Backslash sequences
  if (m_pos + 1 >= m_text.size())
    throw lex_error {"dangling backslash at end of input",
                     _location(start, m_pos + 1)};

  const char next = m_text[m_pos + 1];
  switch (next)
  {
    case '\\':
    case '{':
    case '}':
      return _lex_word();

    case ';':
      return _lex_comment();

    case '"':
      return _lex_string();

    case '/':
      m_pos += 2;
      return {token::type::FORGET, "\\/", start, m_pos};

    case '=': {
      m_pos += 2;
      std::string name = _lex_identifier(start);
      return {token::type::NAMED_PARAM, std::move(name), start, m_pos};
    }

    case '&': {
      m_pos += 2;
      std::string name = _lex_identifier(start);
      return {token::type::REST_PARAM, std::move(name), start, m_pos};
    }

    default: {
      m_pos += 1;
      std::string name = _lex_identifier(start);
      if (m_pos < m_text.size() and m_text[m_pos] == '=')
      {
        m_pos++;
        return {token::type::NAMED_ARG, std::move(name), start, m_pos};
      }
      return {token::type::VARIABLE, std::move(name), start, m_pos};
    }
  }
}


std::string
blt::lexer::_lex_identifier(size_t start)
{
  if (m_pos >= m_text.size() or not _is_letter(m_text[m_pos]))
  {
    const size_t end = std::min(m_pos + 1, m_text.size());
    throw parse_error {
        std::format("bad identifier '{}': must start with a letter",
                    m_text.substr(start, end - start)),
        _location(start, end)};
  }

  const size_t namestart = m_pos;
  while (m_pos < m_text.size() and _is_identifier_char(m_text[m_pos]))
    m_pos++;

  // Admits keyword spellings like set! and let*
  if (m_pos < m_text.size() and (m_text[m_pos] == '!' or m_text[m_pos] == '*'))
    m_pos++;

  return std::string {m_text.substr(namestart, m_pos - namestart)};
}


blt::token
blt::lexer::_lex_word()
{
  const size_t start = m_pos;
  std::string word;
  while (m_pos < m_text.size())
  {
    const char c = m_text[m_pos];
    if (_is_space(c) or c == '{' or c == '}')
      break;

    if (c == '\\')
    {
      if (m_pos + 1 < m_text.size())
      {
        const char next = m_text[m_pos + 1];
        if (next == '\\' or next == '{' or next == '}')
        {
          word += next;
          m_pos += 2;
          continue;
        }
      }
      // Start of another token
      break;
    }

    word += c;
    m_pos++;
  }
  return {token::type::WORD, std::move(word), start, m_pos};
}


blt::token
blt::lexer::_lex_string()
{
  const size_t start = m_pos;
  m_pos += 2; // skip \"

  std::string str;
  while (true)
  {
    if (m_pos >= m_text.size())
      throw lex_error {"unterminated string literal",
                       _location(start, m_text.size())};

    const char c = m_text[m_pos];
    if (c == '\\' and m_pos + 1 < m_text.size())
    {
      const char next = m_text[m_pos + 1];
      if (next == '"')
      {
        m_pos += 2;
        break;
      }
      if (next == '\\')
      {
        str += '\\';
        m_pos += 2;
        continue;
      }
    }
    str += c;
    m_pos++;
  }

  return {token::type::STRING, std::move(str), start, m_pos};
}


blt::token
blt::lexer::_lex_comment()
{
  const size_t start = m_pos;
  m_pos += 2; // skip \;
  while (m_pos < m_text.size() and m_text[m_pos] != '\n')
    m_pos++;
  if (m_pos < m_text.size())
    m_pos++; // the newline belongs to the comment
  return {token::type::COMMENT,
          std::string {m_text.substr(start, m_pos - start)}, start, m_pos};
}


std::vector<blt::token>
blt::lexer::tokenize(std::string_view text, std::string_view source_name)
{
  lexer lex {text, 0, source_name};
  std::vector<token> tokens;
  for (token tok = lex.next(); tok.type != token::type::END; tok = lex.next())
    tokens.push_back(std::move(tok));
  return tokens;
}
