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

#include "blatte/exceptions.hpp"
#include "blatte/source_location.hpp"

#include <string>
#include <string_view>
#include <vector>

/**
 * \file lexer.hpp
 * Lexical analysis of Blatte text
 * 
 * Blatte has three metacharacters: `\`, `{` and `}`. Everything else is
 * either whitespace or belongs to a word.
 * 
 * \ingroup syntax
 */


namespace blt {

/**
 * Token produced by the lexer
 *
 * For words and strings `text` holds the contents with escapes resolved; for
 * variables, named arguments and parameters it holds the bare identifier.
 * 
 * \ingroup syntax
 */
struct token {
  enum class type {
    WHITESPACE,  // run of spaces, tabs, newlines
    WORD,        // foo, a\{b\}
    STRING,      // \"some text\"
    VARIABLE,    // \foo
    NAMED_ARG,   // \foo=
    NAMED_PARAM, // \=foo
    REST_PARAM,  // \&foo
    LBRACE,      // {
    RBRACE,      // }
    FORGET,      // \/
    COMMENT,     // \; to the end of line
    END,         // end of input
  };
  type type;
  std::string text;
  size_t start; ///< Offset of the first character
  size_t end;   ///< Offset past the last character
};

std::string_view
token_type_name(enum token::type type);


/**
 * On-demand tokenizer working over a cursor into a text buffer
 * 
 * \ingroup syntax
 */
class lexer {
  public:
  explicit lexer(std::string_view text, size_t pos = 0,
                 std::string_view source_name = "<string>");

  /**
   * Scan the next token
   * 
   * \return Next token, or a token of type END when the input is exhausted
   * \throws lex_error On unterminated string or a dangling backslash
   * \throws parse_error On a backslash sequence that is not a valid identifier
   */
  token
  next();

  [[nodiscard]] size_t
  position() const noexcept
  { return m_pos; }

  /**
   * Scan all tokens of \p text (not including the END token)
   */
  [[nodiscard]] static std::vector<token>
  tokenize(std::string_view text, std::string_view source_name = "<string>");

  private:
  token
  _lex_word();

  token
  _lex_string();

  token
  _lex_comment();

  std::string
  _lex_identifier(size_t start);

  source_location
  _location(size_t start, size_t end) const
  { return {m_source, start, end}; }

  private:
  std::string_view m_text;
  size_t m_pos;
  std::string m_source;
}; // class blt::lexer

} // namespace blt
