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

#include "blatte/lexer.hpp"
#include "blatte/value.hpp"
#include "blatte/exceptions.hpp"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>

/**
 * \file parser.hpp
 * Recursive-descent parser of Blatte documents
 * 
 * \ingroup syntax
 */


namespace blt {

/**
 * Special forms recognized at the head of a `{...}` group
 * 
 * \ingroup syntax
 */
enum class special_form {
  define,
  set,
  if_,
  and_,
  or_,
  cond,
  while_,
  lambda,
  let,
  let_star,
  letrec,
};


/**
 * Parser for Blatte expressions
 *
 * Every expression is returned wrapped in a whitespace wrapper holding the
 * whitespace that preceded it (minus whatever was cancelled by `\/`). The
 * resulting tree is encoded as follows:
 *
 * - words and strings: `str`
 * - `\VAR`: `sym`
 * - special forms: lists headed by the form name, i.e. `(define V E)`,
 *   `(set! V E)`, `(if T X E...)`, `(and E...)`, `(or E...)`,
 *   `(cond (clause T X...)...)`, `(while T E...)`, `(lambda (P...) E...)`,
 *   `(let ((V X)...) E...)` (likewise `let*` and `letrec`); parameters are
 *   `(positional V)`, `(named V)` or `(rest V)`;
 * - generic groups: `(group E...)`, where a `\NAME=EXPR` argument is
 *   `(named-arg NAME EXPR)`.
 *
 * Sub-expressions of special forms are wrapped just like the top-level
 * expression. The parser holds no per-call state; a single instance may be
 * shared once its keyword table is set up.
 * 
 * \ingroup syntax
 */
class parser {
  public:
  using keyword_table = std::unordered_map<std::string, special_form>;

  /**
   * Maximal depth of nested `{...}` groups
   *
   * Deeper input is rejected with a parse_error; code generation recurses
   * along the same tree.
   */
  static constexpr size_t max_nesting_depth = 1000;

  /**
   * Create parser with the default keyword table
   */
  parser();

  explicit parser(keyword_table keywords)
  : m_keywords {std::move(keywords)}
  { }

  [[nodiscard]] static const keyword_table&
  default_keywords();

  /**
   * Bind \p name to a special form (in addition to already existing bindings)
   */
  void
  define_keyword(std::string_view name, special_form form);

  [[nodiscard]] const keyword_table&
  keywords() const noexcept
  { return m_keywords; }

  /**
   * Parse a single expression starting at \p pos
   *
   * \param text Input text
   * \param[in,out] pos Cursor into \p text; moved past the parsed expression
   *                    on success, left untouched otherwise
   * \param source_name Name of the source for error reporting
   * \return Wrapped expression, or nothing if only whitespace and comments
   *         remain in the input
   * \throws lex_error, parse_error
   */
  [[nodiscard]] std::optional<value>
  read(std::string_view text, size_t &pos,
       std::string_view source_name = "<string>") const;

  /**
   * Parse all expressions in \p text
   *
   * \return List of wrapped expressions
   */
  [[nodiscard]] value
  read_all(std::string_view text,
           std::string_view source_name = "<string>") const;

  /**
   * Whitespace between \p pos and the next expression (or the end of input)
   *
   * Comments are dropped and forget-whitespace markers applied, as they are
   * for the whitespace preceding an expression.
   */
  [[nodiscard]] std::string
  trailing_whitespace(std::string_view text, size_t pos,
                      std::string_view source_name = "<string>") const;

  private:
  class token_stream;

  std::string
  _skip_whitespace(token_stream &ts) const;

  value
  _parse_expression(token_stream &ts) const;

  value
  _parse_group(token_stream &ts, const token &open) const;

  value
  _parse_special_form(token_stream &ts, const token &open,
                      special_form form, const token &keyword) const;

  value
  _parse_body(token_stream &ts, const token &open) const;

  value
  _parse_parameters(token_stream &ts, const token &open) const;

  value
  _parse_bindings(token_stream &ts, const token &keyword) const;

  value
  _parse_cond_clauses(token_stream &ts, const token &open) const;

  private:
  keyword_table m_keywords;
}; // class blt::parser


/**
 * Collect names of the variables referenced or bound in a parsed tree
 *
 * Form names, parameter kinds and names of named arguments (`\NAME=`) are
 * not variables and are skipped.
 */
void
collect_variables(value expr, std::set<std::string> &names);

} // namespace blt
