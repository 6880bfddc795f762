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

#include "blatte/code_transformer.hpp"
#include "blatte/value.hpp"

#include <string>
#include <string_view>

/**
 * \file perl_emitter.hpp
 * Translation of Blatte syntax trees into Perl code
 *
 * \ingroup syntax
 */


namespace blt {

/**
 * Code generator producing Perl
 *
 * Every special form maps to a fixed template; a generic group is compiled
 * into a run-time test of the type of its first element, choosing between a
 * function call and a list. Generated functions take the hash of named
 * arguments as the first parameter, followed by positional arguments.
 *
 * Run-time helpers (`true`, `wrapws`, `unwrapws`, `flatten`) are referred to
 * through the runtime package, `Blatte` by default.
 *
 * \ingroup syntax
 */
class perl_emitter: public code_transformer {
  public:
  explicit perl_emitter(std::string_view package = "Blatte");

  [[nodiscard]] const std::string&
  package() const noexcept
  { return m_package; }

  /**
   * Translate an expression (wrapped or not) into a Perl expression
   *
   * \throws codegen_error On a tree that was not produced by the parser
   */
  [[nodiscard]] std::string
  emit(value expr) const;

  /**
   * Translate a sequence of expressions evaluated for the value of the last
   * one; an empty sequence evaluates to the empty list
   */
  [[nodiscard]] std::string
  emit_body(value exprs) const;

  /**
   * Translate a whole document
   *
   * \param exprs Top-level expressions
   * \param trailing Whitespace following the last expression
   * \param standalone Produce a complete program printing the rendered
   *                   document instead of a plain sequence of statements
   */
  [[nodiscard]] std::string
  emit_document(value exprs, std::string_view trailing, bool standalone) const;

  /**
   * Perl double-quoted literal for \p text
   */
  [[nodiscard]] static std::string
  string_literal(std::string_view text);

  private:
  std::string
  _runtime(std::string_view function) const;

  std::string
  _truth(std::string_view perlexpr) const;

  std::string
  _lambda(value params, value body) const;

  std::string
  _group(value items) const;

  std::string
  _cond(value clauses) const;

  std::string
  _and_or(value exprs, bool isand) const;

  private:
  std::string m_package;
}; // class blt::perl_emitter

} // namespace blt
