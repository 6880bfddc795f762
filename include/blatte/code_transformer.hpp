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

#include "blatte/match.hpp"
#include "blatte/value.hpp"
#include "blatte/exceptions.hpp"
#include "blatte/stl/deque.hpp"

#include <concepts>
#include <functional>

/**
 * \file code_transformer.hpp
 * Rule-driven transformation of syntax trees
 * 
 * \ingroup syntax
 */


namespace blt {


/**
 * Callable mapping one syntax tree to its translation
 */
template <typename T>
concept tree_translator = requires(const T t, value x)
{
  { t(x) } -> std::convertible_to<value>;
};


/**
 * Table of translation rules for Blatte syntax trees
 *
 * A rule pairs a blt::match pattern with the function producing the
 * translation of a tree matching it. Rules are tried in table order and the
 * first match wins; a tree no rule accepts is a codegen_error. This is the
 * dispatch behind blt::perl_emitter, where each special form is a rule:
 * ```
 * append_rule({list("set!"), list("set!", "var", "expr")},
 *             [this](const auto &ms) {
 *   return str(std::format("({} = {})", emit(ms.at("var")),
 *                          emit(ms.at("expr"))));
 * });
 * ```
 * A derived emitter may prepend_rule() its own template for a form to take
 * precedence over the inherited one.
 *
 * \ingroup syntax
 */
class code_transformer {
  public:
  using match_mapping = blt::unordered_map<value, value>;
  using transformation = std::function<value(const match_mapping&, value)>;

  code_transformer() = default;
  code_transformer(const code_transformer&) = delete;
  code_transformer(code_transformer&&) = delete;
  code_transformer& operator = (const code_transformer&) = delete;
  code_transformer& operator = (code_transformer&&) = delete;

  /**
   * Insert a rule in front of all existing ones
   *
   * \param transformer Called with the bindings of \p matcher and the
   *                    matched tree
   */
  void
  prepend_rule(const match &matcher, const transformation &transformer);

  template <typename BindingsRule>
    requires std::regular_invocable<BindingsRule, const match_mapping&>
  void
  prepend_rule(const match &matcher, BindingsRule rule)
  { prepend_rule(matcher, [=](const auto &ms, value) { return rule(ms); }); }

  /**
   * Add a rule after all existing ones
   */
  void
  append_rule(const match &matcher, const transformation &transformer);

  template <typename BindingsRule>
    requires std::regular_invocable<BindingsRule, const match_mapping&>
  void
  append_rule(const match &matcher, BindingsRule rule)
  { append_rule(matcher, [=](const auto &ms, value) { return rule(ms); }); }

  /**
   * Translate \p inexpr with the first rule whose pattern accepts it
   *
   * The result inherits the source location of \p inexpr unless the rule
   * has set one.
   *
   * \throws codegen_error No rule matches
   */
  value
  operator () (value inexpr) const;

  private:
  using syntax_table = blt::stl::deque<std::pair<match, transformation>>;
  syntax_table m_table;
}; // class blt::code_transformer
static_assert(tree_translator<code_transformer>);

} // namespace blt
