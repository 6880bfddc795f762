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


#include "blatte/perl_emitter.hpp"
#include "blatte/runtime.hpp"
#include "blatte/logging.hpp"
#include "blatte/stl/vector.hpp"

#include <format>
#include <optional>
#include <utility>


static std::string
_variable(blt::value var)
{ return std::format("${}", blt::sym_name(var)); }


static std::string
_join(const blt::stl::vector<std::string> &parts, std::string_view sep)
{
  std::string result;
  for (bool first = true; const std::string &part : parts)
  {
    if (not first)
      result += sep;
    result += part;
    first = false;
  }
  return result;
}


// Values collected by an ellipsis (nothing is bound for zero repetitions)
template <typename Mapping>
static blt::value
_bindings(const Mapping &ms, const char *name)
{ return ms.contains(name) ? ms.at(name) : blt::nil; }


static bool
_is_named_arg(blt::value item)
{
  const blt::value x = blt::unwrapws(item);
  return ispair(x) and car(x) == "named-arg";
}


std::string
blt::perl_emitter::string_literal(std::string_view text)
{
  std::string result = "\"";
  for (const char c : text)
  {
    switch (c)
    {
      case '\\':
      case '"':
      case '$':
      case '@':
        result += '\\';
        result += c;
        break;

      case '\n': result += "\\n"; break;
      case '\t': result += "\\t"; break;
      case '\r': result += "\\r"; break;

      default:
        if (static_cast<unsigned char>(c) < 0x20 or c == 0x7f)
          result += std::format("\\x{{{:02x}}}", int(c));
        else
          result += c;
    }
  }
  result += '"';
  return result;
}


blt::perl_emitter::perl_emitter(std::string_view package)
: m_package {package}
{
  // <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
  //                                 define
  append_rule({list("define"), list("define", "var", "expr")},
              [this](const auto &ms) {
    const std::string var = _variable(ms.at("var"));
    return str(std::format("do {{ use vars qw({}); {} = {} }}", var, var,
                           emit(ms.at("expr"))));
  });

  // <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
  //                                  set!
  append_rule({list("set!"), list("set!", "var", "expr")},
              [this](const auto &ms) {
    return str(std::format("({} = {})", _variable(ms.at("var")),
                           emit(ms.at("expr"))));
  });

  // <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
  //                                   if
  append_rule({list("if"), cons("if", cons("test", cons("then", "else")))},
              [this](const auto &ms) {
    const value elsebr = ms.at("else");
    std::string elsecode;
    if (isnil(elsebr))
      elsecode = "[]";
    else if (isnil(cdr(elsebr)))
      elsecode = emit(car(elsebr));
    else
      elsecode = std::format("do {{ {} }}", emit_body(elsebr));
    return str(std::format("({} ? {} : {})", _truth(emit(ms.at("test"))),
                           emit(ms.at("then")), elsecode));
  });

  // <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
  //                                and, or
  append_rule({list("and"), cons("and", "exprs")}, [this](const auto &ms) {
    return str(_and_or(ms.at("exprs"), true));
  });
  append_rule({list("or"), cons("or", "exprs")}, [this](const auto &ms) {
    return str(_and_or(ms.at("exprs"), false));
  });

  // <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
  //                                  cond
  append_rule({list("cond"), cons("cond", "clauses")}, [this](const auto &ms) {
    return str(_cond(ms.at("clauses")));
  });

  // <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
  //                                  while
  append_rule({list("while"), cons("while", cons("test", "body"))},
              [this](const auto &ms) {
    std::string statements;
    for (const value expr : range(ms.at("body")))
      statements += emit(expr) + "; ";
    return str(std::format("do {{ while ({}) {{ {}}} [] }}",
                           _truth(emit(ms.at("test"))), statements));
  });

  // <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
  //                                 lambda
  append_rule({list("lambda"), cons("lambda", cons("params", "body"))},
              [this](const auto &ms) {
    return str(_lambda(ms.at("params"), ms.at("body")));
  });

  // <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
  //                          let, let*, letrec
  append_rule(
      {list("let"), cons("let", cons(list(list("var", "val"), "..."), "body"))},
      [this](const auto &ms) {
    const value varlist = _bindings(ms, "var");
    if (isnil(varlist))
      return str(std::format("do {{ {} }}", emit_body(ms.at("body"))));
    stl::vector<std::string> vars, vals;
    for (const value var : range(varlist))
      vars.push_back(_variable(var));
    for (const value val : range(_bindings(ms, "val")))
      vals.push_back(emit(val));
    return str(std::format("do {{ my({}) = ({}); {} }}", _join(vars, ", "),
                           _join(vals, ", "), emit_body(ms.at("body"))));
  });

  append_rule(
      {list("let*"), cons("let*", cons(list(list("var", "val"), "..."), "body"))},
      [this](const auto &ms) {
    std::string code = "do { ";
    for (value vars = _bindings(ms, "var"), vals = _bindings(ms, "val");
         not isnil(vars);
         vars = cdr(vars), vals = cdr(vals))
      code += std::format("my {} = {}; ", _variable(car(vars)), emit(car(vals)));
    code += emit_body(ms.at("body"));
    code += " }";
    return str(code);
  });

  append_rule(
      {list("letrec"),
       cons("letrec", cons(list(list("var", "val"), "..."), "body"))},
      [this](const auto &ms) {
    const value varlist = _bindings(ms, "var");
    if (isnil(varlist))
      return str(std::format("do {{ {} }}", emit_body(ms.at("body"))));
    stl::vector<std::string> vars, vals;
    for (const value var : range(varlist))
      vars.push_back(_variable(var));
    for (const value val : range(_bindings(ms, "val")))
      vals.push_back(emit(val));
    const std::string decl = _join(vars, ", ");
    return str(std::format("do {{ my({}); ({}) = ({}); {} }}", decl, decl,
                           _join(vals, ", "), emit_body(ms.at("body"))));
  });

  // <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
  //                          function call or list
  append_rule({list("group"), cons("group", "items")}, [this](const auto &ms) {
    return str(_group(ms.at("items")));
  });
}


std::string
blt::perl_emitter::_runtime(std::string_view function) const
{ return std::format("&{}::{}", m_package, function); }


std::string
blt::perl_emitter::_truth(std::string_view perlexpr) const
{ return std::format("{}({})", _runtime("true"), perlexpr); }


std::string
blt::perl_emitter::emit(value expr) const
{
  switch (expr->t)
  {
    case tag::ws: {
      const std::string inner = emit(ws_obj(expr));
      if (ws_text(expr).empty())
        return inner;
      return std::format("{}({}, {})", _runtime("wrapws"),
                         string_literal(ws_text(expr)), inner);
    }

    case tag::str:
      return string_literal(str_view(expr));

    case tag::sym:
      return _variable(expr);

    case tag::num:
      return scalar_text(expr);

    case tag::nil:
      return "[]";

    case tag::pair: {
      const value code = code_transformer::operator () (expr);
      if (not isstr(code))
        throw codegen_error {
            std::format("translation rule produced a non-string: {}", code),
            expr};
      return std::string {str_view(code)};
    }

    case tag::fn:
      break;
  }
  throw codegen_error {
      std::format("unexpected value in a syntax tree: {}", expr), expr};
}


std::string
blt::perl_emitter::emit_body(value exprs) const
{
  if (isnil(exprs))
    return "[]";

  stl::vector<std::string> statements;
  for (const value expr : range(exprs))
    statements.push_back(emit(expr));
  return _join(statements, "; ");
}


std::string
blt::perl_emitter::_and_or(value exprs, bool isand) const
{
  if (isnil(exprs))
    throw codegen_error {std::format("empty \\{}", isand ? "and" : "or")};

  const std::string first = emit(car(exprs));
  if (isnil(cdr(exprs)))
    return first;

  const std::string rest = _and_or(cdr(exprs), isand);
  if (isand)
    return std::format("do {{ my $_v = {}; {} ? {} : $_v }}", first,
                       _truth("$_v"), rest);
  else
    return std::format("do {{ my $_v = {}; {} ? $_v : {} }}", first,
                       _truth("$_v"), rest);
}


std::string
blt::perl_emitter::_cond(value clauses) const
{
  if (isnil(clauses))
    return "[]";

  const value clause = car(clauses);
  if (not ispair(clause) or car(clause) != "clause" or not ispair(cdr(clause)))
    throw codegen_error {std::format("malformed \\cond clause: {}", clause),
                         clause};

  const value test = car(cdr(clause));
  const value body = cdr(cdr(clause));
  const std::string next = _cond(cdr(clauses));

  // A clause without a body yields the value of its test
  if (isnil(body))
    return std::format("do {{ my $_v = {}; {} ? $_v : {} }}", emit(test),
                       _truth("$_v"), next);

  return std::format("({} ? do {{ {} }} : {})", _truth(emit(test)),
                     emit_body(body), next);
}


std::string
blt::perl_emitter::_lambda(value params, value body) const
{
  stl::vector<std::string> positional {"$_named"};
  stl::vector<std::string> named;
  std::optional<std::string> rest;

  for (const value param : range(params))
  {
    if (length(param) != 2 or not issym(car(cdr(param))))
      throw codegen_error {std::format("malformed parameter: {}", param), param};

    const value kind = car(param);
    const value var = car(cdr(param));
    if (rest)
      throw codegen_error {"rest parameter must be the last parameter", param};

    if (kind == "positional")
      positional.push_back(_variable(var));
    else if (kind == "named")
      named.push_back(std::format("my {} = $_named->{{{}}}; ", _variable(var),
                                  sym_name(var)));
    else if (kind == "rest")
      rest = _variable(var);
    else
      throw codegen_error {std::format("malformed parameter: {}", param), param};
  }

  std::string code = "sub { ";
  code += std::format("die \"too few arguments\\n\" if @_ < {}; ",
                      positional.size());
  code += std::format("my({}) = splice(@_, 0, {}); ", _join(positional, ", "),
                      positional.size());
  for (const std::string &binding : named)
    code += binding;
  if (rest)
    code += std::format("my {} = [@_]; ", *rest);
  else
    code += "die \"too many arguments\\n\" if @_; ";
  code += emit_body(body);
  code += " }";
  return code;
}


std::string
blt::perl_emitter::_group(value items) const
{
  // {} is the empty list
  if (isnil(items))
    return "[]";
  if (_is_named_arg(car(items)))
    throw codegen_error {"named argument in function position", car(items)};

  // All items are evaluated once, in written order, into @_e; the dispatch
  // then only refers to them by index
  stl::vector<std::string> elements;
  stl::vector<std::string> named;
  stl::vector<std::string> positional;
  size_t idx = 0;
  for (const value item : range(items))
  {
    if (_is_named_arg(item))
    {
      const value namedarg = unwrapws(item);
      if (length(namedarg) != 3)
        throw codegen_error {
            std::format("malformed named argument: {}", namedarg), item};
      const value name = car(cdr(namedarg));
      elements.push_back(emit(car(cdr(cdr(namedarg)))));
      named.push_back(std::format("{} => $_e[{}]", sym_name(name), idx));
    }
    else
    {
      elements.push_back(emit(item));
      if (idx > 0)
        positional.push_back(std::to_string(idx));
    }
    idx += 1;
  }

  std::string args = std::format("{{{}}}", _join(named, ", "));
  if (positional.size() == 1)
    args += std::format(", $_e[{}]", positional.front());
  else if (not positional.empty())
    args += std::format(", @_e[{}]", _join(positional, ", "));

  std::string listcode = "[@_e]";
  if (not named.empty())
  {
    positional.insert(positional.begin(), "0");
    listcode = std::format("[@_e[{}]]", _join(positional, ", "));
  }

  const std::string head = std::format("{}($_e[0])", _runtime("unwrapws"));
  return std::format("do {{ my @_e = ({}); ref({}) eq 'CODE' ? &{{{}}}({}) : {} }}",
                     _join(elements, ", "), head, head, args, listcode);
}


std::string
blt::perl_emitter::emit_document(value exprs, std::string_view trailing,
                                 bool standalone) const
{
  std::string code;
  if (standalone)
    code += std::format("use {0};\nuse {0}::Builtins;\n\n", m_package);

  for (const value expr : range(exprs))
  {
    debug("translating {}", expr);
    const std::string perlexpr = emit(expr);

    // Definitions contribute nothing to the rendered document
    const value x = unwrapws(expr);
    const bool isdefinition = ispair(x) and car(x) == "define";
    if (standalone and not isdefinition)
      code += std::format("print {}({});\n", _runtime("flatten"), perlexpr);
    else
      code += perlexpr + ";\n";
  }

  if (not trailing.empty())
  {
    if (standalone)
      code += std::format("print {};\n", string_literal(trailing));
    else
      code += string_literal(trailing) + ";\n";
  }

  return code;
}
