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


#include "blatte/parser.hpp"
#include "blatte/logging.hpp"
#include "blatte/source_location.hpp"
#include "blatte/stl/vector.hpp"

#include <format>
#include <optional>


/**
 * Lexer with one token of lookahead
 *
 * Tracks the end of the last consumed token, which is where the cursor is
 * left after a successful parse.
 */
class blt::parser::token_stream {
  public:
  token_stream(std::string_view text, size_t pos, std::string_view source)
  : m_lexer {text, pos, source}, m_source {source}, m_consumed {pos}
  { }

  const token&
  peek()
  {
    if (not m_lookahead.has_value())
      m_lookahead = m_lexer.next();
    return *m_lookahead;
  }

  token
  next()
  {
    token tok = peek();
    m_lookahead.reset();
    m_consumed = tok.end;
    return tok;
  }

  [[nodiscard]] size_t
  consumed() const noexcept
  { return m_consumed; }

  [[nodiscard]] source_location
  location(size_t start, size_t end) const
  { return {m_source, start, end}; }

  [[nodiscard]] source_location
  location(const token &tok) const
  { return {m_source, tok.start, tok.end}; }

  /**
   * Enter a group opened by \p open; leave it when the guard is destroyed
   */
  struct nesting {
    nesting(token_stream &ts, const token &open)
    : m_ts {ts}
    {
      if (m_ts.m_depth >= max_nesting_depth)
        throw parse_error {
            std::format("nesting too deep (more than {} groups)",
                        max_nesting_depth),
            m_ts.location(open)};
      m_ts.m_depth += 1;
    }

    ~nesting()
    { m_ts.m_depth -= 1; }

    nesting(const nesting&) = delete;
    void operator = (const nesting&) = delete;

    private:
    token_stream &m_ts;
  }; // struct blt::parser::token_stream::nesting

  private:
  lexer m_lexer;
  std::string m_source;
  std::optional<token> m_lookahead;
  size_t m_consumed;
  size_t m_depth {0};
}; // class blt::parser::token_stream


static blt::value
_located(blt::value x, const blt::source_location &location)
{
  blt::set_location(x, location);
  return x;
}


static std::string
_form_name(const blt::token &keyword)
{ return "\\" + keyword.text; }


// Reject names that are only admitted by the lexer for keyword spellings
static void
_check_identifier(const blt::token &tok, const blt::source_location &location)
{
  const char last = tok.text.back();
  if (last == '!' or last == '*')
    throw blt::parse_error {
        std::format("bad identifier '\\{}': only letters, digits and "
                    "underscores are allowed", tok.text),
        location};
}


const blt::parser::keyword_table&
blt::parser::default_keywords()
{
  static const keyword_table keywords {
    {"define", special_form::define},
    {"set!", special_form::set},
    {"if", special_form::if_},
    {"and", special_form::and_},
    {"or", special_form::or_},
    {"cond", special_form::cond},
    {"while", special_form::while_},
    {"lambda", special_form::lambda},
    {"let", special_form::let},
    {"let*", special_form::let_star},
    {"letrec", special_form::letrec},
  };
  return keywords;
}


blt::parser::parser()
: m_keywords {default_keywords()}
{ }


void
blt::parser::define_keyword(std::string_view name, special_form form)
{ m_keywords.insert_or_assign(std::string {name}, form); }


std::optional<blt::value>
blt::parser::read(std::string_view text, size_t &pos,
                  std::string_view source_name) const
{
  token_stream ts {text, pos, source_name};
  const size_t start = pos;

  const std::string wsstr = _skip_whitespace(ts);
  if (ts.peek().type == token::type::END)
    return std::nullopt;

  const value expr = _parse_expression(ts);
  const value result = _located(ws(wsstr, expr), ts.location(start, ts.consumed()));
  debug("read {}", result);

  pos = ts.consumed();
  return result;
}


blt::value
blt::parser::read_all(std::string_view text, std::string_view source_name) const
{
  stl::vector<value> exprs;
  size_t pos = 0;
  while (const std::optional<value> expr = read(text, pos, source_name))
    exprs.push_back(*expr);
  return list(exprs);
}


std::string
blt::parser::trailing_whitespace(std::string_view text, size_t pos,
                                 std::string_view source_name) const
{
  token_stream ts {text, pos, source_name};
  return _skip_whitespace(ts);
}


std::string
blt::parser::_skip_whitespace(token_stream &ts) const
{
  std::string wsstr;
  while (true)
  {
    switch (ts.peek().type)
    {
      case token::type::WHITESPACE:
        wsstr += ts.next().text;
        break;

      case token::type::COMMENT:
        ts.next();
        break;

      case token::type::FORGET:
        // Cancel the whitespace preceding the marker
        wsstr.clear();
        ts.next();
        break;

      default:
        return wsstr;
    }
  }
}


blt::value
blt::parser::_parse_expression(token_stream &ts) const
{
  const token tok = ts.next();
  const source_location location = ts.location(tok);

  switch (tok.type)
  {
    case token::type::WORD:
    case token::type::STRING:
      return _located(str(tok.text), location);

    case token::type::VARIABLE:
      _check_identifier(tok, location);
      return _located(sym(tok.text), location);

    case token::type::LBRACE:
      return _parse_group(ts, tok);

    case token::type::RBRACE:
      throw parse_error {"unmatched '}'", location};

    case token::type::NAMED_ARG:
      throw parse_error {
          std::format("named argument '\\{}=' outside of a function call",
                      tok.text),
          location};

    case token::type::NAMED_PARAM:
    case token::type::REST_PARAM:
      throw parse_error {"parameter outside of a parameter list", location};

    case token::type::END:
      throw parse_error {"unexpected end of input", location};

    default:
      throw parse_error {
          std::format("unexpected {}", token_type_name(tok.type)), location};
  }
}


blt::value
blt::parser::_parse_group(token_stream &ts, const token &open) const
{
  const token_stream::nesting guard {ts, open};
  std::string wsstr = _skip_whitespace(ts);

  // Special forms are recognized by the keyword at the head of the group
  if (ts.peek().type == token::type::VARIABLE)
  {
    const auto it = m_keywords.find(ts.peek().text);
    if (it != m_keywords.end())
    {
      const token keyword = ts.next();
      return _parse_special_form(ts, open, it->second, keyword);
    }
  }

  // Generic group: a call or a list, depending on the run-time value of the
  // first element
  stl::vector<value> items;
  for (bool first = true; ; first = false)
  {
    if (not first)
      wsstr = _skip_whitespace(ts);

    const enum token::type type = ts.peek().type;
    if (type == token::type::RBRACE)
    {
      ts.next();
      break;
    }
    if (type == token::type::END)
      throw parse_error {"unmatched '{'", ts.location(open)};

    if (type == token::type::NAMED_ARG)
    {
      const token name = ts.next();
      if (items.empty())
        throw parse_error {
            std::format("named argument '\\{}=' in function position",
                        name.text),
            ts.location(name)};
      const std::string valws = _skip_whitespace(ts);
      const enum token::type valtype = ts.peek().type;
      if (valtype == token::type::RBRACE or valtype == token::type::END)
        throw parse_error {
            std::format("named argument '\\{}=' is missing its value",
                        name.text),
            ts.location(name)};
      const value val = ws(valws, _parse_expression(ts));
      const source_location location = ts.location(name.start, ts.consumed());
      items.push_back(_located(
          ws(wsstr, _located(list("named-arg", sym(name.text), val), location)),
          location));
    }
    else
    {
      const size_t start = ts.peek().start;
      const value expr = _parse_expression(ts);
      items.push_back(_located(ws(wsstr, expr), ts.location(start, ts.consumed())));
    }
  }

  return _located(cons("group", list(items)),
                  ts.location(open.start, ts.consumed()));
}


blt::value
blt::parser::_parse_body(token_stream &ts, const token &open) const
{
  stl::vector<value> items;
  while (true)
  {
    const std::string wsstr = _skip_whitespace(ts);
    const token &tok = ts.peek();
    switch (tok.type)
    {
      case token::type::RBRACE:
        ts.next();
        return list(items);

      case token::type::END:
        throw parse_error {"unmatched '{'", ts.location(open)};

      case token::type::NAMED_ARG:
        throw parse_error {
            std::format("named argument '\\{}=' outside of a function call",
                        tok.text),
            ts.location(tok)};

      default: {
        const size_t start = tok.start;
        const value expr = _parse_expression(ts);
        items.push_back(
            _located(ws(wsstr, expr), ts.location(start, ts.consumed())));
      }
    }
  }
}


blt::value
blt::parser::_parse_parameters(token_stream &ts, const token &open) const
{
  stl::vector<value> params;
  bool seen_rest = false;
  while (true)
  {
    _skip_whitespace(ts);
    const enum token::type type = ts.peek().type;
    if (type == token::type::RBRACE)
    {
      ts.next();
      return list(params);
    }
    if (type == token::type::END)
      throw parse_error {"unmatched '{' in parameter list", ts.location(open)};

    const token tok = ts.next();
    const source_location location = ts.location(tok);

    const char *kind = nullptr;
    switch (tok.type)
    {
      case token::type::VARIABLE: kind = "positional"; break;
      case token::type::NAMED_PARAM: kind = "named"; break;
      case token::type::REST_PARAM: kind = "rest"; break;
      default:
        throw parse_error {
            std::format("bad parameter: expected \\VAR, \\=VAR or \\&VAR, "
                        "got {}", token_type_name(tok.type)),
            location};
    }
    _check_identifier(tok, location);

    if (seen_rest)
    {
      if (tok.type == token::type::REST_PARAM)
        throw parse_error {"duplicate rest parameter", location};
      throw parse_error {"rest parameter must be the last parameter", location};
    }
    seen_rest = tok.type == token::type::REST_PARAM;

    params.push_back(_located(list(kind, sym(tok.text)), location));
  }
}


blt::value
blt::parser::_parse_bindings(token_stream &ts, const token &keyword) const
{
  _skip_whitespace(ts);
  if (ts.peek().type != token::type::LBRACE)
    throw parse_error {
        std::format("{} expects a list of bindings {{{{\\VAR VALUE}}...}}",
                    _form_name(keyword)),
        ts.location(ts.peek())};
  const token open = ts.next();

  stl::vector<value> bindings;
  while (true)
  {
    _skip_whitespace(ts);
    const token tok = ts.next();
    if (tok.type == token::type::RBRACE)
      return list(bindings);
    if (tok.type == token::type::END)
      throw parse_error {"unmatched '{' in binding list", ts.location(open)};
    if (tok.type != token::type::LBRACE)
      throw parse_error {"binding pair malformed: expected {\\VAR VALUE}",
                         ts.location(tok)};

    _skip_whitespace(ts);
    const token var = ts.next();
    if (var.type != token::type::VARIABLE)
      throw parse_error {"binding pair malformed: expected {\\VAR VALUE}",
                         ts.location(var)};
    _check_identifier(var, ts.location(var));

    const value val = _parse_body(ts, tok);
    if (length(val) != 1)
      throw parse_error {"binding pair malformed: expected {\\VAR VALUE}",
                         ts.location(tok.start, ts.consumed())};

    bindings.push_back(
        _located(list(sym(var.text), car(val)),
                 ts.location(tok.start, ts.consumed())));
  }
}


blt::value
blt::parser::_parse_cond_clauses(token_stream &ts, const token &open) const
{
  stl::vector<value> clauses;
  while (true)
  {
    _skip_whitespace(ts);
    const token tok = ts.next();
    switch (tok.type)
    {
      case token::type::RBRACE:
        return list(clauses);

      case token::type::END:
        throw parse_error {"unmatched '{'", ts.location(open)};

      case token::type::LBRACE: {
        const value body = _parse_body(ts, tok);
        const source_location location = ts.location(tok.start, ts.consumed());
        if (isnil(body))
          throw parse_error {"\\cond clause must be a non-empty group", location};
        clauses.push_back(_located(cons("clause", body), location));
        break;
      }

      default:
        throw parse_error {"\\cond clause must be a group {TEST THEN...}",
                           ts.location(tok)};
    }
  }
}


blt::value
blt::parser::_parse_special_form(token_stream &ts, const token &open,
                                 special_form form, const token &keyword) const
{
  const std::string formname = _form_name(keyword);
  value result = nil;

  switch (form)
  {
    case special_form::define: {
      _skip_whitespace(ts);
      const token target = ts.next();
      if (target.type == token::type::VARIABLE)
      {
        _check_identifier(target, ts.location(target));
        const value body = _parse_body(ts, open);
        if (length(body) != 1)
          throw parse_error {
              std::format("{} of a variable expects exactly one value",
                          formname),
              ts.location(open.start, ts.consumed())};
        result = list("define", sym(target.text), car(body));
      }
      else if (target.type == token::type::LBRACE)
      {
        // {\define {\NAME PARAM...} EXPR...}
        _skip_whitespace(ts);
        const token name = ts.next();
        if (name.type != token::type::VARIABLE)
          throw parse_error {
              std::format("malformed {}: expected {{\\NAME PARAM...}}",
                          formname),
              ts.location(name)};
        _check_identifier(name, ts.location(name));
        const value params = _parse_parameters(ts, target);
        const value body = _parse_body(ts, open);
        const source_location location = ts.location(open.start, ts.consumed());
        const value lambda =
            _located(cons("lambda", cons(params, body)), location);
        result = list("define", sym(name.text), _located(ws("", lambda), location));
      }
      else
        throw parse_error {
            std::format("malformed {}: expected \\VAR or {{\\NAME PARAM...}}",
                        formname),
            ts.location(target)};
      break;
    }

    case special_form::set: {
      _skip_whitespace(ts);
      const token target = ts.next();
      if (target.type != token::type::VARIABLE)
        throw parse_error {
            std::format("{} target is not a variable reference", formname),
            ts.location(target)};
      _check_identifier(target, ts.location(target));
      const value body = _parse_body(ts, open);
      if (length(body) != 1)
        throw parse_error {
            std::format("{} expects exactly one value", formname),
            ts.location(open.start, ts.consumed())};
      result = list("set!", sym(target.text), car(body));
      break;
    }

    case special_form::if_: {
      const value body = _parse_body(ts, open);
      if (length(body) < 2)
        throw parse_error {
            std::format("{} requires a test and a consequent", formname),
            ts.location(open.start, ts.consumed())};
      result = cons("if", body);
      break;
    }

    case special_form::and_:
    case special_form::or_: {
      const value body = _parse_body(ts, open);
      if (isnil(body))
        throw parse_error {
            std::format("{} requires at least one expression", formname),
            ts.location(open.start, ts.consumed())};
      result = cons(form == special_form::and_ ? "and" : "or", body);
      break;
    }

    case special_form::cond:
      result = cons("cond", _parse_cond_clauses(ts, open));
      break;

    case special_form::while_: {
      const value body = _parse_body(ts, open);
      if (isnil(body))
        throw parse_error {std::format("{} requires a test", formname),
                           ts.location(open.start, ts.consumed())};
      result = cons("while", body);
      break;
    }

    case special_form::lambda: {
      _skip_whitespace(ts);
      const token params_open = ts.next();
      if (params_open.type != token::type::LBRACE)
        throw parse_error {
            std::format("{} expects a parameter list {{PARAM...}}", formname),
            ts.location(params_open)};
      const value params = _parse_parameters(ts, params_open);
      const value body = _parse_body(ts, open);
      result = cons("lambda", cons(params, body));
      break;
    }

    case special_form::let:
    case special_form::let_star:
    case special_form::letrec: {
      const value bindings = _parse_bindings(ts, keyword);
      const value body = _parse_body(ts, open);
      const char *name = form == special_form::let      ? "let"
                       : form == special_form::let_star ? "let*"
                                                        : "letrec";
      result = cons(name, cons(bindings, body));
      break;
    }
  }

  return _located(result, ts.location(open.start, ts.consumed()));
}


void
blt::collect_variables(value expr, std::set<std::string> &names)
{
  switch (expr->t)
  {
    case tag::ws:
      collect_variables(ws_obj(expr), names);
      break;

    case tag::sym:
      names.emplace(sym_name(expr));
      break;

    case tag::pair: {
      // Nodes are headed by the form name; other lists are plain sequences
      value items = expr;
      if (issym(car(expr)))
      {
        if (issym(car(expr), "named-arg"))
        {
          collect_variables(car(cdr(cdr(expr))), names);
          break;
        }
        items = cdr(expr);
      }
      for (const value x : range(items))
      {
        if (x->t != tag::pair or car(x)->t != tag::pair)
        {
          collect_variables(x, names);
          continue;
        }
        // Parameter list `((KIND V)...)` or binding list `((V X)...)`
        for (const value entry : range(x))
        {
          const value second = car(cdr(entry));
          if (issym(second))
            names.emplace(sym_name(second));
          else
          {
            names.emplace(sym_name(car(entry)));
            collect_variables(second, names);
          }
        }
      }
      break;
    }

    default:
      break;
  }
}
