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

#include "blatte/memory.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <ostream>
#include <cstring>
#include <ranges>
#include <cassert>

/**
 * \file value.hpp
 * Core value representation
 * 
 * The same representation serves both as the abstract syntax tree produced by
 * the parser and as the shape of run-time values: scalars, lists, whitespace
 * wrappers and opaque callables.
 * 
 * \ingroup core
 */


namespace blt {

/**
 * Tag enumeration for object types
 * 
 * \ingroup core
 */
enum class tag {
  nil,  /**< Empty list */
  sym,  /**< Identifier (AST only) */
  str,  /**< Scalar text */
  num,  /**< Numeral */
  pair, /**< Cons cell */
  ws,   /**< Whitespace wrapper */
  fn,   /**< Opaque callable */
};

struct object;
struct source_location;

/**
 * Value class representing a reference to an object
 * 
 * \ingroup core
 */
class value {
  public:
  /**
   * Constructor
   * 
   * \param ptr Pointer to the object
   */
  explicit value(object *ptr): m_ptr {ptr} { assert(ptr != nullptr); }

  value();

  value(const char *sym);

  constexpr object*
  operator -> () const noexcept
  { return m_ptr; }

  constexpr object&
  operator * () const noexcept
  { return *m_ptr; }

  /**
   * Structural equality
   * 
   * \param other Value to compare with
   * \return True if the values are equal
   */
  [[nodiscard]] bool
  operator == (blt::value other) const noexcept;

  /**
   * Overload of equality comparison for symbols 
   *
   * \param symbol Symbol name to compare with
   * \return True if `this` is a symbol with name \p symbol
   */
  [[nodiscard]] bool
  operator == (const char *symbol) const;

  private:
  object *m_ptr; /**< Pointer to the object */
}; // class blt::value


/**
 * Signature of native callables
 *
 * A callable receives the mapping of named arguments (an association list of
 * `(name . value)` pairs, possibly empty) followed by the list of positional
 * arguments in call order.
 *
 * \ingroup core
 */
using primitive = value (*)(value named, value positional);


/**
 * Object structure representing a value
 * 
 * \ingroup core
 */
struct object {
  /**
   * Constructor
   * 
   * \note This constructor leaves the payload uninitialized
   * \param tag Type tag for the object
   */
  object(tag tag): t {tag}, location {nullptr} { }

  tag t; /**< Type tag */
  source_location *location; /**< Where the value was parsed from (optional) */
  union {
    struct { char *data; size_t len; } sym; /**< Symbol data */
    struct { char *data; size_t len; } str; /**< String data */
    struct { object *car, *cdr; }; /**< Pair data */
    long double num; /**< Numeric data */
    struct { char *data; size_t len; object *obj; } ws; /**< Wrapper data */
    struct { primitive proc; const char *name; } fn; /**< Callable data */
  };
}; // struct blt::object


namespace detail {

inline char*
copy_string(std::string_view str)
{
  char *data = static_cast<char*>(allocate_atomic(str.length() + 1));
  std::memcpy(data, str.data(), str.length());
  data[str.length()] = '\0';
  return data;
}

} // namespace blt::detail


/**
 * \name Fundamental constructors
 * \{
 */

/**
 * Create a symbol value
 * 
 * \param str Symbol name
 * \return Symbol value
 *
 * \ingroup core
 */
[[nodiscard]] inline value
sym(std::string_view str)
{
  value ret {make<object>(tag::sym)};
  ret->sym.data = detail::copy_string(str);
  ret->sym.len = str.length();
  return ret;
}

/**
 * Create a string value
 * 
 * \param str String content
 * \return String value
 *
 * \ingroup core
 */
[[nodiscard]] inline value
str(std::string_view str)
{
  value ret {make<object>(tag::str)};
  ret->str.data = detail::copy_string(str);
  ret->str.len = str.length();
  return ret;
}

/**
 * Create a numeric value
 * 
 * \param val Numeric value
 * \return Numeric value
 *
 * \ingroup core
 */
[[nodiscard]] inline value
num(long double val)
{
  value ret {make<object>(tag::num)};
  ret->num = val;
  return ret;
}

/**
 * Create a whitespace wrapper
 * 
 * \param ws Whitespace preceding \p obj in the source text
 * \param obj Wrapped value
 * \return Wrapper value
 *
 * \ingroup core
 */
[[nodiscard]] inline value
ws(std::string_view ws, value obj)
{
  value ret {make<object>(tag::ws)};
  ret->ws.data = detail::copy_string(ws);
  ret->ws.len = ws.length();
  ret->ws.obj = &*obj;
  return ret;
}

/**
 * Create a callable value
 * 
 * \param proc Native implementation
 * \param name Name used when printing the value
 * \return Callable value
 *
 * \ingroup core
 */
[[nodiscard]] inline value
fn(primitive proc, std::string_view name = "anonymous")
{
  if (proc == nullptr)
    throw std::invalid_argument {"fn() - null procedure"};
  value ret {make<object>(tag::fn)};
  ret->fn.proc = proc;
  ret->fn.name = detail::copy_string(name);
  return ret;
}

/**
 * Create a pair value
 * 
 * \param car First element of the pair
 * \param cdr Second element of the pair
 * \return Pair value
 *
 * \ingroup core
 */
[[nodiscard]] inline value
pair(value car, value cdr)
{
  value ret {make<object>(tag::pair)};
  ret->car = &*car;
  ret->cdr = &*cdr;
  return ret;
}

/**
 * Create a pair (cons cell)
 *
 * \ingroup core
 */
[[nodiscard]] inline value
cons(value car, value cdr)
{ return pair(car, cdr); }

extern const value nil; /**< Nil constant (the empty list) */

/** \} */


/**
 * \name List constructor
 * \{
 */

[[nodiscard]] inline value
from(value val)
{ return val; }

/**
 * Create a single-element list
 *
 * \ingroup core
 */
template <typename Head>
[[nodiscard]] value
list(Head head)
{ return cons(from(head), nil); }

/**
 * Create a list from multiple elements
 * 
 * \param head First element
 * \param tail Rest of the elements
 * \return List containing all elements
 *
 * \ingroup core
 */
template <typename Head, typename ...Tail>
[[nodiscard]] value
list(Head head, Tail&& ...tail)
{ return cons(from(head), list(std::forward<Tail>(tail)...)); }

/**
 * Reverse a list
 * 
 * \param l List to reverse
 * \return New list with elements in reverse order
 *
 * \ingroup core
 */
[[nodiscard]] inline value
reverse(value l)
{
  value acc = nil;
  for (; l->t == tag::pair; l = value {l->cdr})
    acc = cons(value {l->car}, acc);
  return acc;
}

/**
 * Create a list from a range
 * 
 * \param range Range of elements
 * \return List containing all elements from the range
 */
template <std::ranges::range Range>
[[nodiscard]] value
list(Range range)
{
  value acc = nil;
  for (const value x : range)
    acc = cons(x, acc);
  return reverse(acc);
}

/** \} */


/**
 * \name Type tests and accessors
 * \{
 */

[[nodiscard]] inline bool
isnil(value x)
{ return x->t == tag::nil; }

[[nodiscard]] inline bool
issym(value x)
{ return x->t == tag::sym; }

/**
 * Check if a value is a specific symbol
 * 
 * \param x Value to check
 * \param str Symbol name to compare with
 * \return True if the value is a symbol with the given name
 *
 * \ingroup core
 */
[[nodiscard]] inline bool
issym(value x, std::string_view str)
{ return issym(x) and (str == std::string_view {x->sym.data, x->sym.len}); }

/**
 * Get the name of a symbol
 * 
 * \param x Value to get the name from (must be a symbol)
 * \return The name of the symbol
 * \throws std::invalid_argument If the value is not a symbol
 *
 * \ingroup core
 */
[[nodiscard]] inline std::string_view
sym_name(value x)
{
  if (not issym(x))
    throw std::invalid_argument {"sym_name() - not a symbol"};
  return std::string_view {x->sym.data, x->sym.len};
}

[[nodiscard]] inline bool
isstr(value x)
{ return x->t == tag::str; }

[[nodiscard]] inline bool
isstr(value x, std::string_view str)
{ return isstr(x) and str == std::string_view {x->str.data, x->str.len}; }

/**
 * Get the string
 *
 * \param x Value to get the string from (must be a string)
 * \return String view corresponding to contents of the object
 * \throws std::invalid_argument If the value is not a string
 *
 * \ingroup core
 */
[[nodiscard]] inline std::string_view
str_view(value x)
{
  if (not isstr(x))
    throw std::invalid_argument {"str_view() - not a string"};
  return std::string_view {x->str.data, x->str.len};
}

[[nodiscard]] inline bool
isnum(value x)
{ return x->t == tag::num; }

[[nodiscard]] inline long double
num_val(value x)
{
  if (not isnum(x))
    throw std::invalid_argument {"num_val() - not a number"};
  return x->num;
}

[[nodiscard]] inline bool
ispair(value x)
{ return x->t == tag::pair; }

[[nodiscard]] inline bool
isws(value x)
{ return x->t == tag::ws; }

/**
 * Whitespace string of a wrapper
 *
 * \throws std::invalid_argument If the value is not a wrapper
 *
 * \ingroup core
 */
[[nodiscard]] inline std::string_view
ws_text(value x)
{
  if (not isws(x))
    throw std::invalid_argument {"ws_text() - not a whitespace wrapper"};
  return std::string_view {x->ws.data, x->ws.len};
}

/**
 * Object inside of a wrapper (a single layer is removed)
 *
 * \throws std::invalid_argument If the value is not a wrapper
 *
 * \ingroup core
 */
[[nodiscard]] inline value
ws_obj(value x)
{
  if (not isws(x))
    throw std::invalid_argument {"ws_obj() - not a whitespace wrapper"};
  return value {x->ws.obj};
}

[[nodiscard]] inline bool
isfn(value x)
{ return x->t == tag::fn; }

[[nodiscard]] inline std::string_view
fn_name(value x)
{
  if (not isfn(x))
    throw std::invalid_argument {"fn_name() - not a callable"};
  return x->fn.name;
}

/** \} */


/**
 * \name Basic functions
 * \{
 */

/**
 * Check if two values are the same object
 *
 * \ingroup core
 */
[[nodiscard]] inline bool
is(value a, value b)
{ return &*a == &*b; }

/**
 * Check if two values are structurally equal
 *
 * Wrappers are equal only to wrappers with the same whitespace and equal
 * contents; callables are equal when they share the implementation.
 *
 * \ingroup core
 */
[[nodiscard]] bool
equal(value a, value b);

/** \} */


/**
 * \name Basic list functions
 * \{
 */

/**
 * Get the first element of a pair
 * 
 * \tparam Test Whether to check if the value is a pair
 * \throws std::runtime_error If the value is not a pair and Test is true
 *
 * \ingroup core
 */
template <bool Test=true>
[[nodiscard]] inline value
car(value x)
{
  if constexpr (Test)
  {
    if (x->t != tag::pair)
      throw std::runtime_error {"car() - not a pair"};
  }
  return value {x->car};
}

/**
 * Get the second element of a pair
 * 
 * \tparam Test Whether to check if the value is a pair
 * \throws std::runtime_error If the value is not a pair and Test is true
 *
 * \ingroup core
 */
template <bool Test=true>
[[nodiscard]] inline value
cdr(value x)
{
  if constexpr (Test)
  {
    if (x->t != tag::pair)
      throw std::runtime_error {"cdr() - not a pair"};
  }
  return value {x->cdr};
}

[[nodiscard]] inline size_t
length(value l)
{
  size_t len = 0;
  for (; l->t == tag::pair; l = cdr(l), ++len);
  return len;
}

/**
 * Check if a value is a member of a list (using value equality)
 *
 * \ingroup core
 */
[[nodiscard]] inline bool
member(value x, value l)
{
  for (; l->t == tag::pair; l = cdr(l))
  {
    if (equal(x, car(l)))
      return true;
  }
  return false;
}

/**
 * Look up a key in an association list using value equality
 * 
 * \param k Key to look up
 * \param l Association list to search in
 * \param result Output parameter to store the value if found
 * \return True if the key was found, false otherwise
 * \throws std::runtime_error If the list is not an association list
 *
 * \ingroup core
 */
inline bool
assoc(value k, value l, value &result)
{
  for (; l->t == tag::pair; l = cdr(l))
  {
    const value kv = car(l);
    if (kv->t != tag::pair)
      throw std::runtime_error {"assoc() - non-associative list"};
    if (equal(k, car(kv)))
    {
      result = cdr(kv);
      return true;
    }
  }
  return false;
}

/**
 * Append two lists
 * 
 * \param l List to append to
 * \param x Tail of the new list
 * \return New list with elements of \p l followed by \p x
 *
 * \ingroup core
 */
[[nodiscard]] inline value
append(value l, value x)
{
  if (l->t == tag::pair)
    return cons(car(l), append(cdr(l), x));
  else
    return x;
}

[[nodiscard]] inline value
list_ref(value l, size_t k)
{
  while (k--)
    l = cdr(l);
  return car(l);
}

/** \} */


/**
 * \name Printing
 * \{
 */

/**
 * Write value as Blatte source text that reads back to an equal tree
 *
 * \ingroup core
 */
void
write(std::ostream &os, const blt::value &val);

/**
 * Debugging representation showing the structure of the tree
 *
 * \ingroup core
 */
void
print(std::ostream &os, const blt::value &val);

/** \} */

} // namespace blt


#include "blatte/cons_list_view.inl" // IWYU pragma: export


inline std::ostream&
operator << (std::ostream &os, const blt::value &val)
{ blt::print(os, val); return os; }

inline
blt::value::value()
: m_ptr {&*blt::nil}
{ }

inline
blt::value::value(const char *sym)
: m_ptr {&*blt::sym(sym)}
{ }

inline bool
blt::value::operator == (blt::value other) const noexcept
{ return blt::equal(*this, other); }

inline bool
blt::value::operator == (const char *symbol) const
{ return issym(*this, symbol); }
