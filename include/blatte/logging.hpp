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

#include "blatte/format.hpp" // IWYU pragma: export

#include <format>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sys/types.h>


namespace blt {

enum class loglevel: int {
  silent,
  error,
  warning,
  info,
  debug,
};

inline std::string_view
loglevel_name(loglevel lvl)
{
  switch (lvl)
  {
    case loglevel::silent: return "silent";
    case loglevel::error: return "error";
    case loglevel::warning: return "warning";
    case loglevel::info: return "info";
    case loglevel::debug: return "debug";
  }
  std::terminate();
}

inline loglevel
parse_loglevel(std::string_view name)
{
  if (name == "silent")
    return loglevel::silent;
  if (name == "error")
    return loglevel::error;
  if (name == "warning")
    return loglevel::warning;
  if (name == "info")
    return loglevel::info;
  if (name == "debug")
    return loglevel::debug;
  throw std::runtime_error {std::format("Invalid loglevel name ({})", name)};
}


inline bool
operator >= (loglevel a, loglevel b)
{ return static_cast<int>(a) >= static_cast<int>(b); }


extern size_t logging_indent;

extern loglevel loglevel;


struct add_indent {
  add_indent(size_t indent): m_indent {indent} { }

  inline friend std::ostream&
  operator << (std::ostream &os, const add_indent &self) noexcept
  {
    for (size_t i = 1; i < self.m_indent; ++i)
      os << "\e[2m¦\e[0m ";
    if (self.m_indent > 0)
      os << "| ";
    return os;
  }

  private:
  size_t m_indent;
};


/**
 * Write a log message with a header
 *
 * Continuation lines of a multiline message are aligned under the first one.
 */
inline void
write_log_message(std::string_view header, size_t header_width,
                  const std::string &message)
{
  std::istringstream input {message};
  std::string line;
  bool first = true;
  while (std::getline(input, line))
  {
    if (first)
      std::cerr << "blatte " << header << add_indent(logging_indent) << line
                << "\n";
    else
      std::cerr << std::string(7 + header_width, ' ')
                << add_indent(logging_indent) << line << "\n";
    first = false;
  }
}


template <typename... Args> void
debug([[maybe_unused]] std::format_string<Args...> fmt, [[maybe_unused]] Args &&...args)
{
#ifndef BLATTE_RELEASE_BUILD
  if (loglevel >= loglevel::debug)
    write_log_message("\e[7;1mdebug\e[0m ", 6,
                      std::format(fmt, std::forward<Args>(args)...));
#endif
}


template <typename... Args> void
info(std::format_string<Args...> fmt, Args &&...args)
{
  if (loglevel >= loglevel::info)
    write_log_message("", 0, std::format(fmt, std::forward<Args>(args)...));
}


template <typename... Args> void
warning(std::format_string<Args...> fmt, Args &&...args)
{
  if (loglevel >= loglevel::warning)
    write_log_message("\e[38;5;3;1mwarning\e[0m ", 8,
                      std::format(fmt, std::forward<Args>(args)...));
}


template <typename... Args> void
error(std::format_string<Args...> fmt, Args &&...args)
{
  if (loglevel >= loglevel::error)
    write_log_message("\e[38;5;1;1merror\e[0m ", 6,
                      std::format(fmt, std::forward<Args>(args)...));
}


struct indent {
  indent(ssize_t inc = 1)
  : m_inc {inc}
  { logging_indent += m_inc; }

  ~indent()
  { logging_indent -= m_inc; }

  indent(const indent&) = delete;
  void operator = (const indent&) = delete;

  private:
  ssize_t m_inc;
}; // struct blt::indent

} // namespace blt
