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

#include "repl.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <set>
#include <string>
#include <utility>
#include <vector>

// Readline headers
#include <readline/readline.h>
#include <readline/history.h>


static const char *history_file = ".blatte_history";

// Special form keywords (with the leading backslash)
static std::vector<std::string> keywords;

// Variables seen so far
static std::set<std::string> used_variables;


bool
prompt_line(const std::string &prompt, std::string &line)
{
  char *input = readline(prompt.c_str());

  // EOF
  if (input == nullptr)
    return false;

  line = input;
  if (not line.empty())
    add_history(input);

  free(input);
  return true;
}


static char *
_completion_generator(const char *text, int state)
{
  static std::vector<std::string> matches;
  static size_t index;

  // New word to complete
  if (state == 0)
  {
    matches.clear();
    index = 0;

    const std::string_view prefix {text};
    for (const std::string &keyword : keywords)
    {
      if (keyword.starts_with(prefix))
        matches.push_back(keyword);
    }
    for (const std::string &var : used_variables)
    {
      if (var.starts_with(prefix))
        matches.push_back(var);
    }
  }

  if (index < matches.size())
    return strdup(matches[index++].c_str());
  return nullptr;
}


static char **
_blatte_completion(const char *text, [[maybe_unused]] int start,
                   [[maybe_unused]] int end)
{
  // No filename completion
  rl_attempted_completion_over = 1;
  return rl_completion_matches(text, _completion_generator);
}


void
init_readline(const blt::parser &parser)
{
  for (const auto &[name, _] : parser.keywords())
    keywords.push_back("\\" + name);

  rl_readline_name = "blatte";
  rl_attempted_completion_function = _blatte_completion;
  // Braces end a word to complete
  rl_basic_word_break_characters = const_cast<char*>(" \t\n{}");
  rl_bind_key('\t', rl_complete);

  read_history(history_file);
}


void
cleanup_readline()
{
  write_history(history_file);
  history_truncate_file(history_file, 500);
}


void
extract_variables(const blt::value expr)
{
  std::set<std::string> names;
  blt::collect_variables(expr, names);
  for (const std::string &name : names)
  {
    std::string var = "\\" + name;
    if (std::find(keywords.begin(), keywords.end(), var) == keywords.end())
      used_variables.insert(std::move(var));
  }
}
