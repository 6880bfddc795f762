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

#include "blatte/parser.hpp"
#include "blatte/value.hpp"

#include <string>


bool
prompt_line(const std::string &prompt, std::string &line);

void
init_readline(const blt::parser &parser);

void
cleanup_readline();

void
extract_variables(const blt::value expr);
