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

#include "blatte/blatte.hpp"
#include "blatte/exceptions.hpp"
#include "blatte/logging.hpp"
#include "blatte/reader.hpp"
#include "blatte/value.hpp"
#include "blatte/utilities/execution_timer.hpp"

#include <boost/program_options.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace std {
namespace fs = std::filesystem;
}


static void
read_translate_print_loop(const blt::parser &parser,
                          const blt::perl_emitter &emitter)
{
  using namespace blt;

  init_readline(parser);

  reader reader {parser};
  for (std::string line; prompt_line(reader.pending() ? ". " : "> ", line);
       line.clear())
  {
    try
    {
      // Readline strips the newline, which is whitespace in Blatte
      reader << line + "\n";

      value expr = nil;
      while (reader >> expr)
      {
        debug("{}", expr);
        extract_variables(expr);
        std::cout << emitter.emit(expr) << ";" << std::endl;
      }
    }
    catch (const bad_code &exn)
    {
      error("{}", exn.display());
      reader.reset();
    }
  }

  cleanup_readline();
}


static std::string
read_input(const std::fs::path &path)
{
  if (path == "-")
    return {std::istreambuf_iterator<char>(std::cin),
            std::istreambuf_iterator<char>()};

  std::ifstream file {path, std::ios::binary};
  if (not file.is_open())
    throw std::runtime_error {
        std::format("Could not open input file '{}'", path.c_str())};
  return {std::istreambuf_iterator<char>(file),
          std::istreambuf_iterator<char>()};
}


int
main(int argc, char **argv)
{
  namespace po = boost::program_options;
  using namespace blt;

  std::string verbosity {loglevel_name(loglevel::info)};
  std::string package {"Blatte"};
  std::string opath;

  // Define command line options
  po::options_description desc {"Allowed options"};
  desc.add_options()
    ("help", "produce help message")
    ("input-file", po::value<std::fs::path>(), "input file to translate ('-' for standard input)")
    ("output,o", po::value<std::string>(&opath), "write Perl code to the specified file")
    ("standalone", "generate a complete program printing the rendered document")
    ("package", po::value<std::string>(&package), "Perl package of the Blatte runtime")
    ("interactive,i", "translate expressions typed at the terminal")
    ("timings", "report time spent in translation")
    ("verbosity,v", po::value<std::string>(&verbosity)->implicit_value("debug"), "verbosity level (silent, error, warning, info, debug)");

  po::positional_options_description posdesc;
  posdesc.add("input-file", 1);

  po::variables_map varmap;
  try
  {
    auto parsedopts = po::command_line_parser(argc, argv)
                          .options(desc)
                          .positional(posdesc)
                          .run();
    po::store(parsedopts, varmap);
    po::notify(varmap);
  }
  catch (const po::error &e)
  {
    error("{}", e.what());
    std::cerr << desc << std::endl;
    return EXIT_FAILURE;
  }

  // Print help
  if (varmap.contains("help"))
  {
    std::cout << "Usage: " << argv[0] << " [options] [input-file]" << std::endl;
    std::cout << desc << std::endl;
    return EXIT_SUCCESS;
  }

  // Set global log-level
  try
  {
    loglevel = parse_loglevel(verbosity);
  }
  catch (const std::runtime_error &exn)
  {
    error("{}", exn.what());
    return EXIT_FAILURE;
  }

  const parser &parser = default_parser();

  // Without an input file, run the interactive loop
  if (varmap.contains("interactive") or not varmap.contains("input-file"))
  {
    if (package == default_emitter().package())
      read_translate_print_loop(parser, default_emitter());
    else
    {
      const perl_emitter emitter {package};
      read_translate_print_loop(parser, emitter);
    }
    return EXIT_SUCCESS;
  }

  const std::fs::path inputpath = varmap["input-file"].as<std::fs::path>();
  if (inputpath != "-" and not std::fs::exists(inputpath))
  {
    error("Input file '{}' does not exist", inputpath.c_str());
    return EXIT_FAILURE;
  }

  try
  {
    info("Translating '{}'", inputpath.c_str());
    const std::string text = read_input(inputpath);

    translation_options options;
    options.source_name = inputpath == "-" ? "<stdin>" : inputpath.string();
    options.package = package;
    options.standalone = varmap.contains("standalone");

    execution_timer timer {"blattec"};
    const std::string code = translate(text, options, parser);
    timer.stop();
    if (varmap.contains("timings"))
      execution_timer::report_global_stats();

    if (opath.empty())
      std::cout << code << std::flush;
    else
    {
      std::ofstream ofile {opath, std::ios::binary};
      if (not ofile.is_open())
      {
        error("Could not open output file '{}'", opath);
        return EXIT_FAILURE;
      }
      ofile << code;
      info("Perl code written to '{}'", opath);
    }
  }
  catch (const bad_code &exn)
  {
    error("{}", exn.display());
    return EXIT_FAILURE;
  }
  catch (const std::runtime_error &exn)
  {
    error("{}", exn.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
