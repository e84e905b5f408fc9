/*
 * Isomorph - Deep structural equality for dynamically typed values
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


#include "isomorph/equality.hpp"
#include "isomorph/format.hpp"
#include "isomorph/literal_parser.hpp"
#include "isomorph/logging.hpp"
#include "isomorph/value.hpp"
#include "isomorph/utilities/execution_timer.hpp"

#include <boost/program_options.hpp>

#include <gc.h>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;


static constexpr int exit_equal = 0;
static constexpr int exit_different = 1;
static constexpr int exit_error = 2;


static iso::value
read_operand(iso::literal_parser &parser, const std::string &operand,
             bool inline_expression)
{
  using namespace iso;

  if (inline_expression)
    return parser.parse(operand, "<command-line>");

  const fs::path path {operand};
  if (std::ifstream infile {path, std::ios::binary})
  {
    debug("reading {}", path.c_str());
    return parser.parse(infile, path.string());
  }
  throw std::runtime_error {std::format("could not open input file '{}'",
                                        path.c_str())};
}


int
main(int argc, char **argv)
{
  namespace po = boost::program_options;
  using namespace iso;

  GC_INIT();

  std::string verbosity {loglevel_name(loglevel::warning)};
  std::vector<std::string> operands;
  equality_options opts;

  // Define command line options
  po::options_description desc {"Allowed options"};
  desc.add_options()
    ("help", "produce help message")
    ("expression,e", "treat LHS and RHS as literals rather than file paths")
    ("strict-sparse-arrays", po::bool_switch(&opts.strict_sparse_arrays),
     "distinguish array holes from undefined elements")
    ("normalize-boxed-primitives", po::bool_switch(&opts.normalize_boxed_primitives),
     "compare boxed primitives by their wrapped values")
    ("allow-prototype-mismatch", po::bool_switch(&opts.allow_prototype_mismatch),
     "compare objects with different prototypes by their properties")
    ("verbosity,v", po::value<std::string>(&verbosity)->implicit_value("debug"),
     "log level (silent, error, warning, info, debug)")
    ("timing", "report time spent comparing")
    ("quiet,q", "do not print the verdict")
    ("operand", po::value<std::vector<std::string>>(&operands), "LHS and RHS");

  po::positional_options_description posdesc;
  posdesc.add("operand", 2);

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
    return exit_error;
  }

  // Print help
  if (varmap.contains("help"))
  {
    std::cout << "Usage: " << argv[0] << " [options] LHS RHS" << std::endl;
    std::cout << desc << std::endl;
    return exit_equal;
  }

  // Set global log-level
  try
  {
    g_loglevel = parse_loglevel(verbosity);
  }
  catch (const std::invalid_argument &e)
  {
    error("{}", e.what());
    return exit_error;
  }

  if (operands.size() != 2)
  {
    error("expected two operands, got {}", operands.size());
    std::cerr << "Usage: " << argv[0] << " [options] LHS RHS" << std::endl;
    return exit_error;
  }

  // Both sides share one parser, so that #fn<name> denotes the same function
  literal_parser parser;
  const bool inline_expression = varmap.contains("expression");
  bool verdict;
  try
  {
    const value lhs = read_operand(parser, operands[0], inline_expression);
    const value rhs = read_operand(parser, operands[1], inline_expression);
    debug("lhs: {:#120}", lhs);
    debug("rhs: {:#120}", rhs);
    verdict = is_equal(lhs, rhs, opts);
  }
  catch (const bad_value &exn)
  {
    error("{}", exn.display());
    return exit_error;
  }
  catch (const std::runtime_error &exn)
  {
    error("{}", exn.what());
    return exit_error;
  }

  if (not varmap.contains("quiet"))
    std::cout << (verdict ? "equal" : "different") << std::endl;

  if (varmap.contains("timing"))
  {
    // Timing goes through info()
    if (not (g_loglevel >= loglevel::info))
      g_loglevel = loglevel::info;
    execution_timer::report_global_stats();
  }

  return verdict ? exit_equal : exit_different;
}
