// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos
// <attila.gombos@effective-range.com> SPDX-License-Identifier: MIT

#include <iostream>
#include <ostream>

#include "calc_utils.hpp"

#include <ConfigSelector.hpp>

#include <argparse/argparse.hpp>

int main(int argc, char *argv[]) try {
  auto pparser = get_parser();
  auto &aug_parser = *pparser;
  auto &parser = aug_parser.parser;
  parser.parse_args(argc, argv);
  validate_args(parser);
  const auto verbose = verbosity(aug_parser.verbosity);

  const auto cpu_frequency = parser.get<CanTiming::freq_t>("--f_cpu");
  const auto baud_rates = requested_baudrates(parser);
  const auto entries = CanTiming::search_batch(baud_rates, cpu_frequency);
  log_results(verbose, entries);

  if (parser["--header"] == true) {
    execHeader(parser, entries);
    return 0;
  }
  const auto output = open_output(parser);
  auto &os = output ? *output : std::cout;
  return execReport(parser, entries, os);
} catch (const std::exception &e) {
  std::cerr << "ERROR:" << e.what() << '\n';
  return -1;
} catch (...) {
  std::cerr << "ERROR: Unknown exception occurred...\n";
  return -2;
}
