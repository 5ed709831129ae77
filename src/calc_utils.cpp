// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include "calc_utils.hpp"

#include <cerrno>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <argparse/argparse.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <HeaderWriter.hpp>
#include <utils.hpp>

#include <range/v3/algorithm/all_of.hpp>

namespace fs = std::filesystem;

std::unique_ptr<AugmentedParser> get_parser() {
  std::unique_ptr<AugmentedParser> parser(new AugmentedParser{
      argparse::ArgumentParser{"cantiming", CANTIMING_VER,
                               argparse::default_arguments::all},
      0});

  auto *program = &parser->parser;
  program->add_description(
      "Calculates CAN bit timing settings for AVR CAN controllers");

  program->add_argument("-f", "--f_cpu")
      .help("clock frequency of the system clock in hz")
      .required()
      .scan<'i', CanTiming::freq_t>();

  program->add_argument("-b", "--baudrate")
      .help("the desired CAN baudrate(s) in bps")
      .required()
      .nargs(argparse::nargs_pattern::at_least_one)
      .scan<'i', CanTiming::baud_t>();

  program->add_argument("-c", "--config")
      .help("print the segment configuration of the best bit timing")
      .flag();

  program->add_argument("-a", "--all")
      .help("list every candidate bit timing, not just the best one")
      .flag();

  program->add_argument("--header")
      .help("generate a C header with the bit timing definitions for the "
            "baudrate at the given cpu frequency")
      .flag();

  program->add_argument("-n", "--name")
      .help("base name of the generated header's include guard")
      .default_value(std::string{"can_baud"});

  program->add_argument("-o", "--output")
      .help("output file, stdout if not specified");

  program->add_argument("-V", "--verbose")
      .action([verbose = std::addressof(parser->verbosity)](const auto &) {
        *verbose += 1;
      })
      .append()
      .nargs(0)
      .help("print more information about the search")
      .default_value(false)
      .implicit_value(true);
  return parser;
}

void validate_args(argparse::ArgumentParser const &parser) {
  if (parser["--header"] != true) {
    return;
  }
  if (parser["--config"] == true || parser["--all"] == true) {
    throw std::logic_error("--header can't be combined with --config or --all");
  }
  if (parser.get<std::vector<CanTiming::baud_t>>("--baudrate").size() != 1) {
    throw std::logic_error("--header requires exactly one baudrate");
  }
}

std::vector<CanTiming::baud_t>
requested_baudrates(argparse::ArgumentParser const &parser) {
  return parser.get<std::vector<CanTiming::baud_t>>("--baudrate");
}

void log_results(Verbosity verbose,
                 std::span<CanTiming::BatchEntry const> entries) {
  for (auto const &entry : entries) {
    if (entry.error) {
      log_msg(verbose, Verbosity::ERROR, "Skipping baudrate {}: {}\n",
              entry.baud_rate, *entry.error);
      continue;
    }
    log_msg(verbose, Verbosity::INFO,
            "Baudrate {} bps at {} hz: {} candidate(s), {:.4} clocks per "
            "bit\n",
            entry.baud_rate, entry.cpu_frequency, entry.candidates.size(),
            static_cast<double>(entry.cpu_frequency) /
                static_cast<double>(entry.baud_rate));
    for (auto const &c : entry.candidates) {
      log_msg(verbose, Verbosity::DEBUG, "  {}\n", render(c));
    }
  }
}

std::string header_timestamp() {
  return fmt::format("{:%c}", fmt::localtime(std::time(nullptr)));
}

std::unique_ptr<std::ostream>
open_output(argparse::ArgumentParser const &parser) {
  const auto path = parser.present("--output");
  if (!path) {
    return nullptr;
  }
  const fs::path outputfile{*path};
  if (fs::is_directory(outputfile)) {
    throw fs::filesystem_error("Output path is a directory", outputfile,
                               std::make_error_code(std::errc::is_a_directory));
  }
  errno = 0;
  auto ofs = std::make_unique<std::ofstream>(outputfile);
  if (!*ofs) {
    const auto ec = errno != 0 ? std::make_error_code(std::errc(errno))
                               : std::make_error_code(std::errc::io_error);
    throw fs::filesystem_error("Can't open output file", outputfile, ec);
  }
  return ofs;
}

std::string render_header(argparse::ArgumentParser const &parser,
                          std::span<CanTiming::BatchEntry const> entries) {
  std::ostringstream buff;
  Header::Writer writer(buff, parser.get<std::string>("--name"),
                        header_timestamp());
  write_entries(writer, entries);
  return buff.str();
}

void execHeader(argparse::ArgumentParser const &parser,
                std::span<CanTiming::BatchEntry const> entries) {
  // the output file is opened (and truncated) only after rendering succeeded
  const auto header = render_header(parser, entries);
  const auto output = open_output(parser);
  auto &os = output ? *output : std::cout;
  os << header;
  if (!os) {
    throw std::runtime_error("Failed to write the generated header");
  }
}

int execReport(argparse::ArgumentParser const &parser,
               std::span<CanTiming::BatchEntry const> entries,
               std::ostream &os) {
  OstreamWriter writer(os, ReportOptions{parser["--config"] == true,
                                         parser["--all"] == true});
  write_entries(writer, entries);
  const auto all_found = rg::all_of(
      entries, [](auto const &entry) { return entry.found(); });
  return all_found ? 0 : 1;
}
