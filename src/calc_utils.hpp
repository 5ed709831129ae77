// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <ConfigSelector.hpp>
#include <IConfigWriter.hpp>

#include <argparse/argparse.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <concepts>
#include <iosfwd>
#include <iostream>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

enum class Verbosity { ERROR = 0, INFO = 1, DEBUG = 2, MAX = DEBUG };

template <std::integral T> Verbosity verbosity(T val) {
  return static_cast<Verbosity>(
      std::clamp(val, T{0}, static_cast<T>(Verbosity::MAX)));
}

template <typename... Args>
void log_msg(Verbosity current, Verbosity level,
             fmt::format_string<Args...> format, Args &&...args) {
  if (level <= current) {
    std::cerr << fmt::format(format, std::forward<Args>(args)...);
  }
}

struct AugmentedParser {
  argparse::ArgumentParser parser;
  int verbosity = 0;
};

std::unique_ptr<AugmentedParser> get_parser();

// throws std::logic_error on conflicting options
void validate_args(argparse::ArgumentParser const &parser);

std::vector<CanTiming::baud_t>
requested_baudrates(argparse::ArgumentParser const &parser);

void log_results(Verbosity verbose,
                 std::span<CanTiming::BatchEntry const> entries);

template <typename Rng> void write_entries(IConfigWriter &writer, Rng &&rng) {
  writer.write_start();
  for (auto const &entry : rng) {
    writer.write_entry(entry);
  }
  writer.write_end();
}

std::string header_timestamp();

// nullptr means stdout
std::unique_ptr<std::ostream>
open_output(argparse::ArgumentParser const &parser);

// throws if the entries can't be represented in a header
std::string render_header(argparse::ArgumentParser const &parser,
                          std::span<CanTiming::BatchEntry const> entries);

// writes to --output or stdout, the output is untouched on failure
void execHeader(argparse::ArgumentParser const &parser,
                std::span<CanTiming::BatchEntry const> entries);

// returns the exit code, non-zero if a baudrate has no configuration
int execReport(argparse::ArgumentParser const &parser,
               std::span<CanTiming::BatchEntry const> entries,
               std::ostream &os);
