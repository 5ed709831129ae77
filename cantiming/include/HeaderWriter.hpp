// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <BitTiming.hpp>
#include <IConfigWriter.hpp>
#include <fwd.hpp>

#include <iterator>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

// C header with preprocessor definitions for the AVR CANBT1..3 registers
namespace Header {

// Upper-cased identifier usable in an include guard, e.g.
// "can baud" -> "CAN_BAUD"
std::string guard_name(std::string_view name);

class Writer : public IConfigWriter {
public:
  inline static constexpr auto defineformat = "#define {} ({})\n"sv;

  // The timestamp only ends up in the banner comment
  Writer(std::ostream &os, std::string_view name, std::string timestamp)
      : os{os}, guard{guard_name(name)}, timestamp{std::move(timestamp)} {}

  void write_start() override;
  void write_end() override;
  // Accepts exactly one entry holding a configuration
  void write_entry(CanTiming::BatchEntry const &entry) override;

  void write_defines(CanTiming::BitTimingConfig const &config);
  void write_register_values();

private:
  template <typename T> void define(std::string_view name, T const &value) {
    fmt::format_to(std::ostream_iterator<char>(os), defineformat, name, value);
  }

  std::ostream &os;
  std::string guard;
  std::string timestamp;
  bool written{false};
};

} // namespace Header
