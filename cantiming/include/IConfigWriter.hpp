// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <ConfigSelector.hpp>

#include <cmath>
#include <string>

#include <fmt/format.h>

// Shortest representation, whole numbers keep a ".0" so a value stays a
// floating point literal in the generated header
inline std::string format_decimal(double val) {
  if (std::isfinite(val) && std::trunc(val) == val) {
    return fmt::format("{:.1f}", val);
  }
  return fmt::format("{}", val);
}

struct IConfigWriter {
  virtual void write_start() = 0;
  virtual void write_end() = 0;
  virtual void write_entry(CanTiming::BatchEntry const &entry) = 0;

protected:
  ~IConfigWriter() = default;
};
