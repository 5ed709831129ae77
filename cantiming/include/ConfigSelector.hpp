// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <BitTiming.hpp>
#include <fwd.hpp>

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace CanTiming {

// Candidate with the smallest error rate, the first one wins on ties.
// nullopt means no bit timing exists for the searched parameters.
std::optional<BitTimingConfig>
best(std::span<BitTimingConfig const> candidates);

std::optional<BitTimingConfig> search_best(baud_t baud_rate,
                                           freq_t cpu_frequency);

// Outcome of the search for one baudrate of a batch
struct BatchEntry {
  baud_t baud_rate{};
  freq_t cpu_frequency{};
  std::vector<BitTimingConfig> candidates;
  std::optional<BitTimingConfig> best;
  std::optional<std::string> error;

  bool found() const noexcept { return best.has_value(); }
};

// Searches each baudrate independently, preserving the input order.
// An invalid baudrate is recorded in its own entry, an invalid CPU
// frequency throws InvalidArgument.
std::vector<BatchEntry> search_batch(std::span<baud_t const> baud_rates,
                                     freq_t cpu_frequency);

} // namespace CanTiming
