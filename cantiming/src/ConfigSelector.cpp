// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <ConfigSelector.hpp>
#include <TimingSearch.hpp>

#include <functional>

#include <range/v3/algorithm/min_element.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

namespace CanTiming {

std::optional<BitTimingConfig>
best(std::span<BitTimingConfig const> candidates) {
  if (candidates.empty()) {
    return std::nullopt;
  }
  // min_element returns the first of equal elements
  return *rg::min_element(candidates, std::less<>{},
                          &BitTimingConfig::error_rate);
}

std::optional<BitTimingConfig> search_best(baud_t baud_rate,
                                           freq_t cpu_frequency) {
  const auto candidates = search(baud_rate, cpu_frequency);
  return best(candidates);
}

namespace {
BatchEntry search_entry(baud_t baud_rate, freq_t cpu_frequency) {
  BatchEntry entry{baud_rate, cpu_frequency};
  try {
    entry.candidates = search(baud_rate, cpu_frequency);
  } catch (InvalidArgument const &e) {
    entry.error = e.what();
    return entry;
  }
  entry.best = best(entry.candidates);
  return entry;
}
} // namespace

std::vector<BatchEntry> search_batch(std::span<baud_t const> baud_rates,
                                     freq_t cpu_frequency) {
  ensure_positive_frequency(cpu_frequency);
  return baud_rates | rgv::transform([cpu_frequency](auto baud_rate) {
           return search_entry(baud_rate, cpu_frequency);
         }) |
         rg::to<std::vector>();
}

} // namespace CanTiming
