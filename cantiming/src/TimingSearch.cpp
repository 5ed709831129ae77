// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <TimingSearch.hpp>

#include <cmath>
#include <utility>

#include <range/v3/view/iota.hpp>

namespace CanTiming {

std::optional<BitTimingConfig> make_candidate(baud_t baud_rate,
                                              freq_t cpu_frequency, int tbit) {
  ensure_positive(baud_rate, cpu_frequency);
  const auto clocks_per_bit =
      static_cast<double>(cpu_frequency) / static_cast<double>(baud_rate);
  const auto error_rate = std::fmod(clocks_per_bit, tbit);

  const auto prescaler = std::floor(clocks_per_bit / tbit);
  if (prescaler > avr::MAX_PRESCALER || prescaler < avr::MIN_PRESCALER) {
    return std::nullopt;
  }

  const auto segments = segments_for(tbit);
  if (!is_valid(segments, tbit)) {
    return std::nullopt;
  }

  if (error_rate >= max_error_rate(segments, baud_rate)) {
    return std::nullopt;
  }
  return BitTimingConfig{cpu_frequency,
                         baud_rate,
                         tbit,
                         static_cast<int>(prescaler),
                         segments,
                         error_rate};
}

std::vector<BitTimingConfig> search(baud_t baud_rate, freq_t cpu_frequency) {
  ensure_positive(baud_rate, cpu_frequency);
  std::vector<BitTimingConfig> result;
  for (const auto tbit : rgv::closed_iota(avr::MIN_TBIT, avr::MAX_TBIT)) {
    if (auto candidate = make_candidate(baud_rate, cpu_frequency, tbit)) {
      result.push_back(std::move(*candidate));
    }
  }
  return result;
}

} // namespace CanTiming
