// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <BitTiming.hpp>
#include <fwd.hpp>

#include <optional>
#include <vector>

namespace CanTiming {

// Splits tbit time quanta into sync, propagation and phase segments.
// The result is not necessarily valid, check it with is_valid()
constexpr Segments segments_for(int tbit) noexcept {
  Segments s{};
  s.sync = avr::SYNC_SEGMENT;
  s.prop = tbit % 2 == 0 ? tbit / 2 : (tbit - 1) / 2;
  s.phase1 = (tbit - s.prop - s.sync) % 2 == 0 ? s.prop / 2 : s.prop / 2 + 1;
  s.phase2 = s.prop / 2;
  s.sjw = avr::SYNC_JUMP_WIDTH;
  return s;
}

// Largest accepted error rate for the given segmentation.
// NOTE: the relaxed limit requires sjw == 4, which segments_for() never
// produces
constexpr double max_error_rate(Segments const &s, baud_t baud_rate) noexcept {
  if (s.prop == 1 && s.phase1 == 4 && s.phase2 == 4 && s.sjw == 4 &&
      baud_rate > avr::RELAXED_MIN_BAUDRATE) {
    return avr::RELAXED_MAX_ERROR_RATE;
  }
  return avr::DEFAULT_MAX_ERROR_RATE;
}

// Evaluates a single bit time, returns nullopt if it can't be realized
std::optional<BitTimingConfig> make_candidate(baud_t baud_rate,
                                              freq_t cpu_frequency, int tbit);

// All realizable bit timings for the given baudrate and CPU clock, in
// ascending Tbit order. Throws InvalidArgument on non-positive input.
std::vector<BitTimingConfig> search(baud_t baud_rate, freq_t cpu_frequency);

} // namespace CanTiming
