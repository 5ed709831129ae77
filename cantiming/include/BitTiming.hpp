// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <fwd.hpp>

#include <stdexcept>

namespace CanTiming {

struct InvalidArgument : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

// Bit timing register model of the AVR CAN controller (CANBT1..CANBT3)
namespace avr {
constexpr int MIN_TBIT = 8;
constexpr int MAX_TBIT = 25;

// BRP[5:0] in CANBT1
constexpr int PRESCALER_BITS = 6;
constexpr int MIN_PRESCALER = 1;
constexpr int MAX_PRESCALER = 1 << PRESCALER_BITS;

constexpr int SYNC_SEGMENT = 1;
// can vary from 1 to 4, but all AVR application notes use 1
constexpr int SYNC_JUMP_WIDTH = 1;

constexpr int MIN_PROP_SEGMENT = 1;
constexpr int MAX_PROP_SEGMENT = 8;
constexpr int MIN_PHASE_SEG1 = 1;
constexpr int MAX_PHASE_SEG1 = 8;
constexpr int MIN_PHASE_SEG2 = 2;

constexpr double DEFAULT_MAX_ERROR_RATE = 0.5;
constexpr double RELAXED_MAX_ERROR_RATE = 1.58;
constexpr baud_t RELAXED_MIN_BAUDRATE = 125 * 1000;
} // namespace avr

// Lengths of the bit time segments, in time quanta
struct Segments {
  int sync{};
  int prop{};
  int phase1{};
  int phase2{};
  int sjw{};

  constexpr int total() const noexcept { return sync + prop + phase1 + phase2; }
  constexpr bool operator==(Segments const &) const = default;
};

constexpr bool in_range(int val, int lo, int hi) noexcept {
  return lo <= val && val <= hi;
}

// The segments must add up to the bit time and every segment must fit
// into its register field
constexpr bool is_valid(Segments const &s, int tbit) noexcept {
  return tbit == s.total() &&
         in_range(s.prop, avr::MIN_PROP_SEGMENT, avr::MAX_PROP_SEGMENT) &&
         in_range(s.phase1, avr::MIN_PHASE_SEG1, avr::MAX_PHASE_SEG1) &&
         in_range(s.phase2, avr::MIN_PHASE_SEG2, s.phase1);
}

class BitTimingConfig {
public:
  BitTimingConfig(freq_t cpu_frequency, baud_t baud_rate, int tbit,
                  int prescaler, Segments segments, double error_rate);

  freq_t cpu_frequency() const noexcept { return m_cpu_frequency; }
  baud_t baud_rate() const noexcept { return m_baud_rate; }
  double clocks_per_bit() const noexcept { return m_clocks_per_bit; }
  int tbit() const noexcept { return m_tbit; }
  int prescaler() const noexcept { return m_prescaler; }
  Segments const &segments() const noexcept { return m_segments; }
  int sync_segment() const noexcept { return m_segments.sync; }
  int prop_segment() const noexcept { return m_segments.prop; }
  int phase_seg1() const noexcept { return m_segments.phase1; }
  int phase_seg2() const noexcept { return m_segments.phase2; }
  int sync_jump_width() const noexcept { return m_segments.sjw; }
  double error_rate() const noexcept { return m_error_rate; }

  bool operator==(BitTimingConfig const &) const = default;

private:
  freq_t m_cpu_frequency{};
  baud_t m_baud_rate{};
  double m_clocks_per_bit{};
  int m_tbit{};
  int m_prescaler{};
  Segments m_segments;
  double m_error_rate{};
};

// throw InvalidArgument on non-positive input
void ensure_positive_frequency(freq_t cpu_frequency);
void ensure_positive(baud_t baud_rate, freq_t cpu_frequency);

} // namespace CanTiming
