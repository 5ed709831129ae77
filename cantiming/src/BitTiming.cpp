// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <BitTiming.hpp>

#include <fmt/format.h>

namespace CanTiming {

void ensure_positive_frequency(freq_t cpu_frequency) {
  if (cpu_frequency <= 0) {
    throw InvalidArgument(
        fmt::format("CPU frequency must be positive, got {}", cpu_frequency));
  }
}

void ensure_positive(baud_t baud_rate, freq_t cpu_frequency) {
  if (baud_rate <= 0) {
    throw InvalidArgument(
        fmt::format("CAN baudrate must be positive, got {}", baud_rate));
  }
  ensure_positive_frequency(cpu_frequency);
}

BitTimingConfig::BitTimingConfig(freq_t cpu_frequency, baud_t baud_rate,
                                 int tbit, int prescaler, Segments segments,
                                 double error_rate)
    : m_cpu_frequency{cpu_frequency}, m_baud_rate{baud_rate},
      m_clocks_per_bit{0.0}, m_tbit{tbit}, m_prescaler{prescaler},
      m_segments{segments}, m_error_rate{error_rate} {
  ensure_positive(baud_rate, cpu_frequency);
  m_clocks_per_bit =
      static_cast<double>(cpu_frequency) / static_cast<double>(baud_rate);
  if (!in_range(tbit, avr::MIN_TBIT, avr::MAX_TBIT)) {
    throw InvalidArgument(fmt::format("Tbit out of range [{},{}]: {}",
                                      avr::MIN_TBIT, avr::MAX_TBIT, tbit));
  }
  if (!in_range(prescaler, avr::MIN_PRESCALER, avr::MAX_PRESCALER)) {
    throw InvalidArgument(fmt::format("prescaler out of range [{},{}]: {}",
                                      avr::MIN_PRESCALER, avr::MAX_PRESCALER,
                                      prescaler));
  }
  if (!is_valid(segments, tbit)) {
    throw InvalidArgument(fmt::format(
        "invalid segmentation for Tbit={}: sync={} prop={} ph1={} ph2={}",
        tbit, segments.sync, segments.prop, segments.phase1,
        segments.phase2));
  }
  if (!(error_rate >= 0.0)) {
    throw InvalidArgument(
        fmt::format("error rate must be non-negative, got {}", error_rate));
  }
}

} // namespace CanTiming
