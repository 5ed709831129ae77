// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <BitTiming.hpp>
#include <ConfigSelector.hpp>
#include <IConfigWriter.hpp>
#include <fwd.hpp>

#include <iterator>
#include <ostream>
#include <string>

#include <fmt/format.h>

// One line summary of a bit timing configuration
inline std::string render(CanTiming::BitTimingConfig const &c) {
  return fmt::format("baud: {} cpu: {} Tbit: {} prescaler: {} "
                     "segments: {}+{}+{}+{} sjw: {} err: {}",
                     c.baud_rate(), c.cpu_frequency(), c.tbit(), c.prescaler(),
                     c.sync_segment(), c.prop_segment(), c.phase_seg1(),
                     c.phase_seg2(), c.sync_jump_width(),
                     format_decimal(c.error_rate()));
}

struct ReportOptions {
  bool details{false};
  bool candidates{false};
};

// Human readable report of the search results
struct OstreamWriter : IConfigWriter {
  explicit OstreamWriter(std::ostream &os, ReportOptions opts = {})
      : os{os}, opts{opts} {}

  void write_start() override {}
  void write_end() override {}

  void write_entry(CanTiming::BatchEntry const &entry) override {
    std::ostream_iterator<char> out(os);
    if (entry.error) {
      fmt::format_to(out, "CAN baudrate {} bps: {}\n", entry.baud_rate,
                     *entry.error);
      return;
    }
    if (!entry.found()) {
      fmt::format_to(out,
                     "CPU frequency {} hz, CAN baudrate {} bps: no valid bit "
                     "timing configuration\n",
                     entry.cpu_frequency, entry.baud_rate);
      return;
    }
    write_summary(out, *entry.best);
    if (opts.details) {
      write_details(out, *entry.best);
    }
    if (opts.candidates) {
      write_candidates(out, entry);
    }
  }

private:
  void write_summary(std::ostream_iterator<char> out,
                     CanTiming::BitTimingConfig const &c) {
    fmt::format_to(out,
                   "CPU frequency {} hz, CAN baudrate {} bps, error rate: {}%\n",
                   c.cpu_frequency(), c.baud_rate(),
                   format_decimal(c.error_rate()));
  }

  void write_details(std::ostream_iterator<char> out,
                     CanTiming::BitTimingConfig const &c) {
    fmt::format_to(out,
                   "Config at Time Quantum = 1\n"
                   "\tPrescaler: {}\n"
                   "\tTbit: {}\n"
                   "\tSync: {}\n"
                   "\tPropagation segment: {}\n"
                   "\tPhase Segment 1: {}\n"
                   "\tPhase Segment 2: {}\n"
                   "\tSJW: {}\n",
                   c.prescaler(), c.tbit(), c.sync_segment(), c.prop_segment(),
                   c.phase_seg1(), c.phase_seg2(), c.sync_jump_width());
  }

  void write_candidates(std::ostream_iterator<char> out,
                        CanTiming::BatchEntry const &entry) {
    fmt::format_to(out, "Candidates ({}):\n", entry.candidates.size());
    for (auto const &c : entry.candidates) {
      fmt::format_to(out, "\t{}\n", render(c));
    }
  }

  //////////////
  std::ostream &os;
  ReportOptions opts;
};
