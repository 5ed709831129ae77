// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <HeaderWriter.hpp>

#include <cctype>
#include <stdexcept>

#include <fmt/format.h>

namespace Header {

std::string guard_name(std::string_view name) {
  if (name.empty()) {
    throw std::invalid_argument("header name must not be empty");
  }
  std::string res;
  res.reserve(name.size());
  for (const auto ch : name) {
    const auto c = static_cast<unsigned char>(ch);
    res.push_back(std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_');
  }
  if (std::isdigit(static_cast<unsigned char>(res.front()))) {
    res.insert(res.begin(), '_');
  }
  return res;
}

void Writer::write_start() {
  std::ostream_iterator<char> oit(os);
  oit = fmt::format_to(oit,
                       "/**\n"
                       " * {}\n"
                       " * This file is machine generated and should not be "
                       "altered by hand.\n"
                       " */\n\n",
                       timestamp);
  oit = fmt::format_to(oit, "#ifndef {0}_H\n#define {0}_H\n\n", guard);
}

void Writer::write_end() {
  fmt::format_to(std::ostream_iterator<char>(os), "\n#endif /* {}_H */\n",
                 guard);
}

void Writer::write_entry(CanTiming::BatchEntry const &entry) {
  if (written) {
    throw std::logic_error("header can hold a single baudrate configuration");
  }
  if (entry.error) {
    throw std::runtime_error(*entry.error);
  }
  if (!entry.found()) {
    throw std::runtime_error(fmt::format(
        "No valid CAN bit timing for baudrate {} bps at CPU frequency {} hz",
        entry.baud_rate, entry.cpu_frequency));
  }
  const auto &config = *entry.best;
  std::ostream_iterator<char> oit(os);
  oit = fmt::format_to(oit, "#if F_CPU == {}\n\n", config.cpu_frequency());
  write_defines(config);
  write_register_values();
  oit = fmt::format_to(oit, "\n#endif /* F_CPU == {} */\n",
                       config.cpu_frequency());
  written = true;
}

void Writer::write_defines(CanTiming::BitTimingConfig const &c) {
  define("CAN_BAUDRATE", c.baud_rate());
  define("CAN_PRESCALER", c.prescaler());
  define("CAN_CLKS_PR_BIT", format_decimal(c.clocks_per_bit()));
  define("CAN_TBIT", c.tbit());
  define("CAN_TSYNS", c.sync_segment());
  define("CAN_TPRS", c.prop_segment());
  define("CAN_TPH1", c.phase_seg1());
  define("CAN_TPH2", c.phase_seg2());
  define("CAN_SJW", c.sync_jump_width());
  define("CAN_ERR_RATE", format_decimal(c.error_rate()));
}

// register fields hold the segment length minus one
void Writer::write_register_values() {
  define("CANBT1_VALUE", "(CAN_PRESCALER-1)<<BRP0"sv);
  define("CANBT2_VALUE", "((CAN_TPRS-1)<<PRS0) | ((CAN_SJW-1)<<SJW0)"sv);
  define("CANBT3_VALUE", "((CAN_TPH1-1)<<PHS10) | ((CAN_TPH2-1)<<PHS20)"sv);
}

} // namespace Header
