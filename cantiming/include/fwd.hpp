// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include <range/v3/algorithm/min_element.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/iota.hpp>
#include <range/v3/view/transform.hpp>

namespace rg = ranges;
namespace rgv = rg::views;

using std::literals::string_view_literals::operator""sv;

namespace CanTiming {
using freq_t = std::int64_t;
using baud_t = std::int64_t;

class BitTimingConfig;
struct Segments;
struct BatchEntry;
} // namespace CanTiming
