#include <catch2/catch.hpp>

#include <BitTiming.hpp>
#include <TimingSearch.hpp>

#include "test_utils.hpp"

#include <vector>

using namespace CanTiming;

TEST_CASE("segmentation of the bit time", "[search][segments]") {
  SECTION("odd Tbit splits evenly") {
    REQUIRE(segments_for(9) == Segments{1, 4, 2, 2, 1});
    REQUIRE(segments_for(11) == Segments{1, 5, 3, 2, 1});
    REQUIRE(segments_for(13) == Segments{1, 6, 3, 3, 1});
    REQUIRE(segments_for(15) == Segments{1, 7, 4, 3, 1});
    REQUIRE(segments_for(17) == Segments{1, 8, 4, 4, 1});
  }
  SECTION("even Tbit overshoots the bit time") {
    REQUIRE(segments_for(8) == Segments{1, 4, 3, 2, 1});
    REQUIRE(segments_for(16) == Segments{1, 8, 5, 4, 1});
    REQUIRE_FALSE(is_valid(segments_for(8), 8));
    REQUIRE_FALSE(is_valid(segments_for(16), 16));
  }
  SECTION("propagation segment too long above 17") {
    REQUIRE(segments_for(19).prop == 9);
    REQUIRE_FALSE(is_valid(segments_for(19), 19));
  }
  SECTION("only a few Tbit values are realizable") {
    std::vector<int> valid;
    for (int tbit = avr::MIN_TBIT; tbit <= avr::MAX_TBIT; ++tbit) {
      if (is_valid(segments_for(tbit), tbit)) {
        valid.push_back(tbit);
      }
    }
    REQUIRE(valid == std::vector<int>{9, 11, 13, 15, 17});
  }
}

TEST_CASE("segment range checks", "[search][segments]") {
  REQUIRE(is_valid(Segments{1, 1, 4, 4, 4}, 10));
  REQUIRE_FALSE(is_valid(Segments{1, 0, 4, 4, 1}, 9));
  REQUIRE_FALSE(is_valid(Segments{1, 2, 9, 2, 1}, 14));
  REQUIRE_FALSE(is_valid(Segments{1, 4, 3, 1, 1}, 9));
  REQUIRE_FALSE(is_valid(Segments{1, 4, 2, 3, 1}, 10));
}

TEST_CASE("error rate threshold", "[search][threshold]") {
  SECTION("default threshold") {
    REQUIRE(max_error_rate(segments_for(9), 1000000) == 0.5);
  }
  SECTION("relaxed threshold needs sjw=4 above 125 kbps") {
    const Segments relaxed{1, 1, 4, 4, 4};
    REQUIRE(max_error_rate(relaxed, 250000) == 1.58);
    REQUIRE(max_error_rate(relaxed, 125000) == 0.5);
    REQUIRE(max_error_rate(Segments{1, 1, 4, 4, 1}, 250000) == 0.5);
  }
  SECTION("relaxed threshold is never used by the search") {
    for (int tbit = avr::MIN_TBIT; tbit <= avr::MAX_TBIT; ++tbit) {
      REQUIRE(max_error_rate(segments_for(tbit), 1000000) == 0.5);
    }
  }
}

TEST_CASE("exact division", "[search]") {
  // 12 MHz / 100 kbps = 120 clocks per bit
  const auto res = search(100000, 12000000);
  REQUIRE(res.size() == 1);
  const auto &c = res.front();
  REQUIRE(c.tbit() == 15);
  REQUIRE(c.prescaler() == 8);
  REQUIRE(c.sync_segment() == 1);
  REQUIRE(c.prop_segment() == 7);
  REQUIRE(c.phase_seg1() == 4);
  REQUIRE(c.phase_seg2() == 3);
  REQUIRE(c.sync_jump_width() == 1);
  REQUIRE(c.error_rate() == 0.0);
  REQUIRE(c.clocks_per_bit() == 120.0);
  REQUIRE(c.baud_rate() == 100000);
  REQUIRE(c.cpu_frequency() == 12000000);
}

TEST_CASE("fractional clocks per bit", "[search]") {
  const auto res = search(400000, 18100000);
  REQUIRE(res.size() == 2);
  REQUIRE(res[0].tbit() == 9);
  REQUIRE(res[0].prescaler() == 5);
  REQUIRE(res[0].error_rate() == Approx(0.25));
  REQUIRE(res[1].tbit() == 15);
  REQUIRE(res[1].prescaler() == 3);
  REQUIRE(res[1].error_rate() == Approx(0.25));
  REQUIRE(res[0].clocks_per_bit() == Approx(45.25));
}

TEST_CASE("candidates are in ascending Tbit order", "[search]") {
  // 15.84 MHz / 160 kbps = 99 clocks per bit
  const auto res = search(160000, 15840000);
  REQUIRE(res.size() == 2);
  REQUIRE(res[0].tbit() == 9);
  REQUIRE(res[0].prescaler() == 11);
  REQUIRE(res[1].tbit() == 11);
  REQUIRE(res[1].prescaler() == 9);
}

TEST_CASE("prescaler register width", "[search][prescaler]") {
  SECTION("64 fits") {
    // 576 clocks per bit = 9 * 64
    const auto res = search(10000, 5760000);
    REQUIRE(res.size() == 1);
    REQUIRE(res[0].tbit() == 9);
    REQUIRE(res[0].prescaler() == 64);
  }
  SECTION("65 is skipped") {
    // 585 clocks per bit = 9 * 65 = 13 * 45 = 15 * 39
    const auto res = search(20000, 11700000);
    REQUIRE(res.size() == 2);
    REQUIRE(res[0].tbit() == 13);
    REQUIRE(res[0].prescaler() == 45);
    REQUIRE(res[1].tbit() == 15);
    REQUIRE(res[1].prescaler() == 39);
  }
  SECTION("zero prescaler is skipped") {
    // 0.25 clocks per bit leaves a small remainder for every Tbit
    REQUIRE(search(4, 1).empty());
    REQUIRE_FALSE(make_candidate(4, 1, 9).has_value());
  }
}

TEST_CASE("no realizable timing", "[search]") {
  SECTION("16 MHz, 500 kbps") {
    // 32 clocks per bit, only even Tbit values divide it
    REQUIRE(search(500000, 16000000).empty());
    REQUIRE_FALSE(make_candidate(500000, 16000000, 16).has_value());
  }
  SECTION("8 MHz, 1 Mbps") { REQUIRE(search(1000000, 8000000).empty()); }
  SECTION("less than 8 clocks per bit") {
    REQUIRE(search(1000000, 4000000).empty());
  }
}

TEST_CASE("invalid arguments", "[search][errors]") {
  REQUIRE_THROWS_AS(search(0, 16000000), InvalidArgument);
  REQUIRE_THROWS_AS(search(-125000, 16000000), InvalidArgument);
  REQUIRE_THROWS_AS(search(125000, -1), InvalidArgument);
  REQUIRE_THROWS_AS(search(125000, 0), InvalidArgument);
  REQUIRE_THROWS_AS(make_candidate(0, 16000000, 9), InvalidArgument);
  REQUIRE_THROWS_AS(search(0, 16000000), std::invalid_argument);
}

TEST_CASE("search properties", "[search][properties]") {
  const std::vector<baud_t> bauds{10000,  20000,  50000,  100000, 125000,
                                  250000, 400000, 500000, 800000, 1000000};
  const std::vector<freq_t> freqs{1000000,  2000000,  4000000,  8000000,
                                  11059200, 12000000, 15840000, 16000000,
                                  18000000, 18100000, 20000000, 24000000};
  for (const auto f : freqs) {
    for (const auto b : bauds) {
      const auto res = search(b, f);
      for (auto const &c : res) {
        require_valid(c);
        REQUIRE(c.baud_rate() == b);
        REQUIRE(c.cpu_frequency() == f);
      }
      for (std::size_t i = 1; i < res.size(); ++i) {
        REQUIRE(res[i - 1].tbit() < res[i].tbit());
      }
      REQUIRE(search(b, f) == res);
    }
  }
}

TEST_CASE("bit timing config validation", "[search][model]") {
  SECTION("valid") {
    const BitTimingConfig c{12000000, 100000, 15, 8, segments_for(15), 0.0};
    REQUIRE(c.clocks_per_bit() == 120.0);
    REQUIRE(c.segments() == segments_for(15));
    REQUIRE(c == BitTimingConfig{12000000, 100000, 15, 8, segments_for(15),
                                 0.0});
  }
  SECTION("segments don't add up") {
    REQUIRE_THROWS_AS(
        BitTimingConfig(16000000, 500000, 16, 2, segments_for(16), 0.0),
        InvalidArgument);
  }
  SECTION("Tbit out of range") {
    REQUIRE_THROWS_AS(
        BitTimingConfig(16000000, 500000, 7, 2, Segments{1, 2, 2, 2, 1}, 0.0),
        InvalidArgument);
    REQUIRE_THROWS_AS(BitTimingConfig(16000000, 500000, 26, 2,
                                      Segments{1, 9, 8, 8, 1}, 0.0),
                      InvalidArgument);
  }
  SECTION("prescaler out of range") {
    REQUIRE_THROWS_AS(
        BitTimingConfig(12000000, 100000, 15, 0, segments_for(15), 0.0),
        InvalidArgument);
    REQUIRE_THROWS_AS(
        BitTimingConfig(12000000, 100000, 15, 65, segments_for(15), 0.0),
        InvalidArgument);
  }
  SECTION("negative error rate") {
    REQUIRE_THROWS_AS(
        BitTimingConfig(12000000, 100000, 15, 8, segments_for(15), -0.1),
        InvalidArgument);
  }
  SECTION("non-positive input") {
    REQUIRE_THROWS_AS(
        BitTimingConfig(12000000, 0, 15, 8, segments_for(15), 0.0),
        InvalidArgument);
  }
}
