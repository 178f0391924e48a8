/**
 * @file test_lfo.cpp
 * @brief Unit tests for the bounce / wrap oscillator
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <blobs/lfo.h>

#include <random>
#include <vector>

using namespace blobs;
using Catch::Matchers::WithinAbs;

TEST_CASE("LFO initial state", "[lfo]") {
    LFO lfo(-2.0f, 6.0f, 1.0f, nullptr);

    REQUIRE(lfo.value() == 2.0f);
    REQUIRE(lfo.direction() == 1);
    REQUIRE(lfo.mode() == LFOMode::Bounce);
}

TEST_CASE("LFO bounce mode", "[lfo]") {
    std::vector<float> seen;
    LFO lfo(0.0f, 10.0f, 4.0f, [&](float v) { seen.push_back(v); }, LFOMode::Bounce);

    SECTION("rises linearly and reports every value") {
        lfo.update(1.0);
        REQUIRE(lfo.value() == 9.0f);
        REQUIRE(seen == std::vector<float>{9.0f});
    }

    SECTION("crossing max by 3 flips direction and lands at max - 3") {
        lfo.update(1.0);
        lfo.update(1.0);
        REQUIRE(lfo.direction() == -1);
        REQUIRE_THAT(lfo.value(), WithinAbs(7.0f, 1e-5f));
    }

    SECTION("crossing min by 1 flips direction back and lands at min + 1") {
        lfo.update(1.0);   // 9
        lfo.update(1.0);   // 7, falling
        lfo.update(1.0);   // 3
        lfo.update(1.0);   // -1 -> 1, rising
        REQUIRE(lfo.direction() == 1);
        REQUIRE_THAT(lfo.value(), WithinAbs(1.0f, 1e-5f));
        REQUIRE(seen.size() == 4);
    }

    SECTION("zero dt leaves the value alone but still calls back") {
        lfo.update(0.0);
        REQUIRE(lfo.value() == 5.0f);
        REQUIRE(seen.size() == 1);
    }
}

TEST_CASE("LFO wrap mode", "[lfo]") {
    LFO lfo(0.0f, 10.0f, 4.0f, nullptr, LFOMode::Wrap);

    SECTION("crossing max by 3 wraps to min + 3 and keeps rising") {
        lfo.update(1.0);
        lfo.update(1.0);
        REQUIRE_THAT(lfo.value(), WithinAbs(3.0f, 1e-5f));
        REQUIRE(lfo.direction() == 1);
    }

    SECTION("hue style sweep wraps around 360") {
        LFO hue(0.0f, 360.0f, 30.0f, nullptr, LFOMode::Wrap);   // starts at 180
        hue.update(7.0);                                          // 390 -> 30
        REQUIRE_THAT(hue.value(), WithinAbs(30.0f, 1e-3f));
        REQUIRE(hue.direction() == 1);
    }
}

TEST_CASE("LFO value stays within bounds", "[lfo]") {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> dtDist(0.0, 0.5);

    for (LFOMode mode : {LFOMode::Bounce, LFOMode::Wrap}) {
        LFO lfo(-0.785398f, 0.785398f, 1.0f, nullptr, mode);
        for (int i = 0; i < 2000; ++i) {
            lfo.update(dtDist(rng));
            REQUIRE(lfo.value() >= lfo.minValue());
            REQUIRE(lfo.value() <= lfo.maxValue());
        }
    }

    SECTION("a step longer than the whole range is clamped") {
        LFO lfo(0.0f, 1.0f, 10.0f, nullptr, LFOMode::Bounce);
        lfo.update(5.0);
        REQUIRE(lfo.value() >= 0.0f);
        REQUIRE(lfo.value() <= 1.0f);
    }
}
