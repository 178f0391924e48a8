/**
 * @file test_color.cpp
 * @brief Unit tests for HSV conversion, Color parsing and HsvColor caching
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <blobs/color.h>

#include <cmath>

using namespace blobs;
using Catch::Matchers::WithinAbs;

// =============================================================================
// hsvToRgb
// =============================================================================

TEST_CASE("hsvToRgb primaries and greys", "[color][hsv]") {
    SECTION("hue 0, 120, 240 at full saturation and value are pure red, green, blue") {
        REQUIRE(hsvToRgb(0.0f, 100.0f, 100.0f) == Rgb8{255, 0, 0});
        REQUIRE(hsvToRgb(120.0f, 100.0f, 100.0f) == Rgb8{0, 255, 0});
        REQUIRE(hsvToRgb(240.0f, 100.0f, 100.0f) == Rgb8{0, 0, 255});
    }

    SECTION("zero saturation gives a grey of round(v * 255) for any hue") {
        for (float h : {0.0f, 45.0f, 200.0f, 359.0f}) {
            for (float v : {0.0f, 20.0f, 50.0f, 100.0f}) {
                int expected = static_cast<int>(std::lround(v / 100.0f * 255.0f));
                Rgb8 rgb = hsvToRgb(h, 0.0f, v);
                REQUIRE(rgb.r == expected);
                REQUIRE(rgb.g == expected);
                REQUIRE(rgb.b == expected);
            }
        }
    }

    SECTION("half value rounds 127.5 up") {
        REQUIRE(hsvToRgb(10.0f, 0.0f, 50.0f) == Rgb8{128, 128, 128});
    }

    SECTION("secondary colours") {
        REQUIRE(hsvToRgb(60.0f, 100.0f, 100.0f) == Rgb8{255, 255, 0});
        REQUIRE(hsvToRgb(180.0f, 100.0f, 100.0f) == Rgb8{0, 255, 255});
        REQUIRE(hsvToRgb(300.0f, 100.0f, 100.0f) == Rgb8{255, 0, 255});
    }

    SECTION("hue of exactly 360 uses the sector 5 formula with no fraction") {
        REQUIRE(hsvToRgb(360.0f, 100.0f, 100.0f) == Rgb8{255, 0, 255});
    }
}

TEST_CASE("hsvToRgb clamps out-of-range input", "[color][hsv]") {
    SECTION("every channel stays in 0-255 over a sweep") {
        for (float h = -30.0f; h <= 400.0f; h += 7.5f) {
            for (float s = -10.0f; s <= 110.0f; s += 15.0f) {
                for (float v = -10.0f; v <= 110.0f; v += 15.0f) {
                    Rgb8 rgb = hsvToRgb(h, s, v);
                    REQUIRE(rgb.r >= 0);
                    REQUIRE(rgb.r <= 255);
                    REQUIRE(rgb.g >= 0);
                    REQUIRE(rgb.g <= 255);
                    REQUIRE(rgb.b >= 0);
                    REQUIRE(rgb.b <= 255);
                }
            }
        }
    }

    SECTION("negative hue behaves like 0, large saturation like 100") {
        REQUIRE(hsvToRgb(-40.0f, 250.0f, 100.0f) == Rgb8{255, 0, 0});
    }

    SECTION("value above 100 behaves like 100") {
        REQUIRE(hsvToRgb(120.0f, 100.0f, 180.0f) == Rgb8{0, 255, 0});
    }
}

// =============================================================================
// Color
// =============================================================================

TEST_CASE("Color parsing", "[color]") {
    SECTION("six digit hex") {
        auto c = Color::fromString("#FF8000");
        REQUIRE(c.has_value());
        REQUIRE(*c == Color::fromBytes(255, 128, 0));
    }

    SECTION("three digit hex expands each digit") {
        auto c = Color::fromString("#0f0");
        REQUIRE(c.has_value());
        REQUIRE(*c == Color::fromBytes(0, 255, 0));
    }

    SECTION("names are case-insensitive") {
        REQUIRE(Color::fromString("black") == Color::Black);
        REQUIRE(Color::fromString("White") == Color::White);
        REQUIRE(Color::fromString("NAVY") == Color::fromHex(0x000080));
    }

    SECTION("unknown strings are rejected") {
        REQUIRE_FALSE(Color::fromString("").has_value());
        REQUIRE_FALSE(Color::fromString("blurple").has_value());
        REQUIRE_FALSE(Color::fromString("#12345").has_value());
        REQUIRE_FALSE(Color::fromString("#GGGGGG").has_value());
    }

    SECTION("glm conversion") {
        glm::vec4 v = Color::fromHex(0xFF0000);
        REQUIRE_THAT(v.r, WithinAbs(1.0f, 1e-6f));
        REQUIRE_THAT(v.g, WithinAbs(0.0f, 1e-6f));
        REQUIRE_THAT(v.a, WithinAbs(1.0f, 1e-6f));
    }
}

// =============================================================================
// HsvColor
// =============================================================================

TEST_CASE("HsvColor caches its RGB conversion", "[color][hsv]") {
    HsvColor c(120.0f, 100.0f, 100.0f);
    REQUIRE(c.rgb() == Rgb8{0, 255, 0});

    SECTION("setHue recomputes immediately and keeps saturation and value") {
        c.setHue(240.0f);
        REQUIRE(c.rgb() == Rgb8{0, 0, 255});
        REQUIRE(c.saturation() == 100.0f);
        REQUIRE(c.value() == 100.0f);
    }

    SECTION("hue is stored modulo 360") {
        c.update(480.0f, 100.0f, 100.0f);
        REQUIRE_THAT(c.hue(), WithinAbs(120.0f, 1e-4f));
        REQUIRE(c.rgb() == Rgb8{0, 255, 0});
    }

    SECTION("hue of 360 is stored as 0") {
        c.setHue(360.0f);
        REQUIRE_THAT(c.hue(), WithinAbs(0.0f, 1e-6f));
        REQUIRE(c.rgb() == Rgb8{255, 0, 0});
    }

    SECTION("color() matches rgb()") {
        REQUIRE(c.color() == Color::fromBytes(0, 255, 0));
    }
}
