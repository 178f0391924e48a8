/**
 * @file test_blob.cpp
 * @brief Unit tests for single blob movement
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <blobs/blob.h>

using namespace blobs;
using Catch::Matchers::WithinAbs;

namespace {
constexpr float PI = 3.14159265359f;

Blob makeBlob(float bearing, float extraSpeed = 0.0f) {
    return Blob(glm::vec2(100.0f, 100.0f), bearing, HsvColor(120.0f, 50.0f, 50.0f), extraSpeed);
}
}

TEST_CASE("Blob movement", "[blob]") {
    BlobSettings motion;   // speed 100, slow 50
    InputState input;

    SECTION("bearing 0 moves up the surface") {
        Blob blob = makeBlob(0.0f);
        blob.update(0.5, input, motion);
        REQUIRE_THAT(blob.position.x, WithinAbs(100.0f, 1e-4f));
        REQUIRE_THAT(blob.position.y, WithinAbs(50.0f, 1e-4f));
    }

    SECTION("bearing pi/2 moves right") {
        Blob blob = makeBlob(PI / 2.0f);
        blob.update(0.1, input, motion);
        REQUIRE_THAT(blob.position.x, WithinAbs(110.0f, 1e-4f));
        REQUIRE_THAT(blob.position.y, WithinAbs(100.0f, 1e-4f));
    }

    SECTION("positions are not clamped to any surface") {
        Blob blob = makeBlob(PI);
        blob.update(10.0, input, motion);
        REQUIRE_THAT(blob.position.y, WithinAbs(1100.0f, 1e-2f));
    }

    SECTION("pause freezes the blob") {
        Blob blob = makeBlob(1.0f);
        input.press(Action::Pause);
        blob.update(1.0, input, motion);
        REQUIRE(blob.position == glm::vec2(100.0f, 100.0f));
    }

    SECTION("slow uses the slow speed") {
        Blob blob = makeBlob(0.0f);
        input.press(Action::Slow);
        blob.update(1.0, input, motion);
        REQUIRE_THAT(blob.position.y, WithinAbs(50.0f, 1e-4f));
    }

    SECTION("bearing shift is added to the heading") {
        Blob blob = makeBlob(0.0f);
        blob.bearingShift = PI / 2.0f;
        blob.update(0.1, input, motion);
        REQUIRE_THAT(blob.position.x, WithinAbs(110.0f, 1e-4f));
        REQUIRE(blob.bearing == 0.0f);
    }
}

TEST_CASE("Blob speed bias", "[blob]") {
    BlobSettings motion;
    InputState input;
    Blob blob = makeBlob(0.0f, -30.0f);

    SECTION("ignored unless randomiseSpeed is held") {
        REQUIRE(blob.effectiveSpeed(input, motion) == 100.0f);
    }

    SECTION("added while randomiseSpeed is held") {
        input.press(Action::RandomiseSpeed);
        REQUIRE(blob.effectiveSpeed(input, motion) == 70.0f);
    }

    SECTION("stacks with slow") {
        input.press(Action::RandomiseSpeed);
        input.press(Action::Slow);
        REQUIRE(blob.effectiveSpeed(input, motion) == 20.0f);
    }

    SECTION("a large negative bias moves the blob backwards") {
        Blob backwards = makeBlob(0.0f, -150.0f);
        input.press(Action::RandomiseSpeed);
        backwards.update(1.0, input, motion);
        REQUIRE_THAT(backwards.position.y, WithinAbs(150.0f, 1e-3f));
    }
}
