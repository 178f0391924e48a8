/**
 * @file test_flock.cpp
 * @brief Unit tests for flock creation and whole-flock operations
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <blobs/flock.h>

#include <cmath>

using namespace blobs;
using Catch::Matchers::WithinAbs;

namespace {
constexpr float PI = 3.14159265359f;
constexpr float TAU = 6.28318530718f;

Flock twoBlobs() {
    Flock flock;
    flock.emplace_back(glm::vec2(0.0f, 0.0f), 1.0f, HsvColor(120.0f, 50.0f, 50.0f));
    flock.emplace_back(glm::vec2(30.0f, 40.0f), 2.0f, HsvColor(120.0f, 50.0f, 50.0f));
    return flock;
}
}

TEST_CASE("createFlock", "[flock]") {
    BlobSettings settings;
    settings.count = 200;
    settings.maxExtraSpeed = 40.0f;
    std::mt19937 rng(42);
    glm::vec2 size(320.0f, 240.0f);

    Flock flock = createFlock(settings, size, rng);
    REQUIRE(flock.size() == 200);

    for (const auto& blob : flock) {
        REQUIRE(blob.position.x >= 0.0f);
        REQUIRE(blob.position.x <= size.x);
        REQUIRE(blob.position.y >= 0.0f);
        REQUIRE(blob.position.y <= size.y);
        REQUIRE(blob.bearing >= 0.0f);
        REQUIRE(blob.bearing <= TAU);
        REQUIRE(blob.bearingShift == 0.0f);
        REQUIRE(blob.colour.hue() == 120.0f);
        REQUIRE(blob.colour.saturation() >= 0.0f);
        REQUIRE(blob.colour.saturation() <= 100.0f);
        REQUIRE(blob.colour.value() >= 0.0f);
        REQUIRE(blob.colour.value() <= 100.0f);
        REQUIRE(blob.extraSpeed() >= -40.0f);
        REQUIRE(blob.extraSpeed() <= 40.0f);
    }

    SECTION("zero count gives an empty flock") {
        settings.count = 0;
        REQUIRE(createFlock(settings, size, rng).empty());
    }

    SECTION("same seed gives the same flock") {
        std::mt19937 a(7), b(7);
        Flock fa = createFlock(settings, size, a);
        Flock fb = createFlock(settings, size, b);
        REQUIRE(fa[10].position == fb[10].position);
        REQUIRE(fa[10].bearing == fb[10].bearing);
    }
}

TEST_CASE("attractBlobs", "[flock]") {
    SECTION("target straight up gives bearing 0") {
        Flock flock;
        flock.emplace_back(glm::vec2(0.0f, 0.0f), 2.0f, HsvColor(0.0f, 0.0f, 0.0f));
        attractBlobs(flock, glm::vec2(0.0f, -10.0f));
        REQUIRE_THAT(flock[0].bearing, WithinAbs(0.0f, 1e-6f));
    }

    SECTION("moving along the new bearing approaches the target") {
        Flock flock = twoBlobs();
        glm::vec2 target(200.0f, 120.0f);
        attractBlobs(flock, target);
        for (const auto& blob : flock) {
            glm::vec2 step(std::sin(blob.bearing), -std::cos(blob.bearing));
            glm::vec2 toTarget = glm::normalize(target - blob.position);
            REQUIRE_THAT(step.x, WithinAbs(toTarget.x, 1e-4f));
            REQUIRE_THAT(step.y, WithinAbs(toTarget.y, 1e-4f));
        }
    }

    SECTION("positions are untouched") {
        Flock flock = twoBlobs();
        attractBlobs(flock, glm::vec2(5.0f, 5.0f));
        REQUIRE(flock[1].position == glm::vec2(30.0f, 40.0f));
    }
}

TEST_CASE("teleportBlobs and dispatchClick", "[flock]") {
    Flock flock = twoBlobs();
    glm::vec2 target(77.0f, 11.0f);

    SECTION("teleport moves every blob and keeps bearings") {
        teleportBlobs(flock, target);
        REQUIRE(flock[0].position == target);
        REQUIRE(flock[1].position == target);
        REQUIRE(flock[0].bearing == 1.0f);
        REQUIRE(flock[1].bearing == 2.0f);
    }

    SECTION("paused click teleports") {
        dispatchClick(flock, target, true);
        REQUIRE(flock[1].position == target);
        REQUIRE(flock[1].bearing == 2.0f);
    }

    SECTION("repeating a paused click changes nothing more") {
        dispatchClick(flock, target, true);
        Flock once = flock;
        dispatchClick(flock, target, true);
        REQUIRE(flock[0].position == once[0].position);
        REQUIRE(flock[1].position == once[1].position);
    }

    SECTION("unpaused click attracts") {
        dispatchClick(flock, target, false);
        REQUIRE(flock[1].position == glm::vec2(30.0f, 40.0f));
        REQUIRE(flock[1].bearing != 2.0f);
    }
}

TEST_CASE("Bearing operations", "[flock]") {
    Flock flock = twoBlobs();

    SECTION("reverse adds pi") {
        reverseBearings(flock);
        REQUIRE_THAT(flock[0].bearing, WithinAbs(1.0f + PI, 1e-5f));
        REQUIRE_THAT(flock[1].bearing, WithinAbs(2.0f + PI, 1e-5f));
    }

    SECTION("randomise stays within a full turn") {
        std::mt19937 rng(3);
        randomiseBearings(flock, rng);
        for (const auto& blob : flock) {
            REQUIRE(blob.bearing >= 0.0f);
            REQUIRE(blob.bearing <= TAU);
        }
    }

    SECTION("reset bearing shift") {
        flock[0].bearingShift = 0.5f;
        flock[1].bearingShift = -0.2f;
        resetBearingShift(flock);
        REQUIRE(flock[0].bearingShift == 0.0f);
        REQUIRE(flock[1].bearingShift == 0.0f);
    }
}
