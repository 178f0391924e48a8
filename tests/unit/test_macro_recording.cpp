/**
 * @file test_macro_recording.cpp
 * @brief Unit tests for capturing live input as a macro
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <blobs/macro_recording.h>

using namespace blobs;
using Catch::Matchers::WithinAbs;

TEST_CASE("MacroRecording timestamps", "[macro][recording]") {
    double clock = 100.0;
    MacroRecording rec([&clock] { return clock; });

    REQUIRE(rec.empty());

    SECTION("first event is stamped 0") {
        rec.addKeyEvent("pause", MacroEventType::KeyDown);
        REQUIRE(rec.events().size() == 1);
        REQUIRE(rec.events()[0].time == 0.0);
    }

    SECTION("later events are stamped relative to the first") {
        clock = 105.0;
        rec.addKeyEvent("pause", MacroEventType::KeyDown);
        clock = 105.25;
        rec.addKeyEvent("pause", MacroEventType::KeyUp);
        clock = 107.0;
        rec.addClick(25.0f, 50.0f);

        const auto& events = rec.events();
        REQUIRE(events.size() == 3);
        REQUIRE(events[0] == MacroEvent::keyDown(0.0, "pause"));
        REQUIRE(events[1] == MacroEvent::keyUp(0.25, "pause"));
        REQUIRE(events[2].type == MacroEventType::Click);
        REQUIRE_THAT(events[2].time, WithinAbs(2.0, 1e-9));
        REQUIRE(events[2].coords == glm::vec2(25.0f, 50.0f));
    }

    SECTION("events sharing a timestamp keep their order") {
        rec.addKeyEvent("slow", MacroEventType::KeyDown);
        rec.addKeyEvent("wavy", MacroEventType::KeyDown);
        REQUIRE(rec.events()[0].key == "slow");
        REQUIRE(rec.events()[1].key == "wavy");
        REQUIRE(rec.events()[1].time == 0.0);
    }
}

TEST_CASE("MacroRecording export", "[macro][recording]") {
    double clock = 0.0;
    MacroRecording rec([&clock] { return clock; });
    rec.addKeyEvent("reverse", MacroEventType::KeyDown);
    clock = 1.5;
    rec.addClick(10.0f, 20.0f);

    auto j = rec.toJson();
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 2);
    REQUIRE(j[0]["type"] == "keydown");
    REQUIRE(j[0]["key"] == "reverse");
    REQUIRE(j[1]["type"] == "click");

    SECTION("exported text replays as the same events") {
        auto parsed = parseMacroEvents(j);
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == rec.events());
    }
}

TEST_CASE("MacroRecording with the wall clock", "[macro][recording]") {
    MacroRecording rec;
    rec.addKeyEvent("center", MacroEventType::KeyDown);
    rec.addKeyEvent("center", MacroEventType::KeyUp);
    REQUIRE(rec.events()[0].time == 0.0);
    REQUIRE(rec.events()[1].time >= 0.0);
}
