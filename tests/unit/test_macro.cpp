/**
 * @file test_macro.cpp
 * @brief Unit tests for macro event parsing and playback timing
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <blobs/macro.h>

#include <string>
#include <vector>

using namespace blobs;
using Catch::Matchers::WithinAbs;
using json = nlohmann::json;

namespace {

// Logs every call as a short string
class RecordingHandler : public InputHandler {
public:
    void actionDown(Action action) override { calls.push_back(std::string("down:") + actionName(action)); }
    void actionUp(Action action) override { calls.push_back(std::string("up:") + actionName(action)); }
    void click(glm::vec2 position) override {
        calls.push_back("click");
        clicks.push_back(position);
    }
    glm::vec2 surfaceSize() const override { return size; }

    glm::vec2 size{200.0f, 100.0f};
    std::vector<std::string> calls;
    std::vector<glm::vec2> clicks;
};

// Restarts the macro it is given whenever startMacro goes down
class RestartingHandler : public RecordingHandler {
public:
    explicit RestartingHandler(Macro& macro) : m_macro(macro) {}
    void actionDown(Action action) override {
        RecordingHandler::actionDown(action);
        if (action == Action::StartMacro) m_macro.start();
    }

private:
    Macro& m_macro;
};

} // namespace

TEST_CASE("Macro playback timing", "[macro]") {
    RecordingHandler handler;
    Macro macro("steps", {
        MacroEvent::keyDown(0.0, "pause"),
        MacroEvent::keyUp(1.0, "pause"),
        MacroEvent::keyDown(2.0, "reverse"),
    });

    SECTION("idle until started") {
        REQUIRE_FALSE(macro.running());
        REQUIRE(macro.update(5.0, handler) == 0);
        REQUIRE(handler.calls.empty());
    }

    SECTION("events fire on the first tick whose elapsed time exceeds them") {
        macro.start();
        std::vector<int> firedPerTick;
        std::vector<bool> runningAfterTick;
        for (int tick = 0; tick < 5; ++tick) {
            firedPerTick.push_back(macro.update(0.5, handler));
            runningAfterTick.push_back(macro.running());
        }

        REQUIRE(firedPerTick == std::vector<int>{1, 0, 1, 0, 1});
        REQUIRE(runningAfterTick == std::vector<bool>{true, true, true, true, false});
        REQUIRE(handler.calls == std::vector<std::string>{"down:pause", "up:pause", "down:reverse"});
    }

    SECTION("a long tick fires everything due in order") {
        macro.start();
        REQUIRE(macro.update(1.5, handler) == 2);
        REQUIRE(handler.calls == std::vector<std::string>{"down:pause", "up:pause"});
        REQUIRE(macro.cursor() == 2);
        REQUIRE(macro.running());
    }

    SECTION("start resets cursor and elapsed time") {
        macro.start();
        macro.update(10.0, handler);
        REQUIRE_FALSE(macro.running());

        macro.start();
        REQUIRE(macro.running());
        REQUIRE(macro.cursor() == 0);
        REQUIRE(macro.elapsed() == 0.0);
        macro.update(0.5, handler);
        REQUIRE(handler.calls.size() == 4);
    }

    SECTION("stop halts without firing") {
        macro.start();
        macro.update(0.5, handler);
        macro.stop();
        REQUIRE(macro.update(10.0, handler) == 0);
        REQUIRE(handler.calls.size() == 1);
    }
}

TEST_CASE("Macro playback events", "[macro]") {
    RecordingHandler handler;

    SECTION("click coordinates are percentages of the surface") {
        Macro macro("clicks", {MacroEvent::click(0.0, {25.0f, 50.0f})});
        macro.start();
        macro.update(0.1, handler);
        REQUIRE(handler.clicks.size() == 1);
        REQUIRE_THAT(handler.clicks[0].x, WithinAbs(50.0f, 1e-4f));
        REQUIRE_THAT(handler.clicks[0].y, WithinAbs(50.0f, 1e-4f));
    }

    SECTION("unknown key names are ignored") {
        Macro macro("unknown", {
            MacroEvent::keyDown(0.0, "fly"),
            MacroEvent::keyDown(0.0, "slow"),
        });
        macro.start();
        REQUIRE(macro.update(0.1, handler) == 2);
        REQUIRE(handler.calls == std::vector<std::string>{"down:slow"});
    }

    SECTION("an empty macro stops on its first update") {
        Macro macro;
        macro.start();
        REQUIRE(macro.running());
        REQUIRE(macro.update(0.016, handler) == 0);
        REQUIRE_FALSE(macro.running());
    }

    SECTION("a macro that restarts itself begins again") {
        Macro macro("loop", {
            MacroEvent::keyDown(0.0, "reverse"),
            MacroEvent::keyDown(1.0, "startMacro"),
        });
        RestartingHandler restarting(macro);
        macro.start();
        macro.update(0.5, restarting);
        macro.update(1.0, restarting);
        REQUIRE(macro.running());
        REQUIRE(macro.cursor() == 0);
        macro.update(0.1, restarting);
        REQUIRE(restarting.calls == std::vector<std::string>{
            "down:reverse", "down:startMacro", "down:reverse"});
    }
}

TEST_CASE("parseMacroEvents", "[macro]") {
    std::string error;

    SECTION("catalog format") {
        json j = json::parse(R"([
            {"time": 0, "type": "keydown", "key": "pause"},
            {"time": 0.5, "type": "click", "coords": [29.5, 28.1]},
            {"time": 1.25, "type": "keyup", "key": "pause"}
        ])");
        auto events = parseMacroEvents(j, &error);
        REQUIRE(events.has_value());
        REQUIRE(events->size() == 3);
        REQUIRE((*events)[0] == MacroEvent::keyDown(0.0, "pause"));
        REQUIRE((*events)[1].type == MacroEventType::Click);
        REQUIRE_THAT((*events)[1].coords.x, WithinAbs(29.5f, 1e-4f));
        REQUIRE((*events)[2] == MacroEvent::keyUp(1.25, "pause"));
    }

    SECTION("serializes back to the same events") {
        std::vector<MacroEvent> events = {
            MacroEvent::keyDown(0.0, "wavy"),
            MacroEvent::click(0.75, {10.0f, 90.0f}),
        };
        auto parsed = parseMacroEvents(macroEventsToJson(events));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == events);
    }

    SECTION("empty array is a valid macro") {
        auto events = parseMacroEvents(json::array());
        REQUIRE(events.has_value());
        REQUIRE(events->empty());
    }

    SECTION("not an array") {
        REQUIRE_FALSE(parseMacroEvents(json::object(), &error).has_value());
    }

    SECTION("unknown type") {
        REQUIRE_FALSE(parseMacroEvents(json::parse(R"([{"time": 0, "type": "scroll"}])"), &error).has_value());
        REQUIRE(error.find("scroll") != std::string::npos);
    }

    SECTION("key event without key") {
        REQUIRE_FALSE(parseMacroEvents(json::parse(R"([{"time": 0, "type": "keyup"}])"), &error).has_value());
    }

    SECTION("click without two coordinates") {
        REQUIRE_FALSE(parseMacroEvents(json::parse(R"([{"time": 0, "type": "click", "coords": [5]}])"), &error).has_value());
    }

    SECTION("click outside the surface") {
        REQUIRE_FALSE(parseMacroEvents(json::parse(R"([{"time": 0, "type": "click", "coords": [5, 101]}])"), &error).has_value());
    }

    SECTION("time going backwards") {
        REQUIRE_FALSE(parseMacroEvents(json::parse(R"([
            {"time": 2, "type": "keydown", "key": "slow"},
            {"time": 1, "type": "keyup", "key": "slow"}
        ])"), &error).has_value());
        REQUIRE(error.find("event 1") != std::string::npos);
    }

    SECTION("negative time") {
        REQUIRE_FALSE(parseMacroEvents(json::parse(R"([{"time": -1, "type": "keydown", "key": "slow"}])"), &error).has_value());
    }
}
