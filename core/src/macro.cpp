// Blobs - Macro Events and Playback

#include <blobs/macro.h>
#include <utility>

namespace blobs {

using json = nlohmann::json;

const char* macroEventTypeName(MacroEventType type) {
    switch (type) {
        case MacroEventType::KeyDown: return "keydown";
        case MacroEventType::KeyUp:   return "keyup";
        case MacroEventType::Click:   return "click";
    }
    return "keydown";
}

MacroEvent MacroEvent::keyDown(double time, const std::string& key) {
    MacroEvent e;
    e.time = time;
    e.type = MacroEventType::KeyDown;
    e.key = key;
    return e;
}

MacroEvent MacroEvent::keyUp(double time, const std::string& key) {
    MacroEvent e;
    e.time = time;
    e.type = MacroEventType::KeyUp;
    e.key = key;
    return e;
}

MacroEvent MacroEvent::click(double time, glm::vec2 coords) {
    MacroEvent e;
    e.time = time;
    e.type = MacroEventType::Click;
    e.coords = coords;
    return e;
}

json MacroEvent::toJson() const {
    json j;
    j["time"] = time;
    j["type"] = macroEventTypeName(type);
    if (type == MacroEventType::Click) {
        j["coords"] = {coords.x, coords.y};
    } else {
        j["key"] = key;
    }
    return j;
}

bool MacroEvent::operator==(const MacroEvent& other) const {
    if (time != other.time || type != other.type) return false;
    if (type == MacroEventType::Click) return coords == other.coords;
    return key == other.key;
}

std::optional<std::vector<MacroEvent>> parseMacroEvents(const json& j, std::string* error) {
    auto fail = [error](size_t index, const std::string& message)
        -> std::optional<std::vector<MacroEvent>> {
        if (error) *error = "event " + std::to_string(index) + ": " + message;
        return std::nullopt;
    };

    if (!j.is_array()) {
        if (error) *error = "macro must be an array of events";
        return std::nullopt;
    }

    std::vector<MacroEvent> events;
    events.reserve(j.size());
    double lastTime = 0.0;

    for (size_t i = 0; i < j.size(); ++i) {
        const json& e = j[i];
        if (!e.is_object()) {
            return fail(i, "not an object");
        }
        if (!e.contains("time") || !e["time"].is_number()) {
            return fail(i, "missing numeric time");
        }
        if (!e.contains("type") || !e["type"].is_string()) {
            return fail(i, "missing type");
        }

        double time = e["time"].get<double>();
        if (time < 0.0) {
            return fail(i, "negative time");
        }
        if (time < lastTime) {
            return fail(i, "time goes backwards");
        }
        lastTime = time;

        std::string type = e["type"].get<std::string>();
        if (type == "keydown" || type == "keyup") {
            if (!e.contains("key") || !e["key"].is_string()) {
                return fail(i, "key event without key name");
            }
            std::string key = e["key"].get<std::string>();
            events.push_back(type == "keydown" ? MacroEvent::keyDown(time, key)
                                               : MacroEvent::keyUp(time, key));
        } else if (type == "click") {
            const json* coords = e.contains("coords") ? &e["coords"] : nullptr;
            if (!coords || !coords->is_array() || coords->size() != 2 ||
                !(*coords)[0].is_number() || !(*coords)[1].is_number()) {
                return fail(i, "click without [x, y] coords");
            }
            float x = (*coords)[0].get<float>();
            float y = (*coords)[1].get<float>();
            if (x < 0.0f || x > 100.0f || y < 0.0f || y > 100.0f) {
                return fail(i, "click coords outside 0-100");
            }
            events.push_back(MacroEvent::click(time, {x, y}));
        } else {
            return fail(i, "unknown type '" + type + "'");
        }
    }

    return events;
}

json macroEventsToJson(const std::vector<MacroEvent>& events) {
    json j = json::array();
    for (const auto& e : events) {
        j.push_back(e.toJson());
    }
    return j;
}

// -----------------------------------------------------------------------------
// Macro
// -----------------------------------------------------------------------------

Macro::Macro(std::string name, std::vector<MacroEvent> events)
    : m_name(std::move(name))
    , m_events(std::move(events))
{
}

void Macro::start() {
    m_cursor = 0;
    m_elapsed = 0.0;
    m_running = true;
}

int Macro::update(double dt, InputHandler& handler) {
    if (!m_running) {
        return 0;
    }

    m_elapsed += dt;

    int fired = 0;
    while (m_cursor < m_events.size() && m_events[m_cursor].time < m_elapsed) {
        // Advance first so a handler that restarts this macro sees a clean state
        const MacroEvent& event = m_events[m_cursor++];
        fire(event, handler);
        ++fired;
        if (!m_running || m_cursor == 0) {
            return fired;
        }
    }

    if (m_cursor >= m_events.size()) {
        m_running = false;
    }
    return fired;
}

void Macro::fire(const MacroEvent& event, InputHandler& handler) {
    if (event.type == MacroEventType::Click) {
        glm::vec2 size = handler.surfaceSize();
        handler.click(event.coords * size / 100.0f);
        return;
    }

    auto action = actionFromName(event.key);
    if (!action) {
        // Same as an unbound live key
        return;
    }

    if (event.type == MacroEventType::KeyDown) {
        handler.actionDown(*action);
    } else {
        handler.actionUp(*action);
    }
}

} // namespace blobs
