#pragma once

/**
 * @file macro.h
 * @brief Timestamped input events and macro playback
 *
 * A macro is an ordered list of key and click events, each scheduled a number
 * of seconds after the macro starts. Playback feeds the events through an
 * InputHandler, the same entry points live input uses.
 *
 * @par Event JSON
 * @code
 * {"time": 0.5, "type": "keydown", "key": "pause"}
 * {"time": 2.4, "type": "click", "coords": [29.5, 28.1]}   // percent of width/height
 * @endcode
 */

#include <blobs/input.h>

#include <glm/glm.hpp>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace blobs {

enum class MacroEventType {
    KeyDown,
    KeyUp,
    Click
};

/// @brief "keydown", "keyup" or "click"
const char* macroEventTypeName(MacroEventType type);

/**
 * @brief One scheduled input event
 */
struct MacroEvent {
    double time = 0.0;                      ///< Seconds after macro start
    MacroEventType type = MacroEventType::KeyDown;
    std::string key;                        ///< Action name (key events)
    glm::vec2 coords{0.0f};                 ///< Percent of surface size (clicks)

    static MacroEvent keyDown(double time, const std::string& key);
    static MacroEvent keyUp(double time, const std::string& key);
    static MacroEvent click(double time, glm::vec2 coords);

    nlohmann::json toJson() const;

    bool operator==(const MacroEvent& other) const;
};

/**
 * @brief Parse an event array in the macro catalog format
 * @param j JSON array of event objects
 * @param error Receives a description of the first problem found
 * @return Events, or nullopt if the structure is invalid
 *
 * Rejects unknown types, missing keys or coords, negative or decreasing
 * times and click coordinates outside [0, 100]. Unknown key names are
 * accepted; playback ignores them.
 */
std::optional<std::vector<MacroEvent>> parseMacroEvents(const nlohmann::json& j,
                                                       std::string* error = nullptr);

/// @brief Serialize events to the macro catalog format
nlohmann::json macroEventsToJson(const std::vector<MacroEvent>& events);

/**
 * @brief Replays a sequence of events against an InputHandler
 *
 * Idle until start(). While running, update(dt) adds dt to the elapsed time
 * and fires, in order, every event whose time is strictly less than the
 * elapsed time. After the tick that fires the last event the macro stops.
 *
 * @par Example
 * @code
 * Macro macro("demo", events);
 * macro.start();
 * // each frame
 * if (macro.running()) macro.update(dt, simulation);
 * @endcode
 */
class Macro {
public:
    Macro() = default;
    Macro(std::string name, std::vector<MacroEvent> events);

    /// @brief Reset cursor and elapsed time and start running
    void start();

    /// @brief Stop without firing anything further
    void stop() { m_running = false; }

    /**
     * @brief Advance playback
     * @param dt Seconds since the last update
     * @param handler Receives the fired events
     * @return Number of events fired this tick
     */
    int update(double dt, InputHandler& handler);

    bool running() const { return m_running; }
    size_t cursor() const { return m_cursor; }
    double elapsed() const { return m_elapsed; }

    const std::string& name() const { return m_name; }
    const std::vector<MacroEvent>& events() const { return m_events; }

private:
    void fire(const MacroEvent& event, InputHandler& handler);

    std::string m_name;
    std::vector<MacroEvent> m_events;
    size_t m_cursor = 0;
    double m_elapsed = 0.0;
    bool m_running = false;
};

} // namespace blobs
