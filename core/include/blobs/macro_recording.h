#pragma once

/**
 * @file macro_recording.h
 * @brief Captures live input as a macro
 */

#include <blobs/macro.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace blobs {

/**
 * @brief Append-only recording of live input events
 *
 * The first event is stamped 0; every later event is stamped with the
 * seconds elapsed since that first event. There is no stop: a recording
 * lives as long as the simulation run that owns it.
 *
 * @par Example
 * @code
 * MacroRecording rec;
 * rec.addKeyEvent("pause", MacroEventType::KeyDown);
 * rec.addClick(25.0f, 50.0f);
 * nlohmann::json macro = rec.toJson();   // catalog format
 * @endcode
 */
class MacroRecording {
public:
    /// @brief Returns the current time in seconds
    using TimeSource = std::function<double()>;

    /// @brief Record against the steady wall clock
    MacroRecording();

    /// @brief Record against a custom clock
    explicit MacroRecording(TimeSource now);

    /**
     * @brief Record a click
     * @param xPercent X as a percentage of surface width
     * @param yPercent Y as a percentage of surface height
     */
    void addClick(float xPercent, float yPercent);

    /// @brief Record a keydown or keyup of a named action
    void addKeyEvent(const std::string& keyName, MacroEventType type);

    const std::vector<MacroEvent>& events() const { return m_events; }
    bool empty() const { return m_events.empty(); }

    /// @brief Events as a catalog-format JSON array
    nlohmann::json toJson() const;

private:
    double timestamp();

    TimeSource m_now;
    std::optional<double> m_startTime;
    std::vector<MacroEvent> m_events;
};

} // namespace blobs
