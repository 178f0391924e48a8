#pragma once

/**
 * @file input.h
 * @brief Symbolic input actions, key bindings and held-action state
 *
 * Raw key codes never reach the simulation logic directly. KeyBindings maps
 * them to an Action, InputState tracks which actions are currently held, and
 * InputHandler is the entry point shared by live input and macro playback.
 */

#include <glm/glm.hpp>
#include <nlohmann/json.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace blobs {

/**
 * @brief Everything a key can be bound to
 */
enum class Action {
    Pause,              ///< Hold: freeze movement (click teleports)
    Randomise,          ///< Randomise every blob's bearing
    Center,             ///< Hold: steer blobs to the surface center
    Slow,               ///< Hold: use the slow speed
    Wavy,               ///< Hold: run the bearing shift oscillator
    Settings,           ///< Reload settings
    ToggleClear,        ///< Toggle clearing the surface each frame
    Help,               ///< Toggle the help overlay
    ToggleSymmetry,     ///< Toggle four-way mirrored drawing
    Reverse,            ///< Turn every blob around
    RandomiseSpeed,     ///< Hold: add each blob's extra speed
    StartMacro,         ///< (Re)start the current macro
    Escape              ///< Close the help overlay
};

constexpr size_t kActionCount = static_cast<size_t>(Action::Escape) + 1;

/// @brief All actions in declaration order
const std::array<Action, kActionCount>& allActions();

/// @brief Symbolic name used in macros and settings ("pause", "randomiseSpeed", "esc", ...)
const char* actionName(Action action);

/// @brief Look up an action by symbolic name
std::optional<Action> actionFromName(const std::string& name);

/// @brief One-line description shown in the help overlay
const char* actionHelp(Action action);

/**
 * @brief Mapping from raw key codes to actions
 *
 * Codes are whatever the windowing layer delivers; defaults() uses GLFW key
 * codes. An action may have several codes (both Shift keys pause), but a
 * code drives at most one action.
 */
class KeyBindings {
public:
    KeyBindings() = default;

    /// @brief Bindings matching the classic layout (Shift pauses, R randomises, ...)
    static KeyBindings defaults();

    /// @brief Bind an action to a key code, replacing all its previous codes
    void bind(Action action, int keyCode);

    /// @brief Add another key code for an action, keeping its existing ones
    void addBinding(Action action, int keyCode);

    /// @brief Remove every binding for an action
    void unbind(Action action);

    /// @brief Action bound to a key code, if any
    std::optional<Action> lookup(int keyCode) const;

    /// @brief First key code bound to an action, if any
    std::optional<int> keyFor(Action action) const;

    /// @brief Every key code bound to an action
    const std::vector<int>& keysFor(Action action) const;

    /**
     * @brief Apply overrides from a JSON object of name -> key code
     * @return false if any entry is not a known action with an integer code
     *         or a non-empty array of integer codes
     *
     * Valid entries are applied even when others are rejected.
     */
    bool applyOverrides(const nlohmann::json& overrides);

    /// @brief name -> code, or name -> [codes] for actions with several
    nlohmann::json toJson() const;

private:
    void release(int keyCode);

    std::array<std::vector<int>, kActionCount> m_codes;
};

/**
 * @brief Set of currently held actions
 */
class InputState {
public:
    bool held(Action action) const { return m_held[index(action)]; }
    void press(Action action) { m_held[index(action)] = true; }
    void release(Action action) { m_held[index(action)] = false; }
    void clear() { m_held.fill(false); }

private:
    static size_t index(Action action) { return static_cast<size_t>(action); }

    std::array<bool, kActionCount> m_held{};
};

/**
 * @brief Input entry points shared by live input and macro playback
 */
class InputHandler {
public:
    virtual ~InputHandler() = default;

    /// @brief An action's key went down
    virtual void actionDown(Action action) = 0;

    /// @brief An action's key went up
    virtual void actionUp(Action action) = 0;

    /// @brief Pointer click in surface pixels
    virtual void click(glm::vec2 position) = 0;

    /// @brief Surface size in pixels (for percentage coordinates)
    virtual glm::vec2 surfaceSize() const = 0;
};

} // namespace blobs
