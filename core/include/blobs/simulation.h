#pragma once

/**
 * @file simulation.h
 * @brief Per-frame orchestrator owning the flock, oscillators and macros
 *
 * One Simulation holds all mutable state of a run. The frame driver calls
 * frame() once per display refresh; the windowing layer forwards raw input to
 * keyDown(), keyUp() and click().
 *
 * @par Tick order
 * 1. Oscillators in fixed order: bearingShift (only while wavy is held), hue
 * 2. Current macro, if running
 * 3. Held center re-applied as a click at the surface center
 * 4. Blob updates
 * 5. Render pass
 *
 * @par Example
 * @code
 * blobs::Simulation sim(settings, seed);
 * sim.setMacro(*catalog.find("test"), "test");
 * sim.setup({1280.0f, 720.0f});
 * while (running) {
 *     sim.frame(dt, canvas);
 * }
 * @endcode
 */

#include <blobs/draw_surface.h>
#include <blobs/flock.h>
#include <blobs/input.h>
#include <blobs/lfo.h>
#include <blobs/macro.h>
#include <blobs/macro_recording.h>
#include <blobs/settings.h>

#include <glm/glm.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace blobs {

/**
 * @brief A named oscillator, optionally gated on a held action
 */
struct Modulator {
    std::string name;
    LFO lfo;
    std::optional<Action> gate;     ///< Only advances while this action is held
};

class Simulation : public InputHandler {
public:
    /// @brief Receives actions the simulation cannot handle itself (help, settings, esc)
    using UiHook = std::function<void(Action)>;

    explicit Simulation(Settings settings = Settings(), uint32_t seed = 5489u);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    /**
     * @brief (Re)build the run state for a surface
     *
     * Replaces the flock, the oscillators, the held input set and the
     * recording. The current macro is rebuilt idle. The next render pass
     * paints the background even when clearCanvas is off.
     */
    void setup(glm::vec2 surfaceSize);

    /// @brief Replace the settings and re-run setup() on the current surface
    void applySettings(Settings settings);

    // -------------------------------------------------------------------------
    /// @name Live input (recorded)
    /// @{

    /// @brief Raw key press; ignored when unbound or already held
    void keyDown(int keyCode);

    /// @brief Raw key release; ignored when unbound
    void keyUp(int keyCode);

    /// @brief Pointer click in surface pixels
    void click(float x, float y);

    /// @}

    // -------------------------------------------------------------------------
    /// @name InputHandler (shared with macro playback, not recorded)
    /// @{

    void actionDown(Action action) override;
    void actionUp(Action action) override;
    void click(glm::vec2 position) override;
    glm::vec2 surfaceSize() const override { return m_surfaceSize; }

    /// @}

    /**
     * @brief Advance the world by dt seconds
     *
     * Does nothing while suspended.
     */
    void update(double dt);

    /// @brief Issue the render pass for the current state
    void draw(DrawSurface& surface);

    /// @brief update() then draw(); does nothing while suspended
    void frame(double dt, DrawSurface& surface);

    /// @brief Make a macro current (idle until startMacro)
    void setMacro(std::vector<MacroEvent> events, const std::string& name = "");

    /**
     * @brief Resize without rebuilding the flock
     *
     * The next render pass repaints the background.
     */
    void setSurfaceSize(glm::vec2 size);

    void setSuspended(bool suspended) { m_suspended = suspended; }
    bool suspended() const { return m_suspended; }

    void setUiHook(UiHook hook) { m_uiHook = std::move(hook); }

    const Settings& settings() const { return m_settings; }
    const Flock& flock() const { return m_flock; }
    Flock& flock() { return m_flock; }
    const InputState& input() const { return m_input; }
    const std::vector<Modulator>& modulators() const { return m_modulators; }
    const Macro& macro() const { return m_macro; }
    const MacroRecording& recording() const { return m_recording; }

    /// @brief Replace the recording's time source (tests)
    void setRecordingClock(MacroRecording::TimeSource now);

private:
    void buildModulators();

    Settings m_settings;
    std::mt19937 m_rng;
    glm::vec2 m_surfaceSize{0.0f};

    Flock m_flock;
    InputState m_input;
    std::vector<Modulator> m_modulators;
    Macro m_macro;
    MacroRecording m_recording;
    MacroRecording::TimeSource m_recordingClock;

    bool m_suspended = false;
    bool m_paintBackground = true;
    UiHook m_uiHook;
};

} // namespace blobs
