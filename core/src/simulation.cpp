// Blobs - Simulation Implementation

#include <blobs/simulation.h>
#include <utility>

namespace blobs {

namespace {
constexpr float PI = 3.14159265359f;
constexpr float kBearingShiftRate = 1.0f;   // radians per second
}

Simulation::Simulation(Settings settings, uint32_t seed)
    : m_settings(std::move(settings))
    , m_rng(seed)
{
}

void Simulation::setup(glm::vec2 surfaceSize) {
    m_surfaceSize = surfaceSize;
    m_flock = createFlock(m_settings.blob, m_surfaceSize, m_rng);
    m_input.clear();
    buildModulators();

    // A fresh idle copy of whatever macro is current
    m_macro = Macro(m_macro.name(), m_macro.events());

    m_recording = m_recordingClock ? MacroRecording(m_recordingClock) : MacroRecording();
    m_suspended = false;
    m_paintBackground = true;
}

void Simulation::applySettings(Settings settings) {
    m_settings = std::move(settings);
    setup(m_surfaceSize);
}

void Simulation::buildModulators() {
    m_modulators.clear();

    m_modulators.push_back({
        "bearingShift",
        LFO(-PI / 4.0f, PI / 4.0f, kBearingShiftRate, [this](float value) {
            for (auto& blob : m_flock) {
                blob.bearingShift = value;
            }
        }, LFOMode::Bounce),
        Action::Wavy
    });

    m_modulators.push_back({
        "hue",
        LFO(0.0f, 360.0f, m_settings.hueChangePerSecond, [this](float value) {
            for (auto& blob : m_flock) {
                blob.colour.update(value, blob.colour.saturation(), blob.colour.value());
            }
        }, LFOMode::Wrap),
        std::nullopt
    });
}

void Simulation::setMacro(std::vector<MacroEvent> events, const std::string& name) {
    m_macro = Macro(name, std::move(events));
}

void Simulation::setSurfaceSize(glm::vec2 size) {
    m_surfaceSize = size;
    m_paintBackground = true;
}

void Simulation::setRecordingClock(MacroRecording::TimeSource now) {
    m_recordingClock = std::move(now);
    m_recording = MacroRecording(m_recordingClock);
}

// -----------------------------------------------------------------------------
// Live input
// -----------------------------------------------------------------------------

void Simulation::keyDown(int keyCode) {
    auto action = m_settings.keys.lookup(keyCode);
    if (!action || m_input.held(*action)) {
        // Unbound, or auto-repeat of a key that is already down
        return;
    }
    actionDown(*action);
    m_recording.addKeyEvent(actionName(*action), MacroEventType::KeyDown);
}

void Simulation::keyUp(int keyCode) {
    auto action = m_settings.keys.lookup(keyCode);
    if (!action) {
        return;
    }
    actionUp(*action);
    m_recording.addKeyEvent(actionName(*action), MacroEventType::KeyUp);
}

void Simulation::click(float x, float y) {
    click(glm::vec2(x, y));
    if (m_surfaceSize.x > 0.0f && m_surfaceSize.y > 0.0f) {
        m_recording.addClick(100.0f * x / m_surfaceSize.x, 100.0f * y / m_surfaceSize.y);
    }
}

// -----------------------------------------------------------------------------
// InputHandler
// -----------------------------------------------------------------------------

void Simulation::actionDown(Action action) {
    m_input.press(action);

    switch (action) {
        case Action::Randomise:
            randomiseBearings(m_flock, m_rng);
            break;
        case Action::ToggleClear:
            m_settings.clearCanvas = !m_settings.clearCanvas;
            break;
        case Action::ToggleSymmetry:
            m_settings.symmetry = !m_settings.symmetry;
            break;
        case Action::Reverse:
            reverseBearings(m_flock);
            break;
        case Action::StartMacro:
            m_macro.start();
            break;
        case Action::Settings:
        case Action::Help:
        case Action::Escape:
            if (m_uiHook) {
                m_uiHook(action);
            }
            break;
        default:
            // Held actions are consulted during update()
            break;
    }
}

void Simulation::actionUp(Action action) {
    m_input.release(action);

    if (action == Action::Wavy) {
        resetBearingShift(m_flock);
    }
}

void Simulation::click(glm::vec2 position) {
    dispatchClick(m_flock, position, m_input.held(Action::Pause));
}

// -----------------------------------------------------------------------------
// Frame
// -----------------------------------------------------------------------------

void Simulation::update(double dt) {
    if (m_suspended) {
        return;
    }

    for (auto& modulator : m_modulators) {
        if (modulator.gate && !m_input.held(*modulator.gate)) {
            continue;
        }
        modulator.lfo.update(dt);
    }

    if (m_macro.running()) {
        m_macro.update(dt, *this);
    }

    if (m_input.held(Action::Center)) {
        click(m_surfaceSize * 0.5f);
    }

    for (auto& blob : m_flock) {
        blob.update(dt, m_input, m_settings.blob);
    }
}

void Simulation::draw(DrawSurface& surface) {
    const float w = m_surfaceSize.x;
    const float h = m_surfaceSize.y;

    if (m_settings.clearCanvas || m_paintBackground) {
        surface.fillRect(0.0f, 0.0f, w, h, m_settings.background());
        m_paintBackground = false;
    }
    surface.strokeRect(0.0f, 0.0f, w, h, m_settings.border());

    const float radius = m_settings.blob.radius;
    for (const auto& blob : m_flock) {
        Color color = blob.colour.color();
        float x = blob.position.x;
        float y = blob.position.y;
        surface.fillCircle(x, y, radius, color);
        if (m_settings.symmetry) {
            // Mirror into the other three quadrants
            surface.fillCircle(x, h - y, radius, color);
            surface.fillCircle(w - x, y, radius, color);
            surface.fillCircle(w - x, h - y, radius, color);
        }
    }
}

void Simulation::frame(double dt, DrawSurface& surface) {
    if (m_suspended) {
        return;
    }
    update(dt);
    draw(surface);
}

} // namespace blobs
