// Blobs - Macro Recording

#include <blobs/macro_recording.h>
#include <chrono>
#include <utility>

namespace blobs {

namespace {

double steadySeconds() {
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
}

} // namespace

MacroRecording::MacroRecording()
    : m_now(steadySeconds)
{
}

MacroRecording::MacroRecording(TimeSource now)
    : m_now(std::move(now))
{
}

double MacroRecording::timestamp() {
    double now = m_now();
    if (!m_startTime) {
        m_startTime = now;
        return 0.0;
    }
    return now - *m_startTime;
}

void MacroRecording::addClick(float xPercent, float yPercent) {
    m_events.push_back(MacroEvent::click(timestamp(), {xPercent, yPercent}));
}

void MacroRecording::addKeyEvent(const std::string& keyName, MacroEventType type) {
    double time = timestamp();
    if (type == MacroEventType::KeyUp) {
        m_events.push_back(MacroEvent::keyUp(time, keyName));
    } else {
        m_events.push_back(MacroEvent::keyDown(time, keyName));
    }
}

nlohmann::json MacroRecording::toJson() const {
    return macroEventsToJson(m_events);
}

} // namespace blobs
