// Blobs - LFO Implementation
// Linear bounce / wrap oscillator

#include <blobs/lfo.h>
#include <algorithm>
#include <utility>

namespace blobs {

LFO::LFO(float minValue, float maxValue, float rate, Callback callback, LFOMode mode)
    : m_min(minValue)
    , m_max(maxValue)
    , m_rate(rate)
    , m_value((minValue + maxValue) / 2.0f)
    , m_mode(mode)
    , m_callback(std::move(callback))
{
}

void LFO::update(double dt) {
    m_value += static_cast<float>(m_rate * dt) * static_cast<float>(m_direction);

    if (m_value > m_max) {
        float overshoot = m_value - m_max;
        if (m_mode == LFOMode::Wrap) {
            m_value = m_min + overshoot;
        } else {
            m_direction = -m_direction;
            m_value = m_max - overshoot;
        }
    }

    // Wrap oscillators only ever rise, so the lower bound always reflects
    if (m_value < m_min) {
        m_direction = -m_direction;
        float overshoot = m_min - m_value;
        m_value = m_min + overshoot;
    }

    // One fold per update; a step longer than the whole range stays in bounds
    m_value = std::clamp(m_value, m_min, m_max);

    if (m_callback) {
        m_callback(m_value);
    }
}

} // namespace blobs
