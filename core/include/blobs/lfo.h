#pragma once

/**
 * @file lfo.h
 * @brief Low-frequency oscillator for parameter modulation
 *
 * Sweeps a value linearly between two bounds at a fixed rate and hands every
 * new value to a callback.
 */

#include <functional>

namespace blobs {

/**
 * @brief What an LFO does when it passes its upper bound
 */
enum class LFOMode {
    Bounce,     ///< Reverse direction and reflect back down
    Wrap        ///< Jump back to the lower bound, keep rising
};

/**
 * @brief Bounded linear oscillator driven by elapsed time
 *
 * The value starts at the midpoint of [min, max] moving upwards. Each
 * update() advances it by rate * dt in the current direction. Crossing max
 * reflects (Bounce) or wraps to min (Wrap); crossing min always reflects.
 *
 * Only a single reflection is applied per update. A step that overshoots a
 * bound by more than (max - min) is not folded further; the result is
 * clamped so the value is never observed outside [min, max].
 *
 * @par Example
 * @code
 * LFO hue(0.0f, 360.0f, 30.0f, [&](float v) { colour.setHue(v); }, LFOMode::Wrap);
 * hue.update(dt);
 * @endcode
 */
class LFO {
public:
    using Callback = std::function<void(float)>;

    /**
     * @param minValue Lower bound (inclusive)
     * @param maxValue Upper bound (inclusive)
     * @param rate Amount the value changes per second
     * @param callback Receives the value after every update
     * @param mode Behaviour at the upper bound
     */
    LFO(float minValue, float maxValue, float rate, Callback callback,
        LFOMode mode = LFOMode::Bounce);

    /// @brief Advance by dt seconds and invoke the callback
    void update(double dt);

    float value() const { return m_value; }
    int direction() const { return m_direction; }
    float minValue() const { return m_min; }
    float maxValue() const { return m_max; }
    float rate() const { return m_rate; }
    LFOMode mode() const { return m_mode; }

private:
    float m_min;
    float m_max;
    float m_rate;
    float m_value;
    int m_direction = 1;
    LFOMode m_mode;
    Callback m_callback;
};

} // namespace blobs
