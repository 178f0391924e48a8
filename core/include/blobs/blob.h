#pragma once

/**
 * @file blob.h
 * @brief A single particle of the flock
 */

#include <blobs/color.h>
#include <blobs/input.h>
#include <blobs/settings.h>

#include <glm/glm.hpp>

namespace blobs {

/**
 * @brief A coloured particle moving along a bearing
 *
 * The bearing is measured in radians from the top of the surface, clockwise,
 * so a bearing of 0 moves towards y = 0. Positions are never clamped to the
 * surface.
 */
class Blob {
public:
    /**
     * @param position Start position in surface pixels
     * @param bearing Heading in radians (0 = up, clockwise)
     * @param colour Initial colour
     * @param extraSpeed Speed bias added while randomiseSpeed is held
     */
    Blob(glm::vec2 position, float bearing, const HsvColor& colour, float extraSpeed = 0.0f);

    /**
     * @brief Move one explicit Euler step
     * @param dt Seconds since the last update
     * @param input Held actions (pause, slow, randomiseSpeed are consulted)
     * @param motion Base and slow speeds
     */
    void update(double dt, const InputState& input, const BlobSettings& motion);

    /// @brief Speed this blob would move at for the given held actions
    float effectiveSpeed(const InputState& input, const BlobSettings& motion) const;

    glm::vec2 position;
    float bearing;
    float bearingShift = 0.0f;      ///< Added to bearing while moving, driven by an LFO
    HsvColor colour;

    float extraSpeed() const { return m_extraSpeed; }

private:
    float m_extraSpeed;
};

} // namespace blobs
