// Blobs - Blob Implementation

#include <blobs/blob.h>
#include <cmath>

namespace blobs {

Blob::Blob(glm::vec2 position, float bearing, const HsvColor& colour, float extraSpeed)
    : position(position)
    , bearing(bearing)
    , colour(colour)
    , m_extraSpeed(extraSpeed)
{
}

float Blob::effectiveSpeed(const InputState& input, const BlobSettings& motion) const {
    float speed = input.held(Action::Slow) ? motion.slowSpeed : motion.speed;
    if (input.held(Action::RandomiseSpeed)) {
        speed += m_extraSpeed;
    }
    return speed;
}

void Blob::update(double dt, const InputState& input, const BlobSettings& motion) {
    if (input.held(Action::Pause)) {
        return;
    }

    float distance = effectiveSpeed(input, motion) * static_cast<float>(dt);
    float heading = bearing + bearingShift;

    position.x += std::sin(heading) * distance;
    position.y -= std::cos(heading) * distance;
}

} // namespace blobs
