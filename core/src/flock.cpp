// Blobs - Flock Operations

#include <blobs/flock.h>
#include <algorithm>
#include <cmath>

namespace blobs {

namespace {
constexpr float TAU = 6.28318530718f;
constexpr float PI = 3.14159265359f;
constexpr float kInitialHue = 120.0f;
}

Flock createFlock(const BlobSettings& settings, glm::vec2 surfaceSize, std::mt19937& rng) {
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);

    Flock flock;
    flock.reserve(static_cast<size_t>(std::max(settings.count, 0)));
    for (int i = 0; i < settings.count; ++i) {
        float bearing = unit(rng) * TAU;
        HsvColor colour(kInitialHue, unit(rng) * 100.0f, unit(rng) * 100.0f);
        glm::vec2 position(unit(rng) * surfaceSize.x, unit(rng) * surfaceSize.y);
        float extraSpeed = 2.0f * settings.maxExtraSpeed * unit(rng) - settings.maxExtraSpeed;
        flock.emplace_back(position, bearing, colour, extraSpeed);
    }
    return flock;
}

void attractBlobs(Flock& flock, glm::vec2 target) {
    for (auto& blob : flock) {
        float dx = target.x - blob.position.x;
        float dy = -(target.y - blob.position.y);
        blob.bearing = std::atan2(dx, dy);
    }
}

void teleportBlobs(Flock& flock, glm::vec2 target) {
    for (auto& blob : flock) {
        blob.position = target;
    }
}

void dispatchClick(Flock& flock, glm::vec2 target, bool paused) {
    if (paused) {
        teleportBlobs(flock, target);
    } else {
        attractBlobs(flock, target);
    }
}

void randomiseBearings(Flock& flock, std::mt19937& rng) {
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    for (auto& blob : flock) {
        blob.bearing = unit(rng) * TAU;
    }
}

void reverseBearings(Flock& flock) {
    for (auto& blob : flock) {
        blob.bearing += PI;
    }
}

void resetBearingShift(Flock& flock) {
    for (auto& blob : flock) {
        blob.bearingShift = 0.0f;
    }
}

} // namespace blobs
