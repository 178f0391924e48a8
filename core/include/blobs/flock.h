#pragma once

/**
 * @file flock.h
 * @brief Whole-collection operations on blobs
 *
 * A Flock is created in one go and replaced in one go; these functions only
 * retarget or reposition the blobs it already holds.
 */

#include <blobs/blob.h>
#include <blobs/settings.h>

#include <glm/glm.hpp>
#include <random>
#include <vector>

namespace blobs {

using Flock = std::vector<Blob>;

/**
 * @brief Create a flock scattered over the surface
 * @param settings Count and speed bias range
 * @param surfaceSize Surface size in pixels
 * @param rng Random source for positions, bearings and colours
 *
 * Every blob starts with hue 120, random saturation and value, a random
 * bearing and a speed bias uniform in [-maxExtraSpeed, maxExtraSpeed].
 */
Flock createFlock(const BlobSettings& settings, glm::vec2 surfaceSize, std::mt19937& rng);

/// @brief Point every blob's bearing at target
void attractBlobs(Flock& flock, glm::vec2 target);

/// @brief Move every blob to target, bearings unchanged
void teleportBlobs(Flock& flock, glm::vec2 target);

/// @brief Teleport when paused, otherwise attract
void dispatchClick(Flock& flock, glm::vec2 target, bool paused);

/// @brief Give every blob a uniformly random bearing
void randomiseBearings(Flock& flock, std::mt19937& rng);

/// @brief Turn every blob around
void reverseBearings(Flock& flock);

/// @brief Zero every blob's bearing shift
void resetBearingShift(Flock& flock);

} // namespace blobs
