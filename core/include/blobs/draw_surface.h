#pragma once

/**
 * @file draw_surface.h
 * @brief Abstract 2D drawing contract used by the simulation's render pass
 *
 * The simulation never talks to a graphics API. Each frame it issues a short
 * list of primitive calls against a DrawSurface; the app implements it on the
 * GPU and tests implement it by recording the calls.
 */

#include <blobs/color.h>

namespace blobs {

class DrawSurface {
public:
    virtual ~DrawSurface() = default;

    /// @brief Fill an axis-aligned rectangle (pixels, origin top-left)
    virtual void fillRect(float x, float y, float w, float h, const Color& color) = 0;

    /// @brief Outline an axis-aligned rectangle with a one pixel line
    virtual void strokeRect(float x, float y, float w, float h, const Color& color) = 0;

    /// @brief Fill a disc centered on (x, y)
    virtual void fillCircle(float x, float y, float radius, const Color& color) = 0;
};

} // namespace blobs
