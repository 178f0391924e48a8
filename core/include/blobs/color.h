#pragma once

/**
 * @file color.h
 * @brief HSV to RGB conversion, RGBA colors and the cached blob colour
 *
 * Provides:
 * - hsvToRgb(): the Photoshop-style HSV (0-360, 0-100, 0-100) to 8-bit RGB
 *   conversion used for every blob
 * - Color: RGBA in 0-1 range with hex / CSS name parsing, used for the
 *   background and border and handed to the draw surface
 * - HsvColor: an HSV triple that keeps its RGB conversion up to date
 *
 * @par Example
 * @code
 * Rgb8 red = hsvToRgb(0.0f, 100.0f, 100.0f);     // {255, 0, 0}
 * HsvColor c(120.0f, 50.0f, 80.0f);
 * c.setHue(200.0f);                               // c.rgb() recomputed now
 * Color bg = Color::fromString("black");
 * @endcode
 */

#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace blobs {

/**
 * @brief 8-bit RGB triple (each channel 0-255)
 */
struct Rgb8 {
    int r = 0;
    int g = 0;
    int b = 0;

    constexpr bool operator==(const Rgb8& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    constexpr bool operator!=(const Rgb8& other) const { return !(*this == other); }
};

/**
 * @brief Convert HSV to 8-bit RGB
 * @param h Hue in degrees (clamped to 0-360)
 * @param s Saturation (clamped to 0-100)
 * @param v Value (clamped to 0-100)
 * @return Channels rounded independently to the nearest integer
 *
 * Zero saturation short-circuits to a grey of round(v * 255). A hue of
 * exactly 360 lands in sector 6, which shares the sector 5 branch.
 */
Rgb8 hsvToRgb(float h, float s, float v);

/**
 * @brief RGBA color with hex and CSS name parsing
 *
 * Stores RGBA values in 0-1 range and converts implicitly to glm::vec4.
 */
class Color {
public:
    float r, g, b, a;

    /// @brief Default constructor (opaque black)
    constexpr Color() : r(0.0f), g(0.0f), b(0.0f), a(1.0f) {}

    constexpr Color(float r, float g, float b, float a = 1.0f)
        : r(r), g(g), b(b), a(a) {}

    constexpr Color(const glm::vec4& v)
        : r(v.r), g(v.g), b(v.b), a(v.a) {}

    constexpr operator glm::vec4() const {
        return glm::vec4(r, g, b, a);
    }

    /**
     * @brief Create color from 0-255 channels
     */
    static constexpr Color fromBytes(int r, int g, int b, int a = 255) {
        return Color(r / 255.0f, g / 255.0f, b / 255.0f, a / 255.0f);
    }

    /**
     * @brief Create color from an 8-bit RGB triple (opaque)
     */
    static constexpr Color fromRgb8(const Rgb8& rgb) {
        return fromBytes(rgb.r, rgb.g, rgb.b);
    }

    /**
     * @brief Create color from hex integer (0xRRGGBB)
     */
    static constexpr Color fromHex(uint32_t hex) {
        return Color(
            ((hex >> 16) & 0xFF) / 255.0f,
            ((hex >> 8) & 0xFF) / 255.0f,
            (hex & 0xFF) / 255.0f,
            1.0f
        );
    }

    /**
     * @brief Parse a CSS-style color string
     * @param text "#RRGGBB", "#RGB" or a basic CSS color name ("black", "navy", ...)
     * @return Parsed color, or nullopt if the string is not recognised
     */
    static std::optional<Color> fromString(const std::string& text);

    constexpr bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    constexpr bool operator!=(const Color& other) const {
        return !(*this == other);
    }

    static const Color Black;
    static const Color White;
};

inline constexpr Color Color::Black{0.0f, 0.0f, 0.0f};
inline constexpr Color Color::White{1.0f, 1.0f, 1.0f};

/**
 * @brief HSV colour with an eagerly cached RGB conversion
 *
 * Every mutation recomputes the RGB triple, so rgb() is always consistent
 * with the last HSV values set. Hue is stored modulo 360.
 */
class HsvColor {
public:
    HsvColor() { update(0.0f, 0.0f, 0.0f); }
    HsvColor(float h, float s, float v) { update(h, s, v); }

    /// @brief Replace all three components
    void update(float h, float s, float v);

    void setHue(float h) { update(h, m_sat, m_val); }

    float hue() const { return m_hue; }
    float saturation() const { return m_sat; }
    float value() const { return m_val; }

    /// @brief Cached 8-bit conversion of the current HSV triple
    const Rgb8& rgb() const { return m_rgb; }

    /// @brief Cached conversion as an opaque RGBA color
    Color color() const { return Color::fromRgb8(m_rgb); }

private:
    float m_hue = 0.0f;
    float m_sat = 0.0f;
    float m_val = 0.0f;
    Rgb8 m_rgb;
};

} // namespace blobs
