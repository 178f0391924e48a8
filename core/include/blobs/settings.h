#pragma once

/**
 * @file settings.h
 * @brief User-customisable settings and their JSON schema
 *
 * Settings are stored as JSON. The document carries a version tag; a stored
 * document whose version differs from kSettingsVersion is discarded in
 * favour of the defaults.
 *
 * @par Schema
 * @code
 * {
 *     "canvas": {"width": 1280, "height": 720,
 *                "backgroundColour": "black", "borderColour": "black"},
 *     "blob": {"radius": 3, "count": 1300, "speed": 100,
 *              "slowSpeed": 50, "maxExtraSpeed": 100},
 *     "clearCanvas": true,
 *     "symmetry": true,
 *     "hueChangePerSecond": 30,
 *     "keys": {"pause": 340},        // optional overrides
 *     "version": 1.3
 * }
 * @endcode
 */

#include <blobs/color.h>
#include <blobs/input.h>

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace blobs {

/// @brief Increment when the structure of the settings document changes
constexpr double kSettingsVersion = 1.3;

struct CanvasSettings {
    int width = 1280;
    int height = 720;
    std::string backgroundColour = "black";
    std::string borderColour = "black";
};

struct BlobSettings {
    float radius = 3.0f;
    int count = 1300;
    float speed = 100.0f;           ///< Pixels per second
    float slowSpeed = 50.0f;        ///< Pixels per second while slow is held
    float maxExtraSpeed = 100.0f;   ///< Bound of each blob's random speed bias
};

/**
 * @brief All settings read by the simulation and the app
 */
struct Settings {
    CanvasSettings canvas;
    BlobSettings blob;
    bool clearCanvas = true;
    bool symmetry = true;
    float hueChangePerSecond = 30.0f;
    KeyBindings keys = KeyBindings::defaults();
    double version = kSettingsVersion;

    /// @brief Background as a color (black if the string does not parse)
    Color background() const;

    /// @brief Border as a color (black if the string does not parse)
    Color border() const;

    nlohmann::json toJson() const;

    /**
     * @brief Build settings from a JSON document
     * @param j Parsed document
     * @param error Receives a description of the first problem found
     * @return Settings, or nullopt if the document is malformed or the
     *         version does not match
     *
     * Missing fields take their default values.
     */
    static std::optional<Settings> fromJson(const nlohmann::json& j, std::string* error = nullptr);
};

/**
 * @brief Parse stored settings text, falling back to defaults
 * @param text JSON text as previously produced by toJson().dump()
 * @return Parsed settings, or the defaults when the text is malformed or from
 *         another version (a diagnostic is logged)
 */
Settings loadSettings(const std::string& text);

} // namespace blobs
