// Blobs - Settings Implementation

#include <blobs/settings.h>
#include <cmath>
#include <iostream>

namespace blobs {

using json = nlohmann::json;

Color Settings::background() const {
    return Color::fromString(canvas.backgroundColour).value_or(Color::Black);
}

Color Settings::border() const {
    return Color::fromString(canvas.borderColour).value_or(Color::Black);
}

json Settings::toJson() const {
    json j;
    j["canvas"] = {
        {"width", canvas.width},
        {"height", canvas.height},
        {"backgroundColour", canvas.backgroundColour},
        {"borderColour", canvas.borderColour}
    };
    j["blob"] = {
        {"radius", blob.radius},
        {"count", blob.count},
        {"speed", blob.speed},
        {"slowSpeed", blob.slowSpeed},
        {"maxExtraSpeed", blob.maxExtraSpeed}
    };
    j["clearCanvas"] = clearCanvas;
    j["symmetry"] = symmetry;
    j["hueChangePerSecond"] = hueChangePerSecond;
    j["keys"] = keys.toJson();
    j["version"] = version;
    return j;
}

std::optional<Settings> Settings::fromJson(const json& j, std::string* error) {
    auto fail = [error](const std::string& message) -> std::optional<Settings> {
        if (error) *error = message;
        return std::nullopt;
    };

    if (!j.is_object()) {
        return fail("settings must be a JSON object");
    }
    if (!j.contains("version") || !j["version"].is_number()) {
        return fail("settings have no version");
    }
    if (std::abs(j["version"].get<double>() - kSettingsVersion) > 1e-9) {
        return fail("settings are for version " + j["version"].dump() +
                    ", expected " + json(kSettingsVersion).dump());
    }

    Settings s;
    try {
        if (j.contains("canvas")) {
            const json& c = j.at("canvas");
            s.canvas.width = c.value("width", s.canvas.width);
            s.canvas.height = c.value("height", s.canvas.height);
            s.canvas.backgroundColour = c.value("backgroundColour", s.canvas.backgroundColour);
            s.canvas.borderColour = c.value("borderColour", s.canvas.borderColour);
        }
        if (j.contains("blob")) {
            const json& b = j.at("blob");
            s.blob.radius = b.value("radius", s.blob.radius);
            s.blob.count = b.value("count", s.blob.count);
            s.blob.speed = b.value("speed", s.blob.speed);
            s.blob.slowSpeed = b.value("slowSpeed", s.blob.slowSpeed);
            s.blob.maxExtraSpeed = b.value("maxExtraSpeed", s.blob.maxExtraSpeed);
        }
        s.clearCanvas = j.value("clearCanvas", s.clearCanvas);
        s.symmetry = j.value("symmetry", s.symmetry);
        s.hueChangePerSecond = j.value("hueChangePerSecond", s.hueChangePerSecond);
    } catch (const json::exception& e) {
        return fail(std::string("bad settings field: ") + e.what());
    }

    if (s.canvas.width <= 0 || s.canvas.height <= 0) {
        return fail("canvas width and height must be positive");
    }
    if (s.blob.count < 0) {
        return fail("blob count must not be negative");
    }
    if (!Color::fromString(s.canvas.backgroundColour)) {
        return fail("unknown background colour: " + s.canvas.backgroundColour);
    }
    if (!Color::fromString(s.canvas.borderColour)) {
        return fail("unknown border colour: " + s.canvas.borderColour);
    }

    if (j.contains("keys") && !s.keys.applyOverrides(j["keys"])) {
        return fail("bad key bindings");
    }

    s.version = kSettingsVersion;
    return s;
}

Settings loadSettings(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        std::cerr << "[blobs-settings] WARNING: Saved settings were not valid JSON: "
                  << e.what() << "\n";
        return Settings{};
    }

    std::string error;
    auto settings = Settings::fromJson(j, &error);
    if (!settings) {
        std::cout << "[blobs-settings] INFO: Using default settings (" << error << ")\n";
        return Settings{};
    }
    return *settings;
}

} // namespace blobs
