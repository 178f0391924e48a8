// Blobs - Color Implementation

#include <blobs/color.h>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace blobs {

Rgb8 hsvToRgb(float h, float s, float v) {
    h = std::clamp(h, 0.0f, 360.0f);
    s = std::clamp(s, 0.0f, 100.0f) / 100.0f;
    v = std::clamp(v, 0.0f, 100.0f) / 100.0f;

    auto channel = [](float c) { return static_cast<int>(std::lround(c * 255.0f)); };

    if (s == 0.0f) {
        // Achromatic
        int grey = channel(v);
        return {grey, grey, grey};
    }

    float sector = h / 60.0f;
    int i = static_cast<int>(std::floor(sector));
    float f = sector - static_cast<float>(i);
    float p = v * (1.0f - s);
    float q = v * (1.0f - s * f);
    float t = v * (1.0f - s * (1.0f - f));

    float r, g, b;
    switch (i) {
        case 0:  r = v; g = t; b = p; break;
        case 1:  r = q; g = v; b = p; break;
        case 2:  r = p; g = v; b = t; break;
        case 3:  r = p; g = q; b = v; break;
        case 4:  r = t; g = p; b = v; break;
        default: r = v; g = p; b = q; break;  // sector 5, and h == 360
    }

    return {channel(r), channel(g), channel(b)};
}

namespace {

struct NamedColor {
    const char* name;
    uint32_t hex;
};

// Basic CSS color keywords
const NamedColor NAMED_COLORS[] = {
    {"black",   0x000000},
    {"silver",  0xC0C0C0},
    {"gray",    0x808080},
    {"grey",    0x808080},
    {"white",   0xFFFFFF},
    {"maroon",  0x800000},
    {"red",     0xFF0000},
    {"purple",  0x800080},
    {"fuchsia", 0xFF00FF},
    {"magenta", 0xFF00FF},
    {"green",   0x008000},
    {"lime",    0x00FF00},
    {"olive",   0x808000},
    {"yellow",  0xFFFF00},
    {"navy",    0x000080},
    {"blue",    0x0000FF},
    {"teal",    0x008080},
    {"aqua",    0x00FFFF},
    {"cyan",    0x00FFFF},
    {"orange",  0xFFA500},
};

} // namespace

std::optional<Color> Color::fromString(const std::string& text) {
    std::string s;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            s += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }

    if (!s.empty() && s[0] == '#') {
        std::string digits = s.substr(1);
        if (!std::all_of(digits.begin(), digits.end(),
                         [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; })) {
            return std::nullopt;
        }
        if (digits.size() == 3) {
            // #RGB shorthand doubles each digit
            std::string expanded;
            for (char c : digits) {
                expanded += c;
                expanded += c;
            }
            digits = expanded;
        }
        if (digits.size() != 6) {
            return std::nullopt;
        }
        return fromHex(static_cast<uint32_t>(std::stoul(digits, nullptr, 16)));
    }

    for (const auto& named : NAMED_COLORS) {
        if (s == named.name) {
            return fromHex(named.hex);
        }
    }
    return std::nullopt;
}

void HsvColor::update(float h, float s, float v) {
    m_hue = std::fmod(h, 360.0f);
    m_sat = s;
    m_val = v;
    m_rgb = hsvToRgb(m_hue, m_sat, m_val);
}

} // namespace blobs
