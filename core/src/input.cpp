// Blobs - Input Actions and Key Bindings

#include <blobs/input.h>
#include <algorithm>
#include <iostream>

namespace blobs {

namespace {

struct ActionInfo {
    Action action;
    const char* name;
    const char* help;
};

const ActionInfo ACTION_INFO[kActionCount] = {
    {Action::Pause,          "pause",          "Hold to pause all blob movement. Hold and click to move all blobs to the clicked position"},
    {Action::Randomise,      "randomise",      "Randomise the direction of each blob"},
    {Action::Center,         "center",         "Make all blobs head towards the center of the screen"},
    {Action::Slow,           "slow",           "Hold to make all blobs travel at the slow speed"},
    {Action::Wavy,           "wavy",           "Hold to make all blobs travel in a wavy line"},
    {Action::Settings,       "settings",       "Reload settings from storage"},
    {Action::ToggleClear,    "toggleClear",    "Toggle clearing of the screen at the beginning of each frame"},
    {Action::Help,           "help",           "Toggle this help"},
    {Action::ToggleSymmetry, "toggleSymmetry", "Toggle symmetry"},
    {Action::Reverse,        "reverse",        "Reverse the direction of all blobs"},
    {Action::RandomiseSpeed, "randomiseSpeed", "Hold to increase/decrease each blob's speed by a random amount"},
    {Action::StartMacro,     "startMacro",     "Start the current macro"},
    {Action::Escape,         "esc",            "Close the help"},
};

size_t index(Action action) { return static_cast<size_t>(action); }

} // namespace

const std::array<Action, kActionCount>& allActions() {
    static const std::array<Action, kActionCount> actions = [] {
        std::array<Action, kActionCount> a{};
        for (size_t i = 0; i < kActionCount; ++i) {
            a[i] = ACTION_INFO[i].action;
        }
        return a;
    }();
    return actions;
}

const char* actionName(Action action) {
    return ACTION_INFO[index(action)].name;
}

const char* actionHelp(Action action) {
    return ACTION_INFO[index(action)].help;
}

std::optional<Action> actionFromName(const std::string& name) {
    for (const auto& info : ACTION_INFO) {
        if (name == info.name) {
            return info.action;
        }
    }
    return std::nullopt;
}

// -----------------------------------------------------------------------------
// KeyBindings
// -----------------------------------------------------------------------------

KeyBindings KeyBindings::defaults() {
    // GLFW key codes: letters are their uppercase ASCII value
    KeyBindings bindings;
    bindings.bind(Action::Pause, 340);          // GLFW_KEY_LEFT_SHIFT
    bindings.addBinding(Action::Pause, 344);    // GLFW_KEY_RIGHT_SHIFT
    bindings.bind(Action::Randomise, 'R');
    bindings.bind(Action::Center, 'C');
    bindings.bind(Action::Slow, 'S');
    bindings.bind(Action::Wavy, 'W');
    bindings.bind(Action::Settings, 'O');
    bindings.bind(Action::ToggleClear, 'K');
    bindings.bind(Action::Help, 'H');
    bindings.bind(Action::ToggleSymmetry, 'Y');
    bindings.bind(Action::Reverse, 'V');
    bindings.bind(Action::RandomiseSpeed, 'Q');
    bindings.bind(Action::StartMacro, 'M');
    bindings.bind(Action::Escape, 256);         // GLFW_KEY_ESCAPE
    return bindings;
}

void KeyBindings::release(int keyCode) {
    // A code drives at most one action
    for (auto& codes : m_codes) {
        codes.erase(std::remove(codes.begin(), codes.end(), keyCode), codes.end());
    }
}

void KeyBindings::bind(Action action, int keyCode) {
    release(keyCode);
    m_codes[index(action)] = {keyCode};
}

void KeyBindings::addBinding(Action action, int keyCode) {
    release(keyCode);
    m_codes[index(action)].push_back(keyCode);
}

void KeyBindings::unbind(Action action) {
    m_codes[index(action)].clear();
}

std::optional<Action> KeyBindings::lookup(int keyCode) const {
    for (size_t i = 0; i < kActionCount; ++i) {
        const auto& codes = m_codes[i];
        if (std::find(codes.begin(), codes.end(), keyCode) != codes.end()) {
            return allActions()[i];
        }
    }
    return std::nullopt;
}

std::optional<int> KeyBindings::keyFor(Action action) const {
    const auto& codes = m_codes[index(action)];
    if (codes.empty()) {
        return std::nullopt;
    }
    return codes.front();
}

const std::vector<int>& KeyBindings::keysFor(Action action) const {
    return m_codes[index(action)];
}

bool KeyBindings::applyOverrides(const nlohmann::json& overrides) {
    if (!overrides.is_object()) {
        std::cerr << "[blobs-settings] Key bindings must be an object of name -> key code\n";
        return false;
    }

    auto validCodes = [](const nlohmann::json& code) {
        if (code.is_number_integer()) {
            return true;
        }
        if (!code.is_array() || code.empty()) {
            return false;
        }
        return std::all_of(code.begin(), code.end(),
                           [](const nlohmann::json& c) { return c.is_number_integer(); });
    };

    bool ok = true;
    for (const auto& [name, code] : overrides.items()) {
        auto action = actionFromName(name);
        if (!action || !validCodes(code)) {
            std::cerr << "[blobs-settings] Ignoring key binding: " << name << "\n";
            ok = false;
            continue;
        }
        if (code.is_number_integer()) {
            bind(*action, code.get<int>());
            continue;
        }
        unbind(*action);
        for (const auto& c : code) {
            addBinding(*action, c.get<int>());
        }
    }
    return ok;
}

nlohmann::json KeyBindings::toJson() const {
    nlohmann::json j = nlohmann::json::object();
    for (Action action : allActions()) {
        const auto& codes = keysFor(action);
        if (codes.size() == 1) {
            j[actionName(action)] = codes.front();
        } else if (!codes.empty()) {
            j[actionName(action)] = codes;
        }
    }
    return j;
}

} // namespace blobs
