// Blobs - Macro Catalog

#include <blobs/macro_catalog.h>
#include <algorithm>
#include <cctype>
#include <iostream>

namespace blobs {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace {

// Demo macros shipped with the app
const char* BUILTIN_MACROS = R"({
    "test": [
        {"time": 0, "type": "keydown", "key": "pause"},
        {"time": 0, "type": "keydown", "key": "center"},
        {"time": 0.1, "type": "keyup", "key": "center"},
        {"time": 0.1, "type": "keyup", "key": "pause"},
        {"time": 1, "type": "keydown", "key": "randomise"},
        {"time": 3, "type": "click", "coords": [0, 0]},
        {"time": 4, "type": "keydown", "key": "toggleClear"},
        {"time": 4, "type": "keydown", "key": "center"},
        {"time": 4.1, "type": "keyup", "key": "center"}
    ],
    "test2": [
        {"time": 0, "type": "keydown", "key": "pause"},
        {"time": 0.179, "type": "keydown", "key": "center"},
        {"time": 0.299, "type": "keyup", "key": "center"},
        {"time": 0.558, "type": "keyup", "key": "pause"},
        {"time": 0.64, "type": "keydown", "key": "randomiseSpeed"},
        {"time": 2.413, "type": "click", "coords": [29.57894736842105, 28.125]},
        {"time": 7.306, "type": "keyup", "key": "randomiseSpeed"}
    ]
})";

std::string trim(const std::string& s) {
    auto notSpace = [](char c) { return !std::isspace(static_cast<unsigned char>(c)); };
    auto begin = std::find_if(s.begin(), s.end(), notSpace);
    auto end = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return begin < end ? std::string(begin, end) : std::string();
}

// Names end up as JSON object keys, which must be valid UTF-8
bool serializable(const std::string& name) {
    try {
        json(name).dump();
    } catch (const json::type_error&) {
        return false;
    }
    return true;
}

} // namespace

MacroCatalog MacroCatalog::builtin() {
    MacroCatalog catalog;
    ordered_json j = ordered_json::parse(BUILTIN_MACROS);
    for (const auto& [name, events] : j.items()) {
        auto parsed = parseMacroEvents(events);
        if (parsed) {
            catalog.add(name, std::move(*parsed), true);
        }
    }
    return catalog;
}

MacroCatalog::Entry* MacroCatalog::findEntry(const std::string& name) {
    for (auto& entry : m_entries) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

void MacroCatalog::add(const std::string& name, std::vector<MacroEvent> events, bool builtin) {
    if (Entry* existing = findEntry(name)) {
        existing->events = std::move(events);
        existing->builtin = builtin;
        return;
    }
    m_entries.push_back({name, std::move(events), builtin});
}

bool MacroCatalog::add(const std::string& name, const std::string& source) {
    std::string cleanName = trim(name);
    if (cleanName.empty()) {
        m_error = "macro name is empty";
        std::cerr << "[blobs-macro] WARNING: " << m_error << "\n";
        return false;
    }
    if (!serializable(cleanName)) {
        m_error = "macro name is not valid UTF-8";
        std::cerr << "[blobs-macro] WARNING: " << m_error << "\n";
        return false;
    }

    json j;
    try {
        j = json::parse(trim(source));
    } catch (const json::parse_error& e) {
        m_error = "macro '" + cleanName + "' is not valid JSON: " + e.what();
        std::cerr << "[blobs-macro] WARNING: " << m_error << "\n";
        return false;
    }

    std::string detail;
    auto events = parseMacroEvents(j, &detail);
    if (!events) {
        m_error = "macro '" + cleanName + "' is invalid: " + detail;
        std::cerr << "[blobs-macro] WARNING: " << m_error << "\n";
        return false;
    }

    add(cleanName, std::move(*events), false);
    m_error.clear();
    return true;
}

bool MacroCatalog::remove(const std::string& name) {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [&name](const Entry& e) { return e.name == name; });
    if (it == m_entries.end()) {
        return false;
    }
    m_entries.erase(it);
    return true;
}

bool MacroCatalog::addUserMacros(const std::string& source) {
    // Ordered so stored macros come back in the order they were added
    ordered_json j;
    try {
        j = ordered_json::parse(source);
    } catch (const json::parse_error& e) {
        m_error = std::string("stored macros are not valid JSON: ") + e.what();
        std::cerr << "[blobs-macro] WARNING: " << m_error << "\n";
        return false;
    }
    if (!j.is_object()) {
        m_error = "stored macros must be an object of name -> events";
        std::cerr << "[blobs-macro] WARNING: " << m_error << "\n";
        return false;
    }

    // Validate everything before touching the catalog
    std::vector<std::pair<std::string, std::vector<MacroEvent>>> parsed;
    for (const auto& [name, events] : j.items()) {
        std::string detail;
        auto result = parseMacroEvents(events, &detail);
        if (trim(name).empty() || !result) {
            m_error = "stored macro '" + name + "' is invalid: " +
                      (detail.empty() ? std::string("empty name") : detail);
            std::cerr << "[blobs-macro] WARNING: " << m_error << "\n";
            return false;
        }
        parsed.emplace_back(trim(name), std::move(*result));
    }

    for (auto& [name, events] : parsed) {
        add(name, std::move(events), false);
    }
    m_error.clear();
    return true;
}

ordered_json MacroCatalog::userMacrosJson() const {
    ordered_json j = ordered_json::object();
    for (const auto& entry : m_entries) {
        if (!entry.builtin) {
            j[entry.name] = macroEventsToJson(entry.events);
        }
    }
    return j;
}

ordered_json MacroCatalog::toJson() const {
    ordered_json j = ordered_json::object();
    for (const auto& entry : m_entries) {
        j[entry.name] = macroEventsToJson(entry.events);
    }
    return j;
}

const std::vector<MacroEvent>* MacroCatalog::find(const std::string& name) const {
    for (const auto& entry : m_entries) {
        if (entry.name == name) {
            return &entry.events;
        }
    }
    return nullptr;
}

std::vector<std::string> MacroCatalog::names() const {
    std::vector<std::string> result;
    result.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        result.push_back(entry.name);
    }
    return result;
}

} // namespace blobs
