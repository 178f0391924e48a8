#include <blobs/storage/persistence.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace blobs::storage {

using json = nlohmann::json;

Settings loadStoredSettings(const Storage& store) {
    auto text = store.getString(SETTINGS_KEY);
    if (!text) {
        return Settings();
    }
    return loadSettings(*text);
}

void storeSettings(Storage& store, const Settings& settings) {
    store.setString(SETTINGS_KEY, settings.toJson().dump());
}

bool importSettings(Storage& store, const std::string& text, std::string* error) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        if (error) *error = std::string("not valid JSON: ") + e.what();
        return false;
    }

    auto settings = Settings::fromJson(j, error);
    if (!settings) {
        return false;
    }
    storeSettings(store, *settings);
    std::cout << "[blobs-storage] Imported settings" << std::endl;
    return true;
}

bool resetStoredSettings(Storage& store) {
    return store.remove(SETTINGS_KEY);
}

MacroCatalog loadMacroCatalog(const Storage& store) {
    MacroCatalog catalog = MacroCatalog::builtin();

    auto text = store.getString(MACROS_KEY);
    if (text && !catalog.addUserMacros(*text)) {
        std::cerr << "[blobs-storage] Ignoring stored macros: " << catalog.error() << "\n";
    }
    return catalog;
}

bool storeUserMacros(Storage& store, const MacroCatalog& catalog) {
    std::string text;
    try {
        text = catalog.userMacrosJson().dump();
    } catch (const json::type_error& e) {
        std::cerr << "[blobs-storage] Cannot store macros: " << e.what() << "\n";
        return false;
    }
    store.setString(MACROS_KEY, text);
    return true;
}

} // namespace blobs::storage
