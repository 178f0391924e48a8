#pragma once

#include <blobs/macro_catalog.h>
#include <blobs/settings.h>
#include <blobs/storage/storage.h>

#include <string>

namespace blobs::storage {

/// Storage key holding the settings document
constexpr const char* SETTINGS_KEY = "settings";

/// Storage key holding user-authored macros in catalog format
constexpr const char* MACROS_KEY = "macros";

/**
 * @brief Settings saved in storage, or the defaults.
 *
 * Malformed or outdated stored settings fall back to the defaults with a
 * diagnostic (see blobs::loadSettings).
 */
Settings loadStoredSettings(const Storage& store);

/// @brief Save settings under SETTINGS_KEY (in memory; call save() to write).
void storeSettings(Storage& store, const Settings& settings);

/**
 * @brief Validate settings JSON text and store it.
 * @param error Receives the reason on failure.
 * @return false if the text is not valid settings; storage is unchanged.
 */
bool importSettings(Storage& store, const std::string& text, std::string* error = nullptr);

/// @brief Drop stored settings so the next load uses the defaults.
bool resetStoredSettings(Storage& store);

/**
 * @brief Built-in macros followed by the user macros saved in storage.
 *
 * If the stored macros are invalid only the built-ins are returned.
 */
MacroCatalog loadMacroCatalog(const Storage& store);

/**
 * @brief Save the catalog's user macros under MACROS_KEY.
 * @return false if the macros cannot be serialized; storage is unchanged.
 */
bool storeUserMacros(Storage& store, const MacroCatalog& catalog);

} // namespace blobs::storage
