#pragma once

/**
 * @file macro_catalog.h
 * @brief Named macros: the built-in demos plus user-authored ones
 *
 * The catalog is the interchange format for saving, loading and sharing
 * macros: a JSON object mapping each macro name to its event array.
 * User-authored macro text is validated here, before it can reach a Macro.
 */

#include <blobs/macro.h>

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace blobs {

/**
 * @brief Ordered name -> events map
 *
 * Names keep their insertion order. Adding a name that already exists
 * replaces its events in place.
 */
class MacroCatalog {
public:
    struct Entry {
        std::string name;
        std::vector<MacroEvent> events;
        bool builtin = false;
    };

    MacroCatalog() = default;

    /// @brief Catalog holding the built-in demo macros
    static MacroCatalog builtin();

    /**
     * @brief Add a user macro from JSON text
     * @param name Macro name (must not be blank, must be valid UTF-8)
     * @param source Event array as JSON text
     * @return false if the name or source is invalid; see error()
     *
     * On failure the catalog is unchanged.
     */
    bool add(const std::string& name, const std::string& source);

    /// @brief Add already-validated events
    void add(const std::string& name, std::vector<MacroEvent> events, bool builtin = false);

    /// @brief Remove a macro by name
    bool remove(const std::string& name);

    /**
     * @brief Merge user macros from a catalog-format JSON object text
     * @return false if any entry is invalid; nothing is merged in that case
     */
    bool addUserMacros(const std::string& source);

    /// @brief User-authored macros as a catalog-format JSON object
    nlohmann::ordered_json userMacrosJson() const;

    /// @brief Every macro as a catalog-format JSON object
    nlohmann::ordered_json toJson() const;

    const std::vector<MacroEvent>* find(const std::string& name) const;
    std::vector<std::string> names() const;
    const std::vector<Entry>& entries() const { return m_entries; }
    bool empty() const { return m_entries.empty(); }
    size_t size() const { return m_entries.size(); }

    /// @brief Last validation error
    const std::string& error() const { return m_error; }

private:
    Entry* findEntry(const std::string& name);

    std::vector<Entry> m_entries;
    std::string m_error;
};

} // namespace blobs
