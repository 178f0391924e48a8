#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace blobs::storage {

/**
 * @brief Persistent string key/value store backed by a JSON file.
 *
 * Holds the app's saved settings and user macros between runs. Every value
 * is a string (usually itself a JSON document), so callers own the format
 * of what they store. Writes are best-effort: a failed save is logged and
 * reported, never thrown.
 *
 * Usage:
 *   Storage store("blobs-storage.json");
 *   store.setString("settings", settings.toJson().dump());
 *   store.save();
 *
 *   // Later...
 *   if (auto text = store.getString("settings")) {
 *       settings = blobs::loadSettings(*text);
 *   }
 */
class Storage {
public:
    /**
     * @brief Open a storage file, loading it if present.
     * @param path Path to the JSON file (created on first save).
     */
    explicit Storage(const std::string& path);
    ~Storage();

    // Non-copyable
    Storage(const Storage&) = delete;
    Storage& operator=(const Storage&) = delete;
    Storage(Storage&&) noexcept;
    Storage& operator=(Storage&&) noexcept;

    /**
     * @brief Reload from file, discarding unsaved changes.
     * @return false if the file exists but could not be read or parsed;
     *         the store is then empty and error() describes why.
     */
    bool load();

    /**
     * @brief Write all entries to file.
     * @return true if the file was written.
     */
    bool save();

    bool has(const std::string& key) const;

    /**
     * @brief Remove a key.
     * @return true if the key existed.
     */
    bool remove(const std::string& key);

    /// @brief Remove every key.
    void clear();

    void setString(const std::string& key, const std::string& value);

    /// @brief Stored string, or nullopt if the key is absent or not a string.
    std::optional<std::string> getString(const std::string& key) const;

    /// @brief Stored keys in sorted order.
    std::vector<std::string> keys() const;

    size_t size() const;

    const std::string& path() const { return path_; }

    /// @brief True if there are changes not yet saved.
    bool dirty() const { return dirty_; }

    /// @brief Description of the last load or save failure.
    const std::string& error() const { return error_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string path_;
    std::string error_;
    bool dirty_ = false;
};

} // namespace blobs::storage
