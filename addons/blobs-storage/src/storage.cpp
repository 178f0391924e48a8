#include <blobs/storage/storage.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace blobs::storage {

using json = nlohmann::json;

struct Storage::Impl {
    json data = json::object();
};

Storage::Storage(const std::string& path)
    : impl_(std::make_unique<Impl>())
    , path_(path) {
    load();
}

Storage::~Storage() {
    if (dirty_) {
        save();
    }
}

Storage::Storage(Storage&& other) noexcept
    : impl_(std::move(other.impl_))
    , path_(std::move(other.path_))
    , error_(std::move(other.error_))
    , dirty_(other.dirty_) {
    other.dirty_ = false;
}

Storage& Storage::operator=(Storage&& other) noexcept {
    if (this != &other) {
        if (dirty_) {
            save();
        }
        impl_ = std::move(other.impl_);
        path_ = std::move(other.path_);
        error_ = std::move(other.error_);
        dirty_ = other.dirty_;
        other.dirty_ = false;
    }
    return *this;
}

bool Storage::load() {
    impl_->data = json::object();
    dirty_ = false;
    error_.clear();

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return true;  // Nothing saved yet
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        error_ = "failed to open " + path_;
        std::cerr << "[blobs-storage] " << error_ << "\n";
        return false;
    }

    json loaded;
    try {
        file >> loaded;
    } catch (const json::parse_error& e) {
        error_ = "parse error in " + path_ + ": " + e.what();
        std::cerr << "[blobs-storage] " << error_ << "\n";
        return false;
    }

    if (!loaded.is_object()) {
        error_ = path_ + " does not hold a key/value object";
        std::cerr << "[blobs-storage] " << error_ << "\n";
        return false;
    }

    // Keep string entries only
    for (auto it = loaded.begin(); it != loaded.end(); ++it) {
        if (it.value().is_string()) {
            impl_->data[it.key()] = it.value();
        } else {
            std::cerr << "[blobs-storage] Ignoring non-string entry '" << it.key() << "'\n";
        }
    }

    std::cout << "[blobs-storage] Loaded: " << path_ << " ("
              << impl_->data.size() << " keys)\n";
    return true;
}

bool Storage::save() {
    // Serialize before opening so a bad value cannot truncate the file
    std::string text;
    try {
        text = impl_->data.dump(2);
    } catch (const json::exception& e) {
        error_ = "cannot serialize " + path_ + ": " + e.what();
        std::cerr << "[blobs-storage] " << error_ << "\n";
        return false;
    }

    std::ofstream file(path_);
    if (!file.is_open()) {
        error_ = "failed to write " + path_;
        std::cerr << "[blobs-storage] " << error_ << "\n";
        return false;
    }

    file << text << std::endl;
    if (!file) {
        error_ = "write error on " + path_;
        std::cerr << "[blobs-storage] " << error_ << "\n";
        return false;
    }
    dirty_ = false;
    return true;
}

bool Storage::has(const std::string& key) const {
    return impl_->data.contains(key);
}

bool Storage::remove(const std::string& key) {
    if (impl_->data.erase(key) > 0) {
        dirty_ = true;
        return true;
    }
    return false;
}

void Storage::clear() {
    if (!impl_->data.empty()) {
        impl_->data = json::object();
        dirty_ = true;
    }
}

void Storage::setString(const std::string& key, const std::string& value) {
    impl_->data[key] = value;
    dirty_ = true;
}

std::optional<std::string> Storage::getString(const std::string& key) const {
    auto it = impl_->data.find(key);
    if (it == impl_->data.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::vector<std::string> Storage::keys() const {
    std::vector<std::string> result;
    result.reserve(impl_->data.size());
    for (auto it = impl_->data.begin(); it != impl_->data.end(); ++it) {
        result.push_back(it.key());
    }
    return result;
}

size_t Storage::size() const {
    return impl_->data.size();
}

} // namespace blobs::storage
