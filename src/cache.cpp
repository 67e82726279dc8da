#include "kiln/cache.hpp"

#include "kiln/console.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace kiln {

bool IncrementalCache::insert(std::string fingerprint) {
    bool inserted = entries_.insert(std::move(fingerprint)).second;
    dirty_ = dirty_ || inserted;
    return inserted;
}

IncrementalCache IncrementalCache::load(const fs::path &path, Console &console) {
    IncrementalCache cache;

    std::ifstream file(path);
    if (!file.is_open()) {
        return cache;
    }

    using json = nlohmann::json;
    json doc = json::parse(file, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        console.warn("Ignoring unreadable cache file '{}'", path.string());
        return cache;
    }

    for (const auto &[key, value] : doc.items()) {
        cache.entries_.insert(key);
    }
    console.debug("Loaded {} cache entries from {}", cache.entries_.size(), path.string());
    return cache;
}

bool IncrementalCache::save(const fs::path &path, Console &console) const {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            console.warn("Failed to create cache directory: {}", ec.message());
            return false;
        }
    }

    using json = nlohmann::json;
    json doc = json::object();
    for (const auto &key : entries_) {
        doc[key] = nullptr;
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        console.warn("Failed to open cache file for writing: {}", path.string());
        return false;
    }
    file << doc.dump(2) << '\n';
    if (!file) {
        console.warn("Failed to write cache file: {}", path.string());
        return false;
    }
    return true;
}

fs::path cache_path(const std::optional<std::string> &cache_dir, const fs::path &config_path) {
    fs::path config_parent = config_path.parent_path();
    if (config_parent.empty()) {
        config_parent = ".";
    }

    fs::path dir = cache_dir ? fs::path(*cache_dir) : fs::path(DEFAULT_CACHE_DIR);
    if (!dir.is_absolute()) {
        dir = config_parent / dir;
    }
    return (dir / CACHE_FILENAME).lexically_normal();
}

} // namespace kiln
