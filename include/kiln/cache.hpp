#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

namespace kiln {

class Console;

inline constexpr std::string_view CACHE_FILENAME = "kiln_cache.json";
inline constexpr std::string_view DEFAULT_CACHE_DIR = ".";

/**
 * @brief Set of fingerprints of previously successful executions.
 *
 * Entries are pure content keys and never expire.
 */
class IncrementalCache {
public:
    bool contains(std::string_view fingerprint) const {
        return entries_.contains(std::string(fingerprint));
    }

    /** @brief Inserts a fingerprint. @return true if it was not present before. */
    bool insert(std::string fingerprint);

    /** @brief True once an insert added something new since loading. */
    bool dirty() const {
        return dirty_;
    }

    size_t size() const {
        return entries_.size();
    }

    const std::unordered_set<std::string> &entries() const {
        return entries_;
    }

    /**
     * @brief Reads a cache file.
     *
     * A missing or unparsable file yields an empty cache; problems with an existing
     * file are reported as warnings.
     */
    static IncrementalCache load(const std::filesystem::path &path, Console &console);

    /**
     * @brief Overwrites the cache file, creating parent directories on demand.
     * @return false if writing failed; the failure has been reported as a warning.
     */
    bool save(const std::filesystem::path &path, Console &console) const;

private:
    std::unordered_set<std::string> entries_;
    bool dirty_ = false;
};

/**
 * @brief Location of the cache file.
 *
 * A relative (or absent) cache_dir is taken relative to the configuration file's directory.
 */
std::filesystem::path cache_path(const std::optional<std::string> &cache_dir, const std::filesystem::path &config_path);

} // namespace kiln
