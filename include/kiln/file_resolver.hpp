#pragma once

#include "kiln/utility.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

class Console;

/** @brief True if the pattern contains any of `*`, `?` or `[`. */
bool is_glob_pattern(std::string_view pattern);

/**
 * @brief Matches a path against a glob pattern component by component.
 *
 * `*`, `?` and `[...]` never cross a `/`; a `**` component matches zero or more
 * whole components.
 */
bool glob_match(std::string_view pattern, std::string_view path);

/**
 * @brief Expands declared input/output patterns into concrete paths.
 *
 * Glob patterns keep only regular files. Literal patterns are kept when the path
 * exists (file or directory). Results are deduplicated across patterns; each glob's
 * matches are sorted, and patterns contribute in declaration order.
 */
class FileResolver {
public:
    explicit FileResolver(Console &console) : console_(console) {
    }

    /**
     * @param patterns Declared patterns of one task.
     * @param warn_missing Warn about literal paths that do not exist.
     * @return The resolved paths, or a File error for a malformed pattern or a failed directory walk.
     */
    Result<std::vector<std::filesystem::path>> resolve(const std::vector<std::string> &patterns,
                                                       bool warn_missing = true) const;

    /** @brief Expands a single glob pattern into matching regular files, sorted. */
    Result<std::vector<std::filesystem::path>> expand_glob(std::string_view pattern) const;

private:
    Console &console_;
};

} // namespace kiln
