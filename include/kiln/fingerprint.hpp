#pragma once

#include "kiln/utility.hpp"

#include <array>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

class Console;
class FileResolver;

using Digest = std::array<unsigned char, 32>;

/** @brief SHA-256 of a byte sequence. */
Result<Digest> sha256(std::string_view bytes);

std::string to_hex(const Digest &digest);

/**
 * @brief Content-addressed digest over a task's resolved input files.
 *
 * Each file contributes H("<len(path)>:<path>" + contents); the per-file digests are
 * concatenated in sorted-path order and hashed once more. The result depends only on
 * the set of (path, contents) pairs. Files that cannot be read are skipped with a
 * warning, and an empty set hashes the empty byte sequence.
 */
class Fingerprinter {
public:
    Fingerprinter(const FileResolver &resolver, Console &console) : resolver_(resolver), console_(console) {
    }

    /**
     * @brief Resolves the patterns, then fingerprints the resulting files.
     * @return Lowercase hex digest, or a File error if resolution fails.
     */
    Result<std::string> fingerprint(const std::vector<std::string> &patterns) const;

    /** @brief Fingerprints an already resolved file set. */
    Result<std::string> fingerprint_files(std::vector<std::filesystem::path> files) const;

private:
    const FileResolver &resolver_;
    Console &console_;
};

} // namespace kiln
