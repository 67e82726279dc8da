#pragma once

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace kiln {

enum class ErrorKind {
    Config,       ///< Unreadable or malformed configuration.
    Dependency,   ///< Missing dependency, self-dependency, cycle or alias collision.
    TaskNotFound, ///< Unknown target id or alias.
    File,         ///< Glob or input file trouble; never fatal during change detection.
    CommandIo,    ///< The command could not be spawned or drained.
    Timeout,      ///< The command exceeded its deadline.
};

struct Error {
    ErrorKind kind;
    std::string message;

    Error(ErrorKind kind, std::string message) : kind(kind), message(std::move(message)) {
    }

    /** @brief Message prefixed with the error category, e.g. "Dependency error: ...". */
    std::string what() const;
};

std::string_view to_string(ErrorKind kind);

template <typename T> using Result = std::expected<T, Error>;

inline std::unexpected<Error> fail(ErrorKind kind, std::string message) {
    return std::unexpected(Error{kind, std::move(message)});
}

/**
 * @brief Parses a duration such as "500ms", "30s" or "1h30m".
 *
 * "0" and the empty string mean "no timeout" and yield std::nullopt.
 *
 * @return The duration, std::nullopt for no timeout, or a Config error if the text is malformed.
 */
Result<std::optional<std::chrono::milliseconds>> parse_duration(std::string_view text);

} // namespace kiln
