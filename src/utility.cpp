#include "kiln/utility.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <format>

namespace kiln {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Config:
        return "Config error";
    case ErrorKind::Dependency:
        return "Dependency error";
    case ErrorKind::TaskNotFound:
        return "Task error";
    case ErrorKind::File:
        return "File error";
    case ErrorKind::CommandIo:
        return "Command execution error";
    case ErrorKind::Timeout:
        return "Command timed out";
    }
    return "Error";
}

std::string Error::what() const {
    if (message.empty())
        return std::string(to_string(kind));
    return std::format("{}: {}", to_string(kind), message);
}

Result<std::optional<std::chrono::milliseconds>> parse_duration(std::string_view text) {
    if (text.empty() || text == "0") {
        return std::nullopt;
    }

    // A century, so that now() + timeout stays representable on a nanosecond clock.
    constexpr uint64_t MAX_MS =
        static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::years(100)).count());
    uint64_t total_ms = 0;
    const char *ptr = text.data();
    const char *end = ptr + text.size();

    while (ptr < end) {
        uint64_t value = 0;
        auto res = std::from_chars(ptr, end, value);
        if (res.ec != std::errc()) {
            return fail(ErrorKind::Config, std::format("invalid duration '{}': expected a number", text));
        }
        ptr = res.ptr;

        const char *unit_start = ptr;
        while (ptr < end && std::isalpha(static_cast<unsigned char>(*ptr)))
            ptr++;
        std::string_view unit(unit_start, ptr - unit_start);

        uint64_t unit_ms = 0;
        if (unit == "ms") {
            unit_ms = 1;
        } else if (unit == "s") {
            unit_ms = 1000;
        } else if (unit == "m") {
            unit_ms = 60 * 1000;
        } else if (unit == "h") {
            unit_ms = 60 * 60 * 1000;
        } else if (unit == "d") {
            unit_ms = 24 * 60 * 60 * 1000;
        } else if (unit.empty()) {
            return fail(ErrorKind::Config, std::format("invalid duration '{}': missing unit", text));
        } else {
            return fail(ErrorKind::Config, std::format("invalid duration '{}': unknown unit '{}'", text, unit));
        }

        if (value > (MAX_MS - total_ms) / unit_ms) {
            return fail(ErrorKind::Config, std::format("invalid duration '{}': too large", text));
        }
        total_ms += value * unit_ms;
    }

    std::chrono::milliseconds total(static_cast<std::chrono::milliseconds::rep>(total_ms));
    if (total.count() == 0)
        return std::nullopt;
    return total;
}

} // namespace kiln
