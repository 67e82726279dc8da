#pragma once

#include <format>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kiln {

enum class Stream { Out, Err };

/**
 * @brief Destination for everything kiln prints.
 *
 * One instance is created by the caller and handed to every component that writes,
 * so concurrently running tasks share a single lock around the real terminal.
 */
class Console {
public:
    explicit Console(bool verbose = false) : verbose_(verbose) {
    }
    virtual ~Console() = default;

    Console(const Console &) = delete;
    Console &operator=(const Console &) = delete;

    /** @brief Writes a chunk as one uninterrupted unit. */
    virtual void write(Stream stream, std::string_view chunk) = 0;

    bool verbose() const {
        return verbose_;
    }
    void set_verbose(bool verbose) {
        verbose_ = verbose;
    }

    template <typename... Args> void info(std::format_string<Args...> fmt, Args &&...args) {
        write(Stream::Out, std::format(fmt, std::forward<Args>(args)...) + "\n");
    }

    template <typename... Args> void debug(std::format_string<Args...> fmt, Args &&...args) {
        if (verbose_)
            write(Stream::Out, std::format(fmt, std::forward<Args>(args)...) + "\n");
    }

    template <typename... Args> void warn(std::format_string<Args...> fmt, Args &&...args) {
        write(Stream::Err, "Warning: " + std::format(fmt, std::forward<Args>(args)...) + "\n");
    }

    template <typename... Args> void error(std::format_string<Args...> fmt, Args &&...args) {
        write(Stream::Err, "Error: " + std::format(fmt, std::forward<Args>(args)...) + "\n");
    }

private:
    bool verbose_;
};

/** @brief stdout/stderr, one mutex across both streams. */
class TerminalConsole final : public Console {
public:
    using Console::Console;
    void write(Stream stream, std::string_view chunk) override;

private:
    std::mutex mtx_;
};

/** @brief Keeps everything in memory. */
class BufferConsole final : public Console {
public:
    using Console::Console;
    void write(Stream stream, std::string_view chunk) override;

    std::string out() const;
    std::string err() const;

private:
    mutable std::mutex mtx_;
    std::string out_;
    std::string err_;
};

} // namespace kiln
