#pragma once

#include "kiln/utility.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace kiln {

class Console;

struct CommandOutput {
    int status = 0;
    std::string out;
    std::string err;

    bool success() const {
        return status == 0;
    }
};

struct ExecOptions {
    std::optional<std::chrono::milliseconds> timeout = std::nullopt;
    bool stream = false; ///< Echo output chunks to the console as they arrive.
};

/**
 * @brief Runs a command through the platform shell.
 *
 * stdout and stderr are always captured in full; with `stream` set every chunk is
 * also written to the console as it is read. When the timeout expires first the
 * process is terminated (then killed) and a Timeout error is returned.
 *
 * @return The exit status and captured output, a CommandIo error if the process could
 *         not be started or drained, or a Timeout error.
 */
Result<CommandOutput> process_exec(std::string_view command, const ExecOptions &options, Console &console);

/** @brief Seam between the scheduler and process execution. */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual Result<CommandOutput> run(const std::string &command, const ExecOptions &options) = 0;
};

class ShellRunner final : public CommandRunner {
public:
    explicit ShellRunner(Console &console) : console_(console) {
    }

    Result<CommandOutput> run(const std::string &command, const ExecOptions &options) override {
        return process_exec(command, options, console_);
    }

private:
    Console &console_;
};

} // namespace kiln
