#include "kiln/process_exec.hpp"

#include "kiln/console.hpp"
#include "kiln/utility.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <reproc++/reproc.hpp>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

namespace kiln {

namespace {

const reproc::stop_actions TIMEOUT_STOP = {
    {reproc::stop::terminate, reproc::milliseconds(500)},
    {reproc::stop::kill, reproc::milliseconds(500)},
    {},
};

std::vector<std::string> shell_args(std::string_view command) {
#ifdef _WIN32
    return {"cmd", "/C", std::string(command)};
#else
    return {"/bin/sh", "-c", std::string(command)};
#endif
}

Result<CommandOutput> timed_out(reproc::process &process, std::string_view command, Console &console) {
    auto [status, ec] = process.stop(TIMEOUT_STOP);
    if (ec) {
        console.warn("Failed to kill timed-out process: {}", ec.message());
    }
    return fail(ErrorKind::Timeout, std::format("'{}' exceeded its timeout", command));
}

} // namespace

Result<CommandOutput> process_exec(std::string_view command, const ExecOptions &exec, Console &console) {
    if (command.empty()) {
        return fail(ErrorKind::CommandIo, "Cannot execute empty command");
    }

    reproc::options options;
    options.redirect.in.type = reproc::redirect::discard;
    options.redirect.out.type = reproc::redirect::pipe;
    options.redirect.err.type = reproc::redirect::pipe;
    options.stop = TIMEOUT_STOP;

    // No reproc deadline: once it expires every poll and wait reports a timeout,
    // even for a process that has already exited.
    using clock = std::chrono::steady_clock;
    std::optional<clock::time_point> deadline;
    if (exec.timeout) {
        deadline = clock::now() + *exec.timeout;
    }
    auto remaining = [&]() -> reproc::milliseconds {
        if (!deadline)
            return reproc::infinite;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - clock::now());
        return reproc::milliseconds(static_cast<int>(std::clamp<int64_t>(left.count(), 0, INT32_MAX)));
    };

    reproc::process process;
    if (std::error_code ec = process.start(shell_args(command), options)) {
        return fail(ErrorKind::CommandIo, std::format("failed to start '{}': {}", command, ec.message()));
    }

    CommandOutput output;
    auto io_failure = [&](std::string_view what, std::error_code ec) {
        if (auto [status, stop_ec] = process.stop(TIMEOUT_STOP); stop_ec) {
            console.warn("Failed to stop '{}': {}", command, stop_ec.message());
        }
        return fail(ErrorKind::CommandIo, std::format("failed to {} '{}': {}", what, command, ec.message()));
    };

    // Both pipes are polled together, so a full stderr never stalls stdout or vice versa.
    // Exit is polled too: a background child can keep the pipes open after the shell is gone.
    bool out_open = true;
    bool err_open = true;
    bool exited = false;
    uint8_t buffer[4096];

    while (out_open || err_open) {
        int interests = (out_open ? reproc::event::out : 0) | (err_open ? reproc::event::err : 0);
        if (!exited)
            interests |= reproc::event::exit;

        auto [events, ec] = process.poll(interests, exited ? reproc::milliseconds(0) : remaining());
        if (ec == reproc::error::broken_pipe)
            break;
        bool expired = ec == std::errc::timed_out || (!ec && events == 0);
        if (ec && !expired)
            return io_failure("read output of", ec);
        if (expired) {
            if (exited)
                break; // whatever was written before exit has been read
            return timed_out(process, command, console);
        }
        if (events & reproc::event::exit)
            exited = true;

        for (auto [flag, stream, open] : {std::tuple{reproc::event::out, reproc::stream::out, &out_open},
                                          std::tuple{reproc::event::err, reproc::stream::err, &err_open}}) {
            if (!(events & flag))
                continue;
            auto [size, read_ec] = process.read(stream, buffer, sizeof(buffer));
            if (read_ec == reproc::error::broken_pipe) {
                *open = false;
                continue;
            }
            if (read_ec)
                return io_failure("read output of", read_ec);

            std::string_view chunk(reinterpret_cast<const char *>(buffer), size);
            bool is_out = stream == reproc::stream::out;
            (is_out ? output.out : output.err).append(chunk);
            if (exec.stream && !chunk.empty())
                console.write(is_out ? Stream::Out : Stream::Err, chunk);
        }
    }

    auto [status, wait_ec] = process.wait(exited ? reproc::milliseconds(0) : remaining());
    if (wait_ec == std::errc::timed_out) {
        return timed_out(process, command, console);
    }
    if (wait_ec) {
        return fail(ErrorKind::CommandIo, std::format("failed to wait for '{}': {}", command, wait_ec.message()));
    }

    output.status = status;
    return output;
}

} // namespace kiln
