#include "kiln/console.hpp"

#include <cstdio>
#include <print>

namespace kiln {

void TerminalConsole::write(Stream stream, std::string_view chunk) {
    std::lock_guard lock(mtx_);
    FILE *target = stream == Stream::Err ? stderr : stdout;
    std::print(target, "{}", chunk);
    std::fflush(target);
}

void BufferConsole::write(Stream stream, std::string_view chunk) {
    std::lock_guard lock(mtx_);
    if (stream == Stream::Err)
        err_.append(chunk);
    else
        out_.append(chunk);
}

std::string BufferConsole::out() const {
    std::lock_guard lock(mtx_);
    return out_;
}

std::string BufferConsole::err() const {
    std::lock_guard lock(mtx_);
    return err_;
}

} // namespace kiln
