#pragma once

#include "kiln/domain.hpp"

#include <string_view>

namespace kiln {

class Console;
class FileResolver;
class Fingerprinter;
class IncrementalCache;

enum class RunReason {
    NoInputs,
    OutputsMissing,
    OutputsOutdated,
    InputsChanged,
    CheckFailed,
    UpToDate,
};

std::string_view describe(RunReason reason);

/**
 * @brief Decides whether a task must run.
 *
 * Checks, in order: no declared inputs; a declared output that resolves to nothing;
 * newest input newer than oldest output; input fingerprint absent from the cache.
 * Any resolution or fingerprinting problem is a warning and means "must run".
 */
class ChangeDetector {
public:
    ChangeDetector(const IncrementalCache &cache, const FileResolver &resolver, const Fingerprinter &fingerprinter,
                   Console &console)
        : cache_(cache), resolver_(resolver), fingerprinter_(fingerprinter), console_(console) {
    }

    RunReason evaluate(const Task &task) const;

    bool should_run(const Task &task) const {
        return evaluate(task) != RunReason::UpToDate;
    }

private:
    bool outputs_missing(const Task &task, bool &failed) const;
    bool outputs_outdated(const Task &task, bool &failed) const;

    const IncrementalCache &cache_;
    const FileResolver &resolver_;
    const Fingerprinter &fingerprinter_;
    Console &console_;
};

} // namespace kiln
