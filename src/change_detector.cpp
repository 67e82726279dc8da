#include "kiln/change_detector.hpp"

#include "kiln/cache.hpp"
#include "kiln/console.hpp"
#include "kiln/file_resolver.hpp"
#include "kiln/fingerprint.hpp"

#include <algorithm>
#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

namespace kiln {

namespace {

std::optional<fs::file_time_type> newest(const std::vector<fs::path> &paths) {
    std::optional<fs::file_time_type> result;
    for (const auto &path : paths) {
        std::error_code ec;
        auto time = fs::last_write_time(path, ec);
        if (ec)
            continue;
        if (!result || time > *result)
            result = time;
    }
    return result;
}

std::optional<fs::file_time_type> oldest(const std::vector<fs::path> &paths) {
    std::optional<fs::file_time_type> result;
    for (const auto &path : paths) {
        std::error_code ec;
        auto time = fs::last_write_time(path, ec);
        if (ec)
            continue;
        if (!result || time < *result)
            result = time;
    }
    return result;
}

} // namespace

std::string_view describe(RunReason reason) {
    switch (reason) {
    case RunReason::NoInputs:
        return "no inputs, always run";
    case RunReason::OutputsMissing:
        return "outputs missing, must run";
    case RunReason::OutputsOutdated:
        return "outputs older than inputs, must run";
    case RunReason::InputsChanged:
        return "input content changed, must run";
    case RunReason::CheckFailed:
        return "could not check inputs, must run";
    case RunReason::UpToDate:
        return "outputs up-to-date, skipping";
    }
    return "";
}

bool ChangeDetector::outputs_missing(const Task &task, bool &failed) const {
    for (const auto &output : task.outputs) {
        auto resolved = resolver_.resolve({output}, false);
        if (!resolved) {
            console_.warn("Could not resolve output '{}' of task '{}': {}", output, task.id,
                          resolved.error().message);
            failed = true;
            return true;
        }
        if (resolved->empty()) {
            return true;
        }
    }
    return false;
}

bool ChangeDetector::outputs_outdated(const Task &task, bool &failed) const {
    if (task.outputs.empty() || task.inputs.empty()) {
        return false;
    }

    auto inputs = resolver_.resolve(task.inputs, false);
    if (!inputs) {
        console_.warn("Could not process inputs for task '{}': {}", task.id, inputs.error().message);
        failed = true;
        return true;
    }
    auto outputs = resolver_.resolve(task.outputs, false);
    if (!outputs) {
        console_.warn("Could not process outputs for task '{}': {}", task.id, outputs.error().message);
        failed = true;
        return true;
    }

    auto newest_input_time = newest(*inputs);
    auto oldest_output_time = oldest(*outputs);
    if (!newest_input_time || !oldest_output_time) {
        return true;
    }
    return *newest_input_time > *oldest_output_time;
}

RunReason ChangeDetector::evaluate(const Task &task) const {
    if (task.inputs.empty()) {
        return RunReason::NoInputs;
    }

    bool failed = false;
    if (outputs_missing(task, failed)) {
        return failed ? RunReason::CheckFailed : RunReason::OutputsMissing;
    }
    if (outputs_outdated(task, failed)) {
        return failed ? RunReason::CheckFailed : RunReason::OutputsOutdated;
    }

    auto fingerprint = fingerprinter_.fingerprint(task.inputs);
    if (!fingerprint) {
        console_.warn("Could not process inputs for task '{}': {}", task.id, fingerprint.error().message);
        return RunReason::CheckFailed;
    }
    if (!cache_.contains(*fingerprint)) {
        return RunReason::InputsChanged;
    }

    return RunReason::UpToDate;
}

} // namespace kiln
