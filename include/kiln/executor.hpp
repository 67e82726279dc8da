#pragma once

#include "kiln/change_detector.hpp"
#include "kiln/domain.hpp"
#include "kiln/file_resolver.hpp"
#include "kiln/fingerprint.hpp"
#include "kiln/graph.hpp"
#include "kiln/process_exec.hpp"

#include <chrono>
#include <optional>
#include <semaphore>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace kiln {

class Console;
class IncrementalCache;

enum class OutputMode {
    Stream, ///< Echo task output live.
    Group,  ///< Print each task's output as one block after it completes.
};

std::optional<OutputMode> parse_output_mode(std::string_view text);

/** @brief Largest worker count the admission semaphore can represent. */
inline constexpr size_t MAX_WORKERS = static_cast<size_t>(std::counting_semaphore<>::max());

struct ExecutorConfig {
    bool dry_run = false;
    bool remove_outputs = false;
    bool continue_on_failure = false;
    size_t jobs = 0; // 0 means auto-detect; capped at MAX_WORKERS
    std::optional<std::chrono::milliseconds> default_timeout = std::nullopt;
    OutputMode output_mode = OutputMode::Group;
};

struct TaskFailure {
    std::string task_id;
    std::string reason;
};

struct RunSummary {
    bool cache_changed = false;
    size_t executed = 0;
    size_t skipped = 0;
    std::vector<TaskFailure> failures;
    bool aborted = false; ///< Later levels were abandoned after a failure.

    bool ok() const {
        return failures.empty();
    }
};

/**
 * @brief Level-by-level scheduler.
 *
 * Every level drains completely before the next one is dispatched. At most
 * `worker_count()` tasks are in flight at any moment over the whole run. The cache
 * is only touched from the calling thread, after a level's results are collected.
 */
class TaskRunner {
public:
    TaskRunner(const TaskGraph &graph, IncrementalCache &cache, CommandRunner &runner, Console &console,
               ExecutorConfig config = {});

    /**
     * @brief Runs the given levels in ascending order.
     *
     * A failing task never cancels its siblings. Unless continue_on_failure is set,
     * levels after the first failing one are not attempted.
     */
    RunSummary run(const std::vector<ExecutionLevel> &levels);

    /** @brief Prints the selected tasks as a Graphviz digraph; tasks that must run are green. */
    void emit_graph(const std::vector<std::string> &task_ids);

    size_t worker_count() const {
        return workers;
    }

private:
    struct TaskResult {
        std::optional<std::string> fingerprint;
        std::optional<TaskFailure> failure;
    };

    TaskResult execute_task(const Task &task);
    void remove_outputs(const Task &task);

    const TaskGraph &graph;
    IncrementalCache &cache;
    CommandRunner &runner;
    Console &console;
    ExecutorConfig config;
    size_t workers;

    FileResolver resolver;
    Fingerprinter fingerprinter;
    ChangeDetector detector;

    std::counting_semaphore<> admission;
    std::vector<std::jthread> pool;
};

} // namespace kiln
