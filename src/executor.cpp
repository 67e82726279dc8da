#include "kiln/executor.hpp"

#include "kiln/cache.hpp"
#include "kiln/console.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <format>
#include <mutex>
#include <string>
#include <thread>

namespace fs = std::filesystem;

namespace kiln {

namespace {

size_t resolve_worker_count(size_t jobs) {
    size_t thread_count = jobs;
    if (thread_count == 0)
        thread_count = std::thread::hardware_concurrency();
    if (thread_count == 0)
        thread_count = 1;
    return std::min(thread_count, MAX_WORKERS);
}

} // namespace

std::optional<OutputMode> parse_output_mode(std::string_view text) {
    if (text == "stream")
        return OutputMode::Stream;
    if (text == "group")
        return OutputMode::Group;
    return std::nullopt;
}

TaskRunner::TaskRunner(const TaskGraph &graph, IncrementalCache &cache, CommandRunner &runner, Console &console,
                       ExecutorConfig config)
    : graph(graph), cache(cache), runner(runner), console(console), config(config),
      workers(resolve_worker_count(config.jobs)), resolver(console), fingerprinter(resolver, console),
      detector(cache, resolver, fingerprinter, console), admission(static_cast<std::ptrdiff_t>(workers)) {
}

void TaskRunner::remove_outputs(const Task &task) {
    auto outputs = resolver.resolve(task.outputs, false);
    if (!outputs) {
        console.warn("Cleanup failed for task '{}': {}", task.id, outputs.error().message);
        return;
    }

    for (const auto &output_path : *outputs) {
        std::error_code ec;
        if (fs::is_directory(output_path, ec)) {
            fs::remove_all(output_path, ec);
        } else {
            fs::remove(output_path, ec);
        }

        if (ec) {
            console.warn("Failed to remove '{}': {}", output_path.string(), ec.message());
        } else {
            console.debug("Removed: {}", output_path.string());
        }
    }
}

TaskRunner::TaskResult TaskRunner::execute_task(const Task &task) {
    TaskResult result;

    ExecOptions options;
    options.timeout = task.timeout ? task.timeout : config.default_timeout;
    options.stream = config.output_mode == OutputMode::Stream;

    auto res = runner.run(task.command, options);
    if (!res) {
        if (res.error().kind == ErrorKind::Timeout) {
            result.failure = TaskFailure{task.id, options.timeout ? std::format("timed out after {}", *options.timeout)
                                                                  : std::string("timed out")};
        } else {
            result.failure = TaskFailure{task.id, std::format("failed to execute: {}", res.error().message)};
        }
        return result;
    }

    if (config.output_mode == OutputMode::Group && (!res->out.empty() || !res->err.empty())) {
        console.write(Stream::Out, std::format("==> {}\n{}", task.id, res->out));
        if (!res->err.empty())
            console.write(Stream::Err, res->err);
    }

    if (!res->success()) {
        result.failure = TaskFailure{task.id, std::format("failed with status: {}", res->status)};
        return result;
    }

    if (!task.inputs.empty()) {
        if (auto fingerprint = fingerprinter.fingerprint(task.inputs)) {
            result.fingerprint = std::move(*fingerprint);
        } else {
            console.warn("Could not fingerprint inputs of task '{}': {}", task.id, fingerprint.error().message);
        }
    }

    if ((config.remove_outputs || task.auto_remove) && !task.outputs.empty()) {
        remove_outputs(task);
    }

    return result;
}

RunSummary TaskRunner::run(const std::vector<ExecutionLevel> &levels) {
    RunSummary summary;

    // Levels are checked only once the previous one has finished, so the total grows as we go.
    size_t total_tasks = 0;
    std::atomic<size_t> dispatched_count = 0;

    for (size_t l = 0; l < levels.size(); ++l) {
        const auto &level = levels[l];
        bool level_failed = false;

        std::vector<const Task *> runnable;
        for (const auto &task_id : level.task_ids) {
            const Task *task = graph.find(task_id);
            if (!task) {
                console.error("task {} found in queue but not in graph", task_id);
                summary.failures.push_back({task_id, "not found in graph"});
                level_failed = true;
                continue;
            }

            RunReason reason = detector.evaluate(*task);
            console.debug("Task '{}': {}", task->id, describe(reason));
            if (reason == RunReason::UpToDate) {
                summary.skipped++;
                continue;
            }
            runnable.push_back(task);
        }

        if (config.dry_run) {
            for (const Task *task : runnable) {
                console.info("[DRY RUN] [level {}] {}: {}", level.level, task->id, task->command);
            }
            continue;
        }

        total_tasks += runnable.size();
        std::vector<TaskResult> results(runnable.size());
        std::mutex mtx;
        size_t next_task = 0;

        auto worker = [&]() {
            while (true) {
                size_t idx;
                {
                    std::lock_guard lock(mtx);
                    if (next_task == runnable.size())
                        return;
                    idx = next_task++;
                }

                admission.acquire();
                const Task &task = *runnable[idx];
                console.info("[{}/{}] {}", dispatched_count.fetch_add(1) + 1, total_tasks, task.id);
                results[idx] = execute_task(task);
                admission.release();
            }
        };

        size_t thread_count = std::min(workers, runnable.size());
        for (size_t i = 0; i < thread_count; ++i) {
            pool.emplace_back(worker);
        }
        pool.clear(); // Join all threads; the level is drained.

        for (auto &result : results) {
            summary.executed++;
            if (result.failure) {
                level_failed = true;
                console.error("Task '{}' {}", result.failure->task_id, result.failure->reason);
                summary.failures.push_back(std::move(*result.failure));
            } else if (result.fingerprint && cache.insert(std::move(*result.fingerprint))) {
                summary.cache_changed = true;
            }
        }

        if (level_failed && l + 1 < levels.size()) {
            if (!config.continue_on_failure) {
                summary.aborted = true;
                break;
            }
            console.warn("Continuing with the next level despite failures");
        }
    }

    return summary;
}

void TaskRunner::emit_graph(const std::vector<std::string> &task_ids) {
    console.info("digraph kiln {{");
    console.info("  rankdir=LR;");
    console.info("  node [shape=box, style=filled, fontname=\"Helvetica\"];");

    for (const auto &task_id : task_ids) {
        const Task *task = graph.find(task_id);
        if (!task)
            continue;
        const char *color = detector.should_run(*task) ? "green" : "white";
        console.info("  \"{}\" [fillcolor=\"{}\"];", task->id, color);
    }
    for (const auto &task_id : task_ids) {
        const Task *task = graph.find(task_id);
        if (!task)
            continue;
        for (const auto &dep_id : task->dependencies) {
            console.info("  \"{}\" -> \"{}\";", dep_id, task->id);
        }
    }
    console.info("}}");
}

} // namespace kiln
