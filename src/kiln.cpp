#include "kiln/builder.hpp"
#include "kiln/cache.hpp"
#include "kiln/console.hpp"
#include "kiln/executor.hpp"
#include "kiln/parser.hpp"
#include "kiln/process_exec.hpp"

#include <charconv>
#include <cstring>
#include <filesystem>
#include <optional>
#include <print>
#include <string>
#include <vector>

namespace {

void print_help() {
    std::println("Usage: kiln [options] [task]");
    std::println("Options:");
    std::println("  -h, --help               Show this help message");
    std::println("  --version                Show version");
    std::println("  -d <dir>                 Change working directory before doing anything");
    std::println("  -f, --file <file>        Use <file> as the task file (default: kiln.json)");
    std::println("  -v, --verbose            Explain every run/skip decision");
    std::println("  -j, --workers <N>        Maximum number of tasks running at once (default: auto)");
    std::println("  -t, --timeout <dur>      Timeout for tasks without their own, e.g. 30s, 5m, 1h30m");
    std::println("  --rm                     Remove outputs after each successful task");
    std::println("  --dry-run                Print commands without executing them");
    std::println("  --continue-on-failure    Keep running later levels after a task fails");
    std::println("  --output <stream|group>  Live output or one block per task (default: group)");
    std::println("  --graph                  Generate DOT graph of the selected tasks");
}

void print_version() {
    std::println("kiln {}", KILN_PROJ_VER);
}

struct Options {
    std::string file = "kiln.json";
    std::filesystem::path work_dir = ".";
    bool verbose = false;
    bool graph = false;
    std::optional<size_t> workers;
    std::optional<std::string> timeout;
    std::optional<std::string> target;
    kiln::ExecutorConfig config;
};

std::optional<std::vector<std::string>> determine_tasks_to_run(const kiln::TaskGraph &graph,
                                                               const std::optional<std::string> &target,
                                                               const std::optional<std::string> &default_task,
                                                               kiln::Console &console) {
    if (target) {
        auto res = graph.get_required_tasks(*target);
        if (!res) {
            console.error("{}", res.error().what());
            return std::nullopt;
        }
        return *res;
    }
    if (default_task) {
        auto res = graph.get_required_tasks(*default_task);
        if (!res) {
            console.error("Error with default task '{}': {}", *default_task, res.error().what());
            return std::nullopt;
        }
        return *res;
    }
    return graph.sort_topologically();
}

} // namespace

int main(const int argc, const char *const *argv) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto next_value = [&]() -> const char * {
            if (i + 1 < argc)
                return argv[++i];
            std::println(stderr, "Missing argument for {}", arg);
            return nullptr;
        };

        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "-d") {
            const char *value = next_value();
            if (!value)
                return 1;
            opts.work_dir = value;
        } else if (arg == "-f" || arg == "--file") {
            const char *value = next_value();
            if (!value)
                return 1;
            opts.file = value;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--rm") {
            opts.config.remove_outputs = true;
        } else if (arg == "--dry-run") {
            opts.config.dry_run = true;
        } else if (arg == "--continue-on-failure") {
            opts.config.continue_on_failure = true;
        } else if (arg == "--graph") {
            opts.graph = true;
        } else if (arg == "-j" || arg == "--workers") {
            const char *value = next_value();
            if (!value)
                return 1;
            size_t workers = 0;
            auto res = std::from_chars(value, value + strlen(value), workers);
            if (res.ec != std::errc() || *res.ptr != '\0' || workers == 0 || workers > kiln::MAX_WORKERS) {
                std::println(stderr, "Invalid worker count: {}", value);
                return 1;
            }
            opts.workers = workers;
        } else if (arg == "-t" || arg == "--timeout") {
            const char *value = next_value();
            if (!value)
                return 1;
            opts.timeout = value;
        } else if (arg == "--output") {
            const char *value = next_value();
            if (!value)
                return 1;
            auto mode = kiln::parse_output_mode(value);
            if (!mode) {
                std::println(stderr, "Invalid output mode: {} (expected stream or group)", value);
                return 1;
            }
            opts.config.output_mode = *mode;
        } else if (!arg.starts_with("-") && !opts.target) {
            opts.target = std::string(arg);
        } else {
            std::println(stderr, "Unknown argument: {}", arg);
            print_help();
            return 1;
        }
    }

    if (opts.work_dir != ".") {
        std::error_code ec;
        std::filesystem::current_path(opts.work_dir, ec);
        if (ec) {
            std::println(stderr, "Failed to change directory to {}: {}", opts.work_dir.string(), ec.message());
            return 1;
        }
    }

    kiln::TerminalConsole console(opts.verbose);

    kiln::KilnBuilder builder;
    if (auto res = kiln::parse(builder, opts.file, console); !res) {
        console.error("{}", res.error().what());
        return 1;
    }

    const kiln::Settings settings = builder.settings();
    kiln::TaskGraph graph = builder.emit_graph();

    graph.show_task_relationships(console);

    const std::filesystem::path cache_file = kiln::cache_path(settings.cache_dir, opts.file);
    kiln::IncrementalCache cache = kiln::IncrementalCache::load(cache_file, console);

    auto task_ids = determine_tasks_to_run(graph, opts.target, settings.default_task, console);
    if (!task_ids) {
        return 1;
    }

    opts.config.jobs = opts.workers.value_or(settings.workers.value_or(0));
    opts.config.default_timeout = settings.default_timeout;
    if (opts.timeout) {
        auto duration = kiln::parse_duration(*opts.timeout);
        if (!duration) {
            console.error("Invalid timeout '{}': {}", *opts.timeout, duration.error().message);
            return 1;
        }
        opts.config.default_timeout = *duration;
    }

    kiln::ShellRunner shell(console);
    kiln::TaskRunner runner(graph, cache, shell, console, opts.config);

    if (opts.graph) {
        runner.emit_graph(*task_ids);
        return 0;
    }

    kiln::RunSummary summary = runner.run(graph.calculate_dependency_levels(*task_ids));

    if (summary.cache_changed) {
        if (!cache.save(cache_file, console))
            console.debug("Cache not saved, the next run will repeat this work.");
    } else {
        console.debug("No changes detected, cache not saved.");
    }

    if (!summary.ok()) {
        console.error("{} task(s) failed{}", summary.failures.size(),
                      summary.aborted ? "; remaining levels were skipped" : "");
        return 1;
    }
    return 0;
}
