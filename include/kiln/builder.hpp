#pragma once

#include "kiln/domain.hpp"
#include "kiln/graph.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace kiln {

/** @brief Global section of the configuration file. */
struct Settings {
    std::optional<std::string> default_task;
    std::optional<std::string> cache_dir;
    std::optional<size_t> workers;
    std::optional<std::chrono::milliseconds> default_timeout;
};

/**
 * @brief Facade used by the configuration parser to populate the task graph.
 *
 * Holds the substitution variables and global settings alongside the graph until
 * the graph is handed over to execution.
 */
class KilnBuilder {
public:
    /**
     * @brief Adds a task to the underlying graph.
     * @param task The task to add; its id must already be set.
     * @return Success or a Dependency error for a duplicate id.
     */
    Result<void> add_task(Task &&task);

    const TaskGraph &graph() const {
        return graph_;
    }

    /**
     * @brief Returns the built graph by moving it out of the builder.
     * @return The completed `TaskGraph`.
     */
    TaskGraph &&emit_graph() {
        return std::move(graph_);
    }

    /** @brief Adds or replaces a substitution variable. */
    void add_variable(std::string_view key, std::string_view value) {
        variables_.insert_or_assign(std::string(key), std::string(value));
    }

    const Variables &variables() const {
        return variables_;
    }

    Settings &settings() {
        return settings_;
    }
    const Settings &settings() const {
        return settings_;
    }

private:
    TaskGraph graph_;
    Variables variables_;
    Settings settings_;
};

} // namespace kiln
