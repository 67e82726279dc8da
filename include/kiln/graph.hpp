#pragma once

#include "kiln/domain.hpp"
#include "kiln/utility.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kiln {

class Console;

/**
 * @brief Owns the task records of a run and answers ordering questions about them.
 *
 * Tasks are kept in declaration order; every ordering the graph produces is derived
 * from that order so results do not depend on hash-map iteration.
 */
class TaskGraph {
public:
    /**
     * @brief Adds a task to the graph.
     * @param task The task to add. An empty id is an error; ids default to their
     *             declaration key before reaching the graph.
     * @return The index of the added task, or a Dependency error if the id is already taken.
     */
    Result<size_t> add_task(Task task);

    /**
     * @brief Checks dependency existence, self-dependency, alias collisions and cycles.
     *
     * Aliases are checked eagerly so that target resolution can never be ambiguous.
     * A cycle is reported as the active traversal path plus the closing node,
     * e.g. "Circular dependency: a -> b -> a".
     */
    Result<void> validate() const;

    /**
     * @brief Kahn's algorithm over every task in the graph.
     * @return Task ids, each after all of its dependencies.
     */
    std::vector<std::string> sort_topologically() const;

    /**
     * @brief Resolves a task id or alias and collects its dependency closure.
     * @param target Task id or alias.
     * @return The closure in topological order, or TaskNotFound.
     */
    Result<std::vector<std::string>> get_required_tasks(std::string_view target) const;

    /**
     * @brief Groups the given tasks by dependency level.
     *
     * level(t) is 0 without dependencies, else 1 + the maximum level of its dependencies.
     * Only dependencies inside `task_ids` are considered.
     *
     * @return Levels in ascending order; ids within a level keep declaration order.
     */
    std::vector<ExecutionLevel> calculate_dependency_levels(const std::vector<std::string> &task_ids) const;

    /** @brief Looks up a task by id (not alias). */
    const Task *find(std::string_view id) const;

    /** @brief Maps an id or alias to the canonical task id. */
    std::optional<std::string> resolve(std::string_view target) const;

    const std::vector<Task> &tasks() const {
        return tasks_;
    }

    /**
     * @brief Reports dependency edges that carry no file relationship.
     *
     * An edge t -> d is "ordering only" when none of d's outputs matches any of t's inputs.
     * Only prints in verbose mode.
     */
    void show_task_relationships(Console &console) const;

private:
    std::vector<std::string> sort_subset(const std::vector<bool> &selected) const;

    std::vector<Task> tasks_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace kiln
