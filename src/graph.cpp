#include "kiln/graph.hpp"

#include "kiln/console.hpp"
#include "kiln/file_resolver.hpp"
#include "kiln/utility.hpp"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <format>
#include <unordered_set>

namespace kiln {

namespace {

bool paths_match(std::string_view output, std::string_view input) {
    if (output == input) {
        return true;
    }

    if (is_glob_pattern(input) && glob_match(input, output)) {
        return true;
    }

    if (size_t pos = input.find("**"); pos != std::string_view::npos) {
        std::string_view prefix = input.substr(0, pos);
        if (!prefix.empty() && output.starts_with(prefix)) {
            return true;
        }
    }

    return false;
}

bool has_file_relationship(const Task &task, const Task &dependency) {
    if (dependency.outputs.empty() || task.inputs.empty()) {
        return false;
    }

    for (const auto &dep_output : dependency.outputs) {
        for (const auto &task_input : task.inputs) {
            if (paths_match(dep_output, task_input)) {
                return true;
            }
        }
    }
    return false;
}

} // namespace

Result<size_t> TaskGraph::add_task(Task task) {
    if (task.id.empty()) {
        return fail(ErrorKind::Dependency, "Task with an empty id");
    }
    if (index_.contains(task.id)) {
        return fail(ErrorKind::Dependency, std::format("Task '{}' is defined more than once", task.id));
    }

    size_t id = tasks_.size();
    index_.emplace(task.id, id);
    tasks_.push_back(std::move(task));
    return id;
}

const Task *TaskGraph::find(std::string_view id) const {
    if (auto it = index_.find(std::string(id)); it != index_.end()) {
        return &tasks_[it->second];
    }
    return nullptr;
}

std::optional<std::string> TaskGraph::resolve(std::string_view target) const {
    if (find(target)) {
        return std::string(target);
    }
    for (const auto &task : tasks_) {
        if (std::ranges::find(task.aliases, target) != task.aliases.end()) {
            return task.id;
        }
    }
    return std::nullopt;
}

Result<void> TaskGraph::validate() const {
    std::unordered_map<std::string_view, std::string_view> alias_owner;

    for (const auto &task : tasks_) {
        for (const auto &dep_id : task.dependencies) {
            if (dep_id == task.id) {
                return fail(ErrorKind::Dependency, std::format("Task '{}' depends on itself", task.id));
            }
            if (!index_.contains(dep_id)) {
                return fail(ErrorKind::Dependency,
                            std::format("Task '{}' depends on '{}' which doesn't exist", task.id, dep_id));
            }
        }

        for (const auto &alias : task.aliases) {
            if (index_.contains(alias)) {
                return fail(ErrorKind::Dependency,
                            std::format("Task '{}' defines alias '{}' which conflicts with task ID '{}'", task.id,
                                        alias, alias));
            }
            if (auto it = alias_owner.find(alias); it != alias_owner.end()) {
                if (it->second == task.id) {
                    continue;
                }
                return fail(ErrorKind::Dependency,
                            std::format("Task '{}' defines alias '{}' which is already used by task '{}'", task.id,
                                        alias, it->second));
            }
            alias_owner.emplace(alias, task.id);
        }
    }

    // Iterative DFS; `path` mirrors the frames currently on the stack.
    enum class MARK : uint8_t { UNVISITED, ON_PATH, CLEARED };

    std::vector<MARK> marks(tasks_.size(), MARK::UNVISITED);
    std::vector<std::pair<size_t, size_t>> stack; // task index, next dependency to look at
    std::vector<std::string_view> path;

    for (size_t root = 0; root < tasks_.size(); ++root) {
        if (marks[root] != MARK::UNVISITED)
            continue;

        marks[root] = MARK::ON_PATH;
        stack.emplace_back(root, 0);
        path.push_back(tasks_[root].id);

        while (!stack.empty()) {
            auto &[u, next] = stack.back();
            const auto &deps = tasks_[u].dependencies;

            if (next == deps.size()) {
                marks[u] = MARK::CLEARED;
                path.pop_back();
                stack.pop_back();
                continue;
            }

            size_t v = index_.at(deps[next++]);
            if (marks[v] == MARK::ON_PATH) {
                std::string report;
                for (auto id : path) {
                    report += id;
                    report += " -> ";
                }
                report += tasks_[v].id;
                return fail(ErrorKind::Dependency, std::format("Circular dependency: {}", report));
            }
            if (marks[v] == MARK::UNVISITED) {
                marks[v] = MARK::ON_PATH;
                path.push_back(tasks_[v].id);
                stack.emplace_back(v, 0);
            }
        }
    }

    return {};
}

std::vector<std::string> TaskGraph::sort_subset(const std::vector<bool> &selected) const {
    std::vector<size_t> in_degrees(tasks_.size(), 0);
    std::vector<std::vector<size_t>> dependents(tasks_.size());

    for (size_t i = 0; i < tasks_.size(); ++i) {
        if (!selected[i])
            continue;
        for (const auto &dep_id : tasks_[i].dependencies) {
            auto it = index_.find(dep_id);
            if (it == index_.end() || !selected[it->second])
                continue;
            in_degrees[i]++;
            dependents[it->second].push_back(i);
        }
    }

    std::deque<size_t> ready_queue;
    for (size_t i = 0; i < tasks_.size(); ++i) {
        if (selected[i] && in_degrees[i] == 0) {
            ready_queue.push_back(i);
        }
    }

    std::vector<std::string> order;
    while (!ready_queue.empty()) {
        size_t u = ready_queue.front();
        ready_queue.pop_front();
        order.push_back(tasks_[u].id);

        for (size_t dependent : dependents[u]) {
            if (--in_degrees[dependent] == 0) {
                ready_queue.push_back(dependent);
            }
        }
    }

    return order;
}

std::vector<std::string> TaskGraph::sort_topologically() const {
    return sort_subset(std::vector<bool>(tasks_.size(), true));
}

Result<std::vector<std::string>> TaskGraph::get_required_tasks(std::string_view target) const {
    auto resolved = resolve(target);
    if (!resolved) {
        return fail(ErrorKind::TaskNotFound, std::format("Task '{}' not found", target));
    }

    std::vector<bool> needed(tasks_.size(), false);
    std::deque<size_t> queue;
    queue.push_back(index_.at(*resolved));

    while (!queue.empty()) {
        size_t u = queue.front();
        queue.pop_front();
        if (needed[u])
            continue;
        needed[u] = true;

        for (const auto &dep_id : tasks_[u].dependencies) {
            if (auto it = index_.find(dep_id); it != index_.end() && !needed[it->second]) {
                queue.push_back(it->second);
            }
        }
    }

    return sort_subset(needed);
}

std::vector<ExecutionLevel> TaskGraph::calculate_dependency_levels(const std::vector<std::string> &task_ids) const {
    std::vector<bool> selected(tasks_.size(), false);
    for (const auto &id : task_ids) {
        if (auto it = index_.find(id); it != index_.end()) {
            selected[it->second] = true;
        }
    }

    constexpr size_t UNSET = static_cast<size_t>(-1);
    std::vector<size_t> levels(tasks_.size(), UNSET);
    std::vector<bool> visiting(tasks_.size(), false);
    std::vector<size_t> stack;

    for (size_t root = 0; root < tasks_.size(); ++root) {
        if (!selected[root] || levels[root] != UNSET)
            continue;

        stack.push_back(root);
        while (!stack.empty()) {
            size_t u = stack.back();
            if (levels[u] != UNSET) {
                stack.pop_back();
                continue;
            }
            visiting[u] = true;

            bool ready = true;
            size_t level = 0;
            for (const auto &dep_id : tasks_[u].dependencies) {
                auto it = index_.find(dep_id);
                if (it == index_.end() || !selected[it->second])
                    continue;
                size_t d = it->second;
                if (levels[d] != UNSET) {
                    level = std::max(level, levels[d] + 1);
                } else if (!visiting[d]) { // a visiting dependency means a cycle; validate() rejects those
                    stack.push_back(d);
                    ready = false;
                }
            }

            if (ready) {
                levels[u] = level;
                visiting[u] = false;
                stack.pop_back();
            }
        }
    }

    std::vector<ExecutionLevel> result;
    for (size_t i = 0; i < tasks_.size(); ++i) {
        if (!selected[i])
            continue;
        if (levels[i] >= result.size()) {
            result.resize(levels[i] + 1);
        }
        result[levels[i]].task_ids.push_back(tasks_[i].id);
    }
    for (size_t l = 0; l < result.size(); ++l) {
        result[l].level = l;
    }
    std::erase_if(result, [](const ExecutionLevel &level) { return level.task_ids.empty(); });

    return result;
}

void TaskGraph::show_task_relationships(Console &console) const {
    if (!console.verbose()) {
        return;
    }

    for (const auto &task : tasks_) {
        for (const auto &dep_id : task.dependencies) {
            const Task *dep_task = find(dep_id);
            if (dep_task && !has_file_relationship(task, *dep_task)) {
                console.info("Info: Task '{}' depends on '{}' for ordering only", task.id, dep_id);
            }
        }
    }
}

} // namespace kiln
