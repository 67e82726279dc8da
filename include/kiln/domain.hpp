#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kiln {

struct Task {
    std::string id;
    std::string command;
    std::vector<std::string> dependencies;
    std::vector<std::string> aliases;
    std::vector<std::string> inputs;  // literal paths or glob patterns
    std::vector<std::string> outputs; // literal paths or glob patterns
    bool auto_remove = false;
    std::optional<std::chrono::milliseconds> timeout = std::nullopt;
};

struct ExecutionLevel {
    size_t level = 0;
    std::vector<std::string> task_ids;
};

using Variables = std::unordered_map<std::string, std::string>;

} // namespace kiln
