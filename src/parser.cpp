#include "kiln/parser.hpp"

#include "kiln/builder.hpp"
#include "kiln/console.hpp"
#include "kiln/executor.hpp"
#include "kiln/utility.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <unistd.h>

extern char **environ;

namespace kiln {

namespace {

using json = nlohmann::ordered_json;

bool is_identifier_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

void add_builtin_variables(KilnBuilder &builder) {
    for (char **env = environ; env && *env; ++env) {
        std::string_view entry = *env;
        size_t eq = entry.find('=');
        if (eq == std::string_view::npos || eq == 0)
            continue;
        builder.add_variable(std::format("ENV_{}", entry.substr(0, eq)), entry.substr(eq + 1));
    }

    std::error_code ec;
    auto pwd = std::filesystem::current_path(ec);
    if (!ec) {
        builder.add_variable("PWD", pwd.string());
    }
}

std::optional<std::chrono::milliseconds> parse_timeout(const std::string &text, Console &console) {
    auto duration = parse_duration(text);
    if (!duration) {
        console.warn("Invalid timeout format '{}': {}", text, duration.error().message);
        console.warn("Use duration format like '5m', '30s', '1h30m'");
        return std::nullopt;
    }
    return *duration;
}

Result<void> parse_settings(const json &section, KilnBuilder &builder, Console &console) {
    if (!section.is_object()) {
        return fail(ErrorKind::Config, "'config' must be an object");
    }

    auto &settings = builder.settings();
    if (section.contains("default")) {
        settings.default_task = section.at("default").get<std::string>();
    }
    if (section.contains("cache_dir")) {
        settings.cache_dir = section.at("cache_dir").get<std::string>();
    }
    if (section.contains("workers")) {
        // Negative numbers parse as signed integers, so only unsigned values can be valid.
        const auto &value = section.at("workers");
        uint64_t workers = value.is_number_unsigned() ? value.get<uint64_t>() : 0;
        if (workers == 0 || workers > MAX_WORKERS) {
            return fail(ErrorKind::Config,
                        std::format("'workers' must be an integer between 1 and {}", MAX_WORKERS));
        }
        settings.workers = static_cast<size_t>(workers);
    }
    if (section.contains("default_timeout")) {
        settings.default_timeout = parse_timeout(section.at("default_timeout").get<std::string>(), console);
    }
    return {};
}

Result<Task> parse_task(const std::string &key, const json &value, const Variables &variables, Console &console) {
    if (!value.is_object()) {
        return fail(ErrorKind::Config, std::format("task '{}' must be an object", key));
    }
    if (!value.contains("command")) {
        return fail(ErrorKind::Config, std::format("task '{}' is missing 'command'", key));
    }

    Task task;
    task.id = value.value("id", std::string());
    if (task.id.empty()) {
        task.id = key;
    }
    task.command = substitute_variables(value.at("command").get<std::string>(), variables);
    task.dependencies = value.value("dependencies", std::vector<std::string>{});
    task.aliases = value.value("aliases", std::vector<std::string>{});
    task.auto_remove = value.value("auto_remove", false);

    for (const auto &input : value.value("inputs", std::vector<std::string>{})) {
        task.inputs.push_back(substitute_variables(input, variables));
    }
    for (const auto &output : value.value("outputs", std::vector<std::string>{})) {
        task.outputs.push_back(substitute_variables(output, variables));
    }

    if (value.contains("timeout")) {
        task.timeout = parse_timeout(value.at("timeout").get<std::string>(), console);
    }
    return task;
}

} // namespace

std::string substitute_variables(std::string_view text, const Variables &variables) {
    std::string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '$' || i + 1 >= text.size()) {
            result += text[i++];
            continue;
        }

        if (text[i + 1] == '{') {
            size_t close = text.find('}', i + 2);
            if (close != std::string_view::npos) {
                std::string name(text.substr(i + 2, close - (i + 2)));
                bool valid = !name.empty() && is_identifier_start(name[0]) &&
                             std::ranges::all_of(name, is_identifier_char);
                if (valid) {
                    if (auto it = variables.find(name); it != variables.end()) {
                        result += it->second;
                    } else {
                        result.append(text.substr(i, close + 1 - i));
                    }
                    i = close + 1;
                    continue;
                }
            }
        } else if (is_identifier_start(text[i + 1])) {
            size_t end = i + 2;
            while (end < text.size() && is_identifier_char(text[end]))
                end++;
            std::string name(text.substr(i + 1, end - (i + 1)));
            if (auto it = variables.find(name); it != variables.end()) {
                result += it->second;
            } else {
                result.append(text.substr(i, end - i));
            }
            i = end;
            continue;
        }

        result += text[i++];
    }

    return result;
}

Result<void> parse(KilnBuilder &builder, const std::filesystem::path &path, Console &console) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return fail(ErrorKind::Config, std::format("Error reading {}: cannot open file", path.string()));
    }

    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::exception &err) {
        return fail(ErrorKind::Config, std::format("Error parsing {}: {}", path.string(), err.what()));
    }
    if (!doc.is_object()) {
        return fail(ErrorKind::Config, std::format("Error parsing {}: top level must be an object", path.string()));
    }

    try {
        if (doc.contains("config")) {
            if (auto res = parse_settings(doc.at("config"), builder, console); !res)
                return res;
        }

        if (doc.contains("variables")) {
            for (const auto &[key, value] : doc.at("variables").items()) {
                builder.add_variable(key, value.get<std::string>());
            }
        }
        add_builtin_variables(builder);

        if (!doc.contains("task") || !doc.at("task").is_object()) {
            return fail(ErrorKind::Config, std::format("Error parsing {}: missing 'task' table", path.string()));
        }

        for (const auto &[key, value] : doc.at("task").items()) {
            auto task = parse_task(key, value, builder.variables(), console);
            if (!task)
                return std::unexpected(task.error());
            if (auto res = builder.add_task(std::move(*task)); !res)
                return res;
        }
    } catch (const json::exception &err) {
        return fail(ErrorKind::Config, std::format("Error parsing {}: {}", path.string(), err.what()));
    }

    return builder.graph().validate();
}

} // namespace kiln
