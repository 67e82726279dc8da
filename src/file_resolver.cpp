#include "kiln/file_resolver.hpp"

#include "kiln/console.hpp"
#include "kiln/utility.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

namespace kiln {

namespace {

std::vector<std::string_view> split_components(std::string_view path) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string_view::npos)
            slash = path.size();
        if (slash > start)
            parts.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return parts;
}

// Matches `[...]` at pattern[pos] against c. Returns the position after the class,
// or npos if the class is malformed.
size_t match_class(std::string_view pattern, size_t pos, char c, bool &matched) {
    size_t i = pos + 1;
    bool negate = false;
    if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
        negate = true;
        i++;
    }

    bool found = false;
    bool first = true;
    while (i < pattern.size() && (first || pattern[i] != ']')) {
        first = false;
        char lo = pattern[i];
        if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
            char hi = pattern[i + 2];
            if (lo <= c && c <= hi)
                found = true;
            i += 3;
        } else {
            if (lo == c)
                found = true;
            i++;
        }
    }
    if (i >= pattern.size())
        return std::string_view::npos;

    matched = found != negate;
    return i + 1;
}

bool match_component(std::string_view pattern, std::string_view name) {
    size_t p = 0;
    size_t n = 0;
    size_t star_p = std::string_view::npos;
    size_t star_n = 0;

    while (n < name.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star_p = p++;
            star_n = n;
            continue;
        }
        if (p < pattern.size()) {
            bool matched = false;
            size_t next = p + 1;
            if (pattern[p] == '?') {
                matched = true;
            } else if (pattern[p] == '[') {
                next = match_class(pattern, p, name[n], matched);
                if (next == std::string_view::npos)
                    return false;
            } else {
                matched = pattern[p] == name[n];
            }
            if (matched) {
                p = next;
                n++;
                continue;
            }
        }
        if (star_p == std::string_view::npos)
            return false;
        p = star_p + 1;
        n = ++star_n;
    }

    while (p < pattern.size() && pattern[p] == '*')
        p++;
    return p == pattern.size();
}

bool match_components(const std::vector<std::string_view> &pattern, const std::vector<std::string_view> &parts) {
    size_t p = 0;
    size_t s = 0;
    size_t star_p = std::string_view::npos;
    size_t star_s = 0;

    while (s < parts.size()) {
        if (p < pattern.size() && pattern[p] == "**") {
            star_p = p++;
            star_s = s;
        } else if (p < pattern.size() && match_component(pattern[p], parts[s])) {
            p++;
            s++;
        } else if (star_p != std::string_view::npos) {
            p = star_p + 1;
            s = ++star_s;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == "**")
        p++;
    return p == pattern.size();
}

Result<void> check_pattern(std::string_view pattern) {
    for (auto component : split_components(pattern)) {
        if (component != "**" && component.find("**") != std::string_view::npos) {
            return fail(ErrorKind::File,
                        std::format("Invalid glob pattern '{}': '**' must form a whole path component", pattern));
        }
        for (size_t i = 0; i < component.size(); ++i) {
            if (component[i] != '[')
                continue;
            bool ignored = false;
            size_t next = match_class(component, i, '\0', ignored);
            if (next == std::string_view::npos) {
                return fail(ErrorKind::File, std::format("Invalid glob pattern '{}': unterminated '['", pattern));
            }
            i = next - 1;
        }
    }
    return {};
}

std::string join(const std::string &prefix, std::string_view name) {
    if (prefix.empty())
        return std::string(name);
    if (prefix.back() == '/')
        return prefix + std::string(name);
    return prefix + "/" + std::string(name);
}

} // namespace

bool is_glob_pattern(std::string_view pattern) {
    return pattern.find_first_of("*?[") != std::string_view::npos;
}

bool glob_match(std::string_view pattern, std::string_view path) {
    return match_components(split_components(pattern), split_components(path));
}

Result<std::vector<fs::path>> FileResolver::expand_glob(std::string_view pattern) const {
    if (auto res = check_pattern(pattern); !res) {
        return std::unexpected(res.error());
    }

    const std::vector<std::string_view> components = split_components(pattern);

    // Longest literal prefix is the directory the walk starts from.
    std::string base = pattern.starts_with('/') ? "/" : "";
    size_t first_glob = 0;
    while (first_glob < components.size() && !is_glob_pattern(components[first_glob])) {
        base = join(base, components[first_glob]);
        first_glob++;
    }
    const std::vector<std::string_view> rest(components.begin() + first_glob, components.end());

    std::vector<fs::path> matches;
    std::error_code ec;

    std::vector<std::pair<std::string, size_t>> stack; // path so far, next pattern component
    stack.emplace_back(base, 0);

    while (!stack.empty()) {
        auto [current, idx] = std::move(stack.back());
        stack.pop_back();

        const fs::path current_path = current.empty() ? fs::path(".") : fs::path(current);

        if (idx == rest.size()) {
            if (!current.empty() && fs::is_regular_file(current_path, ec)) {
                matches.emplace_back(current);
            }
            continue;
        }

        if (!fs::is_directory(current_path, ec)) {
            if (rest[idx] == "**")
                stack.emplace_back(current, idx + 1);
            continue;
        }

        const std::string_view component = rest[idx];
        if (component == "**") {
            stack.emplace_back(current, idx + 1);
        }

        fs::directory_iterator it(current_path, ec);
        if (ec) {
            return fail(ErrorKind::File,
                        std::format("Failed to expand glob '{}': {}: {}", pattern, current_path.string(), ec.message()));
        }
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            const auto &entry = *it;
            const std::string name = entry.path().filename().string();

            if (component == "**") {
                std::error_code type_ec;
                if (entry.is_symlink(type_ec) && entry.is_directory(type_ec))
                    continue; // don't follow directory links while recursing
                stack.emplace_back(join(current, name), idx);
            } else if (match_component(component, name)) {
                stack.emplace_back(join(current, name), idx + 1);
            }
        }
        if (ec) {
            return fail(ErrorKind::File,
                        std::format("Failed to expand glob '{}': {}: {}", pattern, current_path.string(), ec.message()));
        }
    }

    std::ranges::sort(matches);
    auto [first, last] = std::ranges::unique(matches);
    matches.erase(first, last);
    return matches;
}

Result<std::vector<fs::path>> FileResolver::resolve(const std::vector<std::string> &patterns,
                                                    bool warn_missing) const {
    std::vector<fs::path> result;
    std::unordered_set<std::string> seen;

    for (const auto &pattern : patterns) {
        if (is_glob_pattern(pattern)) {
            auto expanded = expand_glob(pattern);
            if (!expanded) {
                return std::unexpected(expanded.error());
            }
            for (auto &path : *expanded) {
                if (seen.insert(path.string()).second) {
                    result.push_back(std::move(path));
                }
            }
        } else {
            std::error_code ec;
            if (fs::exists(pattern, ec)) {
                if (seen.insert(pattern).second) {
                    result.emplace_back(pattern);
                }
            } else if (warn_missing) {
                console_.warn("Input file '{}' does not exist", pattern);
            }
        }
    }

    return result;
}

} // namespace kiln
