#pragma once

#include "kiln/builder.hpp"
#include "kiln/domain.hpp"
#include "kiln/utility.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace kiln {

class Console;

/**
 * @brief Parses a JSON task file.
 *
 * Populates the builder with global settings, variables (the file's own, every
 * environment variable as ENV_<NAME>, and PWD) and tasks with variables already
 * substituted, then validates the resulting graph.
 *
 * @param builder The builder to populate.
 * @param path The configuration file (typically "kiln.json").
 * @param console Receives warnings about ignored values.
 * @return Success, a Config error for unreadable or malformed input, or a Dependency
 *         error if the graph does not validate.
 */
Result<void> parse(KilnBuilder &builder, const std::filesystem::path &path, Console &console);

/**
 * @brief Expands `${NAME}` and `$NAME` references; unknown names are left verbatim.
 */
std::string substitute_variables(std::string_view text, const Variables &variables);

} // namespace kiln
