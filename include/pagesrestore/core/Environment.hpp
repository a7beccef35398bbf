#pragma once

#include "pagesrestore/Config.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pagesrestore {

using EnvironmentLookup = std::function<std::optional<std::string>(std::string_view)>;

// Reads the real process environment. Only main() should use this.
EnvironmentLookup process_environment();

// Builds the run configuration from RESTORE_* variables on top of the
// defaults. Throws ConfigError (E_CONFIG_VALUE) for unparsable values.
Config load_config(const EnvironmentLookup& lookup);

// Checks values that may come from either the environment or the command
// line. Throws ConfigError (E_CONFIG_VALUE).
void validate_config(const Config& config);

bool parse_bool_text(std::string_view text, bool& value);
bool parse_count_text(std::string_view text, std::size_t& value);
std::vector<std::string> split_words(std::string_view text);

}  // namespace pagesrestore
