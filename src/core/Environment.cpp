#include "pagesrestore/core/Environment.hpp"

#include "pagesrestore/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <system_error>
#include <utility>

namespace pagesrestore {

namespace {

std::string to_lower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lowered;
}

void apply_string(const EnvironmentLookup& lookup, std::string_view name, std::string& field) {
    if (auto value = lookup(name); value && !value->empty()) {
        field = std::move(*value);
    }
}

void apply_bool(const EnvironmentLookup& lookup, std::string_view name, bool& field) {
    const auto value = lookup(name);
    if (!value || value->empty()) {
        return;
    }
    if (!parse_bool_text(*value, field)) {
        throw_config_error("E_CONFIG_VALUE",
                           std::string(name) + " must be true or false, got '" + *value + "'");
    }
}

void apply_count(const EnvironmentLookup& lookup, std::string_view name, std::size_t& field) {
    const auto value = lookup(name);
    if (!value || value->empty()) {
        return;
    }
    if (!parse_count_text(*value, field)) {
        throw_config_error("E_CONFIG_VALUE",
                           std::string(name) + " must be a non-negative integer, got '" + *value + "'");
    }
}

}  // namespace

EnvironmentLookup process_environment() {
    return [](std::string_view name) -> std::optional<std::string> {
        const std::string key(name);
        if (const char* value = std::getenv(key.c_str())) {
            return std::string(value);
        }
        return std::nullopt;
    };
}

Config load_config(const EnvironmentLookup& lookup) {
    Config config{};
    apply_string(lookup, "RESTORE_DATA_DIR", config.data_dir);
    apply_string(lookup, "RESTORE_SNAPSHOT", config.snapshot);
    apply_string(lookup, "RESTORE_REMOTE_DATA_DIR", config.remote_data_dir);
    apply_bool(lookup, "RESTORE_CLUSTER", config.cluster);
    if (const auto options = lookup("RESTORE_EXTRA_SSH_OPTS")) {
        config.extra_ssh_options = split_words(*options);
    }
    apply_string(lookup, "RESTORE_SSH", config.ssh_program);
    apply_string(lookup, "RESTORE_RSYNC", config.rsync_program);
    apply_string(lookup, "RESTORE_ROUTE_COMMAND", config.route_command);
    apply_string(lookup, "RESTORE_FINALIZE_COMMAND", config.finalize_command);
    apply_string(lookup, "RESTORE_NODES_COMMAND", config.cluster_nodes_command);
    apply_string(lookup, "RESTORE_STORAGE_USER", config.storage_user);
    apply_count(lookup, "RESTORE_TRANSFER_PARALLEL", config.transfer_parallelism);
    apply_count(lookup, "RESTORE_FINALIZE_PARALLEL", config.finalize_parallelism);
    apply_bool(lookup, "RESTORE_VERBOSE", config.verbose);
    return config;
}

void validate_config(const Config& config) {
    if (config.snapshot.empty() || config.snapshot.find('/') != std::string::npos || config.snapshot == "." ||
        config.snapshot == "..") {
        throw_config_error("E_CONFIG_VALUE", "Snapshot label must be a single directory name: '" + config.snapshot + "'");
    }
    if (config.data_dir.empty()) {
        throw_config_error("E_CONFIG_VALUE", "Data directory cannot be empty");
    }
    if (config.remote_data_dir.empty() || config.remote_data_dir.front() != '/') {
        throw_config_error("E_CONFIG_VALUE",
                           "Remote data directory must be an absolute path: '" + config.remote_data_dir + "'");
    }
    if (config.finalize_chunk_size == 0) {
        throw_config_error("E_CONFIG_VALUE", "Finalize chunk size must be positive");
    }
}

bool parse_bool_text(std::string_view text, bool& value) {
    const auto lowered = to_lower(text);
    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
        value = true;
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
        value = false;
        return true;
    }
    return false;
}

bool parse_count_text(std::string_view text, std::size_t& value) {
    if (text.empty()) {
        return false;
    }
    std::size_t parsed = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, parsed);
    if (ec != std::errc{} || ptr != end) {
        return false;
    }
    value = parsed;
    return true;
}

std::vector<std::string> split_words(std::string_view text) {
    std::vector<std::string> words;
    std::size_t index = 0;
    while (index < text.size()) {
        while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) != 0) {
            ++index;
        }
        const auto start = index;
        while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) == 0) {
            ++index;
        }
        if (index > start) {
            words.emplace_back(text.substr(start, index - start));
        }
    }
    return words;
}

}  // namespace pagesrestore
