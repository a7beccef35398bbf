#pragma once

#include <exception>
#include <string>
#include <string_view>

namespace pagesrestore {

enum class Phase {
    Scratch,
    Enumerate,
    Resolve,
    Partition,
    Discover,
    Transfer,
    Finalize
};

std::string_view phase_to_string(Phase phase);

class ConfigError : public std::exception {
public:
    ConfigError(std::string code, std::string message, std::string hint = {});

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    const std::string& code() const& {
        return code_;
    }

    const std::string& message() const& {
        return message_;
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

class RestoreError : public std::exception {
public:
    RestoreError(Phase phase, std::string code, std::string message, std::string detail = {});

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    Phase phase() const noexcept {
        return phase_;
    }

    const std::string& code() const& {
        return code_;
    }

    const std::string& message() const& {
        return message_;
    }

    // Subprocess identity and captured stderr, when there is one.
    const std::string& detail() const& {
        return detail_;
    }

private:
    Phase phase_;
    std::string code_;
    std::string message_;
    std::string detail_;
    std::string formatted_;
};

[[noreturn]] void throw_config_error(std::string code, std::string message, std::string hint = {});
[[noreturn]] void throw_restore_error(Phase phase, std::string code, std::string message, std::string detail = {});

}  // namespace pagesrestore
