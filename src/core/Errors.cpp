#include "pagesrestore/Errors.hpp"

#include <utility>

namespace pagesrestore {

std::string_view phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::Scratch:
            return "scratch";
        case Phase::Enumerate:
            return "enumerate";
        case Phase::Resolve:
            return "resolve";
        case Phase::Partition:
            return "partition";
        case Phase::Discover:
            return "discover";
        case Phase::Transfer:
            return "transfer";
        case Phase::Finalize:
            return "finalize";
    }
    return "unknown";
}

ConfigError::ConfigError(std::string code, std::string message, std::string hint)
    : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
    formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
}

RestoreError::RestoreError(Phase phase, std::string code, std::string message, std::string detail)
    : phase_(phase), code_(std::move(code)), message_(std::move(message)), detail_(std::move(detail)) {
    formatted_ = "[" + code_ + "] " + std::string(phase_to_string(phase_)) + ": " + message_;
}

void throw_config_error(std::string code, std::string message, std::string hint) {
    throw ConfigError(std::move(code), std::move(message), std::move(hint));
}

void throw_restore_error(Phase phase, std::string code, std::string message, std::string detail) {
    throw RestoreError(phase, std::move(code), std::move(message), std::move(detail));
}

}  // namespace pagesrestore
