#pragma once

#include "pagesrestore/Errors.hpp"

#include <chrono>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pagesrestore::log {

// One JSON object per line:
// {"ts":"...","level":"info","event":"transfer_done","fields":{"node":"..."}}
class StructuredLogger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    using Field = std::pair<std::string, std::string>;
    using FieldList = std::vector<Field>;

    static StructuredLogger& instance();

    void log(Level level, std::string_view event, FieldList fields = {});

    void debug(std::string_view event, FieldList fields = {}) {
        log(Level::Debug, event, std::move(fields));
    }
    void info(std::string_view event, FieldList fields = {}) {
        log(Level::Info, event, std::move(fields));
    }
    void warning(std::string_view event, FieldList fields = {}) {
        log(Level::Warning, event, std::move(fields));
    }
    void error(std::string_view event, FieldList fields = {}) {
        log(Level::Error, event, std::move(fields));
    }

    // Quiet runs drop every event; debug events need verbose on top.
    void set_enabled(bool enabled);
    void set_verbose(bool verbose);

    // Records go to std::clog unless redirected.
    void set_sink(std::ostream& sink);

    static std::string format_record(std::string_view timestamp,
                                     Level level,
                                     std::string_view event,
                                     const FieldList& fields);

private:
    StructuredLogger();

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    static std::string_view level_name(Level level) noexcept;
    static std::string utc_timestamp();

    bool enabled_{true};
    bool verbose_{false};
    std::ostream* sink_;
    std::mutex mutex_;
};

// Brackets one pipeline phase with phase_start and phase_end events, or
// phase_failed when the scope is left by an exception. All three carry
// the phase name; the closing event carries elapsed_ms.
class PhaseTimer {
public:
    explicit PhaseTimer(Phase phase);
    ~PhaseTimer();

    PhaseTimer(const PhaseTimer&) = delete;
    PhaseTimer& operator=(const PhaseTimer&) = delete;

    [[nodiscard]] std::chrono::milliseconds elapsed() const;

private:
    Phase phase_;
    std::chrono::steady_clock::time_point started_;
    int exceptions_;
};

}  // namespace pagesrestore::log
