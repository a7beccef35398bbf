#include "pagesrestore/log/StructuredLogger.hpp"

#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace pagesrestore::log {

namespace {

void append_json_string(std::string& out, std::string_view value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    out.push_back('"');
    for (const unsigned char ch : value) {
        switch (ch) {
            case '"':
                out.append("\\\"");
                break;
            case '\\':
                out.append("\\\\");
                break;
            case '\n':
                out.append("\\n");
                break;
            case '\r':
                out.append("\\r");
                break;
            case '\t':
                out.append("\\t");
                break;
            default:
                if (ch < 0x20) {
                    out.append("\\u00");
                    out.push_back(kHex[ch >> 4]);
                    out.push_back(kHex[ch & 0xF]);
                } else {
                    out.push_back(static_cast<char>(ch));
                }
                break;
        }
    }
    out.push_back('"');
}

}  // namespace

StructuredLogger::StructuredLogger()
    : sink_(&std::clog) {}

StructuredLogger& StructuredLogger::instance() {
    static StructuredLogger logger;
    return logger;
}

void StructuredLogger::log(Level level, std::string_view event, FieldList fields) {
    std::scoped_lock lock(mutex_);
    if (!enabled_ || (level == Level::Debug && !verbose_)) {
        return;
    }
    *sink_ << format_record(utc_timestamp(), level, event, fields) << std::flush;
}

void StructuredLogger::set_enabled(bool enabled) {
    std::scoped_lock lock(mutex_);
    enabled_ = enabled;
}

void StructuredLogger::set_verbose(bool verbose) {
    std::scoped_lock lock(mutex_);
    verbose_ = verbose;
}

void StructuredLogger::set_sink(std::ostream& sink) {
    std::scoped_lock lock(mutex_);
    sink_ = &sink;
}

std::string StructuredLogger::format_record(std::string_view timestamp,
                                            Level level,
                                            std::string_view event,
                                            const FieldList& fields) {
    std::string line = "{\"ts\":";
    append_json_string(line, timestamp);
    line.append(",\"level\":");
    append_json_string(line, level_name(level));
    line.append(",\"event\":");
    append_json_string(line, event);
    if (!fields.empty()) {
        line.append(",\"fields\":{");
        bool first = true;
        for (const auto& [key, value] : fields) {
            if (!first) {
                line.push_back(',');
            }
            first = false;
            append_json_string(line, key);
            line.push_back(':');
            append_json_string(line, value);
        }
        line.push_back('}');
    }
    line.append("}\n");
    return line;
}

std::string_view StructuredLogger::level_name(Level level) noexcept {
    switch (level) {
        case Level::Debug:
            return "debug";
        case Level::Info:
            return "info";
        case Level::Warning:
            return "warning";
        case Level::Error:
            return "error";
    }
    return "info";
}

std::string StructuredLogger::utc_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now - seconds).count();
    const std::time_t raw = std::chrono::system_clock::to_time_t(seconds);

    std::tm utc{};
    gmtime_r(&raw, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return out.str();
}

PhaseTimer::PhaseTimer(Phase phase)
    : phase_(phase),
      started_(std::chrono::steady_clock::now()),
      exceptions_(std::uncaught_exceptions()) {
    StructuredLogger::instance().debug("phase_start", {{"phase", std::string(phase_to_string(phase_))}});
}

PhaseTimer::~PhaseTimer() {
    const bool failed = std::uncaught_exceptions() > exceptions_;
    StructuredLogger::instance().log(failed ? StructuredLogger::Level::Error : StructuredLogger::Level::Debug,
                                     failed ? "phase_failed" : "phase_end",
                                     {{"phase", std::string(phase_to_string(phase_))},
                                      {"elapsed_ms", std::to_string(elapsed().count())}});
}

std::chrono::milliseconds PhaseTimer::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_);
}

}  // namespace pagesrestore::log
