#pragma once
// Log: structured events with a pluggable sink
//
// Components emit named events with key/value context. The default sink
// prints "[Component] event: message k=v" to stderr. Hosts and tests
// install their own sink; nothing in the core depends on which one.

#include "types.hpp"
#include <functional>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace sabha {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

inline const char* level_name(LogLevel l) {
    switch (l) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

inline std::optional<LogLevel> parse_level(const std::string& s) {
    if (s == "debug") return LogLevel::Debug;
    if (s == "info") return LogLevel::Info;
    if (s == "warn") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    return std::nullopt;
}

using LogFields = std::vector<std::pair<std::string, std::string>>;

struct LogEvent {
    Timestamp timestamp = 0;
    LogLevel level = LogLevel::Info;
    std::string component;
    std::string event;
    std::string message;
    LogFields fields;

    // Value of a field, empty if absent
    std::string field(const std::string& key) const {
        for (const auto& [k, v] : fields) {
            if (k == key) return v;
        }
        return "";
    }
};

using LogSink = std::function<void(const LogEvent&)>;

// Default sink: one line per event on stderr
inline LogSink stderr_sink(LogLevel min_level = LogLevel::Info) {
    return [min_level](const LogEvent& e) {
        if (e.level < min_level) return;
        std::ostringstream line;
        line << "[" << e.component << "] " << e.event;
        if (!e.message.empty()) line << ": " << e.message;
        for (const auto& [k, v] : e.fields) {
            line << " " << k << "=" << v;
        }
        line << "\n";
        std::cerr << line.str();
    };
}

namespace detail {

struct LogState {
    std::mutex mutex;
    LogSink sink = stderr_sink();
};

inline LogState& log_state() {
    static LogState state;
    return state;
}

} // namespace detail

// Replace the process-wide sink. An empty sink silences logging.
inline void set_log_sink(LogSink sink) {
    auto& state = detail::log_state();
    std::lock_guard lock(state.mutex);
    state.sink = std::move(sink);
}

inline void emit(LogLevel level, const std::string& component,
                 const std::string& event, const std::string& message = "",
                 LogFields fields = {}) {
    LogEvent e;
    e.timestamp = now();
    e.level = level;
    e.component = component;
    e.event = event;
    e.message = message;
    e.fields = std::move(fields);

    auto& state = detail::log_state();
    std::lock_guard lock(state.mutex);
    if (state.sink) state.sink(e);
}

inline void log_debug(const std::string& component, const std::string& event,
                      const std::string& message = "", LogFields fields = {}) {
    emit(LogLevel::Debug, component, event, message, std::move(fields));
}

inline void log_info(const std::string& component, const std::string& event,
                     const std::string& message = "", LogFields fields = {}) {
    emit(LogLevel::Info, component, event, message, std::move(fields));
}

inline void log_warn(const std::string& component, const std::string& event,
                     const std::string& message = "", LogFields fields = {}) {
    emit(LogLevel::Warn, component, event, message, std::move(fields));
}

inline void log_error(const std::string& component, const std::string& event,
                      const std::string& message = "", LogFields fields = {}) {
    emit(LogLevel::Error, component, event, message, std::move(fields));
}

// Collects events in memory; handy for tests and the snapshot tail
class LogCapture {
public:
    LogSink sink() {
        return [this](const LogEvent& e) {
            std::lock_guard lock(mutex_);
            events_.push_back(e);
        };
    }

    std::vector<LogEvent> events() const {
        std::lock_guard lock(mutex_);
        return events_;
    }

    size_t count(const std::string& event) const {
        std::lock_guard lock(mutex_);
        size_t n = 0;
        for (const auto& e : events_) {
            if (e.event == event) ++n;
        }
        return n;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        events_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogEvent> events_;
};

} // namespace sabha
