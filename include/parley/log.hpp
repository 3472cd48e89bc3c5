#pragma once

#include <cstdio>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace parley {

/** @brief Severity of a library log record. */
enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] inline const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

/** @brief Receives every record at or above the configured level. */
using LogCallback = std::function<void(LogLevel, std::string_view)>;

namespace detail {

struct LogState {
    std::mutex mutex;
    LogCallback callback;
    LogLevel min_level = LogLevel::Warn;
};

inline LogState& log_state() {
    static LogState state;
    return state;
}

inline void default_log_sink(LogLevel level, std::string_view text) {
    std::fprintf(stderr, "[parley] %s: %.*s\n",
                 log_level_to_string(level), static_cast<int>(text.size()), text.data());
}

inline void log(LogLevel level, std::string_view text) {
    auto& state = log_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (level < state.min_level) {
        return;
    }
    if (state.callback) {
        state.callback(level, text);
    } else {
        default_log_sink(level, text);
    }
}

} // namespace detail

/**
 * @brief Install a process-wide log sink
 *
 * Mirrors llama_log_set(): the library never writes to a stream directly once
 * a callback is installed. Passing nullptr restores the stderr sink. The
 * callback runs under the log mutex and must not log re-entrantly.
 */
inline void set_log_callback(LogCallback callback) {
    auto& state = detail::log_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.callback = std::move(callback);
}

/** @brief Drop records below @p level (default: Warn). */
inline void set_log_level(LogLevel level) {
    auto& state = detail::log_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.min_level = level;
}

inline void log_debug(std::string_view text) { detail::log(LogLevel::Debug, text); }
inline void log_info(std::string_view text) { detail::log(LogLevel::Info, text); }
inline void log_warn(std::string_view text) { detail::log(LogLevel::Warn, text); }
inline void log_error(std::string_view text) { detail::log(LogLevel::Error, text); }

} // namespace parley
