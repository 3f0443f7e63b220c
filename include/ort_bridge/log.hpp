// ort_bridge/log.hpp
// Verbosity-controlled diagnostics for ort_bridge
//
// The bridge reports failures through exceptions; logging is only for
// tracing what happened to runtime-owned memory (adopt/release, extraction
// sizes) and for announcing contract violations before they are thrown.
//
// Configuration:
// - ORT_BRIDGE_VERBOSITY environment variable, read once on first use.
//   Accepts 0-4 or silent/info/stats/debug/trace. Default: silent.
// - set_verbosity() overrides the environment at runtime.
// - Define ORT_BRIDGE_DISABLE_LOGGING to compile every call down to nothing.

#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ort_bridge {

enum class VerbosityLevel : std::uint8_t {
    Silent = 0,
    Info = 1,
    Stats = 2,
    Debug = 3,
    Trace = 4,
};

/// Parse a verbosity level from a number ("3") or a name ("debug").
/// Surrounding whitespace is ignored, names are case-insensitive.
/// @throws std::invalid_argument for anything else
[[nodiscard]] inline VerbosityLevel parse_verbosity_level(std::string_view val) {
    constexpr std::string_view ws = " \t\n\r\f\v";
    const auto first = val.find_first_not_of(ws);
    const auto last = val.find_last_not_of(ws);
    const std::string trimmed = (first == std::string_view::npos)
        ? std::string{}
        : std::string(val.substr(first, last - first + 1));

    if (trimmed.empty()) {
        throw std::invalid_argument("Invalid verbosity level: empty");
    }

    if (trimmed.size() == 1 && std::isdigit(static_cast<unsigned char>(trimmed[0]))) {
        switch (trimmed[0]) {
            case '0': return VerbosityLevel::Silent;
            case '1': return VerbosityLevel::Info;
            case '2': return VerbosityLevel::Stats;
            case '3': return VerbosityLevel::Debug;
            case '4': return VerbosityLevel::Trace;
            default: break;
        }
        throw std::invalid_argument("Verbosity level out of range: " + trimmed);
    }

    std::string lower(trimmed.size(), '\0');
    std::transform(trimmed.begin(), trimmed.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "silent") return VerbosityLevel::Silent;
    if (lower == "info")   return VerbosityLevel::Info;
    if (lower == "stats")  return VerbosityLevel::Stats;
    if (lower == "debug")  return VerbosityLevel::Debug;
    if (lower == "trace")  return VerbosityLevel::Trace;
    throw std::invalid_argument("Invalid verbosity level: " + trimmed);
}

[[nodiscard]] constexpr const char* verbosity_label(VerbosityLevel level) noexcept {
    switch (level) {
        case VerbosityLevel::Info:  return "[INFO] ";
        case VerbosityLevel::Stats: return "[STATS] ";
        case VerbosityLevel::Debug: return "[DEBUG] ";
        case VerbosityLevel::Trace: return "[TRACE] ";
        default:                    return "";
    }
}

namespace detail {

struct LogState {
    std::mutex mutex;
    std::atomic<VerbosityLevel> level{VerbosityLevel::Silent};
    std::ostream* sink{&std::cerr};
    std::string env_warning;

    LogState() { apply_env(std::getenv("ORT_BRIDGE_VERBOSITY")); }

    /// Apply an ORT_BRIDGE_VERBOSITY value. A bad value leaves the level as
    /// it was and is reported by the next write.
    void apply_env(const char* env) {
        if (!env) return;
        const std::scoped_lock lock(mutex);
        try {
            level.store(parse_verbosity_level(env));
        } catch (const std::invalid_argument& e) {
            // Reported by the first write; the stream may not be ready yet.
            env_warning = std::string("ORT_BRIDGE_VERBOSITY ignored: ") + e.what();
        }
    }
};

inline LogState& log_state() {
    static LogState state;
    return state;
}

inline void write_line(const char* label, std::string_view message) {
    auto& st = log_state();
    const std::scoped_lock lock(st.mutex);
    if (!st.env_warning.empty()) {
        *st.sink << "[ort_bridge] [WARNING] " << st.env_warning << '\n';
        st.env_warning.clear();
    }
    *st.sink << "[ort_bridge] " << label << message << '\n' << std::flush;
}

} // namespace detail

[[nodiscard]] inline VerbosityLevel verbosity() noexcept {
    return detail::log_state().level.load(std::memory_order_relaxed);
}

inline void set_verbosity(VerbosityLevel level) noexcept {
    detail::log_state().level.store(level, std::memory_order_relaxed);
}

/// Redirect log output (tests capture it in a std::ostringstream).
/// Passing nullptr restores std::cerr. The stream must outlive its use.
inline void set_log_sink(std::ostream* sink) noexcept {
    auto& st = detail::log_state();
    const std::scoped_lock lock(st.mutex);
    st.sink = sink ? sink : &std::cerr;
}

[[nodiscard]] inline bool log_enabled(VerbosityLevel level) noexcept {
#if defined(ORT_BRIDGE_DISABLE_LOGGING)
    (void)level;
    return false;
#else
    return level != VerbosityLevel::Silent &&
           static_cast<std::uint8_t>(verbosity()) >= static_cast<std::uint8_t>(level);
#endif
}

inline void log_verbose(VerbosityLevel level, std::string_view message) {
    if (log_enabled(level)) {
        detail::write_line(verbosity_label(level), message);
    }
}

inline void log_info(std::string_view msg)  { log_verbose(VerbosityLevel::Info, msg); }
inline void log_stats(std::string_view msg) { log_verbose(VerbosityLevel::Stats, msg); }
inline void log_debug(std::string_view msg) { log_verbose(VerbosityLevel::Debug, msg); }
inline void log_trace(std::string_view msg) { log_verbose(VerbosityLevel::Trace, msg); }

// Warnings and errors ignore the verbosity level.

inline void log_warning(std::string_view message) {
#if !defined(ORT_BRIDGE_DISABLE_LOGGING)
    detail::write_line("[WARNING] ", message);
#else
    (void)message;
#endif
}

inline void log_error(std::string_view message) {
#if !defined(ORT_BRIDGE_DISABLE_LOGGING)
    detail::write_line("[ERROR] ", message);
#else
    (void)message;
#endif
}

} // namespace ort_bridge
