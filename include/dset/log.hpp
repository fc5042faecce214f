#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <fmt/format.h>

namespace dset {

// =============================================================================
// Diagnostic channel
// =============================================================================
//
// Recoverable conditions (malformed per-axis metadata, ambiguous mask
// indexing) are reported here instead of being thrown. Messages go to
// stderr unless a sink is installed.
//
// =============================================================================

enum class log_level : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    off = 5
};

auto to_string(log_level level) -> const char*;
auto from_string(std::type_identity<log_level>, const std::string& s) -> log_level;

class logger final {
public:
    using sink_t = std::function<void(log_level, std::string_view)>;

    logger() = delete;

    static void set_level(log_level level);
    static auto level() -> log_level;

    // Replace the output; the default sink writes "[level] message" to stderr
    static void set_sink(sink_t sink);
    static void reset_sink();

    static auto enabled(log_level level) -> bool;
    static void write(log_level level, std::string_view message);

    template<typename... Args>
    static void log(log_level level, fmt::format_string<Args...> format, Args&&... args) {
        if (!enabled(level)) return;
        write(level, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void debug(fmt::format_string<Args...> format, Args&&... args) {
        log(log_level::debug, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(fmt::format_string<Args...> format, Args&&... args) {
        log(log_level::info, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(fmt::format_string<Args...> format, Args&&... args) {
        log(log_level::warn, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(fmt::format_string<Args...> format, Args&&... args) {
        log(log_level::error, format, std::forward<Args>(args)...);
    }
};

} // namespace dset
