// log.cpp - implementation of the diagnostic channel

#include "dset/log.hpp"
#include <cstdio>
#include <mutex>
#include <stdexcept>

namespace dset {

namespace {

struct logger_state_t {
    std::mutex mutex;
    log_level level = log_level::warn;
    logger::sink_t sink;
};

auto state() -> logger_state_t& {
    static auto s = logger_state_t{};
    return s;
}

} // anonymous namespace

auto to_string(log_level level) -> const char* {
    switch (level) {
        case log_level::trace: return "trace";
        case log_level::debug: return "debug";
        case log_level::info:  return "info";
        case log_level::warn:  return "warn";
        case log_level::error: return "error";
        case log_level::off:   return "off";
    }
    return "unknown";
}

auto from_string(std::type_identity<log_level>, const std::string& s) -> log_level {
    if (s == "trace") return log_level::trace;
    if (s == "debug") return log_level::debug;
    if (s == "info")  return log_level::info;
    if (s == "warn")  return log_level::warn;
    if (s == "error") return log_level::error;
    if (s == "off")   return log_level::off;
    throw std::runtime_error("unknown log level: " + s);
}

void logger::set_level(log_level level) {
    auto lock = std::lock_guard{state().mutex};
    state().level = level;
}

auto logger::level() -> log_level {
    auto lock = std::lock_guard{state().mutex};
    return state().level;
}

void logger::set_sink(sink_t sink) {
    auto lock = std::lock_guard{state().mutex};
    state().sink = std::move(sink);
}

void logger::reset_sink() {
    set_sink(nullptr);
}

auto logger::enabled(log_level level) -> bool {
    auto lock = std::lock_guard{state().mutex};
    return level != log_level::off && level >= state().level;
}

// The sink runs unlocked so that it may call back into the logger
void logger::write(log_level level, std::string_view message) {
    auto sink = sink_t{};
    {
        auto lock = std::lock_guard{state().mutex};
        sink = state().sink;
    }
    if (sink) {
        sink(level, message);
    } else {
        fmt::print(stderr, "[{}] {}\n", to_string(level), message);
    }
}

} // namespace dset
