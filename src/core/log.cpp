/// @file src/core/log.cpp
/// @brief stderr sink for the ecutune logger.

#include "ecutune/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <exception>
#include <mutex>

namespace ecutune::log {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::mutex       g_write_mutex;

/// ISO-8601 UTC timestamp with second resolution.
void format_timestamp(char (&buf)[32]) noexcept {
    const std::time_t now = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc) == 0) {
        buf[0] = '\0';
    }
}

} // anonymous namespace

void set_level(Level lvl) noexcept {
    g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

Level level() noexcept {
    return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}

bool enabled(Level lvl) noexcept {
    return static_cast<int>(lvl) >= g_level.load(std::memory_order_relaxed);
}

std::string_view to_string(Level lvl) noexcept {
    switch (lvl) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
    }
    return "?";
}

void write(Level lvl, std::string_view component, std::string_view message) noexcept {
    if (!enabled(lvl)) {
        return;
    }

    char stamp[32];
    format_timestamp(stamp);
    const std::string_view tag = to_string(lvl);

    std::lock_guard<std::mutex> lock(g_write_mutex);
    try {
        fmt::print(stderr, "{} [{}] {}: {}\n", stamp, tag, component, message);
    } catch (const std::exception& e) {
        std::fputs("log: write failed: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputc('\n', stderr);
    }
    std::fflush(stderr);
}

} // namespace ecutune::log
