#pragma once

/// @file include/ecutune/log.hpp
/// @brief Leveled stderr logger used by every ecutune module.
///
/// stdout belongs to the JSON response, so every log line goes to stderr:
/// ```
/// 2026-10-19T20:04:11Z [INFO] runner: request_id=abc seed=777 budget=20 bins=5
/// ```
/// Messages are formatted with fmt. The API never throws.

#include <fmt/core.h>

#include <exception>
#include <string>
#include <string_view>
#include <utility>

namespace ecutune::log {

enum class Level : int { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Set the minimum level that is written (default: Info).
void set_level(Level lvl) noexcept;

/// Current minimum level.
[[nodiscard]] Level level() noexcept;

/// True if a message at `lvl` would be written.
[[nodiscard]] bool enabled(Level lvl) noexcept;

/// Write one pre-formatted line. Thread-safe.
void write(Level lvl, std::string_view component, std::string_view message) noexcept;

/// Upper-case level tag ("DEBUG", "INFO", ...).
[[nodiscard]] std::string_view to_string(Level lvl) noexcept;

template <typename... Args>
void emit(Level lvl, std::string_view component,
          fmt::format_string<Args...> format, Args&&... args) noexcept {
    if (!enabled(lvl)) {
        return;
    }
    try {
        write(lvl, component, fmt::format(format, std::forward<Args>(args)...));
    } catch (const std::exception& e) {
        write(Level::Error, component, e.what());
    }
}

template <typename... Args>
void debug(std::string_view component, fmt::format_string<Args...> format, Args&&... args) noexcept {
    emit(Level::Debug, component, format, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::string_view component, fmt::format_string<Args...> format, Args&&... args) noexcept {
    emit(Level::Info, component, format, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(std::string_view component, fmt::format_string<Args...> format, Args&&... args) noexcept {
    emit(Level::Warn, component, format, std::forward<Args>(args)...);
}

template <typename... Args>
void error(std::string_view component, fmt::format_string<Args...> format, Args&&... args) noexcept {
    emit(Level::Error, component, format, std::forward<Args>(args)...);
}

} // namespace ecutune::log
