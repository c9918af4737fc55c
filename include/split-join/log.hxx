#pragma once

#include <fmt/format.h>

#include <cstdio>
#include <optional>
#include <string_view>
#include <utility>

/**
 * @file log.hxx
 * @brief Minimal leveled logger on top of {fmt}.
 *
 * Messages go to a single `FILE*` (stderr unless redirected) and are written
 * under a mutex so that lines from different threads never interleave.
 */
namespace split_join::log {

/** @enum Level Severity of a log line, ordered from most to least severe. */
enum class Level { error, warning, info, debug };

/// @brief Drop every message less severe than @p threshold.
void set_level(Level threshold) noexcept;

/// @brief Current severity threshold.
Level level() noexcept;

/// @brief Redirect output (stderr by default). Passing nullptr restores it.
void set_output(std::FILE *stream) noexcept;

/// @brief Parse "error", "warning", "info" or "debug" (case-insensitive).
std::optional<Level> parse_level(std::string_view name);

inline bool enabled(Level severity) noexcept {
  return static_cast<int>(severity) <= static_cast<int>(level());
}

namespace detail {
void write(Level severity, std::string_view message);
} // namespace detail

template <typename... Args>
void error(fmt::format_string<Args...> format, Args &&...args) {
  if (enabled(Level::error))
    detail::write(Level::error,
                  fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void warning(fmt::format_string<Args...> format, Args &&...args) {
  if (enabled(Level::warning))
    detail::write(Level::warning,
                  fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void info(fmt::format_string<Args...> format, Args &&...args) {
  if (enabled(Level::info))
    detail::write(Level::info,
                  fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void debug(fmt::format_string<Args...> format, Args &&...args) {
  if (enabled(Level::debug))
    detail::write(Level::debug,
                  fmt::format(format, std::forward<Args>(args)...));
}
} // namespace split_join::log
