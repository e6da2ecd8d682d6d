#pragma once

#include <fmt/color.h>
#include <fmt/core.h>

#include <cstdio>
#include <mutex>
#include <string>

namespace reelcut {
namespace logging {

enum class Level {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

void set_level(Level level);
Level level();
bool enabled(Level level);

// "debug" | "info" | "warning" (or "warn") | "error", case-insensitive.
// Throws InvalidConfiguration for anything else.
Level level_from_string(const std::string& value);
std::string level_to_string(Level level);

// Serializes writers so concurrent pipelines do not interleave lines.
std::mutex& output_mutex();

}  // namespace logging
}  // namespace reelcut

// Leveled log lines on stderr (stdout is reserved for tool output).
#define REELCUT_LOG_AT(lvl, style, format_str, ...)                              \
    do {                                                                         \
        if (::reelcut::logging::enabled(lvl)) {                                  \
            std::lock_guard<std::mutex> reelcut_log_lock(                        \
                ::reelcut::logging::output_mutex());                             \
            fmt::print(stderr, style, format_str "\n", ##__VA_ARGS__);           \
            std::fflush(stderr);                                                 \
        }                                                                        \
    } while (0)

#define REELCUT_LOG_DEBUG(format_str, ...)                                       \
    REELCUT_LOG_AT(::reelcut::logging::Level::Debug, fmt::text_style(),          \
                   "[DEBUG] " format_str, ##__VA_ARGS__)

#define REELCUT_LOG_INFO(format_str, ...)                                        \
    REELCUT_LOG_AT(::reelcut::logging::Level::Info, fmt::text_style(),           \
                   "[INFO] " format_str, ##__VA_ARGS__)

#define REELCUT_LOG_WARN(format_str, ...)                                        \
    REELCUT_LOG_AT(::reelcut::logging::Level::Warning, fg(fmt::color::yellow),   \
                   "[WARN] " format_str, ##__VA_ARGS__)

#define REELCUT_LOG_ERROR(format_str, ...)                                       \
    REELCUT_LOG_AT(::reelcut::logging::Level::Error, fg(fmt::color::red),        \
                   "[ERROR] " format_str, ##__VA_ARGS__)
