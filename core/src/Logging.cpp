#include "reelcut/Logging.h"
#include "reelcut/Errors.h"

#include <algorithm>
#include <atomic>
#include <cctype>

namespace reelcut {
namespace logging {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::Info)};

}  // namespace

void set_level(Level level) {
    g_level.store(static_cast<int>(level));
}

Level level() {
    return static_cast<Level>(g_level.load());
}

bool enabled(Level level) {
    return static_cast<int>(level) >= g_level.load();
}

Level level_from_string(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "debug") {
        return Level::Debug;
    }
    if (v == "info") {
        return Level::Info;
    }
    if (v == "warning" || v == "warn") {
        return Level::Warning;
    }
    if (v == "error") {
        return Level::Error;
    }
    throw InvalidConfiguration("unknown log level: " + value);
}

std::string level_to_string(Level level) {
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

std::mutex& output_mutex() {
    static std::mutex m;
    return m;
}

}  // namespace logging
}  // namespace reelcut
