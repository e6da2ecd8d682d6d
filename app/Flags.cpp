#include "Flags.h"

#include "reelcut/Errors.h"

#include <fmt/core.h>

#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>

namespace reelcut {
namespace cli {

int parse_int_flag(const char* flag, const char* text) {
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(text, &end, 10);
    if (end == text || *end != '\0') {
        throw InvalidConfiguration(fmt::format("--{} is not an integer: {}", flag, text));
    }
    if (errno == ERANGE || v < INT_MIN || v > INT_MAX) {
        throw InvalidConfiguration(fmt::format("--{} is out of range: {}", flag, text));
    }
    return static_cast<int>(v);
}

double parse_number_flag(const char* flag, const char* text) {
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(text, &end);
    if (end == text || *end != '\0' || !std::isfinite(v)) {
        throw InvalidConfiguration(fmt::format("--{} is not a number: {}", flag, text));
    }
    if (errno == ERANGE) {
        throw InvalidConfiguration(fmt::format("--{} is out of range: {}", flag, text));
    }
    return v;
}

}  // namespace cli
}  // namespace reelcut
