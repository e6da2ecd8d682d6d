#pragma once

namespace reelcut {
namespace cli {

// Numeric command-line values. Both throw InvalidConfiguration when the text is
// not a whole number of the right kind or does not fit the target type.
int parse_int_flag(const char* flag, const char* text);
double parse_number_flag(const char* flag, const char* text);

}  // namespace cli
}  // namespace reelcut
