#pragma once

#include "../ClipTypes.h"
#include "../CoreContract.h"

#include <string>
#include <vector>

namespace reelcut {
namespace signals {

/**
 * KeywordDensityExtractor: transcript -> raw keyword_density signal
 *
 * Matching is whole-word and case-insensitive (ASCII folding): "wait" never
 * matches "waiting". A multi-word trigger ("no way") matches consecutive words.
 * Words are compared after stripping surrounding punctuation and whitespace.
 *
 * Output: one sample per word start, value = number of trigger matches whose
 * first word starts within [t - window, t + window]. A transcript without a
 * single match yields an empty signal (no keyword evidence, not a flat zero).
 */
class KeywordDensityExtractor {
public:
    KeywordDensityExtractor(const std::vector<std::string>& keywords,
                            double windowSeconds = contract::DEFAULT_KEYWORD_WINDOW_SEC);

    RawSignal extract(const std::vector<TimedWord>& words) const;

    // Start time of every trigger match, ascending.
    std::vector<double> matchTimes(const std::vector<TimedWord>& words) const;

    bool empty() const { return phrases_.empty(); }

private:
    std::vector<std::vector<std::string>> phrases_;
    double window_;
};

// Trim whitespace and KEYWORD_STRIP_CHARS from both ends, lower-case ASCII letters.
std::string normalize_token(const std::string& text);

}  // namespace signals
}  // namespace reelcut
