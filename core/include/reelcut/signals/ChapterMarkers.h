#pragma once

#include "../ClipTypes.h"

#include <optional>
#include <string>
#include <vector>

namespace reelcut {
namespace signals {

// A chapter with its end resolved (next chapter start, or video end).
struct ChapterSpan {
    double start{0.0};
    double end{0.0};
    std::string title;
};

/**
 * ChapterMarkerExtractor: publisher chapters -> impulse chapter_marker signal
 *
 * Absent or empty chapter lists yield an empty signal; fusion then renormalizes
 * the remaining weights instead of reading absence as a low score.
 */
class ChapterMarkerExtractor {
public:
    ChapterMarkerExtractor() = default;

    RawSignal extract(const std::optional<std::vector<Chapter>>& chapters, double durationSec) const;

    /**
     * Resolve chapter spans in start order.
     * @return Spans with start in [0, duration) and end > start
     */
    std::vector<ChapterSpan> spans(const std::optional<std::vector<Chapter>>& chapters, double durationSec) const;
};

}  // namespace signals
}  // namespace reelcut
