#pragma once

#include "../ClipTypes.h"

#include <vector>

namespace reelcut {
namespace selection {

/**
 * ClipSelector: greedy non-overlapping top-N selection
 *
 * Candidates are taken in descending score order (ties: earlier start, then
 * earlier end) and accepted when they intersect no accepted clip. This is
 * "most exciting first", not the score-sum optimum: a lower candidate that
 * overlaps an accepted one is rejected even if it outscores a later pick.
 */
class ClipSelector {
public:
    ClipSelector() = default;

    /**
     * @param candidates Candidate windows (overlaps allowed)
     * @param clipCount Maximum number of clips (N)
     * @return Up to N clips ranked 1..n by acceptance order, sorted by start.
     *         Fewer than N when fewer non-overlapping candidates exist.
     */
    std::vector<SelectedClip> select(const std::vector<Candidate>& candidates, int clipCount) const;

    /**
     * Move clip edges onto nearby word boundaries: start to the closest word start,
     * end to the closest word end, both within tolerance. The end is re-clamped to
     * the duration bounds; a snapped clip that leaves [0, duration], breaks the
     * bounds or overlaps a neighbour keeps its original edges.
     *
     * @param clips Selected clips sorted by start
     */
    std::vector<SelectedClip> snapToWords(const std::vector<SelectedClip>& clips,
                                          const std::vector<TimedWord>& words,
                                          const WindowConstraints& constraints,
                                          double durationSec,
                                          double tolerance) const;
};

// Half-open interval intersection; touching endpoints do not overlap.
bool overlaps(double aStart, double aEnd, double bStart, double bEnd);

}  // namespace selection
}  // namespace reelcut
