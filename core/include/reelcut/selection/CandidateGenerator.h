#pragma once

#include "../ClipTypes.h"
#include "../CoreContract.h"

#include <cstddef>
#include <vector>

namespace reelcut {
namespace selection {

/**
 * CandidateGenerator: score timeline -> overlapping candidate clip windows
 *
 * Every local peak above the threshold seeds one candidate: among all windows
 * that contain the peak, lie within [0, duration] and last between
 * min_duration and max_duration, the one with the highest mean score wins.
 * The search is bounded by max_duration / step lengths per peak.
 */
class CandidateGenerator {
public:
    CandidateGenerator() = default;

    /**
     * @param timeline Fused score timeline
     * @param constraints Clip duration bounds
     * @param peakThreshold Minimum score for a peak to seed a candidate
     * @return Distinct candidates ordered by start (may be empty; that is a normal outcome)
     */
    std::vector<Candidate> generate(const ScoreTimeline& timeline,
                                    const WindowConstraints& constraints,
                                    double peakThreshold = contract::DEFAULT_PEAK_THRESHOLD) const;

    /**
     * Local peaks: the first index of every plateau that rises from its left
     * neighbour, exceeds the threshold and is followed by a lower value (or the end).
     * For equal adjacent scores the earlier timestamp is the peak.
     */
    std::vector<std::size_t> findPeaks(const std::vector<double>& scores, double threshold) const;

    /**
     * Signal with the largest summed weighted contribution over points [first, last).
     * Ties resolve to the earlier kind in kAllSignalKinds.
     */
    SignalKind dominantSignal(const ScoreTimeline& timeline, std::size_t first, std::size_t last) const;
};

}  // namespace selection
}  // namespace reelcut
