#pragma once

#include "reelcut/ClipTypes.h"
#include "reelcut/CoreContract.h"

namespace reelcut {

/**
 * HighlightScorer: fuse normalized signals into one fixed-step score timeline
 *
 * Only kinds with data for this video take part; their weights are
 * renormalized to sum to 1, so a missing chapter list (or any other signal)
 * shifts weight to the remaining signals instead of reading as a low score.
 *
 * Stateless and deterministic: the same inputs always give the same timeline.
 */
class HighlightScorer {
  public:
    HighlightScorer() = default;

    /**
     * @param signals Normalized signals keyed by kind (kinds absent or empty = no data)
     * @param weights Configured weights (missing kinds count as 0)
     * @param durationSec Video duration
     * @param step Timeline resolution in seconds
     * @param decayWindow Linear decay window applied while resampling
     * @throws InsufficientSignal if no signal has data, or present signals weigh 0 in total
     */
    ScoreTimeline fuse(const SignalMap& signals,
                       const SignalWeights& weights,
                       double durationSec,
                       double step = contract::DEFAULT_SAMPLE_STEP_SEC,
                       double decayWindow = contract::DEFAULT_DECAY_WINDOW_SEC) const;

    /**
     * Renormalize weights over the kinds present in signals.
     * @return Weights summing to 1 over present kinds (empty if the present sum is 0)
     */
    SignalWeights renormalizeWeights(const SignalMap& signals, const SignalWeights& weights) const;
};

}  // namespace reelcut
