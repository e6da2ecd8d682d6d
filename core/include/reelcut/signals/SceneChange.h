#pragma once

#include "../ClipTypes.h"

#include <vector>

namespace reelcut {
namespace signals {

/**
 * SceneChangeExtractor: shot-boundary timestamps -> impulse scene_change signal
 *
 * Input: cut timestamps from the scene-detection collaborator (any order)
 * Output: value 1 at each cut; every other time is implicitly 0
 */
class SceneChangeExtractor {
public:
    SceneChangeExtractor() = default;

    /**
     * @param cutTimesSec Cut timestamps in seconds
     * @param durationSec Video duration; cuts at t <= 0 or t >= duration are dropped
     *                    (no upper bound when duration <= 0)
     */
    RawSignal extract(const std::vector<double>& cutTimesSec, double durationSec) const;
};

// Finite cuts strictly inside (0, duration), sorted, near-duplicates merged.
std::vector<double> sanitize_cut_times(const std::vector<double>& cutTimesSec, double durationSec);

}  // namespace signals
}  // namespace reelcut
