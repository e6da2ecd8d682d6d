#include "reelcut/signals/SceneChange.h"
#include "reelcut/CoreContract.h"

#include <algorithm>
#include <cmath>

namespace reelcut {
namespace signals {

std::vector<double> sanitize_cut_times(const std::vector<double>& cutTimesSec, double durationSec) {
    std::vector<double> out;
    out.reserve(cutTimesSec.size());
    for (double t : cutTimesSec) {
        if (!std::isfinite(t)) continue;
        if (t <= 0.0) continue;
        if (durationSec > 0.0 && t >= durationSec) continue;
        out.push_back(t);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end(),
                          [](double a, double b) { return std::abs(a - b) < contract::SCENE_CUT_MERGE_SEC; }),
              out.end());
    return out;
}

RawSignal SceneChangeExtractor::extract(const std::vector<double>& cutTimesSec, double durationSec) const {
    RawSignal out;
    out.kind = SignalKind::SceneChange;
    out.impulse = true;
    for (double t : sanitize_cut_times(cutTimesSec, durationSec)) {
        out.samples.push_back(SignalSample{t, 1.0});
    }
    return out;
}

}  // namespace signals
}  // namespace reelcut
