#include "reelcut/HighlightScorer.h"
#include "reelcut/Errors.h"
#include "reelcut/Normalization.h"

#include <algorithm>
#include <cmath>

namespace reelcut {

namespace {

bool has_data(const SignalMap& signals, SignalKind kind) {
    const auto it = signals.find(kind);
    return it != signals.end() && !it->second.samples.empty();
}

double weight_of(const SignalWeights& weights, SignalKind kind) {
    const auto it = weights.find(kind);
    if (it == weights.end() || !std::isfinite(it->second)) return 0.0;
    return std::max(0.0, it->second);
}

}  // namespace

SignalWeights HighlightScorer::renormalizeWeights(const SignalMap& signals, const SignalWeights& weights) const {
    double total = 0.0;
    for (SignalKind kind : kAllSignalKinds) {
        if (has_data(signals, kind)) total += weight_of(weights, kind);
    }
    SignalWeights out;
    if (!(total > 0.0)) return out;
    for (SignalKind kind : kAllSignalKinds) {
        if (has_data(signals, kind)) out[kind] = weight_of(weights, kind) / total;
    }
    return out;
}

ScoreTimeline HighlightScorer::fuse(const SignalMap& signals,
                                    const SignalWeights& weights,
                                    double durationSec,
                                    double step,
                                    double decayWindow) const {
    bool anyData = false;
    for (SignalKind kind : kAllSignalKinds) anyData = anyData || has_data(signals, kind);
    if (!anyData) {
        throw InsufficientSignal("no loudness, keyword, scene-cut or chapter data to score");
    }

    ScoreTimeline timeline;
    timeline.step = step;
    timeline.duration = durationSec;
    timeline.weights = renormalizeWeights(signals, weights);
    if (timeline.weights.empty()) {
        throw InsufficientSignal("every signal with data has zero weight");
    }

    const std::size_t N = timeline_length(durationSec, step);
    timeline.points.resize(N);
    for (std::size_t k = 0; k < N; ++k) timeline.points[k].timestamp = static_cast<double>(k) * step;

    for (const auto& [kind, w] : timeline.weights) {
        std::vector<double> dense = resample_with_decay(signals.at(kind), durationSec, step, decayWindow);
        for (auto& v : dense) v *= w;
        for (std::size_t k = 0; k < N; ++k) timeline.points[k].score += dense[k];
        timeline.contributions[kind] = std::move(dense);
    }
    for (auto& p : timeline.points) p.score = std::clamp(p.score, 0.0, 1.0);

    return timeline;
}

}  // namespace reelcut
