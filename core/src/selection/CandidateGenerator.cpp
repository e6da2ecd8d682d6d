#include "reelcut/selection/CandidateGenerator.h"
#include "reelcut/Utility.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

namespace reelcut {
namespace selection {

namespace {

constexpr double kScoreEps = 1e-12;

bool same_score(double a, double b) { return std::abs(a - b) <= kScoreEps; }

struct WindowIdx {
    std::size_t first{0};   // inclusive
    std::size_t length{0};
    double mean{0.0};
};

}  // namespace

std::vector<std::size_t> CandidateGenerator::findPeaks(const std::vector<double>& scores, double threshold) const {
    std::vector<std::size_t> peaks;
    const std::size_t N = scores.size();
    for (std::size_t i = 0; i < N; ++i) {
        if (!(scores[i] > threshold)) continue;
        if (i > 0 && (scores[i] < scores[i - 1] || same_score(scores[i], scores[i - 1]))) continue;

        std::size_t j = i;
        while (j + 1 < N && same_score(scores[j + 1], scores[i])) ++j;
        if (j + 1 == N || scores[j + 1] < scores[i]) peaks.push_back(i);
    }
    return peaks;
}

SignalKind CandidateGenerator::dominantSignal(const ScoreTimeline& timeline,
                                              std::size_t first,
                                              std::size_t last) const {
    SignalKind best = SignalKind::AudioEnergy;
    double bestSum = -1.0;
    for (SignalKind kind : kAllSignalKinds) {
        const auto it = timeline.contributions.find(kind);
        if (it == timeline.contributions.end()) continue;
        const auto& c = it->second;
        double sum = 0.0;
        for (std::size_t k = first; k < std::min(last, c.size()); ++k) sum += c[k];
        if (sum > bestSum + kScoreEps) {
            bestSum = sum;
            best = kind;
        }
    }
    return best;
}

std::vector<Candidate> CandidateGenerator::generate(const ScoreTimeline& timeline,
                                                    const WindowConstraints& constraints,
                                                    double peakThreshold) const {
    std::vector<Candidate> out;
    const auto& pts = timeline.points;
    const double step = timeline.step;
    if (pts.empty() || !(step > 0.0) || !(timeline.duration > 0.0)) return out;

    // Windows end on grid boundaries no later than the video end.
    const auto fullSteps = static_cast<std::size_t>(std::floor(timeline.duration / step + contract::TIME_EPS));
    const std::size_t limit = std::min(pts.size(), fullSteps);
    const auto lenMin = std::max<std::size_t>(
        1, static_cast<std::size_t>(std::ceil(constraints.minDuration / step - contract::TIME_EPS)));
    const auto lenMax = std::min(
        limit, static_cast<std::size_t>(std::floor(constraints.maxDuration / step + contract::TIME_EPS)));
    if (limit == 0 || lenMin > lenMax) return out;

    std::vector<double> scores(pts.size());
    for (std::size_t k = 0; k < pts.size(); ++k) scores[k] = pts[k].score;
    std::vector<double> prefix(scores.size() + 1, 0.0);
    for (std::size_t k = 0; k < scores.size(); ++k) prefix[k + 1] = prefix[k] + scores[k];

    std::set<std::pair<std::size_t, std::size_t>> seen;
    for (std::size_t peak : findPeaks(scores, peakThreshold)) {
        const std::size_t p = std::min(peak, limit - 1);

        bool found = false;
        WindowIdx best;
        for (std::size_t len = lenMin; len <= lenMax; ++len) {
            const std::size_t iLo = (p + 1 >= len) ? (p + 1 - len) : 0;
            const std::size_t iHi = std::min(p, limit - len);
            for (std::size_t i = iLo; i <= iHi; ++i) {
                const double mean = (prefix[i + len] - prefix[i]) / static_cast<double>(len);
                // Higher mean wins; equal means keep the earlier start, then the shorter window.
                if (!found || mean > best.mean + kScoreEps ||
                    (same_score(mean, best.mean) && i < best.first)) {
                    best = WindowIdx{.first = i, .length = len, .mean = mean};
                    found = true;
                }
            }
        }
        if (!found) continue;
        if (!seen.insert({best.first, best.length}).second) continue;

        Candidate c;
        c.start = static_cast<double>(best.first) * step;
        c.end = std::min(timeline.duration, c.start + static_cast<double>(best.length) * step);
        c.score = best.mean;
        c.dominantSignal = dominantSignal(timeline, best.first, best.first + best.length);
        c.reason = signal_kind_label(c.dominantSignal);
        out.push_back(std::move(c));
    }

    std::sort(out.begin(), out.end(), [](const Candidate& a, const Candidate& b) {
        if (a.start != b.start) return a.start < b.start;
        return a.end < b.end;
    });
    return out;
}

}  // namespace selection
}  // namespace reelcut
