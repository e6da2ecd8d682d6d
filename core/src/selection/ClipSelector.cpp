#include "reelcut/selection/ClipSelector.h"
#include "reelcut/CoreContract.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace reelcut {
namespace selection {

bool overlaps(double aStart, double aEnd, double bStart, double bEnd) {
    return aStart < bEnd - contract::TIME_EPS && bStart < aEnd - contract::TIME_EPS;
}

std::vector<SelectedClip> ClipSelector::select(const std::vector<Candidate>& candidates, int clipCount) const {
    std::vector<SelectedClip> selected;
    if (clipCount <= 0 || candidates.empty()) return selected;

    std::vector<Candidate> ordered = candidates;
    std::stable_sort(ordered.begin(), ordered.end(), [](const Candidate& a, const Candidate& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.start != b.start) return a.start < b.start;
        return a.end < b.end;
    });

    for (const auto& c : ordered) {
        if (static_cast<int>(selected.size()) >= clipCount) break;
        const bool clash = std::any_of(selected.begin(), selected.end(), [&](const SelectedClip& s) {
            return overlaps(c.start, c.end, s.start, s.end);
        });
        if (clash) continue;

        SelectedClip clip;
        clip.start = c.start;
        clip.end = c.end;
        clip.score = c.score;
        clip.dominantSignal = c.dominantSignal;
        clip.reason = c.reason;
        clip.rank = static_cast<int>(selected.size()) + 1;
        selected.push_back(std::move(clip));
    }

    std::sort(selected.begin(), selected.end(),
              [](const SelectedClip& a, const SelectedClip& b) { return a.start < b.start; });
    return selected;
}

std::vector<SelectedClip> ClipSelector::snapToWords(const std::vector<SelectedClip>& clips,
                                                    const std::vector<TimedWord>& words,
                                                    const WindowConstraints& constraints,
                                                    double durationSec,
                                                    double tolerance) const {
    std::vector<SelectedClip> out = clips;
    if (words.empty()) return out;

    for (std::size_t i = 0; i < out.size(); ++i) {
        double start = out[i].start;
        double end = out[i].end;

        double bestStart = std::numeric_limits<double>::infinity();
        double bestEnd = std::numeric_limits<double>::infinity();
        for (const auto& w : words) {
            const double ds = std::abs(w.start - clips[i].start);
            if (ds < bestStart && ds <= tolerance) {
                bestStart = ds;
                start = w.start;
            }
            const double de = std::abs(w.end - clips[i].end);
            if (de < bestEnd && de <= tolerance) {
                bestEnd = de;
                end = w.end;
            }
        }

        if (end - start < constraints.minDuration) {
            end = start + constraints.minDuration;
        } else if (end - start > constraints.maxDuration) {
            end = start + constraints.maxDuration;
        }

        const bool inBounds = start >= 0.0 && end <= durationSec + contract::TIME_EPS;
        const bool clashPrev = i > 0 && overlaps(start, end, out[i - 1].start, out[i - 1].end);
        const bool clashNext = i + 1 < out.size() && overlaps(start, end, out[i + 1].start, out[i + 1].end);
        if (!inBounds || clashPrev || clashNext) continue;

        out[i].start = start;
        out[i].end = end;
    }
    return out;
}

}  // namespace selection
}  // namespace reelcut
