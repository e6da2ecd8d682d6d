#include "reelcut/signals/ChapterMarkers.h"
#include "reelcut/CoreContract.h"

#include <algorithm>
#include <cmath>

namespace reelcut {
namespace signals {

namespace {

std::vector<Chapter> valid_chapters(const std::optional<std::vector<Chapter>>& chapters, double durationSec) {
    std::vector<Chapter> out;
    if (!chapters) return out;
    for (const auto& ch : *chapters) {
        if (!std::isfinite(ch.start) || ch.start < 0.0) continue;
        if (durationSec > 0.0 && ch.start >= durationSec) continue;
        out.push_back(ch);
    }
    std::stable_sort(out.begin(), out.end(), [](const Chapter& a, const Chapter& b) { return a.start < b.start; });
    return out;
}

}  // namespace

RawSignal ChapterMarkerExtractor::extract(const std::optional<std::vector<Chapter>>& chapters,
                                          double durationSec) const {
    RawSignal out;
    out.kind = SignalKind::ChapterMarker;
    out.impulse = true;
    for (const auto& ch : valid_chapters(chapters, durationSec)) {
        out.samples.push_back(SignalSample{ch.start, 1.0});
    }
    return out;
}

std::vector<ChapterSpan> ChapterMarkerExtractor::spans(const std::optional<std::vector<Chapter>>& chapters,
                                                       double durationSec) const {
    const auto sorted = valid_chapters(chapters, durationSec);
    std::vector<ChapterSpan> out;
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        ChapterSpan span;
        span.start = sorted[i].start;
        span.end = (i + 1 < sorted.size()) ? sorted[i + 1].start : durationSec;
        span.title = sorted[i].title;
        if (span.end - span.start > contract::TIME_EPS) out.push_back(std::move(span));
    }
    return out;
}

}  // namespace signals
}  // namespace reelcut
