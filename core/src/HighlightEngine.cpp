#include "reelcut/HighlightEngine.h"
#include "reelcut/CoreContract.h"
#include "reelcut/Errors.h"
#include "reelcut/Logging.h"
#include "reelcut/Normalization.h"
#include "reelcut/Utility.h"

#include <algorithm>
#include <cmath>

namespace reelcut {

namespace {

HighlightConfig validated(HighlightConfig config) {
    validate_config(config);
    return config;
}

void note_latest(double& latest, double t) {
    if (std::isfinite(t)) latest = std::max(latest, t);
}

}  // namespace

HighlightEngine::HighlightEngine(HighlightConfig config)
    : config_(validated(std::move(config))),
      keywordExtractor_(config_.keywords, config_.keywordWindow),
      cueBuilder_(config_.wordsPerLine) {}

double HighlightEngine::resolveDuration(const HighlightRequest& request) const {
    if (std::isfinite(request.durationSeconds) && request.durationSeconds > 0.0) {
        return request.durationSeconds;
    }

    double latest = 0.0;
    for (const auto& w : request.words) note_latest(latest, w.end);
    for (const auto& s : request.loudness) note_latest(latest, s.timestamp + config_.sampleStep);
    for (double t : request.sceneCuts) note_latest(latest, t);
    if (request.chapters) {
        for (const auto& ch : *request.chapters) note_latest(latest, ch.start);
    }
    REELCUT_LOG_WARN("video {}: duration not supplied, inferred {:.1f}s from inputs", request.videoId, latest);
    return latest;
}

SignalMap HighlightEngine::buildSignals(const HighlightRequest& request,
                                        double durationSec,
                                        std::vector<SignalKind>& missing) const {
    const RawSignal raw[] = {
        audioExtractor_.extract(request.loudness, durationSec),
        keywordExtractor_.extract(request.words),
        sceneExtractor_.extract(request.sceneCuts, durationSec),
        chapterExtractor_.extract(request.chapters, durationSec),
    };

    SignalMap signals;
    for (const auto& r : raw) {
        if (r.samples.empty()) {
            missing.push_back(r.kind);
            continue;
        }
        REELCUT_LOG_DEBUG("signal {}: {} samples", signal_kind_to_string(r.kind), r.samples.size());
        signals[r.kind] = normalize_signal(r);
    }
    return signals;
}

std::vector<SelectedClip> HighlightEngine::chapterClips(const HighlightRequest& request, double durationSec) const {
    std::vector<SelectedClip> clips;
    for (const auto& span : chapterExtractor_.spans(request.chapters, durationSec)) {
        const double len = span.end - span.start;
        if (len < config_.minDuration || len > config_.maxDuration) continue;
        SelectedClip clip;
        clip.start = span.start;
        clip.end = span.end;
        clip.score = 1.0;
        clip.dominantSignal = SignalKind::ChapterMarker;
        clip.reason = "Chapter: " + span.title.substr(0, contract::CHAPTER_TITLE_MAX);
        clips.push_back(std::move(clip));
    }
    if (clips.size() < static_cast<std::size_t>(config_.clipCount)) return {};

    clips.resize(static_cast<std::size_t>(config_.clipCount));
    for (std::size_t i = 0; i < clips.size(); ++i) clips[i].rank = static_cast<int>(i) + 1;
    return clips;
}

HighlightResult HighlightEngine::run(const HighlightRequest& request) const {
    HighlightResult result;
    result.videoId = request.videoId;
    result.title = request.title;

    // Step 1: Extract and normalize every available signal
    const bool noInputs = request.words.empty() && request.loudness.empty() && request.sceneCuts.empty() &&
                          (!request.chapters || request.chapters->empty());
    if (noInputs) {
        throw InsufficientSignal("video " + request.videoId +
                                 ": no loudness data, no transcript, no scene cuts and no chapters");
    }

    const double duration = resolveDuration(request);
    result.durationSeconds = duration;

    SignalMap signals = buildSignals(request, duration, result.missingSignals);
    if (signals.empty()) {
        // Inputs exist but none yields a usable signal (e.g. a transcript without triggers)
        REELCUT_LOG_INFO("video {}: inputs carry no usable signal, no highlights detected", request.videoId);
        return result;
    }
    if (!(duration > 0.0)) {
        throw InsufficientSignal("video " + request.videoId + ": duration is unknown and inputs carry no timestamps");
    }
    for (SignalKind kind : result.missingSignals) {
        REELCUT_LOG_WARN("video {}: no {} data, fusing without it", request.videoId, signal_kind_to_string(kind));
    }

    // Step 2: Fuse onto the fixed-step timeline
    result.timeline = scorer_.fuse(signals, config_.signalWeights, duration, config_.sampleStep, config_.decayWindow);

    // Step 3: Chapter fast path
    if (config_.preferChapterClips) {
        auto clips = chapterClips(request, duration);
        if (!clips.empty()) {
            REELCUT_LOG_INFO("video {}: using {} chapter-based clips", request.videoId, clips.size());
            cueBuilder_.attach(clips, request.words);
            result.clips = std::move(clips);
            result.usedChapterClips = true;
            return result;
        }
    }

    // Step 4: Candidate windows around score peaks
    const auto candidates = candidateGenerator_.generate(result.timeline, config_.window(), config_.peakThreshold);
    result.candidateCount = candidates.size();
    REELCUT_LOG_INFO("video {}: {} candidate windows", request.videoId, candidates.size());
    if (candidates.empty()) {
        REELCUT_LOG_INFO("video {}: no highlights detected", request.videoId);
        return result;
    }

    // Step 5: Greedy non-overlapping selection (+ optional word snapping)
    auto clips = selector_.select(candidates, config_.clipCount);
    if (config_.snapToWordBoundaries) {
        clips = selector_.snapToWords(clips, request.words, config_.window(), duration, config_.snapTolerance);
    }

    // Step 6: Subtitle cues per clip
    cueBuilder_.attach(clips, request.words);

    for (const auto& clip : clips) {
        REELCUT_LOG_INFO("video {}: clip #{} {}-{} score {:.3f} ({})", request.videoId, clip.rank,
                         format_timecode(clip.start), format_timecode(clip.end), clip.score, clip.reason);
    }
    result.clips = std::move(clips);
    return result;
}

}  // namespace reelcut
