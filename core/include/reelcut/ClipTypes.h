#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace reelcut {

// ========== Collaborator inputs ==========

// One transcribed word. Produced by the transcription collaborator, ordered by start.
struct TimedWord {
    std::string text;
    double start{0.0};        // seconds
    double end{0.0};          // seconds
    double confidence{1.0};   // [0,1]
};

struct SignalSample {
    double timestamp{0.0};    // seconds
    double value{0.0};
};

struct Chapter {
    double start{0.0};
    std::string title;
};

// ========== Signals ==========

enum class SignalKind {
    AudioEnergy,
    KeywordDensity,
    SceneChange,
    ChapterMarker
};

// Fixed iteration order; also the tie-break order for dominant signal labeling.
constexpr std::array<SignalKind, 4> kAllSignalKinds = {
    SignalKind::AudioEnergy,
    SignalKind::KeywordDensity,
    SignalKind::SceneChange,
    SignalKind::ChapterMarker,
};

struct RawSignal {
    SignalKind kind{SignalKind::AudioEnergy};
    // Impulse signals (cuts, chapters) are implicitly 0 wherever no sample exists.
    bool impulse{false};
    std::vector<SignalSample> samples;
};

struct NormalizedSignal {
    SignalKind kind{SignalKind::AudioEnergy};
    std::vector<SignalSample> samples;   // values in [0,1]
};

// Kinds absent from a map have no data for this video (not "low score").
using SignalMap = std::map<SignalKind, NormalizedSignal>;
using SignalWeights = std::map<SignalKind, double>;

// ========== Score timeline ==========

struct ScorePoint {
    double timestamp{0.0};
    double score{0.0};        // [0,1]
};

/**
 * Dense fused timeline.
 * points[k].timestamp = k * step, k = 0..ceil(duration/step)-1;
 * each point stands for [k*step, (k+1)*step).
 */
struct ScoreTimeline {
    double step{1.0};
    double duration{0.0};
    std::vector<ScorePoint> points;
    // Weighted per-kind contribution at every point (same length as points).
    std::map<SignalKind, std::vector<double>> contributions;
    // Renormalized weights actually applied (sum to 1 over present kinds).
    SignalWeights weights;
};

// ========== Clips ==========

struct WindowConstraints {
    double minDuration{15.0};
    double maxDuration{60.0};
};

struct Candidate {
    double start{0.0};
    double end{0.0};
    double score{0.0};
    SignalKind dominantSignal{SignalKind::AudioEnergy};
    std::string reason;

    double duration() const { return end - start; }
};

struct SubtitleCue {
    std::string word;
    double start{0.0};        // clip-relative seconds
    double end{0.0};          // clip-relative seconds
};

// Consecutive cues displayed together; highlight timing comes from the cues themselves.
struct SubtitleLine {
    double start{0.0};
    double end{0.0};
    std::string text;
    std::size_t firstCue{0};
    std::size_t cueCount{0};
};

struct SelectedClip {
    double start{0.0};
    double end{0.0};
    double score{0.0};
    SignalKind dominantSignal{SignalKind::AudioEnergy};
    std::string reason;
    int rank{0};              // 1 = highest score
    std::vector<SubtitleCue> cues;
    std::vector<SubtitleLine> lines;

    double duration() const { return end - start; }
};

// ========== Pipeline request / result ==========

struct HighlightRequest {
    std::string videoId;          // logical id used for persistence
    std::string title;
    double durationSeconds{0.0};  // <= 0: inferred from the latest input timestamp
    std::vector<TimedWord> words;
    std::vector<SignalSample> loudness;
    std::vector<double> sceneCuts;
    std::optional<std::vector<Chapter>> chapters;
};

struct HighlightResult {
    std::string videoId;
    std::string title;
    double durationSeconds{0.0};
    ScoreTimeline timeline;
    std::size_t candidateCount{0};
    std::vector<SelectedClip> clips;          // sorted by start
    std::vector<SignalKind> missingSignals;   // degraded, fusion renormalized without them
    bool usedChapterClips{false};
};

}  // namespace reelcut
