#pragma once

#include "reelcut/ClipTypes.h"
#include "reelcut/CoreContract.h"

#include <optional>
#include <string>
#include <vector>

namespace reelcut {

/**
 * HighlightConfig: all knobs of one engine run.
 *
 * Valid domains (enforced by validate_config, see CoreContract.h):
 *   clipCount      [1,5]
 *   minDuration    [10,30] s
 *   maxDuration    [30,60] s, >= minDuration
 *   signalWeights  finite, >= 0, not all zero
 *   sampleStep     (0, minDuration]
 *   decayWindow, keywordWindow, snapTolerance  >= 0
 *   peakThreshold  [0,1)
 *   wordsPerLine   >= 1
 */
struct HighlightConfig {
    int clipCount{contract::DEFAULT_CLIP_COUNT};
    double minDuration{contract::DEFAULT_MIN_DURATION};
    double maxDuration{contract::DEFAULT_MAX_DURATION};
    SignalWeights signalWeights{
        {SignalKind::AudioEnergy, contract::DEFAULT_AUDIO_ENERGY_WEIGHT},
        {SignalKind::KeywordDensity, contract::DEFAULT_KEYWORD_WEIGHT},
        {SignalKind::SceneChange, contract::DEFAULT_SCENE_CHANGE_WEIGHT},
        {SignalKind::ChapterMarker, contract::DEFAULT_CHAPTER_MARKER_WEIGHT},
    };
    std::vector<std::string> keywords;   // trigger words/phrases; see default_keywords()
    double sampleStep{contract::DEFAULT_SAMPLE_STEP_SEC};
    double decayWindow{contract::DEFAULT_DECAY_WINDOW_SEC};
    double keywordWindow{contract::DEFAULT_KEYWORD_WINDOW_SEC};
    double peakThreshold{contract::DEFAULT_PEAK_THRESHOLD};

    // Use chapter spans directly when enough of them fit the duration bounds.
    bool preferChapterClips{false};
    // Snap selected clip edges to nearby word boundaries.
    bool snapToWordBoundaries{false};
    double snapTolerance{contract::DEFAULT_SNAP_TOLERANCE_SEC};

    int wordsPerLine{contract::DEFAULT_WORDS_PER_LINE};
    // Applied by the front end through logging::set_level; the engine only logs.
    std::string logLevel{"info"};

    WindowConstraints window() const { return WindowConstraints{minDuration, maxDuration}; }
};

// Per-user overrides persisted by the front end.
struct UserSettings {
    std::string userId;
    std::optional<int> clipCount;
    std::optional<double> minDuration;
    std::optional<double> maxDuration;
};

std::vector<std::string> default_keywords();

// Defaults with the default keyword list filled in.
HighlightConfig default_config();

// Throws InvalidConfiguration naming the first offending field.
void validate_config(const HighlightConfig& config);

/**
 * Build a configuration from environment variables on top of default_config().
 *
 * MAX_CLIPS_PER_VIDEO, CLIP_MIN_DURATION, CLIP_MAX_DURATION,
 * AUDIO_ENERGY_WEIGHT, KEYWORD_WEIGHT, SCENE_CHANGE_WEIGHT, CHAPTER_MARKER_WEIGHT,
 * SAMPLE_STEP, DECAY_WINDOW, LOG_LEVEL
 *
 * Unset variables keep their defaults; unparsable values throw InvalidConfiguration.
 * The result is not validated.
 */
HighlightConfig load_config_from_env();

// Merge per-user overrides over a base configuration (unset fields keep the base value).
HighlightConfig apply_user_settings(const HighlightConfig& base, const UserSettings& settings);

}  // namespace reelcut
