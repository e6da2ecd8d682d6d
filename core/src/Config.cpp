#include "reelcut/Config.h"
#include "reelcut/Errors.h"
#include "reelcut/Logging.h"
#include "reelcut/Utility.h"

#include <cmath>
#include <cstdlib>
#include <string>

namespace reelcut {

namespace {

const char* env_or_null(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

int parse_int(const char* name, const char* text) {
    try {
        std::size_t pos = 0;
        const int v = std::stoi(text, &pos);
        if (pos != std::string(text).size()) throw std::invalid_argument(text);
        return v;
    } catch (const std::logic_error&) {
        throw InvalidConfiguration(std::string(name) + " is not an integer: " + text);
    }
}

double parse_double(const char* name, const char* text) {
    try {
        std::size_t pos = 0;
        const double v = std::stod(text, &pos);
        if (pos != std::string(text).size()) throw std::invalid_argument(text);
        return v;
    } catch (const std::logic_error&) {
        throw InvalidConfiguration(std::string(name) + " is not a number: " + text);
    }
}

void read_int(const char* name, int& out) {
    if (const char* v = env_or_null(name)) out = parse_int(name, v);
}

void read_double(const char* name, double& out) {
    if (const char* v = env_or_null(name)) out = parse_double(name, v);
}

void require(bool ok, const std::string& message) {
    if (!ok) throw InvalidConfiguration(message);
}

}  // namespace

std::vector<std::string> default_keywords() {
    return {
        "wait", "listen", "actually", "insane", "crazy", "no way",
        "what", "omg", "wow", "legendary", "fail", "win", "sick",
        "bro", "literally", "shocking", "unbelievable", "secret",
        "wait for it", "you won't believe", "fire", "goat",
        "clutch", "let's go", "no", "yes", "really", "seriously",
        "warte", "krass", "unfassbar", "unmöglich", "ehrlich",
    };
}

HighlightConfig default_config() {
    HighlightConfig config;
    config.keywords = default_keywords();
    return config;
}

void validate_config(const HighlightConfig& c) {
    require(c.clipCount >= contract::CLIP_COUNT_MIN && c.clipCount <= contract::CLIP_COUNT_MAX,
            "clip_count must be in [1,5], got " + std::to_string(c.clipCount));
    require(std::isfinite(c.minDuration) &&
                c.minDuration >= contract::MIN_DURATION_LOWER && c.minDuration <= contract::MIN_DURATION_UPPER,
            "min_duration must be in [10,30] seconds, got " + std::to_string(c.minDuration));
    require(std::isfinite(c.maxDuration) &&
                c.maxDuration >= contract::MAX_DURATION_LOWER && c.maxDuration <= contract::MAX_DURATION_UPPER,
            "max_duration must be in [30,60] seconds, got " + std::to_string(c.maxDuration));
    require(c.minDuration <= c.maxDuration,
            "min_duration (" + std::to_string(c.minDuration) + ") exceeds max_duration (" +
                std::to_string(c.maxDuration) + ")");

    double weightSum = 0.0;
    for (const auto& [kind, w] : c.signalWeights) {
        require(std::isfinite(w) && w >= 0.0,
                "weight for " + signal_kind_to_string(kind) + " must be finite and >= 0");
        weightSum += w;
    }
    require(weightSum > 0.0, "signal weights are all zero");

    require(std::isfinite(c.sampleStep) && c.sampleStep > 0.0 && c.sampleStep <= c.minDuration,
            "sample_step must be in (0, min_duration]");
    require(std::isfinite(c.decayWindow) && c.decayWindow >= 0.0, "decay_window must be >= 0");
    require(std::isfinite(c.keywordWindow) && c.keywordWindow >= 0.0, "keyword_window must be >= 0");
    require(std::isfinite(c.peakThreshold) && c.peakThreshold >= 0.0 && c.peakThreshold < 1.0,
            "peak_threshold must be in [0,1)");
    require(std::isfinite(c.snapTolerance) && c.snapTolerance >= 0.0, "snap_tolerance must be >= 0");
    require(c.wordsPerLine >= 1, "words_per_line must be >= 1");
    logging::level_from_string(c.logLevel);
}

HighlightConfig load_config_from_env() {
    HighlightConfig config = default_config();

    read_int("MAX_CLIPS_PER_VIDEO", config.clipCount);
    read_double("CLIP_MIN_DURATION", config.minDuration);
    read_double("CLIP_MAX_DURATION", config.maxDuration);
    read_double("AUDIO_ENERGY_WEIGHT", config.signalWeights[SignalKind::AudioEnergy]);
    read_double("KEYWORD_WEIGHT", config.signalWeights[SignalKind::KeywordDensity]);
    read_double("SCENE_CHANGE_WEIGHT", config.signalWeights[SignalKind::SceneChange]);
    read_double("CHAPTER_MARKER_WEIGHT", config.signalWeights[SignalKind::ChapterMarker]);
    read_double("SAMPLE_STEP", config.sampleStep);
    read_double("DECAY_WINDOW", config.decayWindow);
    if (const char* v = env_or_null("LOG_LEVEL")) config.logLevel = v;

    return config;
}

HighlightConfig apply_user_settings(const HighlightConfig& base, const UserSettings& settings) {
    HighlightConfig out = base;
    if (settings.clipCount) out.clipCount = *settings.clipCount;
    if (settings.minDuration) out.minDuration = *settings.minDuration;
    if (settings.maxDuration) out.maxDuration = *settings.maxDuration;
    return out;
}

}  // namespace reelcut
