#include "reelcut/Utility.h"

#include <fmt/core.h>

#include <cmath>
#include <stdexcept>

namespace reelcut {

std::string signal_kind_to_string(SignalKind kind) {
    switch (kind) {
        case SignalKind::AudioEnergy:
            return "audio_energy";
        case SignalKind::KeywordDensity:
            return "keyword_density";
        case SignalKind::SceneChange:
            return "scene_change";
        case SignalKind::ChapterMarker:
            return "chapter_marker";
    }
    return "audio_energy";
}

SignalKind signal_kind_from_string(const std::string& value) {
    if (value == "audio_energy") {
        return SignalKind::AudioEnergy;
    }
    if (value == "keyword_density") {
        return SignalKind::KeywordDensity;
    }
    if (value == "scene_change") {
        return SignalKind::SceneChange;
    }
    if (value == "chapter_marker") {
        return SignalKind::ChapterMarker;
    }
    throw std::runtime_error("Unknown signal kind: " + value);
}

std::string signal_kind_label(SignalKind kind) {
    switch (kind) {
        case SignalKind::AudioEnergy:
            return "high energy";
        case SignalKind::KeywordDensity:
            return "keyword";
        case SignalKind::SceneChange:
            return "scene change";
        case SignalKind::ChapterMarker:
            return "chapter";
    }
    return "multi-signal";
}

std::string format_duration(double seconds) {
    const long total = (std::isfinite(seconds) && seconds > 0.0) ? static_cast<long>(seconds) : 0;
    const long s = total % 60;
    const long m = (total / 60) % 60;
    const long h = total / 3600;
    if (h > 0) {
        return fmt::format("{}:{:02d}:{:02d}", h, m, s);
    }
    return fmt::format("{}:{:02d}", m, s);
}

std::string format_timecode(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) seconds = 0.0;
    const long long totalMs = std::llround(seconds * 1000.0);
    const long long ms = totalMs % 1000;
    const long long totalSec = totalMs / 1000;
    return fmt::format("{:02d}:{:02d}:{:02d}.{:03d}", totalSec / 3600, (totalSec / 60) % 60, totalSec % 60, ms);
}

std::string format_clip_caption(const SelectedClip& clip, std::size_t index, std::size_t total) {
    return fmt::format("Clip {}/{} | {} | @ {} | {}",
                       index, total, format_duration(clip.duration()), format_duration(clip.start), clip.reason);
}

}  // namespace reelcut
