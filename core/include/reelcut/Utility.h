#pragma once

#include "reelcut/ClipTypes.h"

#include <string>

namespace reelcut {

// Shown to the end user when a run produced no clips.
constexpr const char* kNoHighlightsMessage =
    "Could not detect any highlights. Try a longer video or different content.";

std::string signal_kind_to_string(SignalKind kind);
SignalKind signal_kind_from_string(const std::string& value);

// Human-readable reason tag for a dominant signal ("high energy", "keyword", ...).
std::string signal_kind_label(SignalKind kind);

// 92 -> "1:32", 3725 -> "1:02:05"
std::string format_duration(double seconds);

// 83.25 -> "00:01:23.250" (media toolchain -ss/-to format)
std::string format_timecode(double seconds);

// "Clip 1/3 | 0:25 | @ 1:32 | high energy"
std::string format_clip_caption(const SelectedClip& clip, std::size_t index, std::size_t total);

}  // namespace reelcut
