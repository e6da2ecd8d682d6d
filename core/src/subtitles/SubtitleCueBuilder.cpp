#include "reelcut/subtitles/SubtitleCueBuilder.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace reelcut {
namespace subtitles {

namespace {

std::string trim(const std::string& s) {
    std::size_t a = 0;
    std::size_t b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

}  // namespace

SubtitleCueBuilder::SubtitleCueBuilder(int wordsPerLine) : wordsPerLine_(std::max(1, wordsPerLine)) {}

std::vector<SubtitleCue> SubtitleCueBuilder::buildCues(const std::vector<TimedWord>& words,
                                                       double clipStart,
                                                       double clipEnd) const {
    std::vector<SubtitleCue> cues;
    const double length = clipEnd - clipStart;
    if (!(length > 0.0)) return cues;

    for (const auto& w : words) {
        if (!std::isfinite(w.start) || !std::isfinite(w.end)) continue;
        const double mid = 0.5 * (w.start + std::max(w.start, w.end));
        if (mid < clipStart || mid >= clipEnd) continue;

        std::string text = trim(w.text);
        if (text.empty()) continue;

        SubtitleCue cue;
        cue.word = std::move(text);
        cue.start = std::clamp(w.start - clipStart, 0.0, length);
        cue.end = std::clamp(w.end - clipStart, 0.0, length);
        if (!cues.empty()) cue.start = std::max(cue.start, cues.back().end);
        cue.end = std::max(cue.end, cue.start);
        cues.push_back(std::move(cue));
    }
    return cues;
}

std::vector<SubtitleLine> SubtitleCueBuilder::buildLines(const std::vector<SubtitleCue>& cues,
                                                         double clipLength) const {
    std::vector<SubtitleLine> lines;
    const auto perLine = static_cast<std::size_t>(wordsPerLine_);
    for (std::size_t i = 0; i < cues.size(); i += perLine) {
        const std::size_t n = std::min(perLine, cues.size() - i);
        SubtitleLine line;
        line.firstCue = i;
        line.cueCount = n;
        line.start = cues[i].start;
        line.end = std::min(clipLength, cues[i + n - 1].end + contract::LINE_TAIL_SEC);
        for (std::size_t j = i; j < i + n; ++j) {
            if (j > i) line.text += ' ';
            line.text += cues[j].word;
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

void SubtitleCueBuilder::attach(std::vector<SelectedClip>& clips, const std::vector<TimedWord>& words) const {
    for (auto& clip : clips) {
        clip.cues = buildCues(words, clip.start, clip.end);
        clip.lines = buildLines(clip.cues, clip.duration());
    }
}

}  // namespace subtitles
}  // namespace reelcut
