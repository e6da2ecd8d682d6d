#pragma once

#include "../ClipTypes.h"
#include "../CoreContract.h"

#include <vector>

namespace reelcut {
namespace subtitles {

/**
 * SubtitleCueBuilder: global transcript -> clip-relative word cues
 *
 * A word belongs to a clip iff its midpoint lies in [clip.start, clip.end), so a
 * word straddling the boundary of two adjacent clips lands in exactly one.
 * Cue times are rebased to the clip start, clamped into [0, clip length] and
 * kept non-overlapping. Styling is left to the rendering collaborator.
 */
class SubtitleCueBuilder {
public:
    explicit SubtitleCueBuilder(int wordsPerLine = contract::DEFAULT_WORDS_PER_LINE);

    std::vector<SubtitleCue> buildCues(const std::vector<TimedWord>& words, double clipStart, double clipEnd) const;

    // Group cues wordsPerLine at a time; a line lingers LINE_TAIL_SEC after its last word.
    std::vector<SubtitleLine> buildLines(const std::vector<SubtitleCue>& cues, double clipLength) const;

    // Fill cues and lines of every clip in place.
    void attach(std::vector<SelectedClip>& clips, const std::vector<TimedWord>& words) const;

private:
    int wordsPerLine_;
};

}  // namespace subtitles
}  // namespace reelcut
