#include "reelcut/subtitles/SubtitleCueBuilder.h"

#include <gtest/gtest.h>

using namespace reelcut;
using namespace reelcut::subtitles;

namespace {

TimedWord word(const std::string& text, double start, double end) {
    TimedWord w;
    w.text = text;
    w.start = start;
    w.end = end;
    return w;
}

SelectedClip clip(double start, double end) {
    SelectedClip c;
    c.start = start;
    c.end = end;
    return c;
}

}  // namespace

TEST(SubtitleCueBuilder, BoundaryWordsAssignedByMidpoint) {
    SubtitleCueBuilder builder;
    const std::vector<TimedWord> words = {
        word("before", 8.0, 9.0),    // mid 8.5, outside
        word("edge", 9.6, 10.6),     // mid 10.1, inside
        word("inside", 12.0, 12.5),
        word("late", 19.0, 19.8),
        word("tail", 19.6, 20.6),    // mid 20.1, outside
    };
    const auto cues = builder.buildCues(words, 10.0, 20.0);
    ASSERT_EQ(cues.size(), 3u);
    EXPECT_EQ(cues[0].word, "edge");
    EXPECT_DOUBLE_EQ(cues[0].start, 0.0);
    EXPECT_NEAR(cues[0].end, 0.6, 1e-9);
    EXPECT_EQ(cues[1].word, "inside");
    EXPECT_DOUBLE_EQ(cues[1].start, 2.0);
    EXPECT_EQ(cues[2].word, "late");
    EXPECT_DOUBLE_EQ(cues[2].start, 9.0);
}

TEST(SubtitleCueBuilder, WordOnClipBoundaryBelongsToExactlyOneClip) {
    SubtitleCueBuilder builder;
    std::vector<SelectedClip> clips = {clip(0.0, 10.0), clip(10.0, 20.0)};
    builder.attach(clips, {word("split", 9.5, 10.5)});   // mid exactly 10.0
    EXPECT_TRUE(clips[0].cues.empty());
    ASSERT_EQ(clips[1].cues.size(), 1u);
    EXPECT_DOUBLE_EQ(clips[1].cues[0].start, 0.0);
}

TEST(SubtitleCueBuilder, CuesNeverOverlap) {
    SubtitleCueBuilder builder;
    const auto cues = builder.buildCues({word("a", 1.0, 2.0), word("b", 1.5, 2.5)}, 0.0, 10.0);
    ASSERT_EQ(cues.size(), 2u);
    EXPECT_DOUBLE_EQ(cues[1].start, 2.0);
    EXPECT_DOUBLE_EQ(cues[1].end, 2.5);
}

TEST(SubtitleCueBuilder, BlankWordsSkipped) {
    SubtitleCueBuilder builder;
    const auto cues = builder.buildCues({word("  ", 1.0, 1.2), word(" hi ", 2.0, 2.3)}, 0.0, 10.0);
    ASSERT_EQ(cues.size(), 1u);
    EXPECT_EQ(cues[0].word, "hi");
}

TEST(SubtitleCueBuilder, LinesGroupWordsAndKeepTail) {
    SubtitleCueBuilder builder(4);
    std::vector<TimedWord> words;
    for (int i = 0; i < 6; ++i) {
        words.push_back(word("w" + std::to_string(i + 1), 1.0 + i, 1.5 + i));
    }
    const auto cues = builder.buildCues(words, 0.0, 6.6);
    ASSERT_EQ(cues.size(), 6u);

    const auto lines = builder.buildLines(cues, 6.6);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].text, "w1 w2 w3 w4");
    EXPECT_EQ(lines[0].firstCue, 0u);
    EXPECT_EQ(lines[0].cueCount, 4u);
    EXPECT_DOUBLE_EQ(lines[0].start, 1.0);
    EXPECT_NEAR(lines[0].end, 4.8, 1e-9);
    EXPECT_EQ(lines[1].text, "w5 w6");
    EXPECT_EQ(lines[1].cueCount, 2u);
    EXPECT_NEAR(lines[1].end, 6.6, 1e-9);   // 6.5 + tail, clipped to the clip
}
