#include "reelcut/selection/ClipSelector.h"

#include <gtest/gtest.h>

using namespace reelcut;
using namespace reelcut::selection;

namespace {

Candidate candidate(double start, double end, double score) {
    Candidate c;
    c.start = start;
    c.end = end;
    c.score = score;
    c.reason = "high energy";
    return c;
}

SelectedClip clip(double start, double end) {
    SelectedClip c;
    c.start = start;
    c.end = end;
    return c;
}

TimedWord word(const std::string& text, double start, double end) {
    TimedWord w;
    w.text = text;
    w.start = start;
    w.end = end;
    return w;
}

}  // namespace

TEST(ClipSelector, OverlapIsHalfOpen) {
    EXPECT_FALSE(overlaps(0.0, 30.0, 30.0, 60.0));
    EXPECT_TRUE(overlaps(0.0, 30.0, 29.0, 60.0));
    EXPECT_TRUE(overlaps(10.0, 20.0, 0.0, 60.0));
}

TEST(ClipSelector, GreedySkipsOverlappingRunnerUp) {
    ClipSelector selector;
    const auto clips = selector.select(
        {candidate(0.0, 30.0, 0.9), candidate(20.0, 50.0, 0.85), candidate(60.0, 90.0, 0.8)}, 2);
    ASSERT_EQ(clips.size(), 2u);
    EXPECT_DOUBLE_EQ(clips[0].score, 0.9);
    EXPECT_EQ(clips[0].rank, 1);
    EXPECT_DOUBLE_EQ(clips[1].score, 0.8);
    EXPECT_EQ(clips[1].rank, 2);
}

TEST(ClipSelector, FewerCandidatesThanRequested) {
    ClipSelector selector;
    EXPECT_EQ(selector.select({candidate(10.0, 40.0, 0.5)}, 3).size(), 1u);
    EXPECT_TRUE(selector.select({}, 3).empty());
}

TEST(ClipSelector, OutputSortedByStartRankedByScore) {
    ClipSelector selector;
    const auto clips = selector.select({candidate(60.0, 90.0, 0.9), candidate(0.0, 30.0, 0.5)}, 3);
    ASSERT_EQ(clips.size(), 2u);
    EXPECT_DOUBLE_EQ(clips[0].start, 0.0);
    EXPECT_EQ(clips[0].rank, 2);
    EXPECT_DOUBLE_EQ(clips[1].start, 60.0);
    EXPECT_EQ(clips[1].rank, 1);
}

TEST(ClipSelector, AdjacentClipsBothSelected) {
    ClipSelector selector;
    const auto clips = selector.select({candidate(0.0, 30.0, 0.7), candidate(30.0, 60.0, 0.6)}, 2);
    EXPECT_EQ(clips.size(), 2u);
}

TEST(ClipSelector, EqualScoresPreferEarlierStart) {
    ClipSelector selector;
    const auto clips = selector.select({candidate(20.0, 50.0, 0.6), candidate(10.0, 40.0, 0.6)}, 1);
    ASSERT_EQ(clips.size(), 1u);
    EXPECT_DOUBLE_EQ(clips[0].start, 10.0);
}

TEST(ClipSelector, SnapMovesEdgesToWordBoundaries) {
    ClipSelector selector;
    const auto snapped = selector.snapToWords({clip(10.0, 30.0)},
                                              {word("so", 9.5, 10.2), word("done", 29.0, 29.8)},
                                              WindowConstraints{15.0, 60.0}, 100.0, 2.0);
    ASSERT_EQ(snapped.size(), 1u);
    EXPECT_DOUBLE_EQ(snapped[0].start, 9.5);
    EXPECT_DOUBLE_EQ(snapped[0].end, 29.8);
}

TEST(ClipSelector, SnapThatCreatesOverlapIsDiscarded) {
    ClipSelector selector;
    const auto snapped = selector.snapToWords({clip(0.0, 20.0), clip(20.0, 40.0)},
                                              {word("long", 0.0, 21.0)},
                                              WindowConstraints{15.0, 60.0}, 100.0, 2.0);
    ASSERT_EQ(snapped.size(), 2u);
    EXPECT_DOUBLE_EQ(snapped[0].end, 20.0);
    EXPECT_DOUBLE_EQ(snapped[1].start, 20.0);
}

TEST(ClipSelector, SnapPastVideoEndIsDiscarded) {
    ClipSelector selector;
    const auto snapped = selector.snapToWords({clip(80.0, 100.0)}, {word("outro", 99.0, 101.0)},
                                              WindowConstraints{15.0, 60.0}, 100.0, 2.0);
    EXPECT_DOUBLE_EQ(snapped[0].end, 100.0);
}
