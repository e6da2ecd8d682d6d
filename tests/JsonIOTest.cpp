#include "JsonIO.h"

#include "reelcut/Utility.h"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

using namespace reelcut;

TEST(JsonIO, ReadsAnalysisDocument) {
    std::istringstream in(R"({
        "video_id": "abc",
        "title": "Demo",
        "duration": 95.5,
        "words": [{"text": "wow", "start": 1.0, "end": 1.3}],
        "loudness": [{"t": 0.0, "value": -20.0}, {"t": 1.0, "value": -12.5}],
        "scene_cuts": [12.4, 30],
        "chapters": [{"start": 0, "title": "Intro"}]
    })");
    const HighlightRequest request = cli::read_request(in);
    EXPECT_EQ(request.videoId, "abc");
    EXPECT_DOUBLE_EQ(request.durationSeconds, 95.5);
    ASSERT_EQ(request.words.size(), 1u);
    EXPECT_DOUBLE_EQ(request.words[0].confidence, 1.0);
    ASSERT_EQ(request.loudness.size(), 2u);
    EXPECT_DOUBLE_EQ(request.loudness[1].value, -12.5);
    ASSERT_EQ(request.sceneCuts.size(), 2u);
    ASSERT_TRUE(request.chapters.has_value());
    EXPECT_EQ(request.chapters->at(0).title, "Intro");
}

TEST(JsonIO, NullChaptersAreAbsent) {
    std::istringstream in(R"({"video_id": "x", "chapters": null})");
    EXPECT_FALSE(cli::read_request(in).chapters.has_value());

    std::istringstream none(R"({"video_id": "x"})");
    EXPECT_FALSE(cli::read_request(none).chapters.has_value());
}

TEST(JsonIO, MalformedInputRejected) {
    std::istringstream broken("{\"video_id\": ");
    EXPECT_THROW(cli::read_request(broken), std::runtime_error);

    std::istringstream wrongType(R"({"duration": "long"})");
    EXPECT_THROW(cli::read_request(wrongType), std::runtime_error);

    std::istringstream notArray(R"({"scene_cuts": 5})");
    EXPECT_THROW(cli::read_request(notArray), std::runtime_error);
}

TEST(JsonIO, ResultCarriesClipsAndMessage) {
    HighlightResult result;
    result.videoId = "abc";
    result.timeline.weights = {{SignalKind::AudioEnergy, 1.0}};
    result.missingSignals = {SignalKind::ChapterMarker};

    Json::Value empty = cli::result_to_json(result);
    EXPECT_EQ(empty["clips"].size(), 0u);
    EXPECT_EQ(empty["message"].asString(), kNoHighlightsMessage);
    EXPECT_EQ(empty["missing_signals"][0].asString(), "chapter_marker");

    SelectedClip clip;
    clip.start = 92.0;
    clip.end = 117.0;
    clip.rank = 1;
    clip.reason = "high energy";
    clip.cues = {SubtitleCue{"wow", 0.5, 0.9}};
    result.clips = {clip};

    Json::Value full = cli::result_to_json(result);
    ASSERT_EQ(full["clips"].size(), 1u);
    EXPECT_FALSE(full.isMember("message"));
    EXPECT_EQ(full["clips"][0]["dominant_signal"].asString(), "audio_energy");
    EXPECT_EQ(full["clips"][0]["ss"].asString(), "00:01:32.000");
    EXPECT_EQ(full["clips"][0]["caption"].asString(), "Clip 1/1 | 0:25 | @ 1:32 | high energy");
    EXPECT_EQ(full["clips"][0]["cues"][0]["word"].asString(), "wow");
    EXPECT_DOUBLE_EQ(full["weights"]["audio_energy"].asDouble(), 1.0);
}
