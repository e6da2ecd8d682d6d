#include "JsonIO.h"

#include "reelcut/Errors.h"
#include "reelcut/HighlightEngine.h"
#include "reelcut/Logging.h"
#include "reelcut/selection/ClipSelector.h"

#include <gtest/gtest.h>

#include <cmath>

using namespace reelcut;

namespace {

HighlightConfig config_with(double minDuration, double maxDuration, int clipCount = 3) {
    HighlightConfig config = default_config();
    config.minDuration = minDuration;
    config.maxDuration = maxDuration;
    config.clipCount = clipCount;
    return config;
}

TimedWord word(const std::string& text, double start, double end) {
    TimedWord w;
    w.text = text;
    w.start = start;
    w.end = end;
    return w;
}

// 120 s of quiet audio with one loud second at t=42.
HighlightRequest spike_request() {
    HighlightRequest request;
    request.videoId = "spike";
    request.title = "Spike";
    request.durationSeconds = 120.0;
    for (int t = 0; t < 120; ++t) {
        request.loudness.push_back(SignalSample{static_cast<double>(t), t == 42 ? -10.0 : -40.0});
    }
    return request;
}

// Ten minutes with bursts of loudness, cuts and trigger words.
HighlightRequest busy_request() {
    HighlightRequest request;
    request.videoId = "busy";
    request.durationSeconds = 600.0;
    for (int t = 0; t < 600; ++t) {
        const double wave = std::sin(t * 0.05) * 10.0 + std::sin(t * 0.31) * 4.0;
        request.loudness.push_back(SignalSample{static_cast<double>(t), -30.0 + wave});
    }
    request.sceneCuts = {35.0, 36.5, 120.0, 240.0, 241.0, 242.0, 400.0, 555.0};
    const char* filler[] = {"and", "then", "we", "went", "there"};
    for (int i = 0; i < 1000; ++i) {
        const double start = i * 0.6;
        std::string text = filler[i % 5];
        if (i % 97 == 0) text = "insane";
        if (i % 131 == 0) text = "wow!";
        request.words.push_back(word(text, start, start + 0.4));
    }
    return request;
}

// The engine logs through the process-wide threshold; keep test output quiet.
class HighlightEngineTest : public ::testing::Test {
  protected:
    void SetUp() override {
        savedLevel_ = logging::level();
        logging::set_level(logging::Level::Error);
    }
    void TearDown() override { logging::set_level(savedLevel_); }

  private:
    logging::Level savedLevel_{logging::Level::Info};
};

}  // namespace

TEST_F(HighlightEngineTest, InvalidConfigurationRejectedUpFront) {
    HighlightConfig config = default_config();
    config.clipCount = 0;
    EXPECT_THROW(HighlightEngine{config}, InvalidConfiguration);
}

TEST_F(HighlightEngineTest, SingleAudioSpikeBecomesOneClip) {
    HighlightEngine engine(config_with(15.0, 30.0, 1));
    const auto result = engine.run(spike_request());

    ASSERT_EQ(result.clips.size(), 1u);
    const auto& clip = result.clips[0];
    EXPECT_LE(clip.start, 42.0);
    EXPECT_GT(clip.end, 42.0);
    EXPECT_GE(clip.duration(), 15.0);
    EXPECT_LE(clip.duration(), 30.0);
    EXPECT_EQ(clip.dominantSignal, SignalKind::AudioEnergy);
    EXPECT_EQ(clip.reason, "high energy");
    EXPECT_EQ(clip.rank, 1);

    ASSERT_EQ(result.timeline.weights.size(), 1u);
    EXPECT_DOUBLE_EQ(result.timeline.weights.at(SignalKind::AudioEnergy), 1.0);
    EXPECT_EQ(result.missingSignals.size(), 3u);
    EXPECT_FALSE(result.usedChapterClips);
}

TEST_F(HighlightEngineTest, NoSignalAtAllThrows) {
    HighlightEngine engine(config_with(15.0, 60.0));
    HighlightRequest request;
    request.videoId = "silent";
    request.durationSeconds = 90.0;
    EXPECT_THROW(engine.run(request), InsufficientSignal);
}

TEST_F(HighlightEngineTest, TranscriptWithoutTriggersYieldsEmptyResult) {
    HighlightEngine engine(config_with(15.0, 60.0));
    HighlightRequest request;
    request.videoId = "chatty";
    request.durationSeconds = 120.0;
    for (int i = 0; i < 200; ++i) {
        request.words.push_back(word("hello", i * 0.6, i * 0.6 + 0.4));
    }

    HighlightResult result;
    ASSERT_NO_THROW(result = engine.run(request));
    EXPECT_TRUE(result.clips.empty());
    EXPECT_EQ(result.candidateCount, 0u);
    EXPECT_DOUBLE_EQ(result.durationSeconds, 120.0);
    EXPECT_EQ(result.missingSignals.size(), 4u);
}

TEST_F(HighlightEngineTest, StrayLoudnessPastEndDoesNotFlattenSpike) {
    HighlightEngine engine(config_with(15.0, 30.0, 1));
    auto request = spike_request();
    request.loudness.push_back(SignalSample{500.0, 20.0});

    const auto result = engine.run(request);
    ASSERT_EQ(result.clips.size(), 1u);
    EXPECT_LE(result.clips[0].start, 42.0);
    EXPECT_GT(result.clips[0].end, 42.0);
    EXPECT_DOUBLE_EQ(result.durationSeconds, 120.0);
}

TEST_F(HighlightEngineTest, LogThresholdHeldAtErrorDuringRuns) {
    HighlightEngine engine(config_with(15.0, 30.0, 1));
    engine.run(spike_request());
    EXPECT_EQ(logging::level(), logging::Level::Error);
    EXPECT_FALSE(logging::enabled(logging::Level::Info));
}

TEST_F(HighlightEngineTest, VideoShorterThanMinimumYieldsNoClips) {
    HighlightEngine engine(config_with(15.0, 30.0));
    HighlightRequest request;
    request.videoId = "short";
    request.durationSeconds = 10.0;
    request.sceneCuts = {4.0};

    const auto result = engine.run(request);
    EXPECT_TRUE(result.clips.empty());
    EXPECT_EQ(result.candidateCount, 0u);
}

TEST_F(HighlightEngineTest, RunIsDeterministic) {
    HighlightEngine engine(config_with(15.0, 45.0));
    const auto a = engine.run(busy_request());
    const auto b = engine.run(busy_request());
    ASSERT_EQ(a.clips.size(), b.clips.size());
    for (std::size_t i = 0; i < a.clips.size(); ++i) {
        EXPECT_DOUBLE_EQ(a.clips[i].start, b.clips[i].start);
        EXPECT_DOUBLE_EQ(a.clips[i].end, b.clips[i].end);
        EXPECT_DOUBLE_EQ(a.clips[i].score, b.clips[i].score);
        EXPECT_EQ(a.clips[i].rank, b.clips[i].rank);
        EXPECT_EQ(a.clips[i].dominantSignal, b.clips[i].dominantSignal);
        EXPECT_EQ(a.clips[i].reason, b.clips[i].reason);

        ASSERT_EQ(a.clips[i].cues.size(), b.clips[i].cues.size());
        for (std::size_t j = 0; j < a.clips[i].cues.size(); ++j) {
            EXPECT_EQ(a.clips[i].cues[j].word, b.clips[i].cues[j].word);
            EXPECT_DOUBLE_EQ(a.clips[i].cues[j].start, b.clips[i].cues[j].start);
            EXPECT_DOUBLE_EQ(a.clips[i].cues[j].end, b.clips[i].cues[j].end);
        }

        ASSERT_EQ(a.clips[i].lines.size(), b.clips[i].lines.size());
        for (std::size_t j = 0; j < a.clips[i].lines.size(); ++j) {
            EXPECT_EQ(a.clips[i].lines[j].text, b.clips[i].lines[j].text);
            EXPECT_DOUBLE_EQ(a.clips[i].lines[j].start, b.clips[i].lines[j].start);
            EXPECT_DOUBLE_EQ(a.clips[i].lines[j].end, b.clips[i].lines[j].end);
            EXPECT_EQ(a.clips[i].lines[j].firstCue, b.clips[i].lines[j].firstCue);
            EXPECT_EQ(a.clips[i].lines[j].cueCount, b.clips[i].lines[j].cueCount);
        }
    }
    EXPECT_EQ(cli::write_json(cli::result_to_json(a)), cli::write_json(cli::result_to_json(b)));
}

TEST_F(HighlightEngineTest, ClipsRespectBoundsAndNeverOverlap) {
    const HighlightConfig config = config_with(20.0, 40.0, 5);
    HighlightEngine engine(config);
    const auto request = busy_request();
    const auto result = engine.run(request);

    ASSERT_FALSE(result.clips.empty());
    EXPECT_LE(result.clips.size(), 5u);
    for (std::size_t i = 0; i < result.clips.size(); ++i) {
        const auto& c = result.clips[i];
        EXPECT_GE(c.start, 0.0);
        EXPECT_LE(c.end, request.durationSeconds);
        EXPECT_GE(c.duration(), config.minDuration - 1e-9);
        EXPECT_LE(c.duration(), config.maxDuration + 1e-9);
        EXPECT_GE(c.score, 0.0);
        EXPECT_LE(c.score, 1.0);
        if (i > 0) {
            EXPECT_LE(result.clips[i - 1].start, c.start);
            EXPECT_FALSE(selection::overlaps(result.clips[i - 1].start, result.clips[i - 1].end, c.start, c.end));
        }
        for (const auto& cue : c.cues) {
            EXPECT_GE(cue.start, 0.0);
            EXPECT_LE(cue.end, c.duration() + 1e-9);
        }
    }

    double weightSum = 0.0;
    for (const auto& [kind, w] : result.timeline.weights) weightSum += w;
    EXPECT_NEAR(weightSum, 1.0, 1e-12);
    EXPECT_EQ(result.timeline.weights.count(SignalKind::ChapterMarker), 0u);
}

TEST_F(HighlightEngineTest, CuesAttachedToSelectedClips) {
    HighlightEngine engine(config_with(15.0, 30.0));
    auto request = spike_request();
    request.words = {word("wait", 40.0, 40.4), word("for", 40.5, 40.7), word("it", 40.8, 41.0)};
    const auto result = engine.run(request);

    ASSERT_FALSE(result.clips.empty());
    std::size_t cueCount = 0;
    for (const auto& c : result.clips) cueCount += c.cues.size();
    EXPECT_EQ(cueCount, 3u);
}

TEST_F(HighlightEngineTest, DurationInferredFromInputs) {
    HighlightEngine engine(config_with(15.0, 30.0));
    auto request = spike_request();
    request.durationSeconds = 0.0;
    const auto result = engine.run(request);
    EXPECT_DOUBLE_EQ(result.durationSeconds, 120.0);
}

TEST_F(HighlightEngineTest, ChapterFastPathUsesChapterSpans) {
    HighlightConfig config = config_with(15.0, 30.0, 2);
    config.preferChapterClips = true;
    HighlightEngine engine(config);

    auto request = spike_request();
    request.durationSeconds = 100.0;
    request.loudness.resize(100);
    request.chapters = std::vector<Chapter>{{0.0, "Intro"}, {20.0, "Setup"}, {45.0, "Payoff"}, {70.0, "Outro"}};

    const auto result = engine.run(request);
    EXPECT_TRUE(result.usedChapterClips);
    ASSERT_EQ(result.clips.size(), 2u);
    EXPECT_DOUBLE_EQ(result.clips[0].start, 0.0);
    EXPECT_DOUBLE_EQ(result.clips[0].end, 20.0);
    EXPECT_EQ(result.clips[0].reason, "Chapter: Intro");
    EXPECT_EQ(result.clips[0].dominantSignal, SignalKind::ChapterMarker);
    EXPECT_DOUBLE_EQ(result.clips[1].start, 20.0);
    EXPECT_DOUBLE_EQ(result.clips[1].end, 45.0);
}

TEST_F(HighlightEngineTest, ChapterFastPathFallsBackWhenSpansDoNotFit) {
    HighlightConfig config = config_with(15.0, 30.0, 2);
    config.preferChapterClips = true;
    HighlightEngine engine(config);

    auto request = spike_request();
    request.chapters = std::vector<Chapter>{{0.0, "First half"}, {60.0, "Second half"}};

    const auto result = engine.run(request);
    EXPECT_FALSE(result.usedChapterClips);
    EXPECT_FALSE(result.clips.empty());
    EXPECT_EQ(result.timeline.weights.count(SignalKind::ChapterMarker), 1u);
}
