#include <gtest/gtest.h>
#include "TestSignals.h"

using namespace standardize_core;
using namespace standardize_core::clip_pipeline;

class TrimStageTest : public ::testing::Test {
  protected:
    static constexpr double kThreshold = -16.0;

    AudioClip trimOrFail(const AudioClip& clip, const ChunkSpec& chunk) {
        AudioClip trimmed;
        const auto result = TrimStage::trim(clip, kThreshold, chunk, trimmed);
        EXPECT_TRUE(result.wasOk()) << result.describe();
        return trimmed;
    }
};

TEST_F(TrimStageTest, RemovesLeadingAndTrailingSilence) {
    // 300 ms silence + 1400 ms tone + 300 ms silence
    const auto clip = test_signals::framedTone(300, 1400, 300);
    ASSERT_EQ(clip.getLengthMs(), 2000);

    const auto trimmed = trimOrFail(clip, ChunkSpec::milliseconds(1));

    EXPECT_NEAR(static_cast<double>(trimmed.getLengthMs()), 1400.0, 50.0);
}

TEST_F(TrimStageTest, LowThresholdWithCoarseChunksKeepsLoudBody) {
    // 500 ms silence + 1000 ms tone at -10 dBFS RMS + 500 ms silence
    const auto clip = test_signals::framedTone(500, 1000, 500, test_signals::sineAmplitudeForDbfs(-10.0));
    AudioClip trimmed;

    ASSERT_TRUE(TrimStage::trim(clip, -50.0, ChunkSpec::milliseconds(50), trimmed).wasOk());

    EXPECT_NEAR(static_cast<double>(trimmed.getLengthMs()), 1000.0, 50.0);
    EXPECT_NEAR(trimmed.getDbfs(), -10.0, 0.5);
}

TEST_F(TrimStageTest, FractionalChunkTrimsToo) {
    const auto clip = test_signals::framedTone(300, 1400, 300);
    const auto trimmed = trimOrFail(clip, ChunkSpec::fraction(1.0 / 200.0)); // 10 ms

    EXPECT_NEAR(static_cast<double>(trimmed.getLengthMs()), 1400.0, 50.0);
}

TEST_F(TrimStageTest, NeverLengthensClip) {
    const auto clip = test_signals::framedTone(50, 200, 75);

    for (int chunk : {1, 5, 20, 100, 1000}) {
        const auto trimmed = trimOrFail(clip, ChunkSpec::milliseconds(chunk));
        EXPECT_LE(trimmed.getNumFrames(), clip.getNumFrames()) << "chunk " << chunk;
    }
}

TEST_F(TrimStageTest, TrimmingTwiceIsStable) {
    const auto clip = test_signals::framedTone(300, 1400, 300);
    const auto once = trimOrFail(clip, ChunkSpec::milliseconds(10));
    const auto twice = trimOrFail(once, ChunkSpec::milliseconds(10));

    EXPECT_EQ(twice.getNumFrames(), once.getNumFrames());
}

TEST_F(TrimStageTest, AllSilentClipIsUnchanged) {
    const auto clip = AudioClip::silent(1000, test_signals::kSampleRate, 2);
    const auto trimmed = trimOrFail(clip, ChunkSpec::milliseconds(1));

    EXPECT_EQ(trimmed.getNumFrames(), clip.getNumFrames());
    EXPECT_EQ(trimmed.getNumChannels(), 2);
}

TEST_F(TrimStageTest, ClipWithoutSilenceIsUnchanged) {
    const auto clip = test_signals::sine(440.0, 0.5f, 500);
    const auto trimmed = trimOrFail(clip, ChunkSpec::milliseconds(1));

    EXPECT_EQ(trimmed.getNumFrames(), clip.getNumFrames());
}

TEST_F(TrimStageTest, OnlyLeadingSilenceIsRemoved) {
    const auto clip = test_signals::framedTone(500, 500, 0);
    const auto trimmed = trimOrFail(clip, ChunkSpec::milliseconds(10));

    EXPECT_NEAR(static_cast<double>(trimmed.getLengthMs()), 500.0, 10.0);
}

TEST_F(TrimStageTest, InvalidChunkIsRejected) {
    const auto clip = test_signals::framedTone(100, 100, 100);
    AudioClip trimmed;

    EXPECT_EQ(TrimStage::trim(clip, kThreshold, ChunkSpec::milliseconds(0), trimmed).getKind(),
              ErrorKind::ConfigurationError);
    EXPECT_EQ(TrimStage::trim(clip, kThreshold, ChunkSpec::fraction(1.5), trimmed).getKind(),
              ErrorKind::ConfigurationError);
}

TEST_F(TrimStageTest, ProcessReplacesClipInPlace) {
    auto clip = test_signals::framedTone(300, 1400, 300);
    TrimStage stage(kThreshold, ChunkSpec::milliseconds(1));

    ASSERT_TRUE(stage.process(clip).wasOk());
    EXPECT_NEAR(static_cast<double>(clip.getLengthMs()), 1400.0, 50.0);
    EXPECT_EQ(stage.getName(), "Trim");
}

TEST_F(TrimStageTest, FailedProcessLeavesClipUntouched) {
    auto clip = test_signals::framedTone(300, 1400, 300);
    const auto originalFrames = clip.getNumFrames();
    TrimStage stage(0.0, ChunkSpec::milliseconds(1));

    EXPECT_TRUE(stage.process(clip).failed());
    EXPECT_EQ(clip.getNumFrames(), originalFrames);
}
