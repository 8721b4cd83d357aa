#include <gtest/gtest.h>
#include <standardize_core/standardize_core.h>

using namespace standardize_core;

class PipelineConfigTest : public ::testing::Test {
  protected:
    static PipelineResult validate(const PipelineSettings& settings) {
        return PipelineConfig(settings).validate();
    }
};

// =============================================================================
// Defaults
// =============================================================================

TEST_F(PipelineConfigTest, DefaultsAreValid) {
    const PipelineConfig config;

    EXPECT_TRUE(config.validate().wasOk());
    EXPECT_EQ(config.getLufsTarget(), -14.0);
    EXPECT_EQ(config.getSilenceThresholdDbfs(), Services::SilenceBoundaryScanner::kDefaultThresholdDbfs);
    EXPECT_EQ(config.getChunkSpec(), ChunkSpec::milliseconds(1));
    EXPECT_EQ(config.getSilencePaddingMs(), 0);
    EXPECT_FALSE(config.getAllowOverwrite());
    EXPECT_TRUE(config.getPeakNormalize());
    EXPECT_TRUE(config.getMatchBitrate());
    EXPECT_EQ(config.getStreamOutputFormat(), "wav");
}

TEST_F(PipelineConfigTest, ExplicitThresholdOverridesDefault) {
    PipelineSettings settings;
    settings.silenceThresholdDbfs = -40.0;

    EXPECT_EQ(PipelineConfig(settings).getSilenceThresholdDbfs(), -40.0);
}

TEST_F(PipelineConfigTest, StreamFormatLosesLeadingDot) {
    PipelineSettings settings;
    settings.streamOutputFormat = ".flac";

    EXPECT_EQ(PipelineConfig(settings).getStreamOutputFormat(), "flac");
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(PipelineConfigTest, PositiveLufsTargetIsRejected) {
    PipelineSettings settings;
    settings.lufsTarget = 3.0;

    const auto result = validate(settings);
    EXPECT_EQ(result.getKind(), ErrorKind::ConfigurationError);
    EXPECT_TRUE(result.getErrorMessage().contains("lufsTarget"));
}

TEST_F(PipelineConfigTest, ZeroLufsTargetIsAccepted) {
    PipelineSettings settings;
    settings.lufsTarget = 0.0;
    EXPECT_TRUE(validate(settings).wasOk());
}

TEST_F(PipelineConfigTest, NonFiniteLufsTargetIsRejected) {
    PipelineSettings settings;
    settings.lufsTarget = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(validate(settings).failed());
}

TEST_F(PipelineConfigTest, NonNegativeThresholdIsRejected) {
    PipelineSettings settings;
    settings.silenceThresholdDbfs = 0.0;

    const auto result = validate(settings);
    EXPECT_EQ(result.getKind(), ErrorKind::ConfigurationError);
    EXPECT_TRUE(result.getErrorMessage().contains("silenceThresholdDbfs"));
}

TEST_F(PipelineConfigTest, BadChunkIsRejected) {
    PipelineSettings settings;

    settings.chunkSpec = ChunkSpec::milliseconds(0);
    EXPECT_TRUE(validate(settings).failed());

    settings.chunkSpec = ChunkSpec::milliseconds(-5);
    EXPECT_TRUE(validate(settings).failed());

    settings.chunkSpec = ChunkSpec::fraction(0.0);
    EXPECT_TRUE(validate(settings).failed());

    settings.chunkSpec = ChunkSpec::fraction(1.0);
    EXPECT_TRUE(validate(settings).failed());

    settings.chunkSpec = ChunkSpec::fraction(0.05);
    EXPECT_TRUE(validate(settings).wasOk());
}

TEST_F(PipelineConfigTest, NegativePaddingIsRejected) {
    PipelineSettings settings;
    settings.silencePaddingMs = -1;

    const auto result = validate(settings);
    EXPECT_EQ(result.getKind(), ErrorKind::ConfigurationError);
    EXPECT_TRUE(result.getErrorMessage().contains("silencePaddingMs"));
}

TEST_F(PipelineConfigTest, EmptyStreamFormatIsRejected) {
    PipelineSettings settings;
    settings.streamOutputFormat = "";
    EXPECT_TRUE(validate(settings).failed());
}

// =============================================================================
// ChunkSpec parsing
// =============================================================================

TEST_F(PipelineConfigTest, ParsesMilliseconds) {
    const auto chunk = ChunkSpec::fromString("25");
    ASSERT_TRUE(chunk.has_value());
    EXPECT_FALSE(chunk->isFraction());
    EXPECT_EQ(chunk->getMilliseconds(), 25);
}

TEST_F(PipelineConfigTest, ParsesRatio) {
    const auto chunk = ChunkSpec::fromString(" 1/20 ");
    ASSERT_TRUE(chunk.has_value());
    EXPECT_TRUE(chunk->isFraction());
    EXPECT_DOUBLE_EQ(chunk->getFraction(), 0.05);
}

TEST_F(PipelineConfigTest, ParsesDecimalFraction) {
    const auto chunk = ChunkSpec::fromString("0.05");
    ASSERT_TRUE(chunk.has_value());
    EXPECT_TRUE(chunk->isFraction());
    EXPECT_DOUBLE_EQ(chunk->getFraction(), 0.05);
}

TEST_F(PipelineConfigTest, RejectsUnparseableChunk) {
    EXPECT_FALSE(ChunkSpec::fromString("").has_value());
    EXPECT_FALSE(ChunkSpec::fromString("abc").has_value());
    EXPECT_FALSE(ChunkSpec::fromString("1/0").has_value());
    EXPECT_FALSE(ChunkSpec::fromString("1/x").has_value());
}

// =============================================================================
// ValueTree persistence
// =============================================================================

TEST_F(PipelineConfigTest, SettingsSurviveValueTree) {
    PipelineSettings settings;
    settings.lufsTarget = -23.0;
    settings.silenceThresholdDbfs = -45.5;
    settings.chunkSpec = ChunkSpec::fraction(0.25);
    settings.silencePaddingMs = 120;
    settings.allowOverwrite = true;
    settings.peakNormalize = false;
    settings.matchBitrate = false;
    settings.streamOutputFormat = "flac";

    const auto restored = PipelineSettings::fromValueTree(settings.toValueTree());

    EXPECT_EQ(restored.lufsTarget, -23.0);
    ASSERT_TRUE(restored.silenceThresholdDbfs.has_value());
    EXPECT_EQ(*restored.silenceThresholdDbfs, -45.5);
    EXPECT_EQ(restored.chunkSpec, ChunkSpec::fraction(0.25));
    EXPECT_EQ(restored.silencePaddingMs, 120);
    EXPECT_TRUE(restored.allowOverwrite);
    EXPECT_FALSE(restored.peakNormalize);
    EXPECT_FALSE(restored.matchBitrate);
    EXPECT_EQ(restored.streamOutputFormat, "flac");
}

TEST_F(PipelineConfigTest, UnsetThresholdStaysUnset) {
    const auto restored = PipelineSettings::fromValueTree(PipelineSettings{}.toValueTree());
    EXPECT_FALSE(restored.silenceThresholdDbfs.has_value());
}

TEST_F(PipelineConfigTest, SettingsSurviveXml) {
    PipelineSettings settings;
    settings.chunkSpec = ChunkSpec::milliseconds(10);
    settings.silencePaddingMs = 250;

    const auto xml = settings.toValueTree().toXmlString();
    const auto restored = PipelineSettings::fromValueTree(juce::ValueTree::fromXml(xml));

    EXPECT_EQ(restored.chunkSpec, ChunkSpec::milliseconds(10));
    EXPECT_EQ(restored.silencePaddingMs, 250);
}

TEST_F(PipelineConfigTest, ForeignTreeGivesDefaults) {
    juce::ValueTree other("SomethingElse");
    other.setProperty("lufsTarget", -30.0, nullptr);

    EXPECT_EQ(PipelineSettings::fromValueTree(other).lufsTarget, -14.0);
}
