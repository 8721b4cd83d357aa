#include <gtest/gtest.h>
#include "TestSignals.h"
#include <atomic>

using namespace standardize_core;

namespace {
/** Real JUCE decoder that counts how often it was asked to decode. */
class CountingDecoder : public Services::AudioDecoder {
  public:
    explicit CountingDecoder(std::atomic<int>& calls) : calls_(calls) {}

    PipelineResult decode(const SourceMedia& source, AudioClip& clip) override {
        ++calls_;
        return decoder_.decode(source, clip);
    }

  private:
    std::atomic<int>& calls_;
    Services::JuceAudioDecoder decoder_;
};

class FixedBitrateAnalyzer : public Services::BitrateAnalyzer {
  public:
    explicit FixedBitrateAnalyzer(double maxKbps) : maxKbps_(maxKbps) {}

    PipelineResult analyze(const SourceMedia&, BitrateStats& stats) override {
        stats.maxBitrateKbps = maxKbps_;
        return PipelineResult::ok();
    }

  private:
    double maxKbps_;
};

class FailingLoudnessMeter : public Services::LoudnessMeter {
  public:
    PipelineResult measureIntegratedLoudness(const AudioClip&, double&) override {
        return PipelineResult::fail(ErrorKind::MeteringError, "meter offline");
    }
};
} // namespace

class StandardizePipelineTest : public ::testing::Test {
  protected:
    void SetUp() override {
        tempDir_ = juce::File::getSpecialLocation(juce::File::tempDirectory)
                       .getNonexistentChildFile("standardize_test", "", false);
        ASSERT_TRUE(tempDir_.createDirectory().wasOk());

        input_ = tempDir_.getChildFile("input.wav");
        ASSERT_TRUE(test_signals::writeWav(test_signals::framedTone(300, 1400, 300), input_));
    }

    void TearDown() override {
        tempDir_.deleteRecursively();
    }

    /** Real codecs, meter and compressor; counted decoder; fixed 700 kbps source. */
    Collaborators makeCollaborators() {
        auto collaborators = Collaborators::createDefault();
        collaborators.decoder = std::make_unique<CountingDecoder>(decodeCalls_);
        collaborators.bitrateAnalyzer = std::make_unique<FixedBitrateAnalyzer>(700.0);
        return collaborators;
    }

    StandardizePipeline makePipeline(const PipelineSettings& settings = {}) {
        return StandardizePipeline(PipelineConfig(settings), makeCollaborators());
    }

    juce::MemoryBlock readBytes(const juce::File& file) {
        juce::MemoryBlock data;
        file.loadFileAsData(data);
        return data;
    }

    double measureLufs(const AudioClip& clip) {
        Services::EbuR128LoudnessMeter meter;
        double lufs = 0.0;
        EXPECT_TRUE(meter.measureIntegratedLoudness(clip, lufs).wasOk());
        return lufs;
    }

    juce::File tempDir_;
    juce::File input_;
    std::atomic<int> decodeCalls_{0};
};

// =============================================================================
// Validation happens before any I/O
// =============================================================================

TEST_F(StandardizePipelineTest, PositiveLufsTargetFailsWithoutDecoding) {
    PipelineSettings settings;
    settings.lufsTarget = 3.0;
    auto pipeline = makePipeline(settings);

    const auto output = tempDir_.getChildFile("out.wav");
    const auto outcome = pipeline.process(PathSource{input_}, OutputTarget{PathTarget{output}});

    EXPECT_EQ(outcome.result.getKind(), ErrorKind::ConfigurationError);
    EXPECT_EQ(decodeCalls_.load(), 0);
    EXPECT_FALSE(output.exists());
}

TEST_F(StandardizePipelineTest, OverwriteIsRefusedWithoutPermission) {
    const auto before = readBytes(input_);
    auto pipeline = makePipeline();

    const auto outcome = pipeline.process(PathSource{input_});

    EXPECT_EQ(outcome.result.getKind(), ErrorKind::OverwriteRefused);
    EXPECT_EQ(decodeCalls_.load(), 0);
    EXPECT_EQ(readBytes(input_), before);
    EXPECT_EQ(tempDir_.getNumberOfChildFiles(juce::File::findFiles), 1);
}

TEST_F(StandardizePipelineTest, ExplicitSamePathIsAlsoRefused) {
    auto pipeline = makePipeline();
    const auto samePath = tempDir_.getChildFile("./input.wav");

    const auto outcome = pipeline.process(PathSource{input_}, OutputTarget{PathTarget{samePath}});

    EXPECT_EQ(outcome.result.getKind(), ErrorKind::OverwriteRefused);
    EXPECT_EQ(decodeCalls_.load(), 0);
}

TEST_F(StandardizePipelineTest, OverwriteWithPermissionReplacesInput) {
    PipelineSettings settings;
    settings.allowOverwrite = true;
    auto pipeline = makePipeline(settings);

    const auto outcome = pipeline.process(PathSource{input_});
    ASSERT_TRUE(outcome.result.wasOk()) << outcome.result.describe();

    const auto rewritten = test_signals::readWav(input_);
    EXPECT_NEAR(static_cast<double>(rewritten.getLengthMs()), 1400.0, 50.0);
}

TEST_F(StandardizePipelineTest, MissingInputIsDecodeError) {
    auto pipeline = makePipeline();
    const auto output = tempDir_.getChildFile("out.wav");

    const auto outcome =
        pipeline.process(PathSource{tempDir_.getChildFile("missing.wav")}, OutputTarget{PathTarget{output}});

    EXPECT_EQ(outcome.result.getKind(), ErrorKind::DecodeError);
    EXPECT_FALSE(output.exists());
}

TEST_F(StandardizePipelineTest, OutputWithoutExtensionIsEncodeError) {
    auto pipeline = makePipeline();
    const auto outcome = pipeline.process(PathSource{input_}, OutputTarget{PathTarget{tempDir_.getChildFile("out")}});

    EXPECT_EQ(outcome.result.getKind(), ErrorKind::EncodeError);
    EXPECT_EQ(decodeCalls_.load(), 0);
}

// =============================================================================
// End to end
// =============================================================================

TEST_F(StandardizePipelineTest, PathToPathStandardizesRecording) {
    auto pipeline = makePipeline();
    const auto output = tempDir_.getChildFile("out.wav");

    const auto outcome = pipeline.process(PathSource{input_}, OutputTarget{PathTarget{output}});
    ASSERT_TRUE(outcome.result.wasOk()) << outcome.result.describe();
    EXPECT_FALSE(outcome.output.has_value());
    EXPECT_EQ(decodeCalls_.load(), 1);

    const auto result = test_signals::readWav(output);
    EXPECT_NEAR(static_cast<double>(result.getLengthMs()), 1400.0, 50.0);
    EXPECT_NEAR(measureLufs(result), -14.0, 0.5);
}

TEST_F(StandardizePipelineTest, PaddingIsAddedAfterTrim) {
    PipelineSettings settings;
    settings.silencePaddingMs = 200;
    auto pipeline = makePipeline(settings);
    const auto output = tempDir_.getChildFile("padded.wav");

    ASSERT_TRUE(pipeline.process(PathSource{input_}, OutputTarget{PathTarget{output}}).result.wasOk());

    const auto result = test_signals::readWav(output);
    EXPECT_NEAR(static_cast<double>(result.getLengthMs()), 1800.0, 50.0);

    const auto padFrames = result.msToFrames(150);
    EXPECT_LT(result.getDbfs(0, padFrames), -60.0);
    EXPECT_LT(result.getDbfs(result.getNumFrames() - padFrames, result.getNumFrames()), -60.0);
}

TEST_F(StandardizePipelineTest, StreamInputReturnsEncodedBytes) {
    auto data = test_signals::toWavData(test_signals::framedTone(300, 1400, 300));
    auto pipeline = makePipeline();

    auto outcome = pipeline.process(StreamSource{std::make_unique<juce::MemoryInputStream>(data, true)});
    ASSERT_TRUE(outcome.result.wasOk()) << outcome.result.describe();
    ASSERT_TRUE(outcome.output.has_value());

    const auto result = test_signals::fromWavData(*outcome.output);
    EXPECT_NEAR(static_cast<double>(result.getLengthMs()), 1400.0, 50.0);
}

TEST_F(StandardizePipelineTest, StreamOutputReceivesBytes) {
    auto pipeline = makePipeline();
    juce::MemoryOutputStream sink;

    const auto outcome = pipeline.process(PathSource{input_}, OutputTarget{StreamTarget{sink}});
    ASSERT_TRUE(outcome.result.wasOk()) << outcome.result.describe();

    const auto result = test_signals::fromWavData(sink.getMemoryBlock());
    EXPECT_NEAR(static_cast<double>(result.getLengthMs()), 1400.0, 50.0);
}

TEST_F(StandardizePipelineTest, EmptyStreamIsDecodeError) {
    auto pipeline = makePipeline();
    juce::MemoryBlock empty;

    const auto outcome = pipeline.process(StreamSource{std::make_unique<juce::MemoryInputStream>(empty, true)});

    EXPECT_EQ(outcome.result.getKind(), ErrorKind::DecodeError);
    EXPECT_EQ(decodeCalls_.load(), 0);
}

TEST_F(StandardizePipelineTest, StageFailureLeavesNoOutput) {
    auto collaborators = makeCollaborators();
    collaborators.loudnessMeter = std::make_unique<FailingLoudnessMeter>();
    StandardizePipeline pipeline(PipelineConfig(), std::move(collaborators));
    const auto output = tempDir_.getChildFile("out.wav");

    const auto outcome = pipeline.process(PathSource{input_}, OutputTarget{PathTarget{output}});

    EXPECT_EQ(outcome.result.getKind(), ErrorKind::MeteringError);
    EXPECT_FALSE(output.exists());
}

TEST_F(StandardizePipelineTest, FailedRunKeepsExistingOutput) {
    const auto output = tempDir_.getChildFile("out.wav");
    ASSERT_TRUE(output.replaceWithText("previous"));

    auto collaborators = makeCollaborators();
    collaborators.loudnessMeter = std::make_unique<FailingLoudnessMeter>();
    StandardizePipeline pipeline(PipelineConfig(), std::move(collaborators));

    EXPECT_TRUE(pipeline.process(PathSource{input_}, OutputTarget{PathTarget{output}}).result.failed());
    EXPECT_EQ(output.loadFileAsString(), "previous");
}

TEST_F(StandardizePipelineTest, MissingCollaboratorIsConfigurationError) {
    auto collaborators = makeCollaborators();
    collaborators.compressor.reset();
    StandardizePipeline pipeline(PipelineConfig(), std::move(collaborators));

    const auto outcome =
        pipeline.process(PathSource{input_}, OutputTarget{PathTarget{tempDir_.getChildFile("out.wav")}});

    EXPECT_EQ(outcome.result.getKind(), ErrorKind::ConfigurationError);
    EXPECT_EQ(decodeCalls_.load(), 0);
}

// =============================================================================
// Stage layout
// =============================================================================

TEST_F(StandardizePipelineTest, ClipChainRunsInFixedOrder) {
    auto pipeline = makePipeline();
    EXPECT_EQ(pipeline.buildClipPipeline()->getName(), "Pipeline[PeakNormalize -> Trim -> Pad -> Compress -> Loudness]");
}

TEST_F(StandardizePipelineTest, PeakNormalizeCanBeDisabled) {
    PipelineSettings settings;
    settings.peakNormalize = false;
    auto pipeline = makePipeline(settings);

    auto chain = pipeline.buildClipPipeline();
    EXPECT_EQ(chain->getName(), "Pipeline[Trim -> Pad -> Compress -> Loudness]");
    EXPECT_EQ(chain->getStage(clip_pipeline::StageTag::PeakNormalize), nullptr);
}

TEST_F(StandardizePipelineTest, SymlinkToInputCountsAsSameFile) {
    const auto link = tempDir_.getChildFile("link.wav");
    if (!input_.createSymbolicLink(link, true))
        GTEST_SKIP() << "symbolic links unavailable";

    EXPECT_TRUE(StandardizePipeline::resolvesToSameFile(input_, link));
    EXPECT_FALSE(StandardizePipeline::resolvesToSameFile(input_, tempDir_.getChildFile("other.wav")));
}

TEST_F(StandardizePipelineTest, OutputThroughSymlinkedDirectoryIsRefused) {
    const auto realDir = tempDir_.getChildFile("real");
    ASSERT_TRUE(realDir.createDirectory().wasOk());
    const auto realInput = realDir.getChildFile("input.wav");
    ASSERT_TRUE(test_signals::writeWav(test_signals::framedTone(300, 1400, 300), realInput));

    const auto linkDir = tempDir_.getChildFile("linkdir");
    if (!realDir.createSymbolicLink(linkDir, true))
        GTEST_SKIP() << "symbolic links unavailable";

    const auto aliased = linkDir.getChildFile("input.wav");
    EXPECT_TRUE(StandardizePipeline::resolvesToSameFile(realInput, aliased));

    const auto before = readBytes(realInput);
    auto pipeline = makePipeline();
    const auto outcome = pipeline.process(PathSource{realInput}, OutputTarget{PathTarget{aliased}});

    EXPECT_EQ(outcome.result.getKind(), ErrorKind::OverwriteRefused);
    EXPECT_EQ(decodeCalls_.load(), 0);
    EXPECT_EQ(readBytes(realInput), before);
}

TEST_F(StandardizePipelineTest, MissingFileBelowSymlinkedDirectoryResolvesToRealDirectory) {
    const auto realDir = tempDir_.getChildFile("real");
    ASSERT_TRUE(realDir.createDirectory().wasOk());

    const auto linkDir = tempDir_.getChildFile("linkdir");
    if (!realDir.createSymbolicLink(linkDir, true))
        GTEST_SKIP() << "symbolic links unavailable";

    const auto viaLink = linkDir.getChildFile("not_yet.wav");
    const auto direct = realDir.getChildFile("not_yet.wav");

    EXPECT_EQ(StandardizePipeline::resolveAllLinks(viaLink), StandardizePipeline::resolveAllLinks(direct));
    EXPECT_TRUE(StandardizePipeline::resolvesToSameFile(viaLink, direct));
    EXPECT_FALSE(StandardizePipeline::resolvesToSameFile(viaLink, realDir.getChildFile("other.wav")));
}
