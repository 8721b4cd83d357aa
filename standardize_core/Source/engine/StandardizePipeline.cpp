#include "StandardizePipeline.h"
#include "../clip_pipeline/BitrateMatchStage.h"
#include "../clip_pipeline/DynamicsStage.h"
#include "../clip_pipeline/LoudnessStage.h"
#include "../clip_pipeline/PadStage.h"
#include "../clip_pipeline/PeakNormalizeStage.h"
#include "../clip_pipeline/TrimStage.h"
#include "../services/JuceAudioCodec.h"
#include <future>

namespace standardize_core {

using namespace clip_pipeline;

namespace {
struct BitrateSelection {
    PipelineResult result = PipelineResult::ok();
    int kbps = 0;
};
} // namespace

Collaborators Collaborators::createDefault() {
    Collaborators collaborators;
    collaborators.decoder = std::make_unique<Services::JuceAudioDecoder>();
    collaborators.encoder = std::make_unique<Services::JuceAudioEncoder>();
    collaborators.loudnessMeter = std::make_unique<Services::EbuR128LoudnessMeter>();
    collaborators.compressor = std::make_unique<Services::JuceDynamicRangeCompressor>();
    collaborators.bitrateAnalyzer = std::make_unique<Services::FFmpegBitrateAnalyzer>();
    return collaborators;
}

StandardizePipeline::StandardizePipeline(PipelineConfig config, Collaborators collaborators)
    : config_(std::move(config)), collaborators_(std::move(collaborators)) {}

juce::File StandardizePipeline::resolveAllLinks(const juce::File& file, int depth) {
    const auto parent = file.getParentDirectory();
    if (parent == file || depth > kMaxLinkDepth)
        return file;

    const auto candidate = resolveAllLinks(parent, depth + 1).getChildFile(file.getFileName());
    const auto target = candidate.getLinkedTarget();
    if (target == candidate)
        return candidate;

    // The link target may itself sit below (or be) another link.
    return resolveAllLinks(target, depth + 1);
}

bool StandardizePipeline::resolvesToSameFile(const juce::File& a, const juce::File& b) {
    // Same inode catches hard links and any symlinked directory on the way.
    if (a.existsAsFile() && b.existsAsFile()) {
        const auto idA = a.getFileIdentifier();
        const auto idB = b.getFileIdentifier();
        if (idA != 0 && idB != 0)
            return idA == idB;
    }

    return resolveAllLinks(a) == resolveAllLinks(b);
}

std::unique_ptr<ClipPipeline> StandardizePipeline::buildClipPipeline() {
    auto pipeline = std::make_unique<ClipPipeline>();

    if (config_.getPeakNormalize())
        pipeline->addStage(std::make_unique<PeakNormalizeStage>(), StageTag::PeakNormalize);

    pipeline->addStage(std::make_unique<TrimStage>(config_.getSilenceThresholdDbfs(), config_.getChunkSpec()),
                       StageTag::Trim);
    pipeline->addStage(std::make_unique<PadStage>(config_.getSilencePaddingMs()), StageTag::Pad);
    pipeline->addStage(std::make_unique<DynamicsStage>(*collaborators_.compressor), StageTag::Compress);
    pipeline->addStage(std::make_unique<LoudnessStage>(config_.getLufsTarget(), *collaborators_.loudnessMeter),
                       StageTag::Loudness);

    return pipeline;
}

PipelineResult StandardizePipeline::resolveDestination(const InputSource& input,
                                                       const std::optional<OutputTarget>& output,
                                                       Destination& destination) const {
    if (!output.has_value()) {
        if (const auto* pathSource = std::get_if<PathSource>(&input)) {
            destination.kind = Destination::Kind::File;
            destination.file = pathSource->file;
        } else {
            destination.kind = Destination::Kind::ReturnToCaller;
        }
    } else if (const auto* pathTarget = std::get_if<PathTarget>(&*output)) {
        destination.kind = Destination::Kind::File;
        destination.file = pathTarget->file;
    } else {
        destination.kind = Destination::Kind::Stream;
        destination.stream = &std::get<StreamTarget>(*output).stream.get();
    }

    if (destination.kind != Destination::Kind::File) {
        destination.formatExtension = config_.getStreamOutputFormat();
        return PipelineResult::ok();
    }

    destination.formatExtension = destination.file.getFileExtension();
    if (destination.formatExtension.isEmpty()) {
        return PipelineResult::fail(ErrorKind::EncodeError,
                                    "Cannot infer an audio format for " + destination.file.getFullPathName()
                                        + " (no file extension)");
    }

    if (const auto* pathSource = std::get_if<PathSource>(&input)) {
        if (!config_.getAllowOverwrite() && resolvesToSameFile(pathSource->file, destination.file)) {
            return PipelineResult::fail(ErrorKind::OverwriteRefused,
                                        "Must give permission to overwrite the input file or supply a different "
                                        "output path: "
                                            + destination.file.getFullPathName());
        }
    }

    return PipelineResult::ok();
}

ProcessOutcome StandardizePipeline::process(InputSource input, std::optional<OutputTarget> output) {
    ProcessOutcome outcome;

    // Validate
    if (auto result = config_.validate(); result.failed()) {
        outcome.result = result;
        return outcome;
    }

    if (!collaborators_.isComplete()) {
        outcome.result = PipelineResult::fail(ErrorKind::ConfigurationError, "pipeline collaborators are incomplete");
        return outcome;
    }

    // Resolve I/O. Nothing has touched the input yet.
    Destination destination;
    if (auto result = resolveDestination(input, output, destination); result.failed()) {
        outcome.result = result;
        return outcome;
    }

    SourceMedia source;
    if (auto* pathSource = std::get_if<PathSource>(&input)) {
        source = SourceMedia::fromFile(pathSource->file);
    } else {
        auto& streamSource = std::get<StreamSource>(input);
        if (streamSource.stream == nullptr || !SourceMedia::readStream(*streamSource.stream, source)) {
            outcome.result = PipelineResult::fail(ErrorKind::DecodeError, "Input stream is missing or empty");
            return outcome;
        }
    }

    // MeasureBitrate only reads the original media; overlap it with the clip chain.
    std::future<BitrateSelection> bitrateTask;
    if (config_.getMatchBitrate()) {
        auto* analyzer = collaborators_.bitrateAnalyzer.get();
        bitrateTask = std::async(std::launch::async, [source, analyzer] {
            BitrateSelection selection;
            selection.result = BitrateMatchStage::selectTargetBitrate(source, *analyzer, selection.kbps);
            return selection;
        });
    }

    // Decode
    AudioClip clip;
    if (auto result = collaborators_.decoder->decode(source, clip); result.failed()) {
        outcome.result = result;
        return outcome;
    }
    DBG("Length of input: " + juce::String(clip.getLengthMs()) + " ms");

    // PeakNormalize → Trim → Pad → Compress → Normalize
    auto clipPipeline = buildClipPipeline();
    if (auto result = clipPipeline->process(clip); result.failed()) {
        outcome.result = result;
        return outcome;
    }

    std::optional<int> targetBitrateKbps;
    if (bitrateTask.valid()) {
        auto selection = bitrateTask.get();
        if (selection.result.failed()) {
            outcome.result = selection.result;
            return outcome;
        }
        targetBitrateKbps = selection.kbps;
    }

    // Encode
    juce::MemoryBlock encoded;
    if (auto result = collaborators_.encoder->encode(clip, destination.formatExtension, targetBitrateKbps, encoded);
        result.failed()) {
        outcome.result = result;
        return outcome;
    }

    outcome.result = commit(encoded, destination, outcome);
    if (outcome.result.wasOk()) {
        DBG("Standardized " + source.describe() + " through " + clipPipeline->getName() + ": "
            + juce::String(clip.getLengthMs()) + " ms, " + juce::String(static_cast<juce::int64>(encoded.getSize()))
            + " bytes");
    }
    return outcome;
}

PipelineResult StandardizePipeline::commit(const juce::MemoryBlock& encoded,
                                           const Destination& destination,
                                           ProcessOutcome& outcome) {
    switch (destination.kind) {
        case Destination::Kind::ReturnToCaller:
            outcome.output = encoded;
            return PipelineResult::ok();

        case Destination::Kind::Stream:
            if (!destination.stream->write(encoded.getData(), encoded.getSize()))
                return PipelineResult::fail(ErrorKind::EncodeError, "Failed writing encoded audio to output stream");
            destination.stream->flush();
            return PipelineResult::ok();

        case Destination::Kind::File: {
            juce::TemporaryFile temporary(destination.file);
            {
                auto stream = temporary.getFile().createOutputStream();
                if (stream == nullptr) {
                    return PipelineResult::fail(ErrorKind::EncodeError,
                                                "Cannot create " + temporary.getFile().getFullPathName());
                }

                if (!stream->write(encoded.getData(), encoded.getSize())) {
                    return PipelineResult::fail(ErrorKind::EncodeError,
                                                "Failed writing " + temporary.getFile().getFullPathName() + ": "
                                                    + stream->getStatus().getErrorMessage());
                }

                stream->flush();
                if (stream->getStatus().failed()) {
                    return PipelineResult::fail(ErrorKind::EncodeError,
                                                "Failed writing " + temporary.getFile().getFullPathName() + ": "
                                                    + stream->getStatus().getErrorMessage());
                }
            }

            if (!temporary.overwriteTargetFileWithTemporary()) {
                return PipelineResult::fail(ErrorKind::EncodeError,
                                            "Cannot replace " + destination.file.getFullPathName());
            }
            return PipelineResult::ok();
        }
    }

    return PipelineResult::fail(ErrorKind::EncodeError, "Unknown output destination");
}

} // namespace standardize_core
