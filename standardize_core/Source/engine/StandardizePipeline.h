#pragma once

#include "../clip_pipeline/ClipPipeline.h"
#include "../model/MediaSource.h"
#include "../model/PipelineConfig.h"
#include "../model/PipelineResult.h"
#include "../services/AudioCodec.h"
#include "../services/BitrateAnalyzer.h"
#include "../services/DynamicRangeCompressor.h"
#include "../services/LoudnessMeter.h"
#include <memory>
#include <optional>

namespace standardize_core {

/**
 * The delegated capabilities one pipeline instance runs against.
 * Owned by the pipeline; each concurrent pipeline gets its own set.
 */
struct Collaborators {
    std::unique_ptr<Services::AudioDecoder> decoder;
    std::unique_ptr<Services::AudioEncoder> encoder;
    std::unique_ptr<Services::LoudnessMeter> loudnessMeter;
    std::unique_ptr<Services::DynamicRangeCompressor> compressor;
    std::unique_ptr<Services::BitrateAnalyzer> bitrateAnalyzer;

    /** JUCE codecs, libebur128 meter, JUCE compressor, FFmpeg bitrate analyzer. */
    static Collaborators createDefault();

    bool isComplete() const noexcept {
        return decoder != nullptr && encoder != nullptr && loudnessMeter != nullptr && compressor != nullptr
               && bitrateAnalyzer != nullptr;
    }
};

/**
 * Result of one process() call. output is set only when the input was a
 * stream and no output target was given.
 */
struct ProcessOutcome {
    PipelineResult result = PipelineResult::ok();
    std::optional<juce::MemoryBlock> output;
};

/**
 * Standardizes one recording.
 *
 * Stage order (linear, no back-edges):
 *   Validate → Resolve I/O → Decode → [PeakNormalize] → Trim → Pad →
 *   Compress → Normalize → Encode → Commit
 *
 * MeasureBitrate reads only the original media, so it runs on its own task
 * alongside Decode..Normalize and is joined before Encode.
 *
 * Failure guarantees:
 * - Invalid configuration or a refused overwrite returns before any
 *   decode or other I/O against the input
 * - Output bytes are produced in memory and committed only after every
 *   stage succeeded; a path target is replaced atomically via a temporary
 *   file, so a failed run leaves no output artifact
 *
 * Threading: one process() call at a time per instance. For parallel work
 * create one instance per worker (see BatchProcessor).
 */
class StandardizePipeline {
  public:
    StandardizePipeline(PipelineConfig config, Collaborators collaborators);

    /**
     * @param input Path or stream to read
     * @param output Path or stream to write. When empty: a path input is
     *               written back to its own path (subject to allowOverwrite);
     *               a stream input is encoded to memory and returned
     */
    ProcessOutcome process(InputSource input, std::optional<OutputTarget> output = std::nullopt);

    const PipelineConfig& getConfig() const noexcept {
        return config_;
    }

    /**
     * The clip chain this configuration runs between Decode and Encode.
     * Stages reference this pipeline's collaborators.
     */
    std::unique_ptr<clip_pipeline::ClipPipeline> buildClipPipeline();

    /**
     * True if both files name the same filesystem object. Existing files are
     * compared by inode; otherwise symlinks are resolved in every
     * path component, not just the last one.
     */
    static bool resolvesToSameFile(const juce::File& a, const juce::File& b);

    /** The path with every symlinked component replaced by its target. */
    static juce::File resolveAllLinks(const juce::File& file, int depth = 0);

  private:
    static constexpr int kMaxLinkDepth = 64;

    struct Destination {
        enum class Kind {
            ReturnToCaller,
            File,
            Stream,
        };

        Kind kind = Kind::ReturnToCaller;
        juce::File file;
        juce::OutputStream* stream = nullptr;
        juce::String formatExtension;
    };

    PipelineResult resolveDestination(const InputSource& input,
                                      const std::optional<OutputTarget>& output,
                                      Destination& destination) const;

    static PipelineResult commit(const juce::MemoryBlock& encoded, const Destination& destination, ProcessOutcome& outcome);

    PipelineConfig config_;
    Collaborators collaborators_;
};

} // namespace standardize_core
