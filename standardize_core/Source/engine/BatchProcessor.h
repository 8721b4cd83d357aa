#pragma once

#include "StandardizePipeline.h"
#include "../model/BitrateStats.h"
#include <functional>
#include <vector>

namespace standardize_core {

struct BatchItemResult {
    juce::File input;
    juce::File output;
    PipelineResult result = PipelineResult::ok();
};

struct BitrateReportEntry {
    juce::File file;
    PipelineResult result = PipelineResult::ok();
    BitrateStats stats;
};

/**
 * Runs many independent pipeline instances over a set of files.
 *
 * Every job builds its own StandardizePipeline with a fresh set of
 * collaborators from the factory; no pipeline state is shared between
 * jobs. One file's failure is recorded in its result and does not stop
 * the others.
 */
class BatchProcessor {
  public:
    using CollaboratorFactory = std::function<Collaborators()>;

    static constexpr const char* kDefaultAudioWildcard = "*.wav;*.flac;*.aif;*.aiff;*.ogg;*.mp3";

    BatchProcessor(PipelineConfig config,
                   int numWorkers,
                   CollaboratorFactory factory = &Collaborators::createDefault);

    /**
     * Standardize every matching file in inputDir (non-recursive) into
     * outputDir, keeping file names. outputDir is created if missing.
     * Results are sorted by input path.
     */
    std::vector<BatchItemResult> processDirectory(const juce::File& inputDir,
                                                  const juce::File& outputDir,
                                                  const juce::String& wildcard = kDefaultAudioWildcard);

    /** Standardize explicit input/output pairs. Results follow input order. */
    std::vector<BatchItemResult> processFiles(const std::vector<std::pair<juce::File, juce::File>>& jobs);

    /** Bitrate statistics for every matching file in dir, sorted by path. */
    std::vector<BitrateReportEntry> analyzeDirectory(const juce::File& dir,
                                                     const juce::String& wildcard = "*.wav;*.flac");

    int getNumWorkers() const noexcept {
        return numWorkers_;
    }

  private:
    static juce::Array<juce::File> findInputs(const juce::File& dir, const juce::String& wildcard);

    PipelineConfig config_;
    int numWorkers_;
    CollaboratorFactory factory_;
};

} // namespace standardize_core
