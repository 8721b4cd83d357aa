#pragma once

#include "ClipProcessingStage.h"
#include "../model/PipelineConfig.h"

namespace standardize_core::clip_pipeline {

/**
 * Removes leading and trailing silence.
 *
 * Algorithm:
 *   1. Resolve the chunk spec to milliseconds once per clip
 *   2. Scan forward; drop [0, lead) unless lead is 0 or the full length
 *   3. Scan backward on the lead-trimmed clip with the same chunk width;
 *      drop [trail, end) unless trail is 0 or the full length
 *
 * A boundary at 0 or at the full length means either "no silence at this
 * edge" or "the clip is entirely silent". Both leave the edge untouched, so
 * an all-silent clip comes out unchanged rather than empty.
 */
class TrimStage : public ClipProcessingStage {
  public:
    TrimStage(double thresholdDbfs, ChunkSpec chunkSpec);

    PipelineResult process(AudioClip& clip) override;

    juce::String getName() const override {
        return "Trim";
    }

    /**
     * Trim both edges of clip.
     *
     * @param clip Input (not modified)
     * @param thresholdDbfs Silence threshold (finite, < 0)
     * @param chunkSpec Chunk width (ms, or fraction of clip duration)
     * @param trimmed Receives the trimmed copy
     * @return ConfigurationError for invalid threshold or chunk
     */
    static PipelineResult trim(const AudioClip& clip,
                               double thresholdDbfs,
                               const ChunkSpec& chunkSpec,
                               AudioClip& trimmed);

  private:
    double thresholdDbfs_;
    ChunkSpec chunkSpec_;
};

} // namespace standardize_core::clip_pipeline
