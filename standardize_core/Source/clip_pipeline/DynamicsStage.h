#pragma once

#include "ClipProcessingStage.h"
#include "../services/DynamicRangeCompressor.h"

namespace standardize_core::clip_pipeline {

/**
 * Range compression through the delegated compressor.
 *
 * Pipeline Position: after padding, before loudness normalization.
 * Compression changes integrated loudness, so it must run before the
 * loudness measurement it would otherwise invalidate.
 */
class DynamicsStage : public ClipProcessingStage {
  public:
    /**
     * @param compressor Non-owning; must outlive the stage
     */
    explicit DynamicsStage(Services::DynamicRangeCompressor& compressor) : compressor_(compressor) {}

    PipelineResult process(AudioClip& clip) override {
        clip = compressor_.compress(clip);
        return PipelineResult::ok();
    }

    juce::String getName() const override {
        return "Compress";
    }

  private:
    Services::DynamicRangeCompressor& compressor_;
};

} // namespace standardize_core::clip_pipeline
