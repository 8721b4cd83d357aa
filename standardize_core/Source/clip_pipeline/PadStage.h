#pragma once

#include "ClipProcessingStage.h"

namespace standardize_core::clip_pipeline {

/**
 * Adds the same amount of digital silence before and after the clip.
 * The silence takes the clip's sample rate and channel count.
 */
class PadStage : public ClipProcessingStage {
  public:
    explicit PadStage(int paddingMs);

    PipelineResult process(AudioClip& clip) override;

    juce::String getName() const override {
        return "Pad";
    }

    /**
     * @param paddingMs Silence per edge in ms (>= 0). Zero still returns a new clip.
     */
    static AudioClip pad(const AudioClip& clip, int paddingMs);

  private:
    int paddingMs_;
};

} // namespace standardize_core::clip_pipeline
