#pragma once

#include "ClipProcessingStage.h"

namespace standardize_core::clip_pipeline {

/**
 * Scales the clip so its absolute peak sits headroomDb below full scale.
 *
 * Runs before trimming so the silence threshold is judged against a clip
 * of known peak level. Quiet clips are raised, clipping ones lowered. An
 * all-zero clip has no peak to normalize and is passed through.
 */
class PeakNormalizeStage : public ClipProcessingStage {
  public:
    static constexpr double kDefaultHeadroomDb = 0.1;

    explicit PeakNormalizeStage(double headroomDb = kDefaultHeadroomDb);

    PipelineResult process(AudioClip& clip) override;

    juce::String getName() const override {
        return "PeakNormalize";
    }

    static AudioClip normalizePeak(const AudioClip& clip, double headroomDb);

  private:
    double headroomDb_;
};

} // namespace standardize_core::clip_pipeline
