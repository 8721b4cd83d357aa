#pragma once

#include "ClipProcessingStage.h"
#include "../services/LoudnessMeter.h"

namespace standardize_core::clip_pipeline {

/**
 * Normalizes integrated loudness to a LUFS target.
 *
 * Measures with the delegated BS.1770 meter, then applies one uniform gain
 * of 10^((target - measured) / 20) to every sample of every channel. No
 * limiter follows: a target that pushes peaks past full scale is honored.
 */
class LoudnessStage : public ClipProcessingStage {
  public:
    /**
     * @param meter Non-owning; must outlive the stage
     */
    LoudnessStage(double targetLufs, Services::LoudnessMeter& meter);

    PipelineResult process(AudioClip& clip) override;

    juce::String getName() const override {
        return "Loudness";
    }

    /**
     * @param targetLufs Finite, <= 0; checked before any measurement
     * @param normalized Receives the gain-scaled copy. A clip whose loudness
     *                   is unmeasurable (silence, shorter than one gating
     *                   block) is copied through unchanged.
     * @return ConfigurationError for a bad target, MeteringError from the meter
     */
    static PipelineResult normalize(const AudioClip& clip,
                                    double targetLufs,
                                    Services::LoudnessMeter& meter,
                                    AudioClip& normalized);

    /** Linear gain taking measuredLufs to targetLufs. */
    static double computeGain(double measuredLufs, double targetLufs);

  private:
    double targetLufs_;
    Services::LoudnessMeter& meter_;
};

} // namespace standardize_core::clip_pipeline
