#pragma once

#include "../model/AudioClip.h"
#include "../model/PipelineResult.h"

namespace standardize_core {
namespace Services {

/**
 * BS.1770 integrated loudness measurement.
 *
 * Implementations must bind their filters to the clip's own sample rate;
 * K-weighting coefficients differ per rate.
 */
class LoudnessMeter {
  public:
    virtual ~LoudnessMeter() = default;

    /**
     * @param clip Audio to measure
     * @param lufs Receives integrated loudness in LUFS. -inf when every
     *             gating block is below the absolute gate (silence, or a clip
     *             shorter than one 400 ms block).
     * @return MeteringError if the meter cannot process the samples
     */
    virtual PipelineResult measureIntegratedLoudness(const AudioClip& clip, double& lufs) = 0;
};

/**
 * libebur128 meter (EBU R128 / ITU-R BS.1770-4, integrated mode).
 */
class EbuR128LoudnessMeter : public LoudnessMeter {
  public:
    EbuR128LoudnessMeter() = default;

    PipelineResult measureIntegratedLoudness(const AudioClip& clip, double& lufs) override;

  private:
    static constexpr int kFramesPerBlock = 4096;
};

} // namespace Services
} // namespace standardize_core
