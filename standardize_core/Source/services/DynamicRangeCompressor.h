#pragma once

#include "../model/AudioClip.h"
#include <juce_dsp/juce_dsp.h>

namespace standardize_core {
namespace Services {

/**
 * Dynamic-range compression capability with fixed library parameters.
 */
class DynamicRangeCompressor {
  public:
    virtual ~DynamicRangeCompressor() = default;

    virtual AudioClip compress(const AudioClip& clip) = 0;
};

/**
 * Feed-forward compressor built on juce::dsp::Compressor.
 *
 * Parameters are not configurable: threshold -20 dBFS, ratio 4:1,
 * attack 5 ms, release 50 ms. No make-up gain; loudness normalization
 * runs afterwards.
 */
class JuceDynamicRangeCompressor : public DynamicRangeCompressor {
  public:
    static constexpr float kThresholdDb = -20.0f;
    static constexpr float kRatio = 4.0f;
    static constexpr float kAttackMs = 5.0f;
    static constexpr float kReleaseMs = 50.0f;

    JuceDynamicRangeCompressor() = default;

    AudioClip compress(const AudioClip& clip) override;

  private:
    static constexpr int kMaxBlockSize = 4096;

    juce::dsp::Compressor<float> compressor_;
};

} // namespace Services
} // namespace standardize_core
