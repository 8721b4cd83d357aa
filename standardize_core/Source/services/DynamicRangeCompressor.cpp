#include "DynamicRangeCompressor.h"
#include <algorithm>

namespace standardize_core {
namespace Services {

AudioClip JuceDynamicRangeCompressor::compress(const AudioClip& clip) {
    juce::AudioBuffer<float> samples(clip.getSamples());
    if (samples.getNumSamples() == 0 || samples.getNumChannels() == 0)
        return AudioClip(std::move(samples), clip.getSampleRate());

    // Prepare per call: every clip may bring its own rate and channel count.
    juce::dsp::ProcessSpec spec{};
    spec.sampleRate = clip.getSampleRate();
    spec.maximumBlockSize = static_cast<juce::uint32>(kMaxBlockSize);
    spec.numChannels = static_cast<juce::uint32>(samples.getNumChannels());

    compressor_.setThreshold(kThresholdDb);
    compressor_.setRatio(kRatio);
    compressor_.setAttack(kAttackMs);
    compressor_.setRelease(kReleaseMs);
    compressor_.prepare(spec);
    compressor_.reset();

    juce::dsp::AudioBlock<float> block(samples);
    const auto numFrames = block.getNumSamples();

    for (size_t start = 0; start < numFrames; start += kMaxBlockSize) {
        const auto length = std::min<size_t>(kMaxBlockSize, numFrames - start);
        auto subBlock = block.getSubBlock(start, length);
        const juce::dsp::ProcessContextReplacing<float> context(subBlock);
        compressor_.process(context);
    }

    return AudioClip(std::move(samples), clip.getSampleRate());
}

} // namespace Services
} // namespace standardize_core
