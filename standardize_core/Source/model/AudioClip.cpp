#include "AudioClip.h"
#include "../primitives/Decibels.h"
#include <algorithm>
#include <cmath>

namespace standardize_core {

AudioClip::AudioClip(juce::AudioBuffer<float> samples, double sampleRate)
    : samples_(std::move(samples)), sampleRate_(sampleRate) {
    jassert(sampleRate > 0.0);
}

AudioClip AudioClip::silent(int durationMs, double sampleRate, int numChannels) {
    jassert(durationMs >= 0 && numChannels > 0);

    const auto numFrames = static_cast<int>(std::llround(durationMs * sampleRate / 1000.0));
    juce::AudioBuffer<float> samples(numChannels, numFrames);
    samples.clear();
    return AudioClip(std::move(samples), sampleRate);
}

juce::int64 AudioClip::getLengthMs() const noexcept {
    return std::llround(static_cast<double>(getNumFrames()) * 1000.0 / sampleRate_);
}

juce::int64 AudioClip::msToFrames(double ms) const noexcept {
    return std::llround(ms * sampleRate_ / 1000.0);
}

AudioClip AudioClip::slice(juce::int64 startFrame, juce::int64 endFrame) const {
    const auto numFrames = getNumFrames();
    startFrame = juce::jlimit<juce::int64>(0, numFrames, startFrame);
    endFrame = juce::jlimit<juce::int64>(startFrame, numFrames, endFrame);

    const int length = static_cast<int>(endFrame - startFrame);
    juce::AudioBuffer<float> result(getNumChannels(), length);

    for (int ch = 0; ch < getNumChannels(); ++ch) {
        result.copyFrom(ch, 0, samples_, ch, static_cast<int>(startFrame), length);
    }

    return AudioClip(std::move(result), sampleRate_);
}

AudioClip AudioClip::sliceMs(juce::int64 startMs, juce::int64 endMs) const {
    return slice(msToFrames(static_cast<double>(startMs)), msToFrames(static_cast<double>(endMs)));
}

AudioClip AudioClip::concatenate(const AudioClip& other) const {
    jassert(hasSameFormatAs(other));

    const int ownFrames = samples_.getNumSamples();
    const int otherFrames = other.samples_.getNumSamples();
    juce::AudioBuffer<float> result(getNumChannels(), ownFrames + otherFrames);

    for (int ch = 0; ch < getNumChannels(); ++ch) {
        if (ownFrames > 0)
            result.copyFrom(ch, 0, samples_, ch, 0, ownFrames);
        if (otherFrames > 0)
            result.copyFrom(ch, ownFrames, other.samples_, ch, 0, otherFrames);
    }

    return AudioClip(std::move(result), sampleRate_);
}

AudioClip AudioClip::withGain(float gain) const {
    juce::AudioBuffer<float> result(samples_);
    result.applyGain(gain);
    return AudioClip(std::move(result), sampleRate_);
}

double AudioClip::getDbfs(juce::int64 startFrame, juce::int64 endFrame) const {
    const auto numFrames = getNumFrames();
    startFrame = juce::jlimit<juce::int64>(0, numFrames, startFrame);
    endFrame = juce::jlimit<juce::int64>(startFrame, numFrames, endFrame);

    const int start = static_cast<int>(startFrame);
    const int end = static_cast<int>(endFrame);

    // Interleaved RMS: every channel's samples count toward one mean.
    double sumOfSquares = 0.0;
    for (int ch = 0; ch < getNumChannels(); ++ch) {
        const float* data = samples_.getReadPointer(ch);
        for (int i = start; i < end; ++i) {
            const double s = data[i];
            sumOfSquares += s * s;
        }
    }

    const auto count = static_cast<long long>(end - start) * getNumChannels();
    return Decibels::meanSquareToDbfs(sumOfSquares, count);
}

float AudioClip::getPeakLevel() const {
    if (isEmpty())
        return 0.0f;
    return samples_.getMagnitude(0, samples_.getNumSamples());
}

} // namespace standardize_core
