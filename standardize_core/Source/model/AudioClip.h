#pragma once

#include <juce_audio_basics/juce_audio_basics.h>

namespace standardize_core {

/**
 * Decoded PCM audio plus its sample rate.
 *
 * Every operation returns a new clip; a clip is never shortened or
 * rescaled in place. Copies are deep (juce::AudioBuffer semantics), so a
 * stage can hand its result on without the caller's clip being affected.
 *
 * Frame indices are per-channel sample positions. Durations in
 * milliseconds convert to frames with round(ms * rate / 1000).
 */
class AudioClip {
  public:
    AudioClip() = default;

    /**
     * Take ownership of decoded samples.
     * @param samples Planar sample data, one buffer channel per audio channel
     * @param sampleRate Sample rate in Hz (must be > 0)
     */
    AudioClip(juce::AudioBuffer<float> samples, double sampleRate);

    /** Clip of digital silence. */
    static AudioClip silent(int durationMs, double sampleRate, int numChannels);

    int getNumChannels() const noexcept {
        return samples_.getNumChannels();
    }

    juce::int64 getNumFrames() const noexcept {
        return samples_.getNumSamples();
    }

    double getSampleRate() const noexcept {
        return sampleRate_;
    }

    bool isEmpty() const noexcept {
        return samples_.getNumSamples() == 0;
    }

    /** Duration rounded to whole milliseconds. */
    juce::int64 getLengthMs() const noexcept;

    juce::int64 msToFrames(double ms) const noexcept;

    const juce::AudioBuffer<float>& getSamples() const noexcept {
        return samples_;
    }

    /**
     * Copy of the frame range [startFrame, endFrame), clamped to the clip.
     */
    AudioClip slice(juce::int64 startFrame, juce::int64 endFrame) const;

    AudioClip sliceMs(juce::int64 startMs, juce::int64 endMs) const;

    /**
     * This clip followed by other. Both must share sample rate and channel count.
     */
    AudioClip concatenate(const AudioClip& other) const;

    /** Copy with every sample of every channel multiplied by gain. */
    AudioClip withGain(float gain) const;

    /**
     * RMS level over all channels of [startFrame, endFrame), in dBFS.
     * Full scale is 1.0. Returns -inf for an empty or all-zero range.
     */
    double getDbfs(juce::int64 startFrame, juce::int64 endFrame) const;

    double getDbfs() const {
        return getDbfs(0, getNumFrames());
    }

    /** Absolute peak across all channels (linear). */
    float getPeakLevel() const;

    bool hasSameFormatAs(const AudioClip& other) const noexcept {
        return getNumChannels() == other.getNumChannels() && sampleRate_ == other.sampleRate_;
    }

  private:
    juce::AudioBuffer<float> samples_;
    double sampleRate_ = 44100.0;
};

} // namespace standardize_core
