#pragma once

#include "AudioCodec.h"
#include <juce_audio_formats/juce_audio_formats.h>

namespace standardize_core {
namespace Services {

/**
 * Decoder backed by juce::AudioFormatManager (WAV, AIFF, FLAC, Ogg Vorbis,
 * MP3 when JUCE_USE_MP3AUDIOFORMAT is enabled).
 */
class JuceAudioDecoder : public AudioDecoder {
  public:
    JuceAudioDecoder();

    PipelineResult decode(const SourceMedia& source, AudioClip& clip) override;

  private:
    juce::AudioFormatManager formatManager_;
};

/**
 * Encoder backed by juce::AudioFormatManager. The format is looked up by
 * file extension.
 *
 * Bitrate hint mapping:
 * - Formats whose quality options read "N kbps" (Ogg Vorbis) use the
 *   smallest option >= the hint, else their highest option.
 * - PCM and lossless formats use the smallest bit depth whose nominal rate
 *   (rate * channels * bits / 1000) is >= the hint, else their deepest one.
 * - With no hint: 16-bit where available and the middle quality option.
 */
class JuceAudioEncoder : public AudioEncoder {
  public:
    static constexpr int kDefaultBitsPerSample = 16;

    JuceAudioEncoder();

    PipelineResult encode(const AudioClip& clip,
                          const juce::String& formatExtension,
                          std::optional<int> targetBitrateKbps,
                          juce::MemoryBlock& encoded) override;

    /**
     * Index of the quality option to use for a bitrate hint.
     * @return -1 if none of the options is expressed in kbps
     */
    static int chooseQualityOption(const juce::StringArray& qualityOptions, int targetKbps);

    /**
     * Smallest depth of at least kDefaultBitsPerSample whose nominal PCM rate
     * covers the hint; the deepest available if none does.
     */
    static int chooseBitDepth(const juce::Array<int>& possibleBitDepths,
                              double sampleRate,
                              int numChannels,
                              std::optional<int> targetKbps);

  private:
    juce::AudioFormatManager formatManager_;
};

} // namespace Services
} // namespace standardize_core
