#pragma once

#include "../model/AudioClip.h"
#include "../model/MediaSource.h"
#include "../model/PipelineResult.h"
#include <optional>

namespace standardize_core {
namespace Services {

/**
 * Decode capability: container/codec detection and PCM extraction.
 */
class AudioDecoder {
  public:
    virtual ~AudioDecoder() = default;

    /**
     * Decode the whole source.
     * @return DecodeError with the codec's message if the media is unreadable
     */
    virtual PipelineResult decode(const SourceMedia& source, AudioClip& clip) = 0;
};

/**
 * Encode capability. Output always goes to memory; the caller decides when
 * (and whether) the bytes reach their destination.
 */
class AudioEncoder {
  public:
    virtual ~AudioEncoder() = default;

    /**
     * @param clip Audio to encode
     * @param formatExtension File extension naming the format ("wav", ".flac", ...)
     * @param targetBitrateKbps Optional bitrate hint; formats map it to their
     *                          nearest setting that does not fall below it
     * @param encoded Receives the complete encoded file
     */
    virtual PipelineResult encode(const AudioClip& clip,
                                  const juce::String& formatExtension,
                                  std::optional<int> targetBitrateKbps,
                                  juce::MemoryBlock& encoded) = 0;
};

} // namespace Services
} // namespace standardize_core
