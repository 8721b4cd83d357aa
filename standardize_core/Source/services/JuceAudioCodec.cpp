#include "JuceAudioCodec.h"
#include <limits>

namespace standardize_core {
namespace Services {

namespace {
int parseKbps(const juce::String& option) {
    const auto trimmed = option.trim();
    if (!trimmed.endsWithIgnoreCase("kbps"))
        return -1;
    return trimmed.upToFirstOccurrenceOf(" ", false, false).getIntValue();
}
} // namespace

// ============================================================================
// JuceAudioDecoder
// ============================================================================

JuceAudioDecoder::JuceAudioDecoder() {
    formatManager_.registerBasicFormats();
}

PipelineResult JuceAudioDecoder::decode(const SourceMedia& source, AudioClip& clip) {
    std::unique_ptr<juce::AudioFormatReader> reader;
    if (source.isFile()) {
        if (!source.getFile().existsAsFile())
            return PipelineResult::fail(ErrorKind::DecodeError, "File not found: " + source.describe());
        reader.reset(formatManager_.createReaderFor(source.getFile()));
    } else {
        auto stream = source.createInputStream();
        if (stream != nullptr)
            reader.reset(formatManager_.createReaderFor(std::move(stream)));
    }

    if (reader == nullptr) {
        return PipelineResult::fail(ErrorKind::DecodeError,
                                    "No registered audio format could read " + source.describe());
    }

    if (reader->numChannels == 0 || reader->sampleRate <= 0.0)
        return PipelineResult::fail(ErrorKind::DecodeError, "Source has no audio channels: " + source.describe());

    if (reader->lengthInSamples > std::numeric_limits<int>::max())
        return PipelineResult::fail(ErrorKind::DecodeError, "Source is too long to decode in memory: " + source.describe());

    const auto numFrames = static_cast<int>(reader->lengthInSamples);
    juce::AudioBuffer<float> samples(static_cast<int>(reader->numChannels), numFrames);

    if (!reader->read(&samples, 0, numFrames, 0, true, true))
        return PipelineResult::fail(ErrorKind::DecodeError, "Failed to read sample data from " + source.describe());

    DBG("Decoded " + source.describe() + " with " + reader->getFormatName() + ": "
        + juce::String(numFrames) + " frames, " + juce::String(reader->numChannels) + " ch, "
        + juce::String(reader->sampleRate) + " Hz");

    clip = AudioClip(std::move(samples), reader->sampleRate);
    return PipelineResult::ok();
}

// ============================================================================
// JuceAudioEncoder
// ============================================================================

JuceAudioEncoder::JuceAudioEncoder() {
    formatManager_.registerBasicFormats();
}

int JuceAudioEncoder::chooseQualityOption(const juce::StringArray& qualityOptions, int targetKbps) {
    int chosen = -1;
    int chosenKbps = 0;
    int highest = -1;
    int highestKbps = 0;

    for (int i = 0; i < qualityOptions.size(); ++i) {
        const int kbps = parseKbps(qualityOptions[i]);
        if (kbps <= 0)
            continue;

        if (highest < 0 || kbps > highestKbps) {
            highest = i;
            highestKbps = kbps;
        }
        if (kbps >= targetKbps && (chosen < 0 || kbps < chosenKbps)) {
            chosen = i;
            chosenKbps = kbps;
        }
    }

    return chosen >= 0 ? chosen : highest;
}

int JuceAudioEncoder::chooseBitDepth(const juce::Array<int>& possibleBitDepths,
                                     double sampleRate,
                                     int numChannels,
                                     std::optional<int> targetKbps) {
    if (possibleBitDepths.isEmpty())
        return kDefaultBitsPerSample;

    auto depths = possibleBitDepths;
    depths.sort();

    if (!targetKbps.has_value()) {
        for (int bits : depths) {
            if (bits >= kDefaultBitsPerSample)
                return bits;
        }
        return depths.getLast();
    }

    // The hint can raise the depth, never lower it below the default.
    for (int bits : depths) {
        if (bits < kDefaultBitsPerSample)
            continue;

        const double nominalKbps = sampleRate * numChannels * bits / 1000.0;
        if (nominalKbps >= *targetKbps)
            return bits;
    }
    return depths.getLast();
}

PipelineResult JuceAudioEncoder::encode(const AudioClip& clip,
                                        const juce::String& formatExtension,
                                        std::optional<int> targetBitrateKbps,
                                        juce::MemoryBlock& encoded) {
    auto* format = formatManager_.findFormatForFileExtension(formatExtension);
    if (format == nullptr)
        return PipelineResult::fail(ErrorKind::EncodeError, "No audio format registered for '" + formatExtension + "'");

    const auto qualityOptions = format->getQualityOptions();
    int qualityIndex = qualityOptions.isEmpty() ? 0 : qualityOptions.size() / 2;
    std::optional<int> bitDepthHint = targetBitrateKbps;

    if (targetBitrateKbps.has_value()) {
        const int option = chooseQualityOption(qualityOptions, *targetBitrateKbps);
        if (option >= 0) {
            qualityIndex = option;
            bitDepthHint.reset(); // the quality option carries the bitrate
        }
    }

    const int bitsPerSample =
        chooseBitDepth(format->getPossibleBitDepths(), clip.getSampleRate(), clip.getNumChannels(), bitDepthHint);

    juce::MemoryBlock block;
    auto outputStream = std::make_unique<juce::MemoryOutputStream>(block, false);

    std::unique_ptr<juce::AudioFormatWriter> writer(format->createWriterFor(outputStream.get(),
                                                                            clip.getSampleRate(),
                                                                            static_cast<unsigned int>(clip.getNumChannels()),
                                                                            bitsPerSample,
                                                                            {},
                                                                            qualityIndex));
    if (writer == nullptr) {
        return PipelineResult::fail(ErrorKind::EncodeError,
                                    format->getFormatName() + " cannot write " + juce::String(clip.getNumChannels())
                                        + " channel(s) at " + juce::String(clip.getSampleRate()) + " Hz, "
                                        + juce::String(bitsPerSample) + " bit");
    }
    outputStream.release(); // owned by the writer from here on

    const auto& samples = clip.getSamples();
    if (!writer->writeFromAudioSampleBuffer(samples, 0, samples.getNumSamples()))
        return PipelineResult::fail(ErrorKind::EncodeError, "Failed writing " + format->getFormatName() + " data");

    // Destroying the writer finalizes headers and flushes into block.
    writer.reset();

    DBG("Encoded " + juce::String(samples.getNumSamples()) + " frames as " + format->getFormatName() + " ("
        + juce::String(bitsPerSample) + " bit, quality option " + juce::String(qualityIndex) + "): "
        + juce::String(static_cast<juce::int64>(block.getSize())) + " bytes");

    encoded = std::move(block);
    return PipelineResult::ok();
}

} // namespace Services
} // namespace standardize_core
