#pragma once

#include "PipelineResult.h"
#include <juce_data_structures/juce_data_structures.h>
#include <optional>

namespace standardize_core {

/**
 * Width of the silence-scan chunk: either a fixed number of milliseconds or
 * a fraction of the clip's duration, resolved per clip.
 */
class ChunkSpec {
  public:
    enum class Kind {
        Milliseconds,
        Fraction,
    };

    static ChunkSpec milliseconds(int ms) {
        return ChunkSpec(Kind::Milliseconds, ms, 0.0);
    }

    static ChunkSpec fraction(double f) {
        return ChunkSpec(Kind::Fraction, 0, f);
    }

    /**
     * Parse "25" (ms), "1/20" or "0.05" (fraction).
     * Returns std::nullopt for text that is neither form; range checks are
     * left to PipelineConfig::validate().
     */
    static std::optional<ChunkSpec> fromString(const juce::String& text);

    Kind getKind() const noexcept {
        return kind_;
    }

    bool isFraction() const noexcept {
        return kind_ == Kind::Fraction;
    }

    int getMilliseconds() const noexcept {
        return milliseconds_;
    }

    double getFraction() const noexcept {
        return fraction_;
    }

    juce::String toString() const;

    /** ConfigurationError unless a positive ms count or a fraction in (0, 1). */
    PipelineResult validate() const;

    bool operator==(const ChunkSpec& other) const noexcept {
        return kind_ == other.kind_ && milliseconds_ == other.milliseconds_ && fraction_ == other.fraction_;
    }

  private:
    ChunkSpec(Kind kind, int ms, double f) : kind_(kind), milliseconds_(ms), fraction_(f) {}

    Kind kind_ = Kind::Milliseconds;
    int milliseconds_ = 1;
    double fraction_ = 0.0;
};

/**
 * Mutable bag of user-facing options, filled in by callers or loaded from a
 * ValueTree. Converted into an immutable PipelineConfig before a run.
 */
struct PipelineSettings {
    /** Integrated loudness to normalize to (LUFS, <= 0). */
    double lufsTarget = -14.0;

    /** Chunk level below which audio counts as silence (dBFS, < 0). Empty = scanner default. */
    std::optional<double> silenceThresholdDbfs;

    ChunkSpec chunkSpec = ChunkSpec::milliseconds(1);

    /** Silence added to each end after trimming (ms, >= 0). */
    int silencePaddingMs = 0;

    /** Permit writing the output over the input file. */
    bool allowOverwrite = false;

    /** Peak-normalize (0.1 dB headroom) before scanning for silence. */
    bool peakNormalize = true;

    /** Pass the source's peak bitrate to the encoder. */
    bool matchBitrate = true;

    /** Container used when the output is returned in memory. */
    juce::String streamOutputFormat = "wav";

    juce::ValueTree toValueTree() const;
    static PipelineSettings fromValueTree(const juce::ValueTree& tree);
};

/**
 * Immutable configuration for one pipeline instance.
 *
 * The silence threshold default is resolved here, once; nothing reads a
 * global default afterwards. Construction never fails - call validate()
 * before running anything.
 */
class PipelineConfig {
  public:
    PipelineConfig();
    explicit PipelineConfig(const PipelineSettings& settings);

    /**
     * Check every numeric field. The first violation is reported as a
     * ConfigurationError naming the field and its constraint.
     */
    PipelineResult validate() const;

    double getLufsTarget() const noexcept {
        return lufsTarget_;
    }
    double getSilenceThresholdDbfs() const noexcept {
        return silenceThresholdDbfs_;
    }
    const ChunkSpec& getChunkSpec() const noexcept {
        return chunkSpec_;
    }
    int getSilencePaddingMs() const noexcept {
        return silencePaddingMs_;
    }
    bool getAllowOverwrite() const noexcept {
        return allowOverwrite_;
    }
    bool getPeakNormalize() const noexcept {
        return peakNormalize_;
    }
    bool getMatchBitrate() const noexcept {
        return matchBitrate_;
    }
    const juce::String& getStreamOutputFormat() const noexcept {
        return streamOutputFormat_;
    }

  private:
    double lufsTarget_;
    double silenceThresholdDbfs_;
    ChunkSpec chunkSpec_;
    int silencePaddingMs_;
    bool allowOverwrite_;
    bool peakNormalize_;
    bool matchBitrate_;
    juce::String streamOutputFormat_;
};

} // namespace standardize_core
