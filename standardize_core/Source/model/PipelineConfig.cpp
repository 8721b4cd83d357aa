#include "PipelineConfig.h"
#include "../services/SilenceBoundaryScanner.h"
#include <cmath>

namespace standardize_core {

namespace {
const juce::Identifier kSettingsType{"PipelineSettings"};
const juce::Identifier kLufsTarget{"lufsTarget"};
const juce::Identifier kSilenceThreshold{"silenceThresholdDbfs"};
const juce::Identifier kChunk{"chunk"};
const juce::Identifier kSilencePadding{"silencePaddingMs"};
const juce::Identifier kAllowOverwrite{"allowOverwrite"};
const juce::Identifier kPeakNormalize{"peakNormalize"};
const juce::Identifier kMatchBitrate{"matchBitrate"};
const juce::Identifier kStreamOutputFormat{"streamOutputFormat"};

PipelineResult configError(const juce::String& message) {
    return PipelineResult::fail(ErrorKind::ConfigurationError, message);
}
} // namespace

// ============================================================================
// ChunkSpec
// ============================================================================

std::optional<ChunkSpec> ChunkSpec::fromString(const juce::String& text) {
    const auto trimmed = text.trim();
    if (trimmed.isEmpty())
        return std::nullopt;

    if (trimmed.containsChar('/')) {
        const auto numerator = trimmed.upToFirstOccurrenceOf("/", false, false).trim();
        const auto denominator = trimmed.fromFirstOccurrenceOf("/", false, false).trim();
        if (!numerator.containsOnly("0123456789") || !denominator.containsOnly("0123456789")
            || numerator.isEmpty() || denominator.isEmpty()) {
            return std::nullopt;
        }

        const auto d = denominator.getLargeIntValue();
        if (d == 0)
            return std::nullopt;
        return fraction(static_cast<double>(numerator.getLargeIntValue()) / static_cast<double>(d));
    }

    if (trimmed.containsOnly("-0123456789"))
        return milliseconds(trimmed.getIntValue());

    if (trimmed.containsOnly("-0123456789.eE"))
        return fraction(trimmed.getDoubleValue());

    return std::nullopt;
}

juce::String ChunkSpec::toString() const {
    if (isFraction())
        return juce::String(fraction_, 10);
    return juce::String(milliseconds_);
}

PipelineResult ChunkSpec::validate() const {
    if (isFraction()) {
        if (!std::isfinite(fraction_) || fraction_ <= 0.0 || fraction_ >= 1.0)
            return configError("chunkSpec fraction must lie in (0, 1), got " + juce::String(fraction_));
        return PipelineResult::ok();
    }

    if (milliseconds_ <= 0)
        return configError("chunkSpec must be a positive number of milliseconds, got " + juce::String(milliseconds_));
    return PipelineResult::ok();
}

// ============================================================================
// PipelineSettings
// ============================================================================

juce::ValueTree PipelineSettings::toValueTree() const {
    juce::ValueTree tree(kSettingsType);
    tree.setProperty(kLufsTarget, lufsTarget, nullptr);
    if (silenceThresholdDbfs.has_value())
        tree.setProperty(kSilenceThreshold, *silenceThresholdDbfs, nullptr);
    tree.setProperty(kChunk, chunkSpec.toString(), nullptr);
    tree.setProperty(kSilencePadding, silencePaddingMs, nullptr);
    tree.setProperty(kAllowOverwrite, allowOverwrite, nullptr);
    tree.setProperty(kPeakNormalize, peakNormalize, nullptr);
    tree.setProperty(kMatchBitrate, matchBitrate, nullptr);
    tree.setProperty(kStreamOutputFormat, streamOutputFormat, nullptr);
    return tree;
}

PipelineSettings PipelineSettings::fromValueTree(const juce::ValueTree& tree) {
    PipelineSettings settings;
    if (!tree.hasType(kSettingsType)) {
        DBG("PipelineSettings::fromValueTree: unexpected tree type " + tree.getType().toString());
        return settings;
    }

    settings.lufsTarget = tree.getProperty(kLufsTarget, settings.lufsTarget);
    if (tree.hasProperty(kSilenceThreshold))
        settings.silenceThresholdDbfs = static_cast<double>(tree.getProperty(kSilenceThreshold));

    if (tree.hasProperty(kChunk)) {
        if (auto chunk = ChunkSpec::fromString(tree.getProperty(kChunk).toString()))
            settings.chunkSpec = *chunk;
        else
            DBG("PipelineSettings::fromValueTree: unparseable chunk '" + tree.getProperty(kChunk).toString() + "'");
    }

    settings.silencePaddingMs = tree.getProperty(kSilencePadding, settings.silencePaddingMs);
    settings.allowOverwrite = tree.getProperty(kAllowOverwrite, settings.allowOverwrite);
    settings.peakNormalize = tree.getProperty(kPeakNormalize, settings.peakNormalize);
    settings.matchBitrate = tree.getProperty(kMatchBitrate, settings.matchBitrate);
    settings.streamOutputFormat = tree.getProperty(kStreamOutputFormat, settings.streamOutputFormat).toString();
    return settings;
}

// ============================================================================
// PipelineConfig
// ============================================================================

PipelineConfig::PipelineConfig() : PipelineConfig(PipelineSettings{}) {}

PipelineConfig::PipelineConfig(const PipelineSettings& settings)
    : lufsTarget_(settings.lufsTarget),
      silenceThresholdDbfs_(settings.silenceThresholdDbfs.value_or(Services::SilenceBoundaryScanner::kDefaultThresholdDbfs)),
      chunkSpec_(settings.chunkSpec),
      silencePaddingMs_(settings.silencePaddingMs),
      allowOverwrite_(settings.allowOverwrite),
      peakNormalize_(settings.peakNormalize),
      matchBitrate_(settings.matchBitrate),
      streamOutputFormat_(settings.streamOutputFormat.trimCharactersAtStart(".")) {}

PipelineResult PipelineConfig::validate() const {
    if (!std::isfinite(lufsTarget_))
        return configError("lufsTarget must be finite");
    if (lufsTarget_ > 0.0)
        return configError("lufsTarget must be <= 0 LUFS, got " + juce::String(lufsTarget_));

    if (!std::isfinite(silenceThresholdDbfs_))
        return configError("silenceThresholdDbfs must be finite");
    if (silenceThresholdDbfs_ >= 0.0)
        return configError("silenceThresholdDbfs must be < 0 dBFS, got " + juce::String(silenceThresholdDbfs_));

    if (auto chunkResult = chunkSpec_.validate(); chunkResult.failed())
        return chunkResult;

    if (silencePaddingMs_ < 0)
        return configError("silencePaddingMs must be >= 0, got " + juce::String(silencePaddingMs_));

    if (streamOutputFormat_.isEmpty())
        return configError("streamOutputFormat must name a file extension");

    return PipelineResult::ok();
}

} // namespace standardize_core
