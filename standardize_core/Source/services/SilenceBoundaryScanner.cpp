#include "SilenceBoundaryScanner.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace standardize_core {
namespace Services {

PipelineResult SilenceBoundaryScanner::validateArguments(double thresholdDbfs, int chunkSizeMs) {
    if (!std::isfinite(thresholdDbfs))
        return PipelineResult::fail(ErrorKind::ConfigurationError, "silence threshold must be finite");

    if (thresholdDbfs >= 0.0) {
        return PipelineResult::fail(ErrorKind::ConfigurationError,
                                    "silence threshold must be a negative dBFS value, got "
                                        + juce::String(thresholdDbfs));
    }

    if (chunkSizeMs == 0)
        return PipelineResult::fail(ErrorKind::ConfigurationError, "chunk size must be a non-zero number of ms");

    return PipelineResult::ok();
}

juce::int64 SilenceBoundaryScanner::chunkSizeToFrames(int chunkSizeMs, double sampleRate) {
    const auto frames = std::llround(std::abs(static_cast<double>(chunkSizeMs)) * sampleRate / 1000.0);
    return std::max<juce::int64>(frames, 1);
}

int SilenceBoundaryScanner::resolveChunkSizeMs(const ChunkSpec& chunkSpec, const AudioClip& clip) {
    if (!chunkSpec.isFraction())
        return chunkSpec.getMilliseconds();

    const auto durationMs = static_cast<double>(clip.getLengthMs());
    const auto resolved = std::llround(chunkSpec.getFraction() * durationMs);
    return static_cast<int>(std::max<long long>(resolved, 1));
}

PipelineResult SilenceBoundaryScanner::scan(const AudioClip& clip,
                                            double thresholdDbfs,
                                            int chunkSizeMs,
                                            juce::int64& boundary) {
    if (auto result = validateArguments(thresholdDbfs, chunkSizeMs); result.failed())
        return result;

    const juce::int64 length = clip.getNumFrames();
    const juce::int64 step = chunkSizeToFrames(chunkSizeMs, clip.getSampleRate());

    if (chunkSizeMs > 0) {
        juce::int64 position = 0;
        while (position < length && clip.getDbfs(position, position + step) < thresholdDbfs) {
            position += step;
        }
        boundary = std::min(position, length);
    } else {
        juce::int64 position = length;
        while (position > 0 && clip.getDbfs(position - step, position) < thresholdDbfs) {
            position -= step;
        }
        boundary = std::max<juce::int64>(position, 0);
    }

    return PipelineResult::ok();
}

} // namespace Services
} // namespace standardize_core
