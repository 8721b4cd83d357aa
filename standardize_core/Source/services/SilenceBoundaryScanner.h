#pragma once

#include "../model/AudioClip.h"
#include "../model/PipelineConfig.h"
#include "../model/PipelineResult.h"

namespace standardize_core {
namespace Services {

/**
 * SilenceBoundaryScanner - Finds where audio stops being silent at one edge
 *
 * Algorithm:
 *   1. Start at frame 0 (forward) or at the clip length (backward)
 *   2. Measure the RMS level (dBFS) of the next chunk in the scan direction
 *   3. While that chunk is below threshold and the far end is not reached,
 *      step one chunk further
 *   4. Return the position, clamped into [0, length]
 *
 * Boundary semantics:
 *   The start boundary (0 forward, length backward) means the first chunk was
 *   already loud: nothing to trim at this edge.
 *   The opposite boundary means no loud chunk was found: the whole clip is
 *   silent. Callers cannot tell "no silence" from "all silence" on a clip
 *   whose only content is at the very edge they scan from; both map to a
 *   boundary index and both mean "leave this edge alone".
 *
 * Service Pattern: Pure static methods (no state)
 */
class SilenceBoundaryScanner {
  public:
    /** Threshold used when the configuration leaves it unset. */
    static constexpr double kDefaultThresholdDbfs = -16.0;

    /**
     * Scan for the silence boundary at one edge.
     *
     * @param clip Audio to scan
     * @param thresholdDbfs Level below which a chunk is silent (finite, < 0)
     * @param chunkSizeMs Chunk width in ms; the sign selects the direction
     *                    (positive = from the start, negative = from the end)
     * @param boundary Receives the frame index in [0, clip.getNumFrames()]
     * @return ConfigurationError for an invalid threshold or a zero chunk,
     *         checked before any scanning
     */
    static PipelineResult scan(const AudioClip& clip, double thresholdDbfs, int chunkSizeMs, juce::int64& boundary);

    /**
     * Chunk width in milliseconds for a given clip.
     * Fractions resolve to max(round(f * durationMs), 1).
     */
    static int resolveChunkSizeMs(const ChunkSpec& chunkSpec, const AudioClip& clip);

    /** Chunk width in frames: at least one frame. */
    static juce::int64 chunkSizeToFrames(int chunkSizeMs, double sampleRate);

    static PipelineResult validateArguments(double thresholdDbfs, int chunkSizeMs);

  private:
    SilenceBoundaryScanner() = delete; // Pure static service
};

} // namespace Services
} // namespace standardize_core
