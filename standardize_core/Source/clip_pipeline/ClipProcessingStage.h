#pragma once

#include "../model/AudioClip.h"
#include "../model/PipelineResult.h"
#include <juce_core/juce_core.h>

namespace standardize_core::clip_pipeline {

/**
 * Base interface for offline stages of the standardization chain.
 *
 * Design principles:
 * - Works on a whole decoded clip, not on real-time blocks
 * - process() replaces the clip with a newly produced one; the previous
 *   buffer is never shortened or rescaled in place
 * - Holds no clip state between calls, so one stage instance may run many
 *   clips in sequence
 */
class ClipProcessingStage {
  public:
    virtual ~ClipProcessingStage() = default;

    /**
     * Produce the stage output for clip and store it back in clip.
     *
     * @param clip Input on entry, output on successful return. Left as the
     *             input when the stage fails.
     */
    virtual PipelineResult process(AudioClip& clip) = 0;

    /**
     * Get stage name for logging.
     */
    virtual juce::String getName() const = 0;
};

} // namespace standardize_core::clip_pipeline
