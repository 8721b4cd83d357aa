#include "TrimStage.h"
#include "../services/SilenceBoundaryScanner.h"

namespace standardize_core::clip_pipeline {

using Services::SilenceBoundaryScanner;

TrimStage::TrimStage(double thresholdDbfs, ChunkSpec chunkSpec)
    : thresholdDbfs_(thresholdDbfs), chunkSpec_(chunkSpec) {}

PipelineResult TrimStage::process(AudioClip& clip) {
    AudioClip trimmed;
    auto result = trim(clip, thresholdDbfs_, chunkSpec_, trimmed);
    if (result.wasOk())
        clip = std::move(trimmed);
    return result;
}

PipelineResult TrimStage::trim(const AudioClip& clip,
                               double thresholdDbfs,
                               const ChunkSpec& chunkSpec,
                               AudioClip& trimmed) {
    if (auto chunkResult = chunkSpec.validate(); chunkResult.failed())
        return chunkResult;

    // Shared by both edges so they scan with the same width.
    const int chunkSizeMs = SilenceBoundaryScanner::resolveChunkSizeMs(chunkSpec, clip);
    DBG("Trim: chunk size " + juce::String(chunkSizeMs) + " ms over " + juce::String(clip.getLengthMs()) + " ms");

    juce::int64 lead = 0;
    if (auto result = SilenceBoundaryScanner::scan(clip, thresholdDbfs, chunkSizeMs, lead); result.failed())
        return result;

    AudioClip working = clip;
    if (lead != 0 && lead != working.getNumFrames()) {
        working = working.slice(lead, working.getNumFrames());
        DBG("Trim: leading silence ends at frame " + juce::String(lead));
    } else {
        juce::Logger::writeToLog("Could not find any leading silence, or the whole clip was silent");
    }

    juce::int64 trail = 0;
    if (auto result = SilenceBoundaryScanner::scan(working, thresholdDbfs, -chunkSizeMs, trail); result.failed())
        return result;

    if (trail != 0 && trail != working.getNumFrames()) {
        working = working.slice(0, trail);
        DBG("Trim: trailing silence starts at frame " + juce::String(trail));
    } else {
        juce::Logger::writeToLog("Could not find any trailing silence, or the whole clip was silent");
    }

    trimmed = std::move(working);
    return PipelineResult::ok();
}

} // namespace standardize_core::clip_pipeline
