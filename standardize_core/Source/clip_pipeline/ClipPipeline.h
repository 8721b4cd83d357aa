#pragma once

#include "ClipProcessingStage.h"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace standardize_core::clip_pipeline {

/**
 * StageTag - Type-safe identifiers for pipeline stage retrieval
 */
enum class StageTag {
    PeakNormalize,
    Trim,
    Pad,
    Compress,
    Loudness,
};

/**
 * Convert StageTag to string for internal storage
 */
inline std::string stageTagToString(StageTag tag) {
    switch (tag) {
        case StageTag::PeakNormalize:
            return "peakNormalize";
        case StageTag::Trim:
            return "trim";
        case StageTag::Pad:
            return "pad";
        case StageTag::Compress:
            return "compress";
        case StageTag::Loudness:
            return "loudness";
    }
    return "unknown";
}

/**
 * Serial chain of clip stages.
 *
 * Stages run in the order they were added. The first failing stage stops
 * the chain and its result is returned; the clip then holds the output of
 * the last stage that succeeded.
 *
 * Example:
 *   pipeline.addStage(std::make_unique<TrimStage>(-50.0, ChunkSpec::milliseconds(10)), StageTag::Trim);
 *   pipeline.addStage(std::make_unique<PadStage>(250), StageTag::Pad);
 *   pipeline.process(clip);  // Trim → Pad
 *
 * LIFETIME
 * ========
 * - Stages owned by pipeline (unique_ptr)
 * - Stage pointers from getStage() valid until clear() or destruction
 */
class ClipPipeline : public ClipProcessingStage {
  public:
    ClipPipeline() = default;

    /**
     * Add stage to end of pipeline with optional tag.
     * @param stage Stage to add
     * @param tag Optional tag for retrieval (auto-generated if empty)
     */
    void addStage(std::unique_ptr<ClipProcessingStage> stage, const std::string& tag = "");

    void addStage(std::unique_ptr<ClipProcessingStage> stage, StageTag tag);

    /**
     * Run clip through all stages in order.
     */
    PipelineResult process(AudioClip& clip) override;

    /**
     * Get name of pipeline (lists all stages).
     */
    juce::String getName() const override;

    int getNumStages() const {
        return static_cast<int>(stages_.size());
    }

    void clear();

    /**
     * Get stage by tag (type-erased).
     * @return Non-owning pointer to stage, or nullptr if not found
     */
    ClipProcessingStage* getStage(const std::string& tag);

    ClipProcessingStage* getStage(StageTag tag) {
        return getStage(stageTagToString(tag));
    }

    /**
     * Get stage by tag (typed).
     * @return Non-owning pointer to stage, or nullptr if not found or type mismatch
     */
    template <typename StageType> StageType* getStage(StageTag tag) {
        return dynamic_cast<StageType*>(getStage(stageTagToString(tag)));
    }

  private:
    std::vector<std::unique_ptr<ClipProcessingStage>> stages_;
    std::unordered_map<std::string, size_t> tagToIndex_; // Tag -> stages_ index
    int autoTagCounter_ = 0;
};

} // namespace standardize_core::clip_pipeline
