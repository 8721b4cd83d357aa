#include "ClipPipeline.h"

namespace standardize_core::clip_pipeline {

void ClipPipeline::addStage(std::unique_ptr<ClipProcessingStage> stage, const std::string& tag) {
    jassert(stage != nullptr);

    std::string finalTag = tag;
    if (finalTag.empty()) {
        finalTag = "stage_" + std::to_string(autoTagCounter_++);
    }

    tagToIndex_[finalTag] = stages_.size();
    stages_.push_back(std::move(stage));
}

void ClipPipeline::addStage(std::unique_ptr<ClipProcessingStage> stage, StageTag tag) {
    addStage(std::move(stage), stageTagToString(tag));
}

PipelineResult ClipPipeline::process(AudioClip& clip) {
    for (auto& stage : stages_) {
        const auto result = stage->process(clip);
        if (result.failed()) {
            DBG(stage->getName() + " failed: " + result.describe());
            return result;
        }

        DBG(stage->getName() + ": " + juce::String(clip.getLengthMs()) + " ms, "
            + juce::String(clip.getDbfs(), 2) + " dBFS");
    }
    return PipelineResult::ok();
}

juce::String ClipPipeline::getName() const {
    juce::String name = "Pipeline[";
    for (size_t i = 0; i < stages_.size(); ++i) {
        if (i > 0) {
            name += " -> ";
        }
        name += stages_[i]->getName();
    }
    name += "]";
    return name;
}

void ClipPipeline::clear() {
    stages_.clear();
    tagToIndex_.clear();
    autoTagCounter_ = 0;
}

ClipProcessingStage* ClipPipeline::getStage(const std::string& tag) {
    auto it = tagToIndex_.find(tag);
    if (it == tagToIndex_.end()) {
        return nullptr;
    }

    jassert(it->second < stages_.size());
    return stages_[it->second].get();
}

} // namespace standardize_core::clip_pipeline
