#include "PeakNormalizeStage.h"
#include "../primitives/Decibels.h"

namespace standardize_core::clip_pipeline {

PeakNormalizeStage::PeakNormalizeStage(double headroomDb) : headroomDb_(headroomDb) {}

PipelineResult PeakNormalizeStage::process(AudioClip& clip) {
    clip = normalizePeak(clip, headroomDb_);
    return PipelineResult::ok();
}

AudioClip PeakNormalizeStage::normalizePeak(const AudioClip& clip, double headroomDb) {
    const float peak = clip.getPeakLevel();
    if (peak <= 0.0f) {
        DBG("PeakNormalize: clip is digital silence, left unchanged");
        return clip;
    }

    const double targetPeak = Decibels::decibelsToGain(-headroomDb);
    return clip.withGain(static_cast<float>(targetPeak / peak));
}

} // namespace standardize_core::clip_pipeline
