#include "LoudnessStage.h"
#include "../primitives/Decibels.h"
#include <cmath>

namespace standardize_core::clip_pipeline {

LoudnessStage::LoudnessStage(double targetLufs, Services::LoudnessMeter& meter)
    : targetLufs_(targetLufs), meter_(meter) {}

PipelineResult LoudnessStage::process(AudioClip& clip) {
    AudioClip normalized;
    auto result = normalize(clip, targetLufs_, meter_, normalized);
    if (result.wasOk())
        clip = std::move(normalized);
    return result;
}

double LoudnessStage::computeGain(double measuredLufs, double targetLufs) {
    return Decibels::decibelsToGain(targetLufs - measuredLufs);
}

PipelineResult LoudnessStage::normalize(const AudioClip& clip,
                                        double targetLufs,
                                        Services::LoudnessMeter& meter,
                                        AudioClip& normalized) {
    if (!std::isfinite(targetLufs) || targetLufs > 0.0) {
        return PipelineResult::fail(ErrorKind::ConfigurationError,
                                    "lufsTarget must be a finite value <= 0 LUFS, got " + juce::String(targetLufs));
    }

    double measured = 0.0;
    if (auto result = meter.measureIntegratedLoudness(clip, measured); result.failed())
        return result;

    if (!std::isfinite(measured)) {
        juce::Logger::writeToLog("Integrated loudness is unmeasurable (silent or shorter than one gating block); "
                                 "loudness normalization skipped");
        normalized = clip;
        return PipelineResult::ok();
    }

    const double gain = computeGain(measured, targetLufs);
    DBG("Loudness: measured " + juce::String(measured, 2) + " LUFS, target " + juce::String(targetLufs, 2)
        + " LUFS, gain " + juce::String(gain, 4));

    normalized = clip.withGain(static_cast<float>(gain));
    return PipelineResult::ok();
}

} // namespace standardize_core::clip_pipeline
