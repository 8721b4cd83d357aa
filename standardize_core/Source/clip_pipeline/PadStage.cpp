#include "PadStage.h"

namespace standardize_core::clip_pipeline {

PadStage::PadStage(int paddingMs) : paddingMs_(paddingMs) {
    jassert(paddingMs >= 0);
}

PipelineResult PadStage::process(AudioClip& clip) {
    if (paddingMs_ < 0) {
        return PipelineResult::fail(ErrorKind::ConfigurationError,
                                    "silencePaddingMs must be >= 0, got " + juce::String(paddingMs_));
    }

    clip = pad(clip, paddingMs_);
    return PipelineResult::ok();
}

AudioClip PadStage::pad(const AudioClip& clip, int paddingMs) {
    if (clip.getNumChannels() == 0)
        return clip;

    const auto padding = AudioClip::silent(juce::jmax(0, paddingMs), clip.getSampleRate(), clip.getNumChannels());
    return padding.concatenate(clip).concatenate(padding);
}

} // namespace standardize_core::clip_pipeline
