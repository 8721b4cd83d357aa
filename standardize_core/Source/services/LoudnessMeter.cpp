#include "LoudnessMeter.h"
#include <ebur128.h>
#include <algorithm>
#include <memory>
#include <vector>

namespace standardize_core {
namespace Services {

namespace {
struct EbuR128StateDeleter {
    void operator()(ebur128_state* state) const noexcept {
        if (state != nullptr)
            ebur128_destroy(&state);
    }
};

using EbuR128StatePtr = std::unique_ptr<ebur128_state, EbuR128StateDeleter>;
} // namespace

PipelineResult EbuR128LoudnessMeter::measureIntegratedLoudness(const AudioClip& clip, double& lufs) {
    const int numChannels = clip.getNumChannels();
    if (numChannels <= 0)
        return PipelineResult::fail(ErrorKind::MeteringError, "cannot measure loudness of a clip without channels");

    EbuR128StatePtr state{ebur128_init(static_cast<unsigned int>(numChannels),
                                       static_cast<unsigned long>(clip.getSampleRate()),
                                       EBUR128_MODE_I)};
    if (state == nullptr) {
        return PipelineResult::fail(ErrorKind::MeteringError,
                                    "ebur128_init failed for " + juce::String(numChannels) + " channel(s) at "
                                        + juce::String(clip.getSampleRate()) + " Hz");
    }

    // libebur128 wants interleaved frames; convert block by block.
    const auto& samples = clip.getSamples();
    const int numFrames = samples.getNumSamples();
    std::vector<float> interleaved(static_cast<size_t>(kFramesPerBlock) * static_cast<size_t>(numChannels));

    for (int start = 0; start < numFrames; start += kFramesPerBlock) {
        const int blockFrames = std::min(kFramesPerBlock, numFrames - start);

        for (int ch = 0; ch < numChannels; ++ch) {
            const float* source = samples.getReadPointer(ch, start);
            for (int i = 0; i < blockFrames; ++i) {
                interleaved[static_cast<size_t>(i * numChannels + ch)] = source[i];
            }
        }

        if (ebur128_add_frames_float(state.get(), interleaved.data(), static_cast<size_t>(blockFrames))
            != EBUR128_SUCCESS) {
            return PipelineResult::fail(ErrorKind::MeteringError, "ebur128_add_frames_float failed");
        }
    }

    double integrated = 0.0;
    if (ebur128_loudness_global(state.get(), &integrated) != EBUR128_SUCCESS)
        return PipelineResult::fail(ErrorKind::MeteringError, "ebur128_loudness_global failed");

    lufs = integrated;
    return PipelineResult::ok();
}

} // namespace Services
} // namespace standardize_core
