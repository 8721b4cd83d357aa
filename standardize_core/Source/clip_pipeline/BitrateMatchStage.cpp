#include "BitrateMatchStage.h"
#include <cmath>

namespace standardize_core::clip_pipeline {

int BitrateMatchStage::roundUpToKbps(double bitrateKbps) {
    return static_cast<int>(std::ceil(bitrateKbps));
}

PipelineResult BitrateMatchStage::selectTargetBitrate(const SourceMedia& source,
                                                      Services::BitrateAnalyzer& analyzer,
                                                      int& kbps) {
    BitrateStats stats;
    if (auto result = analyzer.analyze(source, stats); result.failed())
        return result;

    kbps = roundUpToKbps(stats.maxBitrateKbps);
    DBG("BitrateMatch: source peak " + juce::String(stats.maxBitrateKbps, 3) + " kbps -> target "
        + juce::String(kbps) + " kbps");
    return PipelineResult::ok();
}

} // namespace standardize_core::clip_pipeline
