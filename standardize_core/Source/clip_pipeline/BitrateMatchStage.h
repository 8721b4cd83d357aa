#pragma once

#include "../model/MediaSource.h"
#include "../model/PipelineResult.h"
#include "../services/BitrateAnalyzer.h"

namespace standardize_core::clip_pipeline {

/**
 * Chooses the export bitrate from the source's own bitrate profile.
 *
 * Not a clip stage: it reads the original encoded media, independent of the
 * trim/pad/compress/normalize chain, and may run concurrently with it. The
 * result goes to the encoder unmodified, so the export does not fall below
 * the source's peak bitrate.
 */
class BitrateMatchStage {
  public:
    /**
     * @param kbps Receives ceil(maxBitrateKbps) of the source
     * @return DecodeError if the analyzer cannot read the source
     */
    static PipelineResult selectTargetBitrate(const SourceMedia& source,
                                              Services::BitrateAnalyzer& analyzer,
                                              int& kbps);

    static int roundUpToKbps(double bitrateKbps);

  private:
    BitrateMatchStage() = delete;
};

} // namespace standardize_core::clip_pipeline
