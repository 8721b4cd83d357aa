#pragma once

#include "../model/BitrateStats.h"
#include "../model/MediaSource.h"
#include "../model/PipelineResult.h"

namespace standardize_core {
namespace Services {

/**
 * Bitrate statistics of an encoded source, measured on the original media
 * (never on decoded audio).
 */
class BitrateAnalyzer {
  public:
    virtual ~BitrateAnalyzer() = default;

    /**
     * @return DecodeError if the container cannot be opened or has no audio stream
     */
    virtual PipelineResult analyze(const SourceMedia& source, BitrateStats& stats) = 0;
};

/**
 * Packet-level analyzer on libavformat.
 *
 * Reads every packet of the best audio stream and buckets payload sizes
 * into windows of windowSeconds, starting at the first packet's timestamp.
 * A window's bitrate is its payload bits divided by the window length; the
 * trailing partial window is divided by the span it actually covers.
 */
class FFmpegBitrateAnalyzer : public BitrateAnalyzer {
  public:
    static constexpr double kDefaultWindowSeconds = 0.1;

    explicit FFmpegBitrateAnalyzer(double windowSeconds = kDefaultWindowSeconds);

    PipelineResult analyze(const SourceMedia& source, BitrateStats& stats) override;

    /** One demuxed packet: presentation time, duration and payload size. */
    struct PacketInfo {
        double timeSeconds = 0.0;
        double durationSeconds = 0.0;
        int sizeBytes = 0;
    };

    /**
     * Aggregate packets into window statistics. Exposed for testing the
     * windowing without a container.
     */
    static BitrateStats aggregate(const std::vector<PacketInfo>& packets, double windowSeconds);

  private:
    double windowSeconds_;
};

} // namespace Services
} // namespace standardize_core
