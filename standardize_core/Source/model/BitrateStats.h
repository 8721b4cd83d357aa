#pragma once

#include <vector>

namespace standardize_core {

/**
 * Bitrate profile of an encoded audio stream, aggregated over fixed time
 * windows. All rates are in kbit/s (1 kbit = 1000 bits).
 *
 * Only maxBitrateKbps feeds the encoder; the rest is reported for surveys.
 */
struct BitrateStats {
    /** Total payload bits over total stream duration. */
    double averageBitrateKbps = 0.0;

    /** Mean of bitratePerWindowKbps. */
    double averageOverWindowsKbps = 0.0;

    double minBitrateKbps = 0.0;
    double maxBitrateKbps = 0.0;

    /** Window length the series was computed with (seconds). */
    double windowSeconds = 0.1;

    double durationSeconds = 0.0;
    int numPackets = 0;

    std::vector<double> bitratePerWindowKbps;
};

} // namespace standardize_core
