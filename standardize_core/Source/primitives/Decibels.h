#pragma once

#include <cmath>
#include <limits>

namespace standardize_core {

/**
 * @brief Decibel conversions used by the level-based stages.
 *
 * Unlike the real-time helpers in JUCE, nothing here is floored at -100 dB:
 * silence classification compares chunk levels against thresholds that may
 * sit anywhere below 0 dBFS, so silence maps to negative infinity.
 */
namespace Decibels {

    template<typename T>
    constexpr T minusInfinity = -std::numeric_limits<T>::infinity();

    /**
     * @brief Convert decibels to linear gain.
     *
     * @param decibels The decibel value to convert.
     * @return Linear gain value. 0dB = 1.0, -6dB ≈ 0.5, -inf dB = 0.
     *
     * Formula: gain = 10^(dB/20)
     */
    template<typename T>
    [[nodiscard]] inline T decibelsToGain(T decibels) noexcept
    {
        return decibels > minusInfinity<T>
            ? std::pow(static_cast<T>(10.0), decibels * static_cast<T>(0.05))
            : T{};
    }

    /**
     * @brief Convert linear gain (or an RMS amplitude) to decibels.
     *
     * @param gain Linear value relative to full scale (1.0).
     * @return Decibel value, or negative infinity for zero/negative input.
     */
    template<typename T>
    [[nodiscard]] inline T gainToDecibels(T gain) noexcept
    {
        return gain > T{}
            ? static_cast<T>(std::log10(gain)) * static_cast<T>(20.0)
            : minusInfinity<T>;
    }

    /**
     * @brief Level of a sum of squared samples, in dB relative to full scale.
     *
     * @param sumOfSquares Sum of squared sample values.
     * @param numSamples   Number of samples that went into the sum.
     */
    template<typename T>
    [[nodiscard]] inline T meanSquareToDbfs(T sumOfSquares, long long numSamples) noexcept
    {
        if (numSamples <= 0)
            return minusInfinity<T>;

        return gainToDecibels(std::sqrt(sumOfSquares / static_cast<T>(numSamples)));
    }

} // namespace Decibels
} // namespace standardize_core
