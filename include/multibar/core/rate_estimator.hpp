#pragma once

#include <cstdint>
#include <optional>

namespace multibar {
namespace core {

// Exponential moving average of items/second plus the derived ETA.
class RateEstimator {
public:
    // First sample (no previous estimate) is taken as-is; later samples are
    // blended as smoothing * sample + (1 - smoothing) * previous.
    // Callers must only pass dt_seconds > 0.
    static double update(std::optional<double> previous, double dt_seconds, double items, double smoothing);

    // remaining / rate, or empty when either is unknown or the rate is not positive.
    static std::optional<double> eta(std::optional<double> rate, std::optional<uint64_t> remaining);

    // Smoothing factors must lie in (0, 1].
    static bool isValidSmoothing(double smoothing);
};

}}
