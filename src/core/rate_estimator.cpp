#include "multibar/core/rate_estimator.hpp"
#include <cmath>

namespace multibar {
namespace core {

double RateEstimator::update(std::optional<double> previous, double dt_seconds, double items, double smoothing) {
    double sample = items / dt_seconds;
    if (!previous) {
        return sample;
    }
    return smoothing * sample + (1.0 - smoothing) * *previous;
}

std::optional<double> RateEstimator::eta(std::optional<double> rate, std::optional<uint64_t> remaining) {
    if (!rate || !remaining || !std::isfinite(*rate) || *rate <= 0.0) {
        return std::nullopt;
    }

    double seconds = static_cast<double>(*remaining) / *rate;
    if (!std::isfinite(seconds)) {
        return std::nullopt;
    }
    return seconds;
}

bool RateEstimator::isValidSmoothing(double smoothing) {
    return std::isfinite(smoothing) && smoothing > 0.0 && smoothing <= 1.0;
}

}}
