#include "ForgettingCurve.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace ForgettingCurve
{
    double retrievability(double stability, double elapsedDays) {
        double s = std::isnan(stability) ? kMinimumStability : std::max(kMinimumStability, stability);
        double t = (elapsedDays > 0.0) ? elapsedDays : 0.0;

        double r = std::exp(-t / s * std::log(2.0));

        // exp underflows for huge t/s; keep R strictly positive
        return std::clamp(r, std::numeric_limits<double>::min(), 1.0);
    }

    double scheduledDays(double stability, double targetRetention) {
        double s = std::isnan(stability) ? kMinimumStability : std::max(kMinimumStability, stability);
        double days = s * std::log2(1.0 / targetRetention);
        return (days > 0.0) ? days : 0.0;
    }

    double elapsedDays(std::time_t lastReview, std::time_t now) {
        double seconds = std::difftime(now, lastReview);
        return std::max(0.0, seconds / kSecondsPerDay);
    }

    std::time_t addDays(std::time_t answeredAt, double intervalDays) {
        double seconds = std::max(0.0, intervalDays) * kSecondsPerDay;
        return answeredAt + static_cast<std::time_t>(std::llround(seconds));
    }
}
