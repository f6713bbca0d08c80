#pragma once
#include <ctime>

/*
  Exponential forgetting curve with stability as a half-life:

      R(t) = exp(-t / S * ln 2)

  so retrievability halves every S days. scheduledDays() is the inverse:
  the elapsed time at which R decays to a target retention.
*/
namespace ForgettingCurve
{
    // Lowest stability any formula here will divide by (days).
    constexpr double kMinimumStability = 0.1;
    constexpr double kSecondsPerDay = 86400.0;

    // Always in (0, 1]. Stability is floored at kMinimumStability and
    // negative or NaN elapsed time is treated as zero.
    double retrievability(double stability, double elapsedDays);

    // stability * log2(1 / targetRetention), never negative.
    double scheduledDays(double stability, double targetRetention);

    // (now - lastReview) in days, clamped to >= 0 against clock skew.
    double elapsedDays(std::time_t lastReview, std::time_t now);

    // answeredAt + intervalDays, rounded to whole seconds.
    std::time_t addDays(std::time_t answeredAt, double intervalDays);
}
