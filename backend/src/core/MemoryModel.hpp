#pragma once
#include "SchedulerConfig.hpp"

struct MemoryState {
    double stability = 0.0;   // days
    double difficulty = 0.0;
};

/*
  Stability/difficulty updater. Pure functions of their inputs; every result
  is clamped to the configured bounds.

  Correct answer:
    growth = stability_growth * (Dmax + 1 - D) / Dmax
             * (1 + recall_bonus * (1 - R)) * S^(-stability_decay)
    S' = S * (1 + growth)
    D' = D - difficulty_decrease * (D - Dmin) / (Dmax - Dmin)

  Incorrect answer:
    S' = min(S, S * lapse_stability_factor * sqrt((Dmax + 1 - D) / Dmax))
    D' = D + difficulty_increase * (Dmax - D) / (Dmax - Dmin)

  Lower R and lower D both give larger growth; a lapse shrinks stability by a
  factor instead of resetting it.
*/
namespace MemoryModel
{
    // State assigned on the first review of a New card.
    MemoryState seed(const SchedulerConfig& cfg, bool isCorrect);

    MemoryState update(const SchedulerConfig& cfg, const MemoryState& current,
        double retrievability, bool isCorrect);

    double clampStability(const SchedulerConfig& cfg, double stability);
    double clampDifficulty(const SchedulerConfig& cfg, double difficulty);
}
