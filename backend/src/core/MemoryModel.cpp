#include "MemoryModel.hpp"
#include <algorithm>
#include <cmath>

namespace MemoryModel
{
    double clampStability(const SchedulerConfig& cfg, double stability) {
        if (std::isnan(stability)) return cfg.minimum_stability;
        return std::clamp(stability, cfg.minimum_stability, cfg.maximum_stability);
    }

    double clampDifficulty(const SchedulerConfig& cfg, double difficulty) {
        if (std::isnan(difficulty)) return cfg.initial_difficulty;
        return std::clamp(difficulty, cfg.minimum_difficulty, cfg.maximum_difficulty);
    }

    MemoryState seed(const SchedulerConfig& cfg, bool isCorrect) {
        MemoryState m;
        m.difficulty = clampDifficulty(cfg, cfg.initial_difficulty);
        m.stability = clampStability(cfg,
            isCorrect ? cfg.initial_stability_good : cfg.initial_stability_again);
        return m;
    }

    MemoryState update(const SchedulerConfig& cfg, const MemoryState& current,
        double retrievability, bool isCorrect)
    {
        const double dMin = cfg.minimum_difficulty;
        const double dMax = cfg.maximum_difficulty;

        double s = clampStability(cfg, current.stability);
        double d = clampDifficulty(cfg, current.difficulty);
        double r = std::isnan(retrievability) ? 1.0 : std::clamp(retrievability, 0.0, 1.0);

        // ease in (0, 1]: 1 at the easiest bound, 1/Dmax at the hardest
        double ease = (dMax + 1.0 - d) / dMax;

        MemoryState next;
        if (isCorrect) {
            double growth = cfg.stability_growth
                * ease
                * (1.0 + cfg.recall_bonus * (1.0 - r))
                * std::pow(s, -cfg.stability_decay);

            next.stability = s * (1.0 + growth);
            next.difficulty = d - cfg.difficulty_decrease * (d - dMin) / (dMax - dMin);
        }
        else {
            double shrunk = s * cfg.lapse_stability_factor * std::sqrt(ease);
            next.stability = std::min(s, shrunk);
            next.difficulty = d + cfg.difficulty_increase * (dMax - d) / (dMax - dMin);
        }

        next.stability = clampStability(cfg, next.stability);
        next.difficulty = clampDifficulty(cfg, next.difficulty);
        return next;
    }
}
