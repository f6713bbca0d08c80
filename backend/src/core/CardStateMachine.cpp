#include "CardStateMachine.hpp"
#include <algorithm>

namespace CardStateMachine
{
    namespace {
        constexpr double kMinutesPerDay = 24.0 * 60.0;

        double minutes(double m) { return m / kMinutesPerDay; }

        double reviewInterval(const SchedulerConfig& cfg, double candidateDays) {
            return std::clamp(candidateDays, cfg.graduation_threshold_days, cfg.maximum_interval_days);
        }

        bool graduates(const SchedulerConfig& cfg, double candidateDays) {
            return candidateDays >= cfg.graduation_threshold_days;
        }
    }

    Step next(const SchedulerConfig& cfg, CardState current, bool isCorrect, double candidateDays) {
        Step step;

        switch (current) {
        case CardState::New:
            step.state = CardState::Learning;
            step.intervalDays = minutes(isCorrect ? cfg.learning_step_good_minutes
                                                  : cfg.learning_step_again_minutes);
            break;

        case CardState::Learning:
            if (isCorrect && graduates(cfg, candidateDays)) {
                step.state = CardState::Review;
                step.intervalDays = reviewInterval(cfg, candidateDays);
            }
            else {
                step.state = CardState::Learning;
                step.intervalDays = minutes(isCorrect ? cfg.learning_step_good_minutes
                                                      : cfg.learning_step_again_minutes);
            }
            break;

        case CardState::Review:
            if (isCorrect) {
                step.state = CardState::Review;
                step.intervalDays = reviewInterval(cfg, candidateDays);
            }
            else {
                step.state = CardState::Relearning;
                step.intervalDays = minutes(cfg.relearning_step_minutes);
                step.lapse = true;
            }
            break;

        case CardState::Relearning:
            if (isCorrect && graduates(cfg, candidateDays)) {
                step.state = CardState::Review;
                step.intervalDays = reviewInterval(cfg, candidateDays);
            }
            else {
                // Same unresolved lapse: no second lapse count
                step.state = CardState::Relearning;
                step.intervalDays = minutes(cfg.relearning_step_minutes);
            }
            break;
        }

        return step;
    }
}
