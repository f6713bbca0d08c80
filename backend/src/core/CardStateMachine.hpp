#pragma once
#include "Card.hpp"
#include "SchedulerConfig.hpp"

/*
  Lifecycle: New -> Learning -> Review <-> Relearning.

    New         any answer               -> Learning (fixed learning step)
    Learning    incorrect                -> Learning (retry step)
    Learning    correct, interval >= 1d  -> Review
    Learning    correct, interval <  1d  -> Learning (learning step)
    Review      correct                  -> Review
    Review      incorrect                -> Relearning, lapse
    Relearning  correct, interval >= 1d  -> Review
    Relearning  otherwise                -> Relearning (relearning step)

  "1d" is graduation_threshold_days.
*/
namespace CardStateMachine
{
    struct Step {
        CardState state = CardState::New;
        double intervalDays = 0.0;
        bool lapse = false;   // true only on Review -> Relearning
    };

    // candidateDays: scheduledDays() of the post-update stability.
    Step next(const SchedulerConfig& cfg, CardState current, bool isCorrect, double candidateDays);
}
