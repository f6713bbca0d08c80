#pragma once
#include <ctime>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include "Card.hpp"
#include "ReviewOutcome.hpp"
#include "SchedulerConfig.hpp"
#include "MemoryModel.hpp"

/*
  Scheduler bound to one SchedulerConfig. Construct one instance and pass it
  to whoever needs it.

   - initializeCard(): a New card, due immediately
   - reviewCard(): forgetting curve -> memory model -> state machine
   - retrievability(): recall probability of a reviewed card at a moment

  Every call is a pure function of its arguments and the config; the
  scheduler keeps no per-card state, so one instance may be shared across
  threads.
*/

class Scheduler {
public:
    explicit Scheduler(const SchedulerConfig& config = SchedulerConfig{});

    Card initializeCard(const std::string& ownerId = "", std::time_t createdAt = std::time(nullptr)) const;

    // Throws std::logic_error for a soft-deleted card.
    Card reviewCard(const Card& card, const ReviewOutcome& outcome) const;

    // Empty for cards that were never reviewed.
    std::optional<double> retrievability(const Card& card, std::time_t now) const;

    const SchedulerConfig& config() const { return cfg; }

private:
    SchedulerConfig cfg;

    // Stored memory state, clamped (with a warning) if storage handed us
    // something outside the configured bounds.
    MemoryState storedMemory(const Card& card) const;
};
