#include "Scheduler.hpp"
#include "ForgettingCurve.hpp"
#include "CardStateMachine.hpp"
#include <stdexcept>

Scheduler::Scheduler(const SchedulerConfig& config)
    : cfg(config)
{
    cfg.validate();
    spdlog::info("Scheduler initialized: target_retention={:.3f} max_interval={}d",
        cfg.target_retention, cfg.maximum_interval_days);
}

/*
  Public API:
    - initializeCard(ownerId, createdAt)
    - reviewCard(Card, ReviewOutcome)
    - retrievability(Card, now)
*/

Card Scheduler::initializeCard(const std::string& ownerId, std::time_t createdAt) const {
    Card card;
    card.id = Card::generateID();
    card.ownerId = ownerId;
    card.createdAt = createdAt;
    card.state = CardState::New;

    spdlog::debug("Initialized card ID={} for owner '{}'", card.id, ownerId);
    return card;
}

Card Scheduler::reviewCard(const Card& card, const ReviewOutcome& outcome) const {
    if (card.isDeleted()) {
        spdlog::error("reviewCard called on soft-deleted card ID={}", card.id);
        throw std::logic_error("cannot review soft-deleted card " + card.id);
    }

    const bool correct = outcome.isCorrect();

    MemoryState next;
    double recall = 1.0;
    double candidateDays = 0.0;

    if (card.state == CardState::New) {
        // First review: no curve to consult yet
        next = MemoryModel::seed(cfg, correct);
    }
    else {
        MemoryState current = storedMemory(card);

        if (card.lastReviewAt) {
            double elapsed = ForgettingCurve::elapsedDays(*card.lastReviewAt, outcome.answeredAt);
            recall = ForgettingCurve::retrievability(current.stability, elapsed);
        }

        next = MemoryModel::update(cfg, current, recall, correct);
        candidateDays = ForgettingCurve::scheduledDays(next.stability, cfg.target_retention);
    }

    CardStateMachine::Step step = CardStateMachine::next(cfg, card.state, correct, candidateDays);

    Card updated = card;
    updated.state = step.state;
    updated.stability = next.stability;
    updated.difficulty = next.difficulty;
    updated.reps = card.reps + 1;
    if (step.lapse) updated.lapses = card.lapses + 1;
    updated.lastReviewAt = outcome.answeredAt;
    updated.scheduledDays = step.intervalDays;
    updated.nextReviewAt = ForgettingCurve::addDays(outcome.answeredAt, step.intervalDays);

    spdlog::debug("Review card ID={} correct={} R={:.4f} | {} -> {} | S={:.3f} D={:.3f} | interval={:.4f}d lapses={}",
        card.id, correct, recall, toString(card.state), toString(updated.state),
        next.stability, next.difficulty, step.intervalDays, updated.lapses);

    if (step.lapse) {
        spdlog::info("Card ID={} lapsed. lapses={}", card.id, updated.lapses);
    }

    return updated;
}

std::optional<double> Scheduler::retrievability(const Card& card, std::time_t now) const {
    if (card.state == CardState::New || !card.lastReviewAt) {
        return std::nullopt;
    }

    MemoryState current = storedMemory(card);
    double elapsed = ForgettingCurve::elapsedDays(*card.lastReviewAt, now);
    return ForgettingCurve::retrievability(current.stability, elapsed);
}

/* -------------------------
   Corrupt state handling
   -------------------------
   Values outside the configured bounds mean upstream corruption. Clamp them
   and keep scheduling, but say so loudly.
*/
MemoryState Scheduler::storedMemory(const Card& card) const {
    MemoryState m;

    if (!card.stability) {
        spdlog::warn("Card ID={} in state '{}' has no stability; reseeding", card.id, toString(card.state));
        m.stability = cfg.initial_stability_again;
    }
    else if (!(*card.stability >= cfg.minimum_stability && *card.stability <= cfg.maximum_stability)) {
        spdlog::warn("Card ID={} stability {} out of bounds [{}, {}]; clamping",
            card.id, *card.stability, cfg.minimum_stability, cfg.maximum_stability);
        m.stability = MemoryModel::clampStability(cfg, *card.stability);
    }
    else {
        m.stability = *card.stability;
    }

    if (!card.difficulty) {
        spdlog::warn("Card ID={} in state '{}' has no difficulty; reseeding", card.id, toString(card.state));
        m.difficulty = cfg.initial_difficulty;
    }
    else if (!(*card.difficulty >= cfg.minimum_difficulty && *card.difficulty <= cfg.maximum_difficulty)) {
        spdlog::warn("Card ID={} difficulty {} out of bounds [{}, {}]; clamping",
            card.id, *card.difficulty, cfg.minimum_difficulty, cfg.maximum_difficulty);
        m.difficulty = MemoryModel::clampDifficulty(cfg, *card.difficulty);
    }
    else {
        m.difficulty = *card.difficulty;
    }

    return m;
}
