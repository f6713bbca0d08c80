#include "ReviewService.hpp"
#include <stdexcept>

ReviewService::ReviewService(CardStore& s, const Scheduler& sched)
    : store(s), scheduler(sched)
{
}

Card ReviewService::loadOwned(const std::string& ownerId, const std::string& cardId) const {
    auto card = store.get(cardId);
    if (!card || card->ownerId != ownerId) {
        spdlog::warn("Card ID={} not found for owner '{}'", cardId, ownerId);
        throw std::runtime_error("Card not found or unauthorized");
    }
    return *card;
}

Card ReviewService::createCard(const std::string& ownerId, const std::string& question,
    const std::string& answer, std::time_t now)
{
    Card card = scheduler.initializeCard(ownerId, now);
    card.question = question;
    card.answer = answer;

    if (!store.insert(card)) {
        throw std::runtime_error("Failed to insert card " + card.id);
    }

    spdlog::info("Created card ID={} for owner '{}'", card.id, ownerId);
    return card;
}

ReviewReceipt ReviewService::submitAnswer(const std::string& ownerId, const std::string& cardId,
    bool isCorrect, const std::string& userAnswer, std::time_t answeredAt)
{
    const int attempts = scheduler.config().max_update_attempts;
    const ReviewOutcome outcome = ReviewOutcome::fromCorrectness(isCorrect, answeredAt);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        Card current = loadOwned(ownerId, cardId);
        Card updated = scheduler.reviewCard(current, outcome);

        if (!store.compareAndSwap(current, updated)) {
            spdlog::warn("Card ID={} changed during review (attempt {}/{}); retrying", cardId, attempt, attempts);
            continue;
        }

        store.appendInteraction(Interaction{ cardId, ownerId, userAnswer, isCorrect, answeredAt });

        ReviewReceipt receipt;
        receipt.previousState = current.state;
        receipt.deltas = reviewDelta(current, updated, answeredAt);
        receipt.card = updated;

        if (!receipt.deltas.empty()) {
            spdlog::debug("Card ID={} stat deltas: new={} learning={} mature={} dueNow={}", cardId,
                receipt.deltas.newCount, receipt.deltas.learningCount, receipt.deltas.matureCount,
                receipt.deltas.dueNowCount);
        }

        spdlog::info("Card ID={} reviewed: correct={} {} -> {} next in {:.3f}d",
            cardId, isCorrect, toString(current.state), toString(updated.state), updated.scheduledDays);
        return receipt;
    }

    spdlog::error("Giving up on card ID={} after {} conflicting updates", cardId, attempts);
    throw std::runtime_error("Concurrent modification of card " + cardId);
}

bool ReviewService::softDelete(const std::string& ownerId, const std::string& cardId, std::time_t now) {
    const int attempts = scheduler.config().max_update_attempts;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        Card current = loadOwned(ownerId, cardId);
        Card updated = current;
        if (!updated.softDelete(now)) return false;
        if (store.compareAndSwap(current, updated)) return true;
        spdlog::warn("Card ID={} changed during delete (attempt {}/{}); retrying", cardId, attempt, attempts);
    }

    throw std::runtime_error("Concurrent modification of card " + cardId);
}

bool ReviewService::restore(const std::string& ownerId, const std::string& cardId) {
    const int attempts = scheduler.config().max_update_attempts;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        Card current = loadOwned(ownerId, cardId);
        Card updated = current;
        if (!updated.restore()) return false;
        if (store.compareAndSwap(current, updated)) return true;
        spdlog::warn("Card ID={} changed during restore (attempt {}/{}); retrying", cardId, attempt, attempts);
    }

    throw std::runtime_error("Concurrent modification of card " + cardId);
}

DueSet ReviewService::dueCards(const std::string& ownerId, std::time_t now) const {
    return ::dueCards(store.listByOwner(ownerId), now);
}

std::optional<Card> ReviewService::nextCard(const std::string& ownerId, std::time_t now) const {
    return nextDueCard(store.listByOwner(ownerId), now);
}

CardStats ReviewService::stats(const std::string& ownerId, std::time_t now) const {
    return computeStats(store.listByOwner(ownerId), now);
}

ReplayResult ReviewService::rebuildFromHistory(const std::string& ownerId, const std::string& cardId, int limit) {
    Card current = loadOwned(ownerId, cardId);

    Card fresh = scheduler.initializeCard(ownerId, current.createdAt);
    fresh.id = current.id;
    fresh.question = current.question;
    fresh.answer = current.answer;

    std::vector<Interaction> history;
    for (const auto& i : store.interactionsFor(cardId)) {
        if (i.ownerId == ownerId) history.push_back(i);
    }

    ReplayResult result = replayInteractions(scheduler, fresh, history, limit);
    result.card.deletedAt = current.deletedAt;

    if (!store.compareAndSwap(current, result.card)) {
        throw std::runtime_error("Concurrent modification of card " + cardId);
    }
    return result;
}
