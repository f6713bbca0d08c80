#pragma once
#include <ctime>
#include <optional>
#include <string>
#include "Card.hpp"
#include "CardStats.hpp"
#include "DueSelector.hpp"
#include "Replay.hpp"
#include "Scheduler.hpp"
#include "../storage/CardStore.hpp"

struct ReviewReceipt {
    Card card;                 // as persisted
    CardState previousState = CardState::New;
    StatDeltas deltas;         // counter changes caused by this review
};

/*
  Caller side of the scheduling engine: load -> check -> reviewCard ->
  compare-and-swap -> log. The store and scheduler must outlive the service.

  Lookups of unknown cards, or cards owned by someone else, throw
  std::runtime_error. Reviewing a soft-deleted card throws std::logic_error.
*/
class ReviewService {
public:
    ReviewService(CardStore& store, const Scheduler& scheduler);

    Card createCard(const std::string& ownerId, const std::string& question,
        const std::string& answer, std::time_t now);

    ReviewReceipt submitAnswer(const std::string& ownerId, const std::string& cardId,
        bool isCorrect, const std::string& userAnswer, std::time_t answeredAt);

    // false if the card was already in the requested visibility
    bool softDelete(const std::string& ownerId, const std::string& cardId, std::time_t now);
    bool restore(const std::string& ownerId, const std::string& cardId);

    DueSet dueCards(const std::string& ownerId, std::time_t now) const;
    std::optional<Card> nextCard(const std::string& ownerId, std::time_t now) const;
    CardStats stats(const std::string& ownerId, std::time_t now) const;

    // Rebuilds a card's memory state from a fresh New card and its logged
    // interactions, then stores it. Visibility and content are kept.
    ReplayResult rebuildFromHistory(const std::string& ownerId, const std::string& cardId,
        int limit = kDefaultReplayLimit);

private:
    CardStore& store;
    const Scheduler& scheduler;

    Card loadOwned(const std::string& ownerId, const std::string& cardId) const;
};
