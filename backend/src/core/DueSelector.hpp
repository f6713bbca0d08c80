#pragma once
#include <ctime>
#include <optional>
#include <vector>
#include "Card.hpp"

struct DueSet {
    std::vector<Card> due;      // presentation order
    std::size_t newCount = 0;   // eligible, never scheduled
    std::size_t dueCount = 0;   // eligible, scheduled at or before now
};

/*
  A card is eligible when it is not soft-deleted and either has no
  nextReviewAt or nextReviewAt <= now.

  Order: scheduled cards by ascending nextReviewAt (most overdue first), then
  never-scheduled cards. Ties break on id.
*/
DueSet dueCards(const std::vector<Card>& cards, std::time_t now);

// First card of dueCards(cards, now).due, if any.
std::optional<Card> nextDueCard(const std::vector<Card>& cards, std::time_t now);
