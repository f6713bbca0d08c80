#pragma once
#include <vector>
#include "Card.hpp"
#include "Interaction.hpp"
#include "Scheduler.hpp"

constexpr int kDefaultReplayLimit = 50;

struct ReplayResult {
    Card card;
    int applied = 0;
};

// Applies the last `limit` interactions (chronological order) to `card`
// through reviewCard. Empty log or limit <= 0 returns the card unchanged.
ReplayResult replayInteractions(const Scheduler& scheduler, const Card& card,
    const std::vector<Interaction>& interactions, int limit = kDefaultReplayLimit);
