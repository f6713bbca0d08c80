#include "CardStats.hpp"
#include <algorithm>

namespace {

void bump(StatDeltas& d, CardState state, int by) {
    switch (state) {
    case CardState::New: d.newCount += by; break;
    case CardState::Learning:
    case CardState::Relearning: d.learningCount += by; break;
    case CardState::Review: d.matureCount += by; break;
    }
}

int floorAdd(int value, int delta) {
    return std::max(0, value + delta);
}

} // namespace

void CardStats::apply(const StatDeltas& deltas) {
    totalCards = floorAdd(totalCards, deltas.totalCards);
    newCount = floorAdd(newCount, deltas.newCount);
    learningCount = floorAdd(learningCount, deltas.learningCount);
    matureCount = floorAdd(matureCount, deltas.matureCount);
    dueNowCount = floorAdd(dueNowCount, deltas.dueNowCount);
}

bool CardStats::operator==(const CardStats& other) const {
    return totalCards == other.totalCards
        && newCount == other.newCount
        && learningCount == other.learningCount
        && matureCount == other.matureCount
        && dueNowCount == other.dueNowCount
        && nextReviewAt == other.nextReviewAt;
}

std::optional<StatDeltas> transitionDelta(std::optional<CardState> oldState, std::optional<CardState> newState) {
    if (oldState == newState) {
        return std::nullopt;
    }

    StatDeltas d;
    if (oldState) bump(d, *oldState, -1);
    if (newState) bump(d, *newState, +1);
    return d;
}

StatDeltas reviewDelta(const Card& before, const Card& after, std::time_t now) {
    StatDeltas d = transitionDelta(before.state, after.state).value_or(StatDeltas{});

    bool wasDue = before.isDue(now);
    bool isDueNow = after.isDue(now);
    if (wasDue && !isDueNow) d.dueNowCount -= 1;
    else if (!wasDue && isDueNow) d.dueNowCount += 1;

    return d;
}

CardStats computeStats(const std::vector<Card>& cards, std::time_t now) {
    CardStats stats;

    for (const auto& card : cards) {
        if (card.isDeleted()) continue;

        stats.totalCards++;
        switch (card.state) {
        case CardState::New: stats.newCount++; break;
        case CardState::Learning:
        case CardState::Relearning: stats.learningCount++; break;
        case CardState::Review: stats.matureCount++; break;
        }

        if (card.isDue(now)) {
            stats.dueNowCount++;
        }
        else if (!stats.nextReviewAt || *card.nextReviewAt < *stats.nextReviewAt) {
            stats.nextReviewAt = card.nextReviewAt;
        }
    }

    spdlog::debug("computeStats: total={} new={} learning={} mature={} dueNow={}",
        stats.totalCards, stats.newCount, stats.learningCount, stats.matureCount, stats.dueNowCount);
    return stats;
}
