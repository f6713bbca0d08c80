#pragma once
#include <ctime>
#include <optional>
#include <vector>
#include "Card.hpp"

// Per-owner counters. Learning and Relearning share learningCount; Review
// cards are "mature".
struct StatDeltas {
    int totalCards = 0;
    int newCount = 0;
    int learningCount = 0;
    int matureCount = 0;
    int dueNowCount = 0;

    bool empty() const {
        return totalCards == 0 && newCount == 0 && learningCount == 0
            && matureCount == 0 && dueNowCount == 0;
    }
};

struct CardStats {
    int totalCards = 0;
    int newCount = 0;
    int learningCount = 0;
    int matureCount = 0;
    int dueNowCount = 0;
    std::optional<std::time_t> nextReviewAt;  // earliest future review

    // Adds deltas, flooring every counter at zero.
    void apply(const StatDeltas& deltas);

    bool operator==(const CardStats& other) const;
};

// Counter changes for a state change; empty when the state is unchanged.
std::optional<StatDeltas> transitionDelta(std::optional<CardState> oldState, std::optional<CardState> newState);

// Delta for one review: state counters plus the due-now flip.
StatDeltas reviewDelta(const Card& before, const Card& after, std::time_t now);

// Full recount from a snapshot. Soft-deleted cards are not counted.
CardStats computeStats(const std::vector<Card>& cards, std::time_t now);
