#include "DueSelector.hpp"
#include <algorithm>

DueSet dueCards(const std::vector<Card>& cards, std::time_t now) {
    DueSet set;
    std::vector<Card> scheduled;
    std::vector<Card> fresh;

    for (const auto& card : cards) {
        if (card.isDeleted()) continue;

        if (!card.nextReviewAt) {
            fresh.push_back(card);
        }
        else if (*card.nextReviewAt <= now) {
            scheduled.push_back(card);
        }
    }

    std::sort(scheduled.begin(), scheduled.end(),
        [](const Card& a, const Card& b) {
            if (*a.nextReviewAt != *b.nextReviewAt) return *a.nextReviewAt < *b.nextReviewAt;
            return a.id < b.id;
        });

    std::sort(fresh.begin(), fresh.end(),
        [](const Card& a, const Card& b) { return a.id < b.id; });

    set.dueCount = scheduled.size();
    set.newCount = fresh.size();

    set.due.reserve(scheduled.size() + fresh.size());
    set.due.insert(set.due.end(), scheduled.begin(), scheduled.end());
    set.due.insert(set.due.end(), fresh.begin(), fresh.end());

    spdlog::debug("dueCards: {} scheduled due, {} new, {} total input", set.dueCount, set.newCount, cards.size());
    return set;
}

std::optional<Card> nextDueCard(const std::vector<Card>& cards, std::time_t now) {
    DueSet set = dueCards(cards, now);
    if (set.due.empty()) return std::nullopt;
    return set.due.front();
}
