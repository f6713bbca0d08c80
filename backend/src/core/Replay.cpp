#include "Replay.hpp"
#include <algorithm>

ReplayResult replayInteractions(const Scheduler& scheduler, const Card& card,
    const std::vector<Interaction>& interactions, int limit)
{
    ReplayResult result{ card, 0 };

    if (interactions.empty() || limit <= 0) {
        return result;
    }

    std::vector<Interaction> chronological = interactions;
    std::stable_sort(chronological.begin(), chronological.end(),
        [](const Interaction& a, const Interaction& b) { return a.attemptedAt < b.attemptedAt; });

    std::size_t start = 0;
    if (chronological.size() > static_cast<std::size_t>(limit)) {
        start = chronological.size() - static_cast<std::size_t>(limit);
    }

    for (std::size_t i = start; i < chronological.size(); ++i) {
        const Interaction& it = chronological[i];
        result.card = scheduler.reviewCard(result.card,
            ReviewOutcome::fromCorrectness(it.isCorrect, it.attemptedAt));
        result.applied++;
    }

    spdlog::info("Replayed {} of {} interactions into card ID={}", result.applied, interactions.size(), card.id);
    return result;
}
