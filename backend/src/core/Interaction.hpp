#pragma once
#include <string>
#include <ctime>

// One submitted answer. Appended to the log for every review.
struct Interaction {
    std::string cardId;
    std::string ownerId;
    std::string userAnswer;
    bool isCorrect = false;
    std::time_t attemptedAt = 0;

    bool operator==(const Interaction& other) const {
        return cardId == other.cardId
            && ownerId == other.ownerId
            && userAnswer == other.userAnswer
            && isCorrect == other.isCorrect
            && attemptedAt == other.attemptedAt;
    }
};
