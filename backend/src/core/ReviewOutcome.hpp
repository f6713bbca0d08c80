#pragma once
#include <ctime>

// Ratings keep the classic four-grade numbering (AGAIN=1 .. EASY=4) so HARD
// and EASY can be added later without renumbering. Only the binary pair is
// produced today.
enum class ReviewRating {
    AGAIN = 1,
    GOOD = 3
};

struct ReviewOutcome {
    ReviewRating rating = ReviewRating::AGAIN;
    std::time_t answeredAt = 0;

    bool isCorrect() const { return rating != ReviewRating::AGAIN; }

    static ReviewOutcome fromCorrectness(bool isCorrect, std::time_t answeredAt) {
        return ReviewOutcome{ isCorrect ? ReviewRating::GOOD : ReviewRating::AGAIN, answeredAt };
    }
};
