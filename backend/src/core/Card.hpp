#pragma once
#include <string>
#include <ctime>
#include <optional>
#include <spdlog/spdlog.h>

enum class CardState {
    New,
    Learning,
    Review,
    Relearning
};

const char* toString(CardState state);
std::optional<CardState> parseCardState(const std::string& text);

class Card {
public:
    Card() = default;

    // Identity
    std::string id;          // Auto-generated, stable for the card's lifetime
    std::string ownerId;

    // Content (opaque to the scheduler)
    std::string question;
    std::string answer;
    std::time_t createdAt = 0;

    // Memory state
    CardState state = CardState::New;
    std::optional<double> stability;   // Days; absent while New
    std::optional<double> difficulty;  // [min, max] difficulty; absent while New
    int reps = 0;                      // Every completed review
    int lapses = 0;                    // Review -> Relearning transitions

    // Scheduling
    std::optional<std::time_t> lastReviewAt;
    std::optional<std::time_t> nextReviewAt;  // Absent = due immediately
    double scheduledDays = 0.0;

    // Visibility
    std::optional<std::time_t> deletedAt;

    bool isDeleted() const { return deletedAt.has_value(); }
    bool isDue(std::time_t now) const;

    // Soft delete / restore only toggle deletedAt.
    bool softDelete(std::time_t at);   // false if already deleted
    bool restore();                    // false if not deleted

    bool operator==(const Card& other) const;
    bool operator!=(const Card& other) const { return !(*this == other); }

    // Utility
    static std::string generateID();
};
