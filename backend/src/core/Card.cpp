#include "Card.hpp"
#include <chrono>
#include <random>
#include <sstream>
#include <iomanip>
#include <cstdint>
#include <cstring>

const char* toString(CardState state) {
    switch (state) {
    case CardState::New: return "new";
    case CardState::Learning: return "learning";
    case CardState::Review: return "review";
    case CardState::Relearning: return "relearning";
    }
    return "new";
}

std::optional<CardState> parseCardState(const std::string& text) {
    if (text == "new") return CardState::New;
    if (text == "learning") return CardState::Learning;
    if (text == "review") return CardState::Review;
    if (text == "relearning") return CardState::Relearning;
    return std::nullopt;
}

bool Card::isDue(std::time_t now) const {
    if (isDeleted()) return false;
    return !nextReviewAt || *nextReviewAt <= now;
}

bool Card::softDelete(std::time_t at) {
    if (deletedAt) {
        spdlog::warn("Card ID={} already deleted", id);
        return false;
    }
    deletedAt = at;
    spdlog::info("Card ID={} soft-deleted at {}", id, at);
    return true;
}

bool Card::restore() {
    if (!deletedAt) {
        spdlog::warn("Card ID={} is not deleted; nothing to restore", id);
        return false;
    }
    deletedAt.reset();
    spdlog::info("Card ID={} restored", id);
    return true;
}

// Bitwise identity, so a NaN read from storage still equals its own copy.
static bool sameBits(double a, double b) {
    return std::memcmp(&a, &b, sizeof(double)) == 0;
}

static bool sameBits(const std::optional<double>& a, const std::optional<double>& b) {
    if (a.has_value() != b.has_value()) return false;
    return !a || sameBits(*a, *b);
}

bool Card::operator==(const Card& other) const {
    return id == other.id
        && ownerId == other.ownerId
        && question == other.question
        && answer == other.answer
        && createdAt == other.createdAt
        && state == other.state
        && sameBits(stability, other.stability)
        && sameBits(difficulty, other.difficulty)
        && reps == other.reps
        && lapses == other.lapses
        && lastReviewAt == other.lastReviewAt
        && nextReviewAt == other.nextReviewAt
        && sameBits(scheduledDays, other.scheduledDays)
        && deletedAt == other.deletedAt;
}

// Simple unique ID generator (timestamp + random bits)
std::string Card::generateID() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count();

    std::random_device rd;
    std::mt19937_64 eng(rd());
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t randPart = dist(eng);

    std::stringstream ss;
    ss << std::hex << millis << "-" << std::setw(16) << std::setfill('0') << randPart;
    return ss.str();
}
