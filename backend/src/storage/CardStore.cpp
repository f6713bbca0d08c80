#include "CardStore.hpp"
#include <spdlog/spdlog.h>

MemoryCardStore::MemoryCardStore(const std::vector<Card>& cards, const std::vector<Interaction>& history) {
    for (const auto& c : cards) {
        if (!insert(c)) {
            spdlog::warn("Duplicate card ID={} dropped while loading store", c.id);
        }
    }
    interactions = history;
    spdlog::info("MemoryCardStore loaded {} cards, {} interactions", cards_by_id.size(), interactions.size());
}

std::optional<Card> MemoryCardStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = cards_by_id.find(id);
    if (it == cards_by_id.end()) return std::nullopt;
    return it->second;
}

std::vector<Card> MemoryCardStore::listByOwner(const std::string& ownerId) const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<Card> out;
    for (const auto& id : insertion_order) {
        const Card& c = cards_by_id.at(id);
        if (c.ownerId == ownerId) out.push_back(c);
    }
    return out;
}

bool MemoryCardStore::insert(const Card& card) {
    std::lock_guard<std::mutex> lock(mtx);
    if (card.id.empty()) {
        spdlog::warn("Refusing to insert card without an id");
        return false;
    }
    if (!cards_by_id.emplace(card.id, card).second) {
        spdlog::warn("Card ID={} already exists", card.id);
        return false;
    }
    insertion_order.push_back(card.id);
    spdlog::debug("Inserted card ID={} for owner '{}'", card.id, card.ownerId);
    return true;
}

bool MemoryCardStore::compareAndSwap(const Card& expected, const Card& updated) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = cards_by_id.find(expected.id);
    if (it == cards_by_id.end()) {
        spdlog::warn("compareAndSwap: card ID={} not found", expected.id);
        return false;
    }
    if (updated.id != expected.id) {
        spdlog::error("compareAndSwap: id change {} -> {} rejected", expected.id, updated.id);
        return false;
    }
    if (it->second != expected) {
        spdlog::debug("compareAndSwap: card ID={} changed concurrently", expected.id);
        return false;
    }
    it->second = updated;
    return true;
}

void MemoryCardStore::appendInteraction(const Interaction& interaction) {
    std::lock_guard<std::mutex> lock(mtx);
    interactions.push_back(interaction);
}

std::vector<Interaction> MemoryCardStore::interactionsFor(const std::string& cardId) const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<Interaction> out;
    for (const auto& i : interactions) {
        if (i.cardId == cardId) out.push_back(i);
    }
    return out;
}

std::vector<Card> MemoryCardStore::allCards() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<Card> out;
    out.reserve(insertion_order.size());
    for (const auto& id : insertion_order) out.push_back(cards_by_id.at(id));
    return out;
}

std::vector<Interaction> MemoryCardStore::allInteractions() const {
    std::lock_guard<std::mutex> lock(mtx);
    return interactions;
}
