#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "../core/Card.hpp"
#include "../core/Interaction.hpp"

// What the review flow needs from a card store. Every call must be atomic;
// compareAndSwap is the per-card read-modify-write primitive.
class CardStore {
public:
    virtual ~CardStore() = default;

    virtual std::optional<Card> get(const std::string& id) const = 0;
    virtual std::vector<Card> listByOwner(const std::string& ownerId) const = 0;

    // false if a card with the same id already exists
    virtual bool insert(const Card& card) = 0;

    // Replaces the stored card with `updated` only if it still equals
    // `expected`. false on a concurrent modification or unknown id.
    virtual bool compareAndSwap(const Card& expected, const Card& updated) = 0;

    virtual void appendInteraction(const Interaction& interaction) = 0;
    virtual std::vector<Interaction> interactionsFor(const std::string& cardId) const = 0;
};

class MemoryCardStore : public CardStore {
public:
    MemoryCardStore() = default;
    MemoryCardStore(const std::vector<Card>& cards, const std::vector<Interaction>& interactions);

    std::optional<Card> get(const std::string& id) const override;
    std::vector<Card> listByOwner(const std::string& ownerId) const override;
    bool insert(const Card& card) override;
    bool compareAndSwap(const Card& expected, const Card& updated) override;
    void appendInteraction(const Interaction& interaction) override;
    std::vector<Interaction> interactionsFor(const std::string& cardId) const override;

    // Snapshot for persistence, cards in insertion order.
    std::vector<Card> allCards() const;
    std::vector<Interaction> allInteractions() const;

private:
    mutable std::mutex mtx;
    std::unordered_map<std::string, Card> cards_by_id;
    std::vector<std::string> insertion_order;
    std::vector<Interaction> interactions;
};
