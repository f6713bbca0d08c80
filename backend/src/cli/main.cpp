#include <iostream>
#include <vector>
#include <string>
#include <sodium.h>
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <cctype>
#include <ctime>

#include "../utils/logging.hpp"
#include "../storage/Storage.hpp"
#include "../storage/CardStore.hpp"
#include "../core/Scheduler.hpp"
#include "../core/SchedulerConfig.hpp"
#include "../core/ReviewService.hpp"

std::string deckFileFor(const std::string& owner) {
    return "deck_" + owner + ".dat";
}

std::string trim(const std::string& s) {
    std::string t = s;
    while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
    while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
    return t;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool answersMatch(const std::string& given, const std::string& expected) {
    return lower(trim(given)) == lower(trim(expected));
}

std::string formatTime(const std::optional<std::time_t>& t) {
    if (!t) return "now";
    char buf[32];
    std::tm tm_buf{};
    localtime_r(&*t, &tm_buf);
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm_buf);
    return buf;
}

void listAllCards(const std::vector<Card>& cards, const Scheduler& scheduler) {
    std::cout << "\n===== ALL CARDS =====\n";

    if (cards.empty()) {
        std::cout << "No cards stored.\n";
        return;
    }

    std::time_t now = std::time(nullptr);
    for (size_t i = 0; i < cards.size(); i++) {
        const Card& c = cards[i];
        std::cout << i + 1 << ". " << c.question << (c.isDeleted() ? "  [deleted]" : "") << "\n";
        std::cout << "   State: " << toString(c.state) << "\n";
        std::cout << "   Reps: " << c.reps << "  Lapses: " << c.lapses << "\n";
        if (c.stability && c.difficulty) {
            std::cout << "   Stability: " << *c.stability << " days  Difficulty: " << *c.difficulty << "\n";
        }
        if (auto r = scheduler.retrievability(c, now)) {
            std::cout << "   Recall now: " << static_cast<int>(*r * 100.0 + 0.5) << "%\n";
        }
        std::cout << "   Next review: " << formatTime(c.nextReviewAt) << "\n";
        std::cout << "-----------------------------\n";
    }
}

int chooseCardIndex(const std::vector<Card>& cards, const Scheduler& scheduler) {
    if (cards.empty()) {
        std::cout << "No cards available.\n";
        return -1;
    }
    listAllCards(cards, scheduler);
    std::cout << "Choose card number: ";

    int sel;
    if (!(std::cin >> sel)) {
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        return -1;
    }
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');

    if (sel < 1 || (size_t)sel > cards.size()) {
        std::cout << "Invalid selection.\n";
        return -1;
    }
    return sel - 1;
}

void reviewDue(ReviewService& service, const std::string& owner) {
    std::time_t now = std::time(nullptr);
    DueSet set = service.dueCards(owner, now);
    if (set.due.empty()) { std::cout << "No cards due.\n"; return; }

    std::cout << set.dueCount << " due, " << set.newCount << " new.\n";

    for (const auto& card : set.due) {
        std::cout << "\nQuestion: " << card.question << "\nYour answer: ";
        std::string given;
        std::getline(std::cin, given);

        bool correct = answersMatch(given, card.answer);
        std::cout << (correct ? "Correct!" : "Incorrect.") << " Answer: " << card.answer << "\n";

        ReviewReceipt receipt = service.submitAnswer(owner, card.id, correct, given, std::time(nullptr));
        std::cout << "State: " << toString(receipt.card.state)
            << " | next review: " << formatTime(receipt.card.nextReviewAt) << "\n";
    }
}

int main() {
    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    Log::init();

    SchedulerConfig config;
    try {
        config = SchedulerConfig::loadFile("recall.cfg");
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "Bad recall.cfg: " << e.what() << "\n";
        return 1;
    }

    Scheduler scheduler(config);

    std::string owner, passphrase;
    std::cout << "Owner: "; std::getline(std::cin, owner);
    owner = trim(owner);
    if (owner.empty()) { std::cout << "Owner required.\n"; return 1; }
    std::cout << "Passphrase: "; std::getline(std::cin, passphrase);

    Deck deck;
    if (!Storage::loadDeck(deck, deckFileFor(owner), passphrase)) {
        std::cout << "Could not open deck (wrong passphrase?).\n";
        return 1;
    }

    MemoryCardStore store(deck.cards, deck.interactions);
    ReviewService service(store, scheduler);

    // MAIN LOOP
    while (true) {
        std::cout << "\n===== MAIN MENU =====\n"
            "Owner: " << owner << "\n"
            "1. Add Card\n"
            "2. Review Due Cards\n"
            "3. List All Cards\n"
            "4. Delete Card\n"
            "5. Restore Card\n"
            "6. Statistics\n"
            "7. Save & Exit\n> ";

        int choice;
        if (!(std::cin >> choice)) {
            if (std::cin.eof()) break;
            std::cin.clear(); std::string dummy; std::getline(std::cin, dummy);
            continue;
        }
        std::cin.ignore();

        try {
            if (choice == 1) {
                std::string question, answer;
                std::cout << "Enter question: "; std::getline(std::cin, question);
                if (trim(question).empty()) { std::cout << "Question required.\n"; continue; }
                std::cout << "Enter answer: "; std::getline(std::cin, answer);

                service.createCard(owner, question, answer, std::time(nullptr));
                std::cout << "Card added.\n";
            }

            else if (choice == 2) {
                reviewDue(service, owner);
            }

            else if (choice == 3) {
                listAllCards(store.listByOwner(owner), scheduler);
            }

            else if (choice == 4 || choice == 5) {
                auto cards = store.listByOwner(owner);
                int idx = chooseCardIndex(cards, scheduler); if (idx < 0) continue;
                bool changed = (choice == 4)
                    ? service.softDelete(owner, cards[idx].id, std::time(nullptr))
                    : service.restore(owner, cards[idx].id);
                std::cout << (changed ? "Done.\n" : "Nothing to change.\n");
            }

            else if (choice == 6) {
                CardStats s = service.stats(owner, std::time(nullptr));
                std::cout << "=== STATISTICS ===\n"
                    << "Total: " << s.totalCards << "\n"
                    << "New: " << s.newCount << "\n"
                    << "Learning: " << s.learningCount << "\n"
                    << "Mature: " << s.matureCount << "\n"
                    << "Due now: " << s.dueNowCount << "\n";
                if (s.nextReviewAt) std::cout << "Next review: " << formatTime(s.nextReviewAt) << "\n";
            }

            else if (choice == 7) {
                break;
            }

            else std::cout << "Invalid.\n";
        }
        catch (const std::exception& e) {
            spdlog::error("Menu action {} failed: {}", choice, e.what());
            std::cout << "Error: " << e.what() << "\n";
        }
    }

    deck.cards = store.allCards();
    deck.interactions = store.allInteractions();
    if (!Storage::saveDeck(deck, deckFileFor(owner), passphrase)) {
        std::cout << "Error saving deck.\n";
        return 1;
    }

    std::cout << "Goodbye!\n";
    return 0;
}
