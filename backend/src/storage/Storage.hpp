#pragma once
#include <vector>
#include <string>
#include "../core/Card.hpp"
#include "../core/Interaction.hpp"

struct Deck {
    std::vector<Card> cards;
    std::vector<Interaction> interactions;
};

// Storage handles the per-owner encrypted deck file.
//
// File layout:
//   Header: 8 bytes ASCII "RCDECK1\n" (magic + version)
//   Salt:   crypto_pwhash_SALTBYTES (key derivation)
//   Nonce:  crypto_secretbox_NONCEBYTES
//   Ciphertext: remaining bytes
//
// Plaintext is one tab-separated record per line:
//   C  id owner question answer createdAt state stability difficulty reps lapses
//      lastReviewAt nextReviewAt scheduledDays deletedAt
//   I  cardId owner userAnswer isCorrect attemptedAt
// Absent optionals are "-", doubles are hexfloat so they round-trip exactly.
//
// The key is derived from the passphrase with crypto_pwhash. sodium_init()
// must have succeeded before any call.

class Storage {
public:
    static bool saveDeck(const Deck& deck, const std::string& filename, const std::string& passphrase);

    // A missing file yields an empty deck and returns true.
    static bool loadDeck(Deck& deck, const std::string& filename, const std::string& passphrase);

    // Plaintext codec
    static std::string serializeDeck(const Deck& deck);
    static bool parseDeck(const std::string& plain, Deck& deck);

private:
    static bool deriveKey(const std::string& passphrase, const unsigned char* salt, std::vector<unsigned char>& key);
};
