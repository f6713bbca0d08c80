#include "Storage.hpp"
#include <fstream>
#include <sstream>
#include <cstring>
#include <cstdlib>
#include <cerrno>
#include <cmath>
#include <iterator>
#include <optional>
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "RCDECK1\n";
static constexpr std::size_t ENC_KEY_BYTES = crypto_secretbox_KEYBYTES;
static constexpr std::size_t SALT_BYTES = crypto_pwhash_SALTBYTES;
static const char ABSENT[] = "-";

/* -------------------------
   Field encoding helpers
   ------------------------- */

static std::string escapeText(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '\t': out += "\\t"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        default: out += c; break;
        }
    }
    return out;
}

static bool unescapeText(const std::string& s, std::string& out) {
    out.clear();
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\') {
            out += s[i];
            continue;
        }
        if (++i >= s.size()) return false;
        switch (s[i]) {
        case '\\': out += '\\'; break;
        case 't': out += '\t'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        default: return false;
        }
    }
    return true;
}

static std::string encodeDouble(double v) {
    std::ostringstream oss;
    oss << std::hexfloat << v;
    return oss.str();
}

static bool decodeDouble(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    out = std::strtod(s.c_str(), &end);
    return errno == 0 && end == s.c_str() + s.size();
}

static bool decodeInt64(const std::string& s, long long& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    out = std::strtoll(s.c_str(), &end, 10);
    return errno == 0 && end == s.c_str() + s.size();
}

static bool decodeInt(const std::string& s, int& out) {
    long long v = 0;
    if (!decodeInt64(s, v) || v < 0 || v > 2147483647LL) return false;
    out = static_cast<int>(v);
    return true;
}

template <typename T, typename Encode>
static std::string encodeOptional(const std::optional<T>& v, Encode encode) {
    return v ? encode(*v) : std::string(ABSENT);
}

static std::string encodeTime(std::time_t t) {
    return std::to_string(static_cast<long long>(t));
}

static bool decodeTime(const std::string& s, std::time_t& out) {
    long long v = 0;
    if (!decodeInt64(s, v)) return false;
    out = static_cast<std::time_t>(v);
    return true;
}

static bool decodeOptionalTime(const std::string& s, std::optional<std::time_t>& out) {
    if (s == ABSENT) { out.reset(); return true; }
    std::time_t t = 0;
    if (!decodeTime(s, t)) return false;
    out = t;
    return true;
}

static bool decodeOptionalDouble(const std::string& s, std::optional<double>& out) {
    if (s == ABSENT) { out.reset(); return true; }
    double d = 0.0;
    if (!decodeDouble(s, d)) return false;
    out = d;
    return true;
}

static std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::string cur;
    for (char c : line) {
        if (c == '\t') {
            fields.push_back(cur);
            cur.clear();
        }
        else {
            cur += c;
        }
    }
    fields.push_back(cur);
    return fields;
}

/* -------------------------
   Record codec
   ------------------------- */

static std::string encodeCard(const Card& c) {
    std::ostringstream oss;
    oss << "C"
        << '\t' << escapeText(c.id)
        << '\t' << escapeText(c.ownerId)
        << '\t' << escapeText(c.question)
        << '\t' << escapeText(c.answer)
        << '\t' << encodeTime(c.createdAt)
        << '\t' << toString(c.state)
        << '\t' << encodeOptional(c.stability, encodeDouble)
        << '\t' << encodeOptional(c.difficulty, encodeDouble)
        << '\t' << c.reps
        << '\t' << c.lapses
        << '\t' << encodeOptional(c.lastReviewAt, encodeTime)
        << '\t' << encodeOptional(c.nextReviewAt, encodeTime)
        << '\t' << encodeDouble(c.scheduledDays)
        << '\t' << encodeOptional(c.deletedAt, encodeTime);
    return oss.str();
}

static bool decodeCard(const std::vector<std::string>& f, Card& c) {
    if (f.size() != 15) return false;

    if (!unescapeText(f[1], c.id) || c.id.empty()) return false;
    if (!unescapeText(f[2], c.ownerId)) return false;
    if (!unescapeText(f[3], c.question)) return false;
    if (!unescapeText(f[4], c.answer)) return false;
    if (!decodeTime(f[5], c.createdAt)) return false;

    auto state = parseCardState(f[6]);
    if (!state) return false;
    c.state = *state;

    if (!decodeOptionalDouble(f[7], c.stability)) return false;
    if (!decodeOptionalDouble(f[8], c.difficulty)) return false;
    if (!decodeInt(f[9], c.reps)) return false;
    if (!decodeInt(f[10], c.lapses)) return false;
    if (!decodeOptionalTime(f[11], c.lastReviewAt)) return false;
    if (!decodeOptionalTime(f[12], c.nextReviewAt)) return false;
    if (!decodeDouble(f[13], c.scheduledDays)) return false;
    if (!decodeOptionalTime(f[14], c.deletedAt)) return false;

    // Non-finite memory state is dropped here; the scheduler reseeds it
    if (c.stability && !std::isfinite(*c.stability)) {
        spdlog::warn("Card ID={} has non-finite stability; dropping it", c.id);
        c.stability.reset();
    }
    if (c.difficulty && !std::isfinite(*c.difficulty)) {
        spdlog::warn("Card ID={} has non-finite difficulty; dropping it", c.id);
        c.difficulty.reset();
    }
    if (!std::isfinite(c.scheduledDays)) {
        spdlog::warn("Card ID={} has non-finite scheduledDays; resetting to 0", c.id);
        c.scheduledDays = 0.0;
    }
    return true;
}

static std::string encodeInteraction(const Interaction& i) {
    std::ostringstream oss;
    oss << "I"
        << '\t' << escapeText(i.cardId)
        << '\t' << escapeText(i.ownerId)
        << '\t' << escapeText(i.userAnswer)
        << '\t' << (i.isCorrect ? 1 : 0)
        << '\t' << encodeTime(i.attemptedAt);
    return oss.str();
}

static bool decodeInteraction(const std::vector<std::string>& f, Interaction& i) {
    if (f.size() != 6) return false;
    if (!unescapeText(f[1], i.cardId)) return false;
    if (!unescapeText(f[2], i.ownerId)) return false;
    if (!unescapeText(f[3], i.userAnswer)) return false;
    if (f[4] != "0" && f[4] != "1") return false;
    i.isCorrect = (f[4] == "1");
    return decodeTime(f[5], i.attemptedAt);
}

std::string Storage::serializeDeck(const Deck& deck) {
    std::ostringstream oss;
    for (const auto& c : deck.cards) oss << encodeCard(c) << "\n";
    for (const auto& i : deck.interactions) oss << encodeInteraction(i) << "\n";
    return oss.str();
}

bool Storage::parseDeck(const std::string& plain, Deck& deck) {
    deck.cards.clear();
    deck.interactions.clear();

    std::istringstream iss(plain);
    std::string line;
    std::size_t lineNo = 0;

    while (std::getline(iss, line)) {
        ++lineNo;
        if (line.empty()) continue;

        auto fields = splitFields(line);
        if (fields[0] == "C") {
            Card c;
            if (!decodeCard(fields, c)) {
                spdlog::error("Malformed card record on line {}", lineNo);
                return false;
            }
            deck.cards.push_back(c);
        }
        else if (fields[0] == "I") {
            Interaction i;
            if (!decodeInteraction(fields, i)) {
                spdlog::error("Malformed interaction record on line {}", lineNo);
                return false;
            }
            deck.interactions.push_back(i);
        }
        else {
            spdlog::error("Unknown record type '{}' on line {}", fields[0], lineNo);
            return false;
        }
    }

    return true;
}

/* -------------------------
   Encryption
   ------------------------- */

bool Storage::deriveKey(const std::string& passphrase, const unsigned char* salt, std::vector<unsigned char>& key) {
    spdlog::debug("Deriving deck key (not logging passphrase or salt)");

    key.assign(ENC_KEY_BYTES, 0);

    if (crypto_pwhash(key.data(),
        ENC_KEY_BYTES,
        passphrase.c_str(),
        static_cast<unsigned long long>(passphrase.size()),
        salt,
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_DEFAULT) != 0)
    {
        spdlog::error("crypto_pwhash failed during deck key derivation");
        key.clear();
        return false;
    }
    return true;
}

bool Storage::saveDeck(const Deck& deck, const std::string& filename, const std::string& passphrase) {
    spdlog::info("Saving {} cards and {} interactions to '{}'", deck.cards.size(), deck.interactions.size(), filename);

    unsigned char salt[SALT_BYTES];
    randombytes_buf(salt, sizeof(salt));

    std::vector<unsigned char> key;
    if (!deriveKey(passphrase, salt, key)) {
        return false;
    }

    std::string plain = serializeDeck(deck);
    const unsigned char* p = reinterpret_cast<const unsigned char*>(plain.data());
    unsigned long long plen = plain.size();

    std::vector<unsigned char> ciphertext(plen + crypto_secretbox_MACBYTES);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    int rc = crypto_secretbox_easy(ciphertext.data(), p, plen, nonce, key.data());
    sodium_memzero(key.data(), key.size());
    if (rc != 0) {
        spdlog::error("Encryption failed");
        return false;
    }

    std::ofstream out(filename, std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for encrypted write", filename);
        return false;
    }

    out.write(MAGIC_HDR, sizeof(MAGIC_HDR) - 1);
    out.write(reinterpret_cast<const char*>(salt), sizeof(salt));
    out.write(reinterpret_cast<const char*>(nonce), sizeof(nonce));
    out.write(reinterpret_cast<const char*>(ciphertext.data()), ciphertext.size());

    if (!out) {
        spdlog::error("Write to '{}' failed", filename);
        return false;
    }
    return true;
}

bool Storage::loadDeck(Deck& deck, const std::string& filename, const std::string& passphrase) {
    spdlog::info("Loading encrypted deck from '{}'", filename);
    deck.cards.clear();
    deck.interactions.clear();

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::warn("Deck file '{}' not found; treating as empty", filename);
        return true;
    }

    char hdr[sizeof(MAGIC_HDR) - 1];
    in.read(hdr, sizeof(hdr));
    if (in.gcount() != sizeof(hdr) || std::strncmp(hdr, MAGIC_HDR, sizeof(hdr)) != 0) {
        spdlog::error("Invalid magic header");
        return false;
    }

    unsigned char salt[SALT_BYTES];
    in.read(reinterpret_cast<char*>(salt), sizeof(salt));
    if (in.gcount() != sizeof(salt)) {
        spdlog::error("Failed to read salt");
        return false;
    }

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    in.read(reinterpret_cast<char*>(nonce), sizeof(nonce));
    if (in.gcount() != sizeof(nonce)) {
        spdlog::error("Failed to read nonce");
        return false;
    }

    std::vector<unsigned char> ciphertext(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());

    if (ciphertext.size() < crypto_secretbox_MACBYTES) {
        spdlog::error("Ciphertext too short");
        return false;
    }

    std::vector<unsigned char> key;
    if (!deriveKey(passphrase, salt, key)) {
        return false;
    }

    std::vector<unsigned char> plain(ciphertext.size() - crypto_secretbox_MACBYTES);
    int rc = crypto_secretbox_open_easy(plain.data(), ciphertext.data(), ciphertext.size(), nonce, key.data());
    sodium_memzero(key.data(), key.size());
    if (rc != 0) {
        spdlog::error("Decryption failed (wrong passphrase or corrupted file)");
        return false;
    }

    std::string plain_str(reinterpret_cast<char*>(plain.data()), plain.size());
    if (!parseDeck(plain_str, deck)) {
        deck.cards.clear();
        deck.interactions.clear();
        return false;
    }

    spdlog::info("Loaded {} cards and {} interactions", deck.cards.size(), deck.interactions.size());
    return true;
}
