#include "Storage.hpp"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <limits>
#include <cstring>
#include <stdexcept>
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "SGDATA1\n";
static const char RECORD_SEP[] = "---";

static constexpr std::size_t ENC_KEY_BYTES = crypto_secretbox_KEYBYTES;
static constexpr std::size_t SALT_BYTES = crypto_pwhash_SALTBYTES;

static void ensureSodium() {
    if (sodium_init() < 0) {
        spdlog::error("libsodium initialization failed");
        throw std::runtime_error("sodium_init failed");
    }
}

/* -------------------------
   Plain-text payload
   -------------------------
   One field per line, records closed by "---". Free text (ids, card faces) is
   escaped so embedded newlines cannot break the framing.
*/
static std::string escapeLine(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\\') out += "\\\\";
        else if (c == '\n') out += "\\n";
        else if (c == '\r') out += "\\r";
        else out += c;
    }
    return out;
}

static std::string unescapeLine(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size()) {
            char n = s[++i];
            if (n == 'n') out += '\n';
            else if (n == 'r') out += '\r';
            else out += n;
        }
        else {
            out += s[i];
        }
    }
    return out;
}

static bool readLine(std::istringstream& iss, std::string& out) {
    if (!std::getline(iss, out)) return false;
    out = unescapeLine(out);
    return true;
}

static bool readSection(std::istringstream& iss, const char* name, std::size_t& count) {
    std::string line;
    if (!std::getline(iss, line) || line != name) {
        spdlog::error("Store payload: expected section '{}'", name);
        return false;
    }
    if (!std::getline(iss, line)) return false;
    std::istringstream nss(line);
    if (!(nss >> count)) {
        spdlog::error("Store payload: bad record count in section '{}'", name);
        return false;
    }
    return true;
}

static bool readSeparator(std::istringstream& iss) {
    std::string sep;
    return std::getline(iss, sep) && sep == RECORD_SEP;
}

std::string Storage::serialize(const CardStore& store) {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10);

    auto cards = store.getCards();
    oss << "CARDS\n" << cards.size() << "\n";
    for (const auto& c : cards) {
        oss << escapeLine(c.id) << "\n"
            << escapeLine(c.deck_id) << "\n"
            << escapeLine(c.front) << "\n"
            << escapeLine(c.back) << "\n"
            << c.created_at << "\n"
            << RECORD_SEP << "\n";
    }

    auto states = store.getStates();
    oss << "STATES\n" << states.size() << "\n";
    for (const auto& kv : states) {
        const CardState& s = kv.second;
        oss << escapeLine(kv.first.card_id) << "\n"
            << escapeLine(kv.first.learner_id) << "\n"
            << toString(s.state) << "\n"
            << s.stability << " " << s.difficulty << " "
            << s.elapsed_days << " " << s.scheduled_days << " "
            << s.reps << " " << s.lapses << " " << s.due << " ";
        if (s.last_review) oss << *s.last_review;
        else oss << "-";
        oss << "\n" << RECORD_SEP << "\n";
    }

    auto log = store.getLog();
    oss << "LOG\n" << log.size() << "\n";
    for (const auto& e : log) {
        oss << escapeLine(e.card_id) << "\n"
            << escapeLine(e.learner_id) << "\n"
            << static_cast<int>(e.rating) << " "
            << toString(e.state) << " " << toString(e.result) << " "
            << e.elapsed_days << " " << e.scheduled_days << " "
            << e.review_time_ms << " " << e.reviewed_at << "\n"
            << RECORD_SEP << "\n";
    }

    return oss.str();
}

bool Storage::deserialize(const std::string& plain, CardStore& store) {
    std::istringstream iss(plain);
    store.clear();

    std::size_t count = 0;
    if (!readSection(iss, "CARDS", count)) return false;
    for (std::size_t i = 0; i < count; ++i) {
        Card c;
        std::string created;
        if (!readLine(iss, c.id) || !readLine(iss, c.deck_id) || !readLine(iss, c.front)
            || !readLine(iss, c.back) || !std::getline(iss, created)) {
            spdlog::error("Store payload: truncated card record {}", i);
            return false;
        }
        std::istringstream css(created);
        if (!(css >> c.created_at) || !readSeparator(iss)) {
            spdlog::error("Store payload: malformed card record {}", i);
            return false;
        }
        store.insertCard(c);
    }

    if (!readSection(iss, "STATES", count)) return false;
    std::size_t clamped = 0;
    for (std::size_t i = 0; i < count; ++i) {
        std::string cardId, learnerId, label, fields;
        if (!readLine(iss, cardId) || !readLine(iss, learnerId)
            || !std::getline(iss, label) || !std::getline(iss, fields)) {
            spdlog::error("Store payload: truncated state record {}", i);
            return false;
        }

        CardState s;
        if (!lifecycleFromString(label, s.state)) {
            spdlog::error("Store payload: unknown card state '{}' in record {}", label, i);
            return false;
        }

        std::istringstream fss(fields);
        std::string last;
        if (!(fss >> s.stability >> s.difficulty >> s.elapsed_days >> s.scheduled_days
            >> s.reps >> s.lapses >> s.due >> last) || !readSeparator(iss)) {
            spdlog::error("Store payload: malformed state record {}", i);
            return false;
        }
        if (last != "-") {
            std::istringstream lss(last);
            std::time_t t = 0;
            if (!(lss >> t)) {
                spdlog::error("Store payload: bad last review time in record {}", i);
                return false;
            }
            s.last_review = t;
        }

        if (s.clampToBounds()) clamped++;
        store.putState(cardId, learnerId, s);
    }
    if (clamped) spdlog::warn("{} stored card state(s) were out of range and were clamped", clamped);

    if (!readSection(iss, "LOG", count)) return false;
    for (std::size_t i = 0; i < count; ++i) {
        ReviewLogEntry e;
        std::string fields;
        if (!readLine(iss, e.card_id) || !readLine(iss, e.learner_id) || !std::getline(iss, fields)) {
            spdlog::error("Store payload: truncated log entry {}", i);
            return false;
        }

        std::istringstream fss(fields);
        int rating = 0;
        std::string before, after;
        if (!(fss >> rating >> before >> after >> e.elapsed_days >> e.scheduled_days
            >> e.review_time_ms >> e.reviewed_at) || !readSeparator(iss)
            || !ratingFromInt(rating, e.rating)
            || !lifecycleFromString(before, e.state) || !lifecycleFromString(after, e.result)) {
            spdlog::error("Store payload: malformed log entry {}", i);
            return false;
        }
        store.appendLog(e);
    }

    return true;
}

bool Storage::deriveKey(const std::string& passphrase, const std::vector<unsigned char>& salt,
    std::vector<unsigned char>& key)
{
    ensureSodium();
    spdlog::debug("Deriving store key (not logging passphrase or salt)");

    if (salt.size() != SALT_BYTES) {
        spdlog::error("Salt length mismatch while deriving key");
        return false;
    }

    key.assign(ENC_KEY_BYTES, 0);
    if (crypto_pwhash(key.data(),
        ENC_KEY_BYTES,
        passphrase.c_str(),
        static_cast<unsigned long long>(passphrase.size()),
        salt.data(),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_DEFAULT) != 0)
    {
        spdlog::error("crypto_pwhash failed during key derivation");
        key.clear();
        return false;
    }
    return true;
}

bool Storage::saveStore(const CardStore& store, const std::string& filename, const std::string& passphrase) {
    ensureSodium();

    std::vector<unsigned char> salt(SALT_BYTES);
    randombytes_buf(salt.data(), salt.size());

    std::vector<unsigned char> key;
    if (!deriveKey(passphrase, salt, key)) return false;

    std::string plain = serialize(store);
    spdlog::info("Saving encrypted store to '{}' ({} bytes plain)", filename, plain.size());

    const unsigned char* p = reinterpret_cast<const unsigned char*>(plain.data());
    unsigned long long plen = plain.size();

    std::vector<unsigned char> ciphertext(plen + crypto_secretbox_MACBYTES);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    int rc = crypto_secretbox_easy(ciphertext.data(), p, plen, nonce, key.data());
    sodium_memzero(key.data(), key.size());
    sodium_memzero(&plain[0], plain.size());
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
    out.write(reinterpret_cast<const char*>(salt.data()), salt.size());
    out.write(reinterpret_cast<const char*>(nonce), sizeof(nonce));
    out.write(reinterpret_cast<const char*>(ciphertext.data()), ciphertext.size());
    if (!out) {
        spdlog::error("Write to '{}' failed", filename);
        return false;
    }
    return true;
}

bool Storage::loadStore(CardStore& store, const std::string& filename, const std::string& passphrase) {
    ensureSodium();
    spdlog::info("Loading encrypted store from '{}'", filename);
    store.clear();

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::warn("Store file '{}' not found; starting empty", filename);
        return true;
    }

    char hdr[sizeof(MAGIC_HDR) - 1];
    in.read(hdr, sizeof(hdr));
    if (in.gcount() != static_cast<std::streamsize>(sizeof(hdr)) || std::strncmp(hdr, MAGIC_HDR, sizeof(hdr)) != 0) {
        spdlog::error("Invalid magic header");
        return false;
    }

    std::vector<unsigned char> salt(SALT_BYTES);
    in.read(reinterpret_cast<char*>(salt.data()), salt.size());
    if (in.gcount() != static_cast<std::streamsize>(salt.size())) {
        spdlog::error("Failed to read salt");
        return false;
    }

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    in.read(reinterpret_cast<char*>(nonce), sizeof(nonce));
    if (in.gcount() != static_cast<std::streamsize>(sizeof(nonce))) {
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
    if (!deriveKey(passphrase, salt, key)) return false;

    std::vector<unsigned char> plain(ciphertext.size() - crypto_secretbox_MACBYTES);
    int rc = crypto_secretbox_open_easy(plain.data(), ciphertext.data(), ciphertext.size(), nonce, key.data());
    sodium_memzero(key.data(), key.size());
    if (rc != 0) {
        spdlog::error("Decryption failed (wrong passphrase or corrupt file)");
        return false;
    }

    std::string plain_str(reinterpret_cast<char*>(plain.data()), plain.size());
    sodium_memzero(plain.data(), plain.size());
    if (!deserialize(plain_str, store)) {
        store.clear();
        return false;
    }

    spdlog::info("Loaded {} cards, {} states, {} log entries",
        store.getCards().size(), store.getStates().size(), store.getLog().size());
    return true;
}
