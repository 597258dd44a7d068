#include "CardStore.hpp"
#include <spdlog/spdlog.h>

CardStore::CardStore(const Scheduler& scheduler)
    : reviewer(scheduler)
{
}

Card CardStore::addCard(const std::string& deckId, const std::string& front, const std::string& back, std::time_t now) {
    Card c(deckId, front, back, now);
    insertCard(c);
    return c;
}

void CardStore::insertCard(const Card& card) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = card_index.find(card.id);
    if (it != card_index.end()) {
        spdlog::warn("Card '{}' already present; replacing catalog entry", card.id);
        cards[it->second] = card;
        return;
    }
    card_index.emplace(card.id, cards.size());
    cards.push_back(card);
}

bool CardStore::hasCard(const std::string& cardId) const {
    std::lock_guard<std::mutex> lock(mtx);
    return card_index.count(cardId) != 0;
}

std::optional<Card> CardStore::getCard(const std::string& cardId) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = card_index.find(cardId);
    if (it == card_index.end()) return std::nullopt;
    return cards[it->second];
}

std::vector<Card> CardStore::getCards() const {
    std::lock_guard<std::mutex> lock(mtx);
    return cards;
}

std::optional<CardState> CardStore::getState(const std::string& cardId, const std::string& learnerId) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = states.find(StateKey{ cardId, learnerId });
    if (it == states.end()) return std::nullopt;
    return it->second;
}

void CardStore::putState(const std::string& cardId, const std::string& learnerId, const CardState& state) {
    std::lock_guard<std::mutex> lock(mtx);
    states[StateKey{ cardId, learnerId }] = state;
}

std::vector<std::pair<StateKey, CardState>> CardStore::getStates() const {
    std::lock_guard<std::mutex> lock(mtx);
    return std::vector<std::pair<StateKey, CardState>>(states.begin(), states.end());
}

std::vector<StudyCard> CardStore::studyCards(const std::string& learnerId, std::time_t now,
    const std::optional<std::string>& deckId) const
{
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<StudyCard> out;
    out.reserve(cards.size());

    for (const auto& c : cards) {
        if (deckId && c.deck_id != *deckId) continue;
        auto it = states.find(StateKey{ c.id, learnerId });
        out.push_back(StudyCard{ c.id, c.deck_id,
            it != states.end() ? it->second : CardState::newCard(now) });
    }
    return out;
}

ReviewError CardStore::review(const std::string& cardId, const std::string& learnerId, Rating rating,
    std::time_t now, std::int64_t reviewTimeMs, CardState* result)
{
    std::lock_guard<std::mutex> lock(mtx);

    if (card_index.count(cardId) == 0) {
        spdlog::warn("Review for unknown card '{}'", cardId);
        return ReviewError::CARD_NOT_FOUND;
    }

    const StateKey key{ cardId, learnerId };
    auto it = states.find(key);
    std::optional<CardState> current;
    if (it != states.end()) current = it->second;

    CardState next;
    ReviewError err = reviewer.apply(current, rating, now, next);
    if (err != ReviewError::NONE) return err;

    const CardState before = current ? *current : CardState::newCard(now);
    states[key] = next;
    log.push_back(makeLogEntry(cardId, learnerId, rating, before, next, reviewTimeMs, now));

    spdlog::info("Card {} reviewed by '{}': {} -> {}, next due in {:.4f} days",
        cardId, learnerId, toString(before.state), toString(next.state), next.scheduled_days);

    if (result) *result = next;
    return ReviewError::NONE;
}

void CardStore::appendLog(const ReviewLogEntry& entry) {
    std::lock_guard<std::mutex> lock(mtx);
    log.push_back(entry);
}

std::vector<ReviewLogEntry> CardStore::getLog() const {
    std::lock_guard<std::mutex> lock(mtx);
    return log;
}

void CardStore::clear() {
    std::lock_guard<std::mutex> lock(mtx);
    cards.clear();
    card_index.clear();
    states.clear();
    log.clear();
}
