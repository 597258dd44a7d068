#pragma once
#include <cstdint>
#include <ctime>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>
#include "../core/Card.hpp"
#include "../core/CardState.hpp"
#include "../core/DueQueue.hpp"
#include "../core/Reviewer.hpp"
#include "../core/ReviewLog.hpp"

struct StateKey {
    std::string card_id;
    std::string learner_id;

    bool operator<(const StateKey& o) const {
        return std::tie(card_id, learner_id) < std::tie(o.card_id, o.learner_id);
    }
};

/*
  In-memory card catalog, per-(card, learner) states and the review log.

  All access is serialized by one mutex; review() holds it across
  read -> schedule -> upsert -> log append, so a key is never double-applied.
*/
class CardStore {
public:
    explicit CardStore(const Scheduler& scheduler);

    // CATALOG
    Card addCard(const std::string& deckId, const std::string& front, const std::string& back, std::time_t now);
    void insertCard(const Card& card); // keeps the given id; used when loading
    bool hasCard(const std::string& cardId) const;
    std::optional<Card> getCard(const std::string& cardId) const;
    std::vector<Card> getCards() const; // creation order

    // STATES
    std::optional<CardState> getState(const std::string& cardId, const std::string& learnerId) const;
    void putState(const std::string& cardId, const std::string& learnerId, const CardState& state);
    std::vector<std::pair<StateKey, CardState>> getStates() const;

    // Cards joined with the learner's states, in creation order; never-reviewed cards come back as New.
    std::vector<StudyCard> studyCards(const std::string& learnerId, std::time_t now,
        const std::optional<std::string>& deckId = std::nullopt) const;

    // Atomic read-modify-write of one (card, learner) key plus one log append.
    ReviewError review(const std::string& cardId, const std::string& learnerId, Rating rating,
        std::time_t now, std::int64_t reviewTimeMs, CardState* result = nullptr);

    // LOG
    void appendLog(const ReviewLogEntry& entry);
    std::vector<ReviewLogEntry> getLog() const;

    void clear();

private:
    mutable std::mutex mtx;
    Reviewer reviewer;

    std::vector<Card> cards;
    std::unordered_map<std::string, std::size_t> card_index;
    std::map<StateKey, CardState> states;
    std::vector<ReviewLogEntry> log;
};
