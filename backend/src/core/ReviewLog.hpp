#pragma once
#include <cstdint>
#include <ctime>
#include <string>
#include "CardState.hpp"

// Append-only audit record of one applied rating. Never fed back into scheduling.
struct ReviewLogEntry {
    std::string card_id;
    std::string learner_id;
    Rating rating = Rating::GOOD;
    CardLifecycle state = CardLifecycle::NEW;  // lifecycle the rating was given in
    CardLifecycle result = CardLifecycle::NEW; // lifecycle after the review
    double elapsed_days = 0.0;
    double scheduled_days = 0.0;
    std::int64_t review_time_ms = 0;
    std::time_t reviewed_at = 0;
};

ReviewLogEntry makeLogEntry(const std::string& cardId, const std::string& learnerId, Rating rating,
    const CardState& before, const CardState& after, std::int64_t reviewTimeMs, std::time_t now);
