#include "CardState.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

bool ratingFromInt(int value, Rating& out) {
    if (value < 1 || value > 4) {
        spdlog::debug("Rejected rating value {}", value);
        return false;
    }
    out = static_cast<Rating>(value);
    return true;
}

bool isValidRating(Rating rating) {
    int v = static_cast<int>(rating);
    return v >= 1 && v <= 4;
}

const char* toString(Rating rating) {
    switch (rating) {
    case Rating::AGAIN: return "again";
    case Rating::HARD: return "hard";
    case Rating::GOOD: return "good";
    case Rating::EASY: return "easy";
    }
    return "invalid";
}

const char* toString(CardLifecycle state) {
    switch (state) {
    case CardLifecycle::NEW: return "new";
    case CardLifecycle::LEARNING: return "learning";
    case CardLifecycle::REVIEW: return "review";
    case CardLifecycle::RELEARNING: return "relearning";
    }
    return "unknown";
}

bool lifecycleFromString(const std::string& text, CardLifecycle& out) {
    if (text == "new") out = CardLifecycle::NEW;
    else if (text == "learning") out = CardLifecycle::LEARNING;
    else if (text == "review") out = CardLifecycle::REVIEW;
    else if (text == "relearning") out = CardLifecycle::RELEARNING;
    else return false;
    return true;
}

CardState CardState::newCard(std::time_t now) {
    CardState s;
    s.due = now;
    return s;
}

double CardState::retrievability(std::time_t now) const {
    if (state == CardLifecycle::NEW || stability <= 0.0) return 0.0;
    return forgettingCurve(elapsedDaysSince(last_review, now), stability);
}

bool CardState::isDue(std::time_t now) const {
    return state == CardLifecycle::NEW || due <= now;
}

bool CardState::clampToBounds() {
    const CardState before = *this;

    if (state == CardLifecycle::NEW) {
        // A new card carries no history; anything else in the record is noise.
        reps = 0;
        lapses = 0;
        last_review.reset();
    }
    else {
        if (!std::isfinite(stability)) stability = MIN_STABILITY;
        stability = std::clamp(stability, MIN_STABILITY, MAX_STABILITY);

        if (!std::isfinite(difficulty)) difficulty = (MIN_DIFFICULTY + MAX_DIFFICULTY) / 2.0;
        difficulty = std::clamp(difficulty, MIN_DIFFICULTY, MAX_DIFFICULTY);
    }

    if (!std::isfinite(elapsed_days) || elapsed_days < 0.0) elapsed_days = 0.0;
    if (!std::isfinite(scheduled_days) || scheduled_days < 0.0) scheduled_days = 0.0;
    reps = std::max(0, reps);
    lapses = std::max(0, lapses);

    bool changed = !(before == *this);
    if (changed) {
        spdlog::warn("Card state out of range (stability={}, difficulty={}, reps={}, lapses={}); clamped",
            before.stability, before.difficulty, before.reps, before.lapses);
    }
    return changed;
}

bool CardState::operator==(const CardState& other) const {
    // Bitwise comparison of the doubles is intended: results must be reproducible exactly.
    return stability == other.stability
        && difficulty == other.difficulty
        && elapsed_days == other.elapsed_days
        && scheduled_days == other.scheduled_days
        && reps == other.reps
        && lapses == other.lapses
        && state == other.state
        && due == other.due
        && last_review == other.last_review;
}

double elapsedDaysSince(const std::optional<std::time_t>& lastReview, std::time_t now) {
    if (!lastReview) return 0.0;
    double days = std::difftime(now, *lastReview) / SECONDS_PER_DAY;
    if (!std::isfinite(days) || days < 0.0) {
        if (days < 0.0) spdlog::warn("Review time precedes last review by {:.4f} days; using 0", -days);
        return 0.0;
    }
    return days;
}

double forgettingCurve(double elapsedDays, double stability) {
    if (stability <= 0.0) return 0.0;
    return 1.0 / (1.0 + std::max(0.0, elapsedDays) / (9.0 * stability));
}

std::time_t addDays(std::time_t base, double days) {
    return base + static_cast<std::time_t>(std::llround(days * SECONDS_PER_DAY));
}
