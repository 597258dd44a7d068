#include "Reviewer.hpp"
#include <spdlog/spdlog.h>

const char* toString(ReviewError error) {
    switch (error) {
    case ReviewError::NONE: return "ok";
    case ReviewError::INVALID_RATING: return "invalid rating";
    case ReviewError::CARD_NOT_FOUND: return "card not found";
    }
    return "unknown error";
}

Reviewer::Reviewer(const Scheduler& s)
    : scheduler(s)
{
}

ReviewError Reviewer::apply(const std::optional<CardState>& state, Rating rating, std::time_t now, CardState& out) const {
    if (!isValidRating(rating)) {
        spdlog::warn("Review rejected: rating {} out of range", static_cast<int>(rating));
        return ReviewError::INVALID_RATING;
    }

    const CardState current = state ? *state : CardState::newCard(now);
    SchedulingPreview preview = scheduler.preview(current, now);
    out = preview.forRating(rating);

    spdlog::debug("Review {} : {} -> {} | S={:.3f} D={:.3f} reps={} lapses={} scheduled={:.4f}d",
        toString(rating), toString(current.state), toString(out.state),
        out.stability, out.difficulty, out.reps, out.lapses, out.scheduled_days);
    return ReviewError::NONE;
}
