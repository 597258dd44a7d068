#pragma once
#include <ctime>
#include <optional>
#include "CardState.hpp"
#include "Scheduler.hpp"

enum class ReviewError {
    NONE = 0,
    INVALID_RATING,
    CARD_NOT_FOUND
};

const char* toString(ReviewError error);

/*
  Applies one rating. The result is always the matching branch of
  Scheduler::preview, so interval previews and committed reviews cannot drift.
  Persisting the result is the caller's job.
*/
class Reviewer {
public:
    explicit Reviewer(const Scheduler& scheduler);

    // `state` empty means the learner has never reviewed this card.
    // On error `out` is left untouched.
    ReviewError apply(const std::optional<CardState>& state, Rating rating, std::time_t now, CardState& out) const;

private:
    const Scheduler& scheduler;
};
