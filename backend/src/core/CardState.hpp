#pragma once
#include <ctime>
#include <optional>
#include <string>

enum class Rating {
    AGAIN = 1,
    HARD = 2,
    GOOD = 3,
    EASY = 4
};

enum class CardLifecycle {
    NEW,
    LEARNING,
    REVIEW,
    RELEARNING
};

// Boundary validation: the only place a raw integer becomes a Rating.
bool ratingFromInt(int value, Rating& out);
bool isValidRating(Rating rating);

const char* toString(Rating rating);
const char* toString(CardLifecycle state);
bool lifecycleFromString(const std::string& text, CardLifecycle& out);

constexpr double SECONDS_PER_DAY = 24.0 * 60.0 * 60.0;

/*
  Per-card, per-learner memory state.

  stability     days until predicted recall decays to 90%
  difficulty    intrinsic hardness in [MIN_DIFFICULTY, MAX_DIFFICULTY]
  elapsed_days  time since the previous review, recomputed at scheduling time
  scheduled_days interval chosen by the last scheduling decision (never rounded)
*/
struct CardState {
    static constexpr double MIN_DIFFICULTY = 1.0;
    static constexpr double MAX_DIFFICULTY = 10.0;
    static constexpr double MIN_STABILITY = 0.1;
    static constexpr double MAX_STABILITY = 36500.0;

    double stability = 0.0;
    double difficulty = 0.0;
    double elapsed_days = 0.0;
    double scheduled_days = 0.0;
    int reps = 0;
    int lapses = 0;
    CardLifecycle state = CardLifecycle::NEW;
    std::time_t due = 0;
    std::optional<std::time_t> last_review;

    // Implicit state of a card the learner has never reviewed.
    static CardState newCard(std::time_t now);

    // Probability of recall at `now`; 0 for cards that were never reviewed.
    double retrievability(std::time_t now) const;
    bool isDue(std::time_t now) const;

    // Forgiving recovery for records loaded from storage. Returns true if anything changed.
    bool clampToBounds();

    bool operator==(const CardState& other) const;
    bool operator!=(const CardState& other) const { return !(*this == other); }
};

// Days between the last review and `now`; clock skew and NaN collapse to 0.
double elapsedDaysSince(const std::optional<std::time_t>& lastReview, std::time_t now);

// Power forgetting curve R(t) = (1 + t / (9 S))^-1, so R(S) = 0.9.
double forgettingCurve(double elapsedDays, double stability);

std::time_t addDays(std::time_t base, double days);
