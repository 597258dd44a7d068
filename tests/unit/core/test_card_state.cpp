#include <catch2/catch.hpp>
#include <cmath>
#include <limits>

#include "core/CardState.hpp"

static const std::time_t T = 1700000000;
static const std::time_t DAY = 86400;

static CardState reviewCard(double stability, double difficulty, std::time_t lastReview, std::time_t due) {
    CardState s;
    s.state = CardLifecycle::REVIEW;
    s.stability = stability;
    s.difficulty = difficulty;
    s.reps = 3;
    s.last_review = lastReview;
    s.due = due;
    return s;
}

TEST_CASE("Synthesized new card has no history", "[state]") {
    CardState s = CardState::newCard(T);
    REQUIRE(s.state == CardLifecycle::NEW);
    REQUIRE(s.reps == 0);
    REQUIRE(s.lapses == 0);
    REQUIRE_FALSE(s.last_review.has_value());
    REQUIRE(s.due == T);

    // New cards are eligible regardless of the clock
    REQUIRE(s.isDue(T - 10 * DAY));
    REQUIRE(s.retrievability(T) == 0.0);
}

TEST_CASE("Retrievability follows the forgetting curve", "[state]") {
    CardState s = reviewCard(10.0, 5.0, T, T + 10 * DAY);

    REQUIRE(s.retrievability(T) == Approx(1.0));
    REQUIRE(s.retrievability(T + 10 * DAY) == Approx(0.9));

    double prev = 1.0;
    for (int d = 1; d <= 100; d += 7) {
        double r = s.retrievability(T + d * DAY);
        REQUIRE(r < prev);
        REQUIRE(r > 0.0);
        prev = r;
    }

    // Higher stability decays slower
    CardState strong = reviewCard(40.0, 5.0, T, T);
    REQUIRE(strong.retrievability(T + 20 * DAY) > s.retrievability(T + 20 * DAY));
}

TEST_CASE("Review card becomes due at its due time", "[state]") {
    CardState s = reviewCard(10.0, 5.0, T, T + 100);
    REQUIRE_FALSE(s.isDue(T));
    REQUIRE(s.isDue(T + 100));
    REQUIRE(s.isDue(T + 101));
}

TEST_CASE("Corrupt values are clamped, not rejected", "[state][clamp]") {
    CardState s = reviewCard(-3.0, 42.0, T, T);
    s.reps = -2;
    s.elapsed_days = -1.0;
    REQUIRE(s.clampToBounds());
    REQUIRE(s.stability == Approx(CardState::MIN_STABILITY));
    REQUIRE(s.difficulty == Approx(CardState::MAX_DIFFICULTY));
    REQUIRE(s.reps == 0);
    REQUIRE(s.elapsed_days == 0.0);

    CardState n = reviewCard(5.0, std::numeric_limits<double>::quiet_NaN(), T, T);
    REQUIRE(n.clampToBounds());
    REQUIRE(n.difficulty >= CardState::MIN_DIFFICULTY);
    REQUIRE(n.difficulty <= CardState::MAX_DIFFICULTY);

    CardState ok = reviewCard(5.0, 5.0, T, T);
    REQUIRE_FALSE(ok.clampToBounds());
}

TEST_CASE("New record with stray history is normalized", "[state][clamp]") {
    CardState s = CardState::newCard(T);
    s.reps = 4;
    s.lapses = 2;
    s.last_review = T - DAY;
    REQUIRE(s.clampToBounds());
    REQUIRE(s.reps == 0);
    REQUIRE(s.lapses == 0);
    REQUIRE_FALSE(s.last_review.has_value());
}

TEST_CASE("Ratings are validated at the boundary", "[state][rating]") {
    Rating r = Rating::HARD;
    REQUIRE_FALSE(ratingFromInt(0, r));
    REQUIRE_FALSE(ratingFromInt(5, r));
    REQUIRE_FALSE(ratingFromInt(-1, r));
    REQUIRE(r == Rating::HARD);

    REQUIRE(ratingFromInt(1, r));
    REQUIRE(r == Rating::AGAIN);
    REQUIRE(ratingFromInt(4, r));
    REQUIRE(r == Rating::EASY);

    REQUIRE_FALSE(isValidRating(static_cast<Rating>(5)));
}

TEST_CASE("Elapsed days tolerate missing history and clock skew", "[state]") {
    REQUIRE(elapsedDaysSince(std::nullopt, T) == 0.0);
    REQUIRE(elapsedDaysSince(T + DAY, T) == 0.0);
    REQUIRE(elapsedDaysSince(T, T + 2 * DAY) == Approx(2.0));
    REQUIRE(elapsedDaysSince(T, T + DAY / 2) == Approx(0.5));
}

TEST_CASE("Lifecycle labels parse back", "[state]") {
    for (auto st : {CardLifecycle::NEW, CardLifecycle::LEARNING, CardLifecycle::REVIEW, CardLifecycle::RELEARNING}) {
        CardLifecycle parsed = CardLifecycle::NEW;
        REQUIRE(lifecycleFromString(toString(st), parsed));
        REQUIRE(parsed == st);
    }
    CardLifecycle out = CardLifecycle::REVIEW;
    REQUIRE_FALSE(lifecycleFromString("graduated", out));
    REQUIRE(out == CardLifecycle::REVIEW);
}
