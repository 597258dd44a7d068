#include <catch2/catch.hpp>
#include <utility>
#include <vector>

#include "core/Reviewer.hpp"

static const std::time_t T = 1700000000;
static const std::time_t DAY = 86400;

static const Rating ALL_RATINGS[] = {Rating::AGAIN, Rating::HARD, Rating::GOOD, Rating::EASY};

static std::vector<CardState> sampleStates() {
    std::vector<CardState> out;
    out.push_back(CardState::newCard(T));

    CardState learning;
    learning.state = CardLifecycle::LEARNING;
    learning.stability = 2.4;
    learning.difficulty = 4.93;
    learning.reps = 1;
    learning.last_review = T - 600;
    learning.due = T;
    out.push_back(learning);

    CardState review = learning;
    review.state = CardLifecycle::REVIEW;
    review.stability = 30.0;
    review.difficulty = 5.0;
    review.reps = 6;
    review.lapses = 1;
    review.last_review = T - 30 * DAY;
    out.push_back(review);

    CardState relearning = review;
    relearning.state = CardLifecycle::RELEARNING;
    relearning.stability = 4.0;
    relearning.last_review = T - 600;
    out.push_back(relearning);

    return out;
}

TEST_CASE("Applied review equals the matching preview branch", "[reviewer][agreement]") {
    Scheduler sched;
    Reviewer reviewer(sched);

    for (const auto& state : sampleStates()) {
        SchedulingPreview p = sched.preview(state, T);
        for (Rating r : ALL_RATINGS) {
            CardState out;
            REQUIRE(reviewer.apply(state, r, T, out) == ReviewError::NONE);
            REQUIRE(out == p.forRating(r));
        }
    }
}

TEST_CASE("Applying the same review twice gives identical results", "[reviewer][determinism]") {
    Scheduler sched;
    Reviewer reviewer(sched);

    for (const auto& state : sampleStates()) {
        for (Rating r : ALL_RATINGS) {
            CardState a, b;
            REQUIRE(reviewer.apply(state, r, T + 123, a) == ReviewError::NONE);
            REQUIRE(reviewer.apply(state, r, T + 123, b) == ReviewError::NONE);
            REQUIRE(a == b);
        }
    }
}

TEST_CASE("Missing state is treated as a new card", "[reviewer]") {
    Scheduler sched;
    Reviewer reviewer(sched);

    CardState fromNone, fromNew;
    REQUIRE(reviewer.apply(std::nullopt, Rating::GOOD, T, fromNone) == ReviewError::NONE);
    REQUIRE(reviewer.apply(CardState::newCard(T), Rating::GOOD, T, fromNew) == ReviewError::NONE);
    REQUIRE(fromNone == fromNew);
    REQUIRE(fromNone.state == CardLifecycle::LEARNING);
    REQUIRE(fromNone.reps == 1);
}

TEST_CASE("Out-of-range rating is rejected without touching anything", "[reviewer][error]") {
    Scheduler sched;
    Reviewer reviewer(sched);

    const CardState input = sampleStates()[2];
    const CardState inputCopy = input;

    CardState out;
    out.reps = 777;
    const CardState sentinel = out;

    REQUIRE(reviewer.apply(input, static_cast<Rating>(5), T, out) == ReviewError::INVALID_RATING);
    REQUIRE(reviewer.apply(input, static_cast<Rating>(0), T, out) == ReviewError::INVALID_RATING);
    REQUIRE(out == sentinel);
    REQUIRE(input == inputCopy);

    Rating parsed = Rating::GOOD;
    REQUIRE_FALSE(ratingFromInt(5, parsed));
}

TEST_CASE("Lapses count only forgotten review cards", "[reviewer][lapses]") {
    Scheduler sched;
    Reviewer reviewer(sched);

    CardState s;
    std::time_t now = T;

    // New -> Again stays out of the lapse count
    REQUIRE(reviewer.apply(std::nullopt, Rating::AGAIN, now, s) == ReviewError::NONE);
    REQUIRE(s.state == CardLifecycle::LEARNING);
    REQUIRE(s.lapses == 0);

    // Learning -> Again is not a lapse either
    now = s.due;
    REQUIRE(reviewer.apply(s, Rating::AGAIN, now, s) == ReviewError::NONE);
    REQUIRE(s.lapses == 0);

    now = s.due;
    REQUIRE(reviewer.apply(s, Rating::GOOD, now, s) == ReviewError::NONE);
    REQUIRE(s.state == CardLifecycle::REVIEW);
    REQUIRE(s.lapses == 0);

    // Review -> Again is a lapse
    now = s.due;
    REQUIRE(reviewer.apply(s, Rating::AGAIN, now, s) == ReviewError::NONE);
    REQUIRE(s.state == CardLifecycle::RELEARNING);
    REQUIRE(s.lapses == 1);

    // Relearning -> Again does not add another
    now = s.due;
    REQUIRE(reviewer.apply(s, Rating::AGAIN, now, s) == ReviewError::NONE);
    REQUIRE(s.state == CardLifecycle::RELEARNING);
    REQUIRE(s.lapses == 1);

    now = s.due;
    REQUIRE(reviewer.apply(s, Rating::GOOD, now, s) == ReviewError::NONE);
    REQUIRE(s.state == CardLifecycle::REVIEW);
    REQUIRE(s.lapses == 1);

    now = s.due;
    REQUIRE(reviewer.apply(s, Rating::EASY, now, s) == ReviewError::NONE);
    REQUIRE(s.lapses == 1);
    REQUIRE(s.reps == 7);
}

TEST_CASE("Review history replays to the same state", "[reviewer][replay]") {
    Scheduler sched;
    Reviewer reviewer(sched);

    const std::vector<std::pair<Rating, std::time_t>> history{
        {Rating::GOOD, T},
        {Rating::GOOD, T + 600},
        {Rating::HARD, T + 3 * DAY},
        {Rating::AGAIN, T + 9 * DAY},
        {Rating::GOOD, T + 9 * DAY + 900},
        {Rating::EASY, T + 14 * DAY},
    };

    auto replay = [&]() {
        std::optional<CardState> state;
        for (const auto& step : history) {
            CardState next;
            REQUIRE(reviewer.apply(state, step.first, step.second, next) == ReviewError::NONE);
            REQUIRE(next.due >= step.second);
            state = next;
        }
        return *state;
    };

    CardState first = replay();
    CardState second = replay();
    REQUIRE(first == second);
    REQUIRE(first.state == CardLifecycle::REVIEW);
    REQUIRE(first.reps == 6);
    REQUIRE(first.lapses == 1);
}
