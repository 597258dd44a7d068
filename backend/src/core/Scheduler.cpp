#include "Scheduler.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <spdlog/spdlog.h>

static constexpr double MINUTES_PER_DAY = 24.0 * 60.0;

void validateParams(const SchedulerParams& p) {
    if (!(p.request_retention > 0.0 && p.request_retention < 1.0))
        throw std::invalid_argument("request_retention must be in (0, 1)");
    if (!(p.maximum_interval >= 1.0 && p.maximum_interval <= CardState::MAX_STABILITY))
        throw std::invalid_argument("maximum_interval must be in [1, 36500] days");
    if (!(p.graduating_interval > 0.0 && p.graduating_interval <= CardState::MAX_STABILITY))
        throw std::invalid_argument("graduating_interval must be in (0, 36500] days");
    if (!(p.easy_interval > 0.0 && p.easy_interval <= CardState::MAX_STABILITY))
        throw std::invalid_argument("easy_interval must be in (0, 36500] days");

    auto checkSteps = [](const std::vector<double>& steps, const char* name) {
        if (steps.empty())
            throw std::invalid_argument(std::string(name) + " must not be empty");
        for (double m : steps) {
            if (!(m > 0.0 && m <= CardState::MAX_STABILITY * MINUTES_PER_DAY))
                throw std::invalid_argument(std::string(name) + " must contain positive minutes up to 36500 days");
        }
    };
    checkSteps(p.learning_steps, "learning_steps");
    checkSteps(p.relearning_steps, "relearning_steps");

    for (std::size_t i = 0; i < p.w.size(); ++i) {
        if (!std::isfinite(p.w[i]))
            throw std::invalid_argument("weights[" + std::to_string(i) + "] is not finite");
    }
    for (std::size_t i = 0; i < 4; ++i) {
        if (!(p.w[i] > 0.0))
            throw std::invalid_argument("weights[" + std::to_string(i) + "] (initial stability) must be positive");
    }
    // Keeps recall growth ordered Hard < Good < Easy
    if (!(p.w[15] > 0.0 && p.w[15] < 1.0))
        throw std::invalid_argument("weights[15] (hard penalty) must be in (0, 1)");
    if (!(p.w[16] > 1.0))
        throw std::invalid_argument("weights[16] (easy bonus) must be greater than 1");
}

const CardState& SchedulingPreview::forRating(Rating rating) const {
    switch (rating) {
    case Rating::AGAIN: return again;
    case Rating::HARD: return hard;
    case Rating::GOOD: return good;
    case Rating::EASY: return easy;
    }
    throw std::invalid_argument("rating out of range");
}

Scheduler::Scheduler(SchedulerParams p)
    : params(std::move(p))
{
    validateParams(params);
    spdlog::info("Scheduler initialized: retention={:.2f}, max_interval={}d, learning_steps={}, relearning_steps={}",
        params.request_retention, params.maximum_interval,
        params.learning_steps.size(), params.relearning_steps.size());
}

/*
  Public API:
    - preview(CardState, now) -> four candidate states

  The input is never modified. Every branch is derived from the same sanitized copy,
  so identical inputs always give identical outputs.
*/
SchedulingPreview Scheduler::preview(const CardState& state, std::time_t now) const {
    CardState base = state;
    base.clampToBounds();
    base.elapsed_days = elapsedDaysSince(base.last_review, now);

    SchedulingPreview out;
    switch (base.state) {
    case CardLifecycle::NEW:
        base.elapsed_days = 0.0;
        scheduleNew(base, now, out);
        break;
    case CardLifecycle::LEARNING:
    case CardLifecycle::RELEARNING:
        scheduleLearning(base, forgettingCurve(base.elapsed_days, base.stability), now, out);
        break;
    case CardLifecycle::REVIEW:
        scheduleReview(base, forgettingCurve(base.elapsed_days, base.stability), now, out);
        break;
    }

    spdlog::debug("Preview state={} elapsed={:.3f}d -> again={:.4f}d hard={:.4f}d good={:.4f}d easy={:.4f}d",
        toString(base.state), base.elapsed_days,
        out.again.scheduled_days, out.hard.scheduled_days,
        out.good.scheduled_days, out.easy.scheduled_days);
    return out;
}

CardState Scheduler::advance(const CardState& base, CardLifecycle next, double scheduledDays, std::time_t now) const {
    CardState s = base;
    s.state = next;
    s.scheduled_days = std::max(0.0, scheduledDays);
    s.reps = base.reps + 1;
    s.last_review = now;
    s.due = addDays(now, s.scheduled_days);
    return s;
}

/* -------------------------
   New cards
   -------------------------
   Seed stability and difficulty from the first rating. Again/Hard/Good enter the
   learning steps; Easy skips them and goes straight to review.
*/
void Scheduler::scheduleNew(const CardState& base, std::time_t now, SchedulingPreview& out) const {
    const auto& steps = params.learning_steps;

    auto seeded = [&](Rating r, CardLifecycle next, double days) {
        CardState s = advance(base, next, days, now);
        s.stability = initialStability(r);
        s.difficulty = initialDifficulty(r);
        return s;
    };

    out.again = seeded(Rating::AGAIN, CardLifecycle::LEARNING, learningStep(steps, Rating::AGAIN));
    out.hard = seeded(Rating::HARD, CardLifecycle::LEARNING, learningStep(steps, Rating::HARD));
    out.good = seeded(Rating::GOOD, CardLifecycle::LEARNING, learningStep(steps, Rating::GOOD));

    double easyDays = std::max(params.easy_interval, nextInterval(initialStability(Rating::EASY)));
    out.easy = seeded(Rating::EASY, CardLifecycle::REVIEW, std::min(easyDays, params.maximum_interval));
}

/* -------------------------
   Learning / relearning
   -------------------------
   Again and Hard repeat a short step in the same phase. Good and Easy graduate; Easy
   always lands strictly after Good unless both hit the maximum interval.
*/
void Scheduler::scheduleLearning(const CardState& base, double r, std::time_t now, SchedulingPreview& out) const {
    const bool relearning = base.state == CardLifecycle::RELEARNING;
    const auto& steps = relearning ? params.relearning_steps : params.learning_steps;

    out.again = advance(base, base.state, learningStep(steps, Rating::AGAIN), now);
    out.again.difficulty = nextDifficulty(base.difficulty, Rating::AGAIN);

    out.hard = advance(base, base.state, learningStep(steps, Rating::HARD), now);
    out.hard.difficulty = nextDifficulty(base.difficulty, Rating::HARD);

    double goodStability = recallStability(base.stability, base.difficulty, r, Rating::GOOD);
    double goodDays = std::max(params.graduating_interval, nextInterval(goodStability));
    goodDays = std::min(goodDays, params.maximum_interval);

    double easyStability = recallStability(base.stability, base.difficulty, r, Rating::EASY);
    double easyDays = std::max({ params.easy_interval, nextInterval(easyStability), goodDays + 1.0 });
    easyDays = std::min(easyDays, params.maximum_interval);

    out.good = advance(base, CardLifecycle::REVIEW, goodDays, now);
    out.good.stability = goodStability;
    out.good.difficulty = nextDifficulty(base.difficulty, Rating::GOOD);

    out.easy = advance(base, CardLifecycle::REVIEW, easyDays, now);
    out.easy.stability = easyStability;
    out.easy.difficulty = nextDifficulty(base.difficulty, Rating::EASY);
}

/* -------------------------
   Review cards
   -------------------------
   Again is a lapse: stability drops to the post-lapse value and the card re-enters
   relearning. Successful recalls grow stability; intervals are kept ordered
   hard <= good < easy, each at least one day.
*/
void Scheduler::scheduleReview(const CardState& base, double r, std::time_t now, SchedulingPreview& out) const {
    out.again = advance(base, CardLifecycle::RELEARNING,
        learningStep(params.relearning_steps, Rating::AGAIN), now);
    out.again.stability = forgetStability(base.stability, base.difficulty, r);
    out.again.difficulty = nextDifficulty(base.difficulty, Rating::AGAIN);
    out.again.lapses = base.lapses + 1;

    double hardStability = recallStability(base.stability, base.difficulty, r, Rating::HARD);
    double goodStability = recallStability(base.stability, base.difficulty, r, Rating::GOOD);
    double easyStability = recallStability(base.stability, base.difficulty, r, Rating::EASY);

    double hardDays = nextInterval(hardStability);
    double goodDays = nextInterval(goodStability);
    double easyDays = nextInterval(easyStability);

    hardDays = std::min(hardDays, goodDays);
    goodDays = std::max(goodDays, hardDays + 1.0);
    easyDays = std::max(easyDays, goodDays + 1.0);

    auto bounded = [this](double days) {
        return std::clamp(days, 1.0, params.maximum_interval);
    };

    out.hard = advance(base, CardLifecycle::REVIEW, bounded(hardDays), now);
    out.hard.stability = hardStability;
    out.hard.difficulty = nextDifficulty(base.difficulty, Rating::HARD);

    out.good = advance(base, CardLifecycle::REVIEW, bounded(goodDays), now);
    out.good.stability = goodStability;
    out.good.difficulty = nextDifficulty(base.difficulty, Rating::GOOD);

    out.easy = advance(base, CardLifecycle::REVIEW, bounded(easyDays), now);
    out.easy.stability = easyStability;
    out.easy.difficulty = nextDifficulty(base.difficulty, Rating::EASY);
}

/* -------------------------
   Memory model
   -------------------------
   R(t, S) = (1 + t / 9S)^-1
   D0(G)   = w4 - (G - 3) w5
   D'      = w7 D0(3) + (1 - w7)(D - w6 (G - 3))
   S'r     = S (1 + max(floor(G), e^w8 (11 - D) S^-w9 (e^((1 - R) w10) - 1) hard easy))
   S'f     = min(S, w11 D^-w12 ((S + 1)^w13 - 1) e^((1 - R) w14))
   I(S)    = 9 S (1 / retention - 1)
*/
double Scheduler::initialStability(Rating r) const {
    return std::clamp(params.w[static_cast<int>(r) - 1], CardState::MIN_STABILITY, CardState::MAX_STABILITY);
}

double Scheduler::initialDifficulty(Rating r) const {
    double d = params.w[4] - (static_cast<int>(r) - 3) * params.w[5];
    return std::clamp(d, CardState::MIN_DIFFICULTY, CardState::MAX_DIFFICULTY);
}

double Scheduler::nextDifficulty(double d, Rating r) const {
    double stepped = d - params.w[6] * (static_cast<int>(r) - 3);
    double reverted = params.w[7] * initialDifficulty(Rating::GOOD) + (1.0 - params.w[7]) * stepped;
    return std::clamp(reverted, CardState::MIN_DIFFICULTY, CardState::MAX_DIFFICULTY);
}

double Scheduler::recallStability(double s, double d, double retrievability, Rating r) const {
    const auto& w = params.w;
    double hardPenalty = r == Rating::HARD ? w[15] : 1.0;
    double easyBonus = r == Rating::EASY ? w[16] : 1.0;

    double growth = std::exp(w[8])
        * (11.0 - d)
        * std::pow(s, -w[9])
        * (std::exp((1.0 - retrievability) * w[10]) - 1.0)
        * hardPenalty
        * easyBonus;

    // Recall always grows stability, by at least a per-rating floor, so the
    // Hard < Good < Easy order holds even with zero elapsed time.
    double next = s * (1.0 + std::max(minimumGrowth(r), growth));
    return std::clamp(next, CardState::MIN_STABILITY, CardState::MAX_STABILITY);
}

double Scheduler::minimumGrowth(Rating r) {
    switch (r) {
    case Rating::HARD: return 0.01;
    case Rating::GOOD: return 0.02;
    case Rating::EASY: return 0.03;
    default: return 0.0;
    }
}

double Scheduler::forgetStability(double s, double d, double retrievability) const {
    const auto& w = params.w;
    double next = w[11]
        * std::pow(d, -w[12])
        * (std::pow(s + 1.0, w[13]) - 1.0)
        * std::exp((1.0 - retrievability) * w[14]);

    next = std::min(next, s);
    return std::clamp(next, CardState::MIN_STABILITY, CardState::MAX_STABILITY);
}

double Scheduler::nextInterval(double stability) const {
    double days = 9.0 * stability * (1.0 / params.request_retention - 1.0);
    return std::clamp(days, 0.0, params.maximum_interval);
}

double Scheduler::learningStep(const std::vector<double>& steps, Rating r) const {
    double minutes = steps.front();
    switch (r) {
    case Rating::HARD:
        // halfway between the first two steps, or 1.5x a single step
        minutes = steps.size() > 1 ? (steps[0] + steps[1]) / 2.0 : steps[0] * 1.5;
        break;
    case Rating::GOOD:
        minutes = steps.size() > 1 ? steps[1] : steps[0];
        break;
    default:
        break;
    }
    return minutes / MINUTES_PER_DAY;
}
