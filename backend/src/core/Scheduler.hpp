#pragma once
#include <array>
#include <ctime>
#include <vector>
#include "CardState.hpp"

/*
  Tunable model parameters.

  w[0..3]   initial stability for Again, Hard, Good, Easy (days)
  w[4..7]   initial difficulty, difficulty step, mean reversion weight
  w[8..10]  stability growth after a successful recall
  w[11..14] stability after a lapse
  w[15..16] hard penalty, easy bonus
*/
struct SchedulerParams {
    double request_retention = 0.9;
    double maximum_interval = 36500.0;           // days
    std::vector<double> learning_steps{ 1.0, 10.0 }; // minutes
    std::vector<double> relearning_steps{ 10.0 };    // minutes
    double graduating_interval = 1.0;            // days
    double easy_interval = 4.0;                  // days

    std::array<double, 17> w{
        0.4, 0.6, 2.4, 5.8,
        4.93, 0.94, 0.86, 0.01,
        1.49, 0.14, 0.94,
        2.18, 0.05, 0.34, 1.26,
        0.29, 2.61
    };
};

// Throws std::invalid_argument naming the first offending field.
void validateParams(const SchedulerParams& params);

// One candidate next state per rating.
struct SchedulingPreview {
    CardState again;
    CardState hard;
    CardState good;
    CardState easy;

    // Caller guarantees `rating` is valid.
    const CardState& forRating(Rating rating) const;
};

/*
  Memory-model scheduler. Stateless apart from its parameters, so one instance can be
  shared between threads. `now` is always supplied by the caller.
*/
class Scheduler {
public:
    explicit Scheduler(SchedulerParams params = SchedulerParams());

    SchedulingPreview preview(const CardState& state, std::time_t now) const;

    const SchedulerParams& getParams() const { return params; }

private:
    SchedulerParams params;

    void scheduleNew(const CardState& base, std::time_t now, SchedulingPreview& out) const;
    void scheduleLearning(const CardState& base, double retrievability, std::time_t now,
        SchedulingPreview& out) const;
    void scheduleReview(const CardState& base, double retrievability, std::time_t now,
        SchedulingPreview& out) const;

    // Model formulas
    double initialStability(Rating r) const;
    double initialDifficulty(Rating r) const;
    double nextDifficulty(double d, Rating r) const;
    double recallStability(double s, double d, double retrievability, Rating r) const;
    static double minimumGrowth(Rating r);
    double forgetStability(double s, double d, double retrievability) const;
    double nextInterval(double stability) const;

    // Short re-queue steps, in days
    double learningStep(const std::vector<double>& steps, Rating r) const;

    CardState advance(const CardState& base, CardLifecycle next, double scheduledDays, std::time_t now) const;
};
