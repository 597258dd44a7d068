#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>
#include "DueQueue.hpp"
#include "ReviewLog.hpp"

// Day boundaries are UTC calendar days.
struct StudyStats {
    static constexpr double MASTERED_STABILITY_DAYS = 21.0;

    std::size_t reviewed_today = 0;
    std::size_t due_today = 0;
    std::size_t due_tomorrow = 0;
    std::size_t total_cards = 0;
    std::size_t mastered = 0;
    std::size_t learning = 0;
    std::size_t new_cards = 0;
    std::array<std::size_t, 4> ratings{}; // again, hard, good, easy
    std::int64_t review_time_ms = 0;

    // Consecutive UTC days with at least one review. The current streak is still
    // alive when its last day is today or yesterday.
    std::size_t streak_current = 0;
    std::size_t streak_longest = 0;

    static StudyStats compute(const std::vector<StudyCard>& cards, const std::vector<ReviewLogEntry>& log,
        const std::string& learnerId, std::time_t now);
};
