#include "StudyStats.hpp"
#include <algorithm>
#include <set>

static std::time_t utcDayStart(std::time_t t) {
    const std::time_t day = static_cast<std::time_t>(SECONDS_PER_DAY);
    std::time_t rem = t % day;
    if (rem < 0) rem += day;
    return t - rem;
}

StudyStats StudyStats::compute(const std::vector<StudyCard>& cards, const std::vector<ReviewLogEntry>& log,
    const std::string& learnerId, std::time_t now)
{
    const std::time_t day = static_cast<std::time_t>(SECONDS_PER_DAY);
    const std::time_t todayStart = utcDayStart(now);
    const std::time_t tomorrowStart = todayStart + day;
    const std::time_t tomorrowEnd = tomorrowStart + day;

    StudyStats st;
    st.total_cards = cards.size();

    for (const auto& c : cards) {
        const CardState& s = c.state;
        switch (s.state) {
        case CardLifecycle::NEW:
            st.new_cards++;
            continue;
        case CardLifecycle::LEARNING:
        case CardLifecycle::RELEARNING:
            st.learning++;
            break;
        case CardLifecycle::REVIEW:
            if (s.stability > MASTERED_STABILITY_DAYS) st.mastered++;
            else st.learning++;
            break;
        }

        if (s.due < tomorrowStart) st.due_today++;
        else if (s.due < tomorrowEnd) st.due_tomorrow++;
    }

    std::set<std::time_t> studyDays;
    for (const auto& e : log) {
        if (e.learner_id != learnerId) continue;
        studyDays.insert(utcDayStart(e.reviewed_at));
        if (isValidRating(e.rating)) st.ratings[static_cast<int>(e.rating) - 1]++;
        st.review_time_ms += e.review_time_ms;
        if (e.reviewed_at >= todayStart && e.reviewed_at < tomorrowStart) st.reviewed_today++;
    }

    // LONGEST
    std::size_t run = 0;
    std::time_t prev = 0;
    for (std::time_t d : studyDays) {
        run = (run > 0 && d - prev == day) ? run + 1 : 1;
        st.streak_longest = std::max(st.streak_longest, run);
        prev = d;
    }

    // CURRENT: walk back from today, or from yesterday if nothing was studied yet today
    std::time_t cursor = studyDays.count(todayStart) ? todayStart : todayStart - day;
    while (studyDays.count(cursor)) {
        st.streak_current++;
        cursor -= day;
    }

    return st;
}
