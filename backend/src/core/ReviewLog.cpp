#include "ReviewLog.hpp"
#include <algorithm>

ReviewLogEntry makeLogEntry(const std::string& cardId, const std::string& learnerId, Rating rating,
    const CardState& before, const CardState& after, std::int64_t reviewTimeMs, std::time_t now)
{
    ReviewLogEntry e;
    e.card_id = cardId;
    e.learner_id = learnerId;
    e.rating = rating;
    e.state = before.state;
    e.result = after.state;
    e.elapsed_days = after.elapsed_days;
    e.scheduled_days = after.scheduled_days;
    e.review_time_ms = std::max<std::int64_t>(0, reviewTimeMs);
    e.reviewed_at = now;
    return e;
}
