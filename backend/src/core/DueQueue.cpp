#include "DueQueue.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

static bool inScope(const StudyCard& c, const std::optional<std::string>& deckId) {
    return !deckId || c.deck_id == *deckId;
}

std::vector<StudyCard> DueQueue::select(const std::vector<StudyCard>& cards, std::time_t now,
    const DueQueueOptions& options)
{
    std::vector<StudyCard> due;
    due.reserve(std::min(cards.size(), options.limit) + 8);

    for (const auto& c : cards) {
        if (inScope(c, options.deck_id) && c.state.isDue(now)) {
            due.push_back(c);
        }
    }

    // New cards first, then oldest due first; stable so ties keep creation order
    std::stable_sort(due.begin(), due.end(),
        [](const StudyCard& a, const StudyCard& b) {
            bool newA = a.state.state == CardLifecycle::NEW;
            bool newB = b.state.state == CardLifecycle::NEW;
            if (newA != newB) return newA;
            if (newA) return false;
            return a.state.due < b.state.due;
        });

    if (due.size() > options.limit) {
        due.resize(options.limit);
    }

    spdlog::debug("Due queue: {} of {} cards selected (limit={})", due.size(), cards.size(), options.limit);
    return due;
}

std::size_t DueQueue::countEligible(const std::vector<StudyCard>& cards, std::time_t now,
    const std::optional<std::string>& deckId)
{
    return static_cast<std::size_t>(std::count_if(cards.begin(), cards.end(),
        [&](const StudyCard& c) { return inScope(c, deckId) && c.state.isDue(now); }));
}
