#pragma once
#include <cstddef>
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include "CardState.hpp"

// A card joined with the learner's state for it (synthesized New when never reviewed).
struct StudyCard {
    std::string card_id;
    std::string deck_id;
    CardState state;
};

struct DueQueueOptions {
    std::size_t limit = 20;
    std::optional<std::string> deck_id;
};

/*
  Picks the cards to study now from a learner's cards, given in creation order.
  Eligible: never reviewed, or due <= now.
  Order: new cards first, then ascending due; equal keys keep input order.
*/
class DueQueue {
public:
    static std::vector<StudyCard> select(const std::vector<StudyCard>& cards, std::time_t now,
        const DueQueueOptions& options = DueQueueOptions());

    static std::size_t countEligible(const std::vector<StudyCard>& cards, std::time_t now,
        const std::optional<std::string>& deckId = std::nullopt);
};
