#include <catch2/catch.hpp>
#include <string>
#include <vector>

#include "core/DueQueue.hpp"

static const std::time_t T = 1700000000;

static StudyCard newCard(const std::string& id, const std::string& deck = "d1") {
    return StudyCard{id, deck, CardState::newCard(T)};
}

static StudyCard reviewCard(const std::string& id, std::time_t due, const std::string& deck = "d1") {
    CardState s;
    s.state = CardLifecycle::REVIEW;
    s.stability = 10.0;
    s.difficulty = 5.0;
    s.reps = 3;
    s.last_review = due - 10 * 86400;
    s.due = due;
    return StudyCard{id, deck, s};
}

static std::vector<std::string> ids(const std::vector<StudyCard>& cards) {
    std::vector<std::string> out;
    for (const auto& c : cards)
        out.push_back(c.card_id);
    return out;
}

TEST_CASE("New cards come first, then overdue reviews by due", "[queue][scenario]") {
    std::vector<StudyCard> cards{
        reviewCard("r-recent", T - 100),
        newCard("n1"),
        reviewCard("r-future", T + 100),
        newCard("n2"),
        reviewCard("r-old", T - 5000),
        newCard("n3"),
    };

    DueQueueOptions opts;
    opts.limit = 10;
    auto due = DueQueue::select(cards, T, opts);

    REQUIRE(ids(due) == std::vector<std::string>{"n1", "n2", "n3", "r-old", "r-recent"});
}

TEST_CASE("Limit bounds the queue without padding", "[queue]") {
    std::vector<StudyCard> cards{
        newCard("n1"), newCard("n2"), newCard("n3"), reviewCard("r1", T - 1),
    };

    DueQueueOptions opts;
    opts.limit = 2;
    REQUIRE(ids(DueQueue::select(cards, T, opts)) == std::vector<std::string>{"n1", "n2"});

    std::vector<StudyCard> notDue{reviewCard("a", T + 1), reviewCard("b", T + 86400)};
    REQUIRE(DueQueue::select(notDue, T).empty());

    // default limit is 20
    std::vector<StudyCard> many;
    for (int i = 0; i < 30; ++i)
        many.push_back(newCard("n" + std::to_string(i)));
    REQUIRE(DueQueue::select(many, T).size() == 20);
}

TEST_CASE("Card due exactly now is eligible", "[queue]") {
    std::vector<StudyCard> cards{reviewCard("edge", T)};
    REQUIRE(DueQueue::select(cards, T).size() == 1);
    REQUIRE(DueQueue::select(cards, T - 1).empty());
}

TEST_CASE("Ties keep input order", "[queue][determinism]") {
    std::vector<StudyCard> cards{
        reviewCard("b", T - 50), reviewCard("a", T - 50), reviewCard("c", T - 50),
    };
    REQUIRE(ids(DueQueue::select(cards, T)) == std::vector<std::string>{"b", "a", "c"});
}

TEST_CASE("Repeated selection is deterministic", "[queue][determinism]") {
    std::vector<StudyCard> cards;
    for (int i = 0; i < 50; ++i) {
        if (i % 3 == 0)
            cards.push_back(newCard("n" + std::to_string(i)));
        else
            cards.push_back(reviewCard("r" + std::to_string(i), T - (i % 7) * 60));
    }

    DueQueueOptions opts;
    opts.limit = 25;
    auto first = ids(DueQueue::select(cards, T, opts));
    for (int k = 0; k < 5; ++k)
        REQUIRE(ids(DueQueue::select(cards, T, opts)) == first);

    // every new card precedes every review card
    bool seenReview = false;
    for (const auto& id : first) {
        if (id[0] == 'r')
            seenReview = true;
        else
            REQUIRE_FALSE(seenReview);
    }
}

TEST_CASE("Deck filter scopes selection", "[queue]") {
    std::vector<StudyCard> cards{
        newCard("n1", "spanish"), reviewCard("r1", T - 10, "spanish"),
        newCard("n2", "german"), reviewCard("r2", T - 20, "german"),
    };

    DueQueueOptions opts;
    opts.deck_id = std::string("german");
    REQUIRE(ids(DueQueue::select(cards, T, opts)) == std::vector<std::string>{"n2", "r2"});

    REQUIRE(DueQueue::countEligible(cards, T) == 4);
    REQUIRE(DueQueue::countEligible(cards, T, std::string("spanish")) == 2);
    REQUIRE(DueQueue::countEligible(cards, T - 15, std::string("german")) == 2);
    REQUIRE(DueQueue::countEligible(cards, T - 25, std::string("german")) == 1);
}
