#include "Card.hpp"
#include <chrono>
#include <cstdint>
#include <random>
#include <sstream>
#include <iomanip>
#include <spdlog/spdlog.h>

Card::Card(const std::string& deckId, const std::string& f, const std::string& b, std::time_t createdAt)
    : deck_id(deckId), front(f), back(b), created_at(createdAt)
{
    id = generateID();
    spdlog::info("Created Card: ID={}, Deck={}", id, deck_id);
}

// Simple unique ID generator (timestamp + random bits)
std::string Card::generateID() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count();

    std::random_device rd;
    std::mt19937_64 eng(rd());
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t randPart = dist(eng);

    std::stringstream ss;
    ss << std::hex << millis << "-" << std::setw(16) << std::setfill('0') << randPart;
    return ss.str();
}
