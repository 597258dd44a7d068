#pragma once
#include <string>
#include <ctime>

class Card {
public:
    Card() = default;
    Card(const std::string& deckId, const std::string& front, const std::string& back, std::time_t createdAt);

    // Basic fields
    std::string id;          // Auto-generated
    std::string deck_id;
    std::string front;
    std::string back;
    std::time_t created_at = 0;

    // Utility
    static std::string generateID();
};
