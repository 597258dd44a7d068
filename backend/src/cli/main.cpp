#include <iostream>
#include <vector>
#include <string>
#include <chrono>
#include <ctime>
#include <limits>
#include <optional>
#include <stdexcept>
#include <sodium.h>
#include <yaml-cpp/yaml.h>

#include "../utils/logging.hpp"
#include "../config/ConfigYAML.hpp"
#include "../core/Scheduler.hpp"
#include "../core/DueQueue.hpp"
#include "../core/IntervalFormat.hpp"
#include "../core/StudyStats.hpp"
#include "../storage/CardStore.hpp"
#include "../storage/Storage.hpp"

static void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config <file.yaml>] [--learner <name>]\n";
}

static std::string formatTime(std::time_t t) {
    char buf[32];
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M UTC", &tm_utc);
    return buf;
}

void listAllCards(const CardStore& store, const std::string& learner) {
    std::cout << "\n===== ALL CARDS =====\n";

    auto cards = store.getCards();
    if (cards.empty()) {
        std::cout << "No cards stored.\n";
        return;
    }

    std::time_t now = std::time(nullptr);
    for (size_t i = 0; i < cards.size(); i++) {
        const Card& c = cards[i];
        std::cout << i + 1 << ". [" << c.deck_id << "] " << c.front << "\n";

        auto st = store.getState(c.id, learner);
        if (!st) {
            std::cout << "   State: new (never reviewed)\n";
        }
        else {
            std::cout << "   State: " << toString(st->state) << "\n";
            std::cout << "   Stability: " << st->stability << " days\n";
            std::cout << "   Difficulty: " << st->difficulty << "\n";
            std::cout << "   Reps: " << st->reps << "  Lapses: " << st->lapses << "\n";
            std::cout << "   Recall now: " << static_cast<int>(st->retrievability(now) * 100.0 + 0.5) << "%\n";
            std::cout << "   Next review: " << formatTime(st->due) << "\n";
        }
        std::cout << "-----------------------------\n";
    }
}

int askRating(const SchedulingPreview& preview) {
    while (true) {
        std::cout << "\nHow well did you remember?\n"
            " 1 = AGAIN (" << formatInterval(preview.again.scheduled_days) << ")\n"
            " 2 = HARD  (" << formatInterval(preview.hard.scheduled_days) << ")\n"
            " 3 = GOOD  (" << formatInterval(preview.good.scheduled_days) << ")\n"
            " 4 = EASY  (" << formatInterval(preview.easy.scheduled_days) << ")\n> ";
        int q;
        if (std::cin >> q && q >= 1 && q <= 4) {
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            return q;
        }
        if (std::cin.eof()) return 0;
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        std::cout << "Invalid input.\n";
    }
}

void studyDue(CardStore& store, const Scheduler& scheduler, const std::string& learner, size_t limit) {
    std::cout << "Deck to study (blank = all decks): ";
    std::string deck;
    std::getline(std::cin, deck);

    DueQueueOptions opts;
    opts.limit = limit;
    if (!deck.empty()) opts.deck_id = deck;

    std::time_t now = std::time(nullptr);
    auto due = DueQueue::select(store.studyCards(learner, now, opts.deck_id), now, opts);
    if (due.empty()) {
        std::cout << "No cards due.\n";
        return;
    }

    size_t done = 0;
    for (const auto& sc : due) {
        auto card = store.getCard(sc.card_id);
        if (!card) continue;

        std::cout << "\n[" << done + 1 << "/" << due.size() << "] " << card->front
            << "\n(press Enter to show answer)";
        auto shown = std::chrono::steady_clock::now();
        std::string dummy;
        if (!std::getline(std::cin, dummy)) return;
        std::cout << "Answer: " << card->back << "\n";

        now = std::time(nullptr);
        SchedulingPreview preview = scheduler.preview(sc.state, now);
        int q = askRating(preview);
        if (q == 0) return;

        Rating rating;
        if (!ratingFromInt(q, rating)) {
            std::cout << "Invalid rating.\n";
            continue;
        }

        auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - shown).count();

        CardState next;
        ReviewError err = store.review(sc.card_id, learner, rating, std::time(nullptr), elapsedMs, &next);
        if (err != ReviewError::NONE) {
            std::cout << "Review failed: " << toString(err) << "\n";
            continue;
        }
        std::cout << "Next review in " << formatInterval(next.scheduled_days) << ".\n";
        done++;
    }
    std::cout << "\nSession complete: " << done << " card(s) reviewed.\n";
}

void printStats(const CardStore& store, const std::string& learner) {
    std::time_t now = std::time(nullptr);
    StudyStats st = StudyStats::compute(store.studyCards(learner, now), store.getLog(), learner, now);

    std::cout << "\n===== STATS =====\n"
        << "Reviewed today: " << st.reviewed_today << "\n"
        << "Due today:      " << st.due_today << "\n"
        << "Due tomorrow:   " << st.due_tomorrow << "\n"
        << "Total cards:    " << st.total_cards << "\n"
        << "  new:          " << st.new_cards << "\n"
        << "  learning:     " << st.learning << "\n"
        << "  mastered:     " << st.mastered << "\n"
        << "Ratings (again/hard/good/easy): "
        << st.ratings[0] << "/" << st.ratings[1] << "/" << st.ratings[2] << "/" << st.ratings[3] << "\n"
        << "Time spent:     " << st.review_time_ms / 1000 << " s\n"
        << "Streak:         " << st.streak_current << " day(s), longest " << st.streak_longest << "\n";
}

int main(int argc, char** argv) {
    std::string configPath;
    std::string learner = "local";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) configPath = argv[++i];
        else if (arg == "--learner" && i + 1 < argc) learner = argv[++i];
        else {
            printUsage(argv[0]);
            return arg == "--help" || arg == "-h" ? 0 : 1;
        }
    }

    AppConfig cfg;
    if (!configPath.empty()) {
        try {
            cfg = load_config_from_yaml(configPath);
        }
        catch (const YAML::Exception& e) {
            std::cerr << "Config error in '" << configPath << "': " << e.what() << "\n";
            return 1;
        }
        catch (const std::runtime_error& e) {
            std::cerr << "Config error: " << e.what() << "\n";
            return 1;
        }
    }

    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    Log::init(cfg.log.path, cfg.log.level);

    Scheduler scheduler(cfg.scheduler);
    CardStore store(scheduler);

    std::string passphrase;
    std::cout << "Passphrase for '" << cfg.storage_path << "': ";
    std::getline(std::cin, passphrase);
    if (passphrase.empty()) {
        std::cout << "Passphrase required.\n";
        return 1;
    }

    if (!Storage::loadStore(store, cfg.storage_path, passphrase)) {
        std::cout << "Could not open store (wrong passphrase or corrupt file).\n";
        return 1;
    }

    // MAIN LOOP
    while (true) {
        std::cout << "\n===== MAIN MENU =====\n"
            "Learner: " << learner << "\n"
            "1. Add Card\n"
            "2. Study Due Cards\n"
            "3. List All Cards\n"
            "4. Statistics\n"
            "5. Save & Exit\n> ";

        int choice;
        if (!(std::cin >> choice)) {
            if (std::cin.eof()) {
                // Input closed: save as "Save & Exit" would
                std::cout << "\nEnd of input; saving store.\n";
                spdlog::warn("Input closed at the main menu; saving before exit");
                if (!Storage::saveStore(store, cfg.storage_path, passphrase)) {
                    std::cout << "Error saving store; changes from this session were not written.\n";
                    sodium_memzero(&passphrase[0], passphrase.size());
                    return 1;
                }
                break;
            }
            std::cin.clear(); std::string dummy; std::getline(std::cin, dummy);
            continue;
        }
        std::cin.ignore();

        if (choice == 1) {
            std::string deck, front, back;
            std::cout << "Deck: "; std::getline(std::cin, deck);
            if (deck.empty()) deck = "default";
            std::cout << "Front: "; std::getline(std::cin, front);
            if (front.empty()) { std::cout << "Front required.\n"; continue; }
            std::cout << "Back: "; std::getline(std::cin, back);

            store.addCard(deck, front, back, std::time(nullptr));
            std::cout << "Card added.\n";
        }

        else if (choice == 2) {
            studyDue(store, scheduler, learner, cfg.queue_limit);
        }

        else if (choice == 3) {
            listAllCards(store, learner);
        }

        else if (choice == 4) {
            printStats(store, learner);
        }

        else if (choice == 5) {
            if (!Storage::saveStore(store, cfg.storage_path, passphrase)) {
                std::cout << "Error saving store.\n";
                sodium_memzero(&passphrase[0], passphrase.size());
                return 1;
            }
            std::cout << "Goodbye!\n";
            break;
        }

        else std::cout << "Invalid.\n";
    }

    sodium_memzero(&passphrase[0], passphrase.size());
    return 0;
}
