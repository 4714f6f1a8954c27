#include <iostream>
#include <vector>
#include <string>
#include <limits>
#include <memory>
#include <stdexcept>
#include <ctime>

#include "../utils/logging.hpp"
#include "../storage/FileReviewBackend.hpp"
#include "../core/Scheduler.hpp"
#include "../core/SchedulingConfig.hpp"
#include "../core/ReviewStore.hpp"
#include "../core/DueQuery.hpp"
#include "../core/ReviewStats.hpp"

std::string formatTime(std::time_t t) {
    char buf[32];
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M UTC", &tm);
    return buf;
}

void printRecord(const ReviewRecord& r) {
    std::cout << "   Item: " << r.item_id << "\n";
    std::cout << "   Interval: " << r.interval_days << " days\n";
    std::cout << "   Ease: " << r.ease_factor << "\n";
    std::cout << "   Repetitions: " << r.repetition_count << "\n";
    std::cout << "   Last grade: " << gradeName(r.last_grade) << "\n";
    std::cout << "   Due: " << formatTime(r.due_at) << "\n";
    std::cout << "-----------------------------\n";
}

void listAllRecords(const std::vector<ReviewRecord>& records) {
    std::cout << "\n===== ALL REVIEWS =====\n";

    if (records.empty()) {
        std::cout << "No items tracked.\n";
        return;
    }

    for (size_t i = 0; i < records.size(); i++) {
        std::cout << i + 1 << ".\n";
        printRecord(records[i]);
    }
}

Grade askGrade() {
    while (true) {
        std::cout << "\nHow well did you recall it?\n"
            " 1 = AGAIN (Failed)\n"
            " 2 = HARD\n"
            " 3 = GOOD\n"
            " 4 = EASY\n> ";
        int q;
        if (std::cin >> q && q >= 1 && q <= 4) {
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            return static_cast<Grade>(q - 1);
        }
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        std::cout << "Invalid input.\n";
    }
}

int main(int argc, char** argv) {
    Log::init();

    SchedulingConfig cfg;
    try {
        if (argc > 1) cfg = SchedulingConfig::loadFile(argv[1]);
        cfg.validate();
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "Invalid scheduling config: " << e.what() << "\n";
        return 1;
    }

    std::string owner, passphrase;
    std::cout << "Learner id: "; std::getline(std::cin, owner);
    std::cout << "Passphrase: "; std::getline(std::cin, passphrase);
    if (owner.empty() || passphrase.empty()) {
        std::cout << "Empty fields.\n";
        return 1;
    }

    std::string reviewFile;
    try {
        reviewFile = FileReviewBackend::fileNameFor(owner);
    }
    catch (const std::invalid_argument& e) {
        std::cout << "Invalid learner id: " << e.what() << "\n";
        return 1;
    }

    std::unique_ptr<FileReviewBackend> backend;
    try {
        backend = std::make_unique<FileReviewBackend>(reviewFile, passphrase);
    }
    catch (const std::runtime_error& e) {
        std::cerr << "Cannot open review storage: " << e.what() << "\n";
        return 1;
    }

    Scheduler scheduler(cfg);
    ReviewStore store(scheduler, *backend);
    DueQuery dueQuery(store);
    StatsAggregator statsAggregator(store);

    store.subscribe([](const StoreEvent& ev) {
        if (ev.kind == StoreEventKind::PERSIST_FAILED)
            std::cout << "(warning: could not save '" << ev.item_id << "': " << ev.detail << ")\n";
    });

    store.load(owner);
    if (store.loadFailed()) {
        std::cout << "Could not read your reviews (wrong passphrase?). Starting empty.\n";
    }

    // MAIN LOOP
    while (true) {
        std::cout << "\n===== MAIN MENU =====\n"
            "Learner: " << owner << " | due now: " << dueQuery.dueCount(store.now()) << "\n"
            "1. Grade an item\n"
            "2. Review due items\n"
            "3. List all items\n"
            "4. Statistics\n"
            "5. Reset an item\n"
            "6. Sync changes from disk\n"
            "7. Exit\n> ";

        int choice;
        if (!(std::cin >> choice)) {
            if (std::cin.eof()) break;
            std::cin.clear(); std::string dummy; std::getline(std::cin, dummy);
            continue;
        }
        std::cin.ignore();

        if (choice == 1) {
            std::string itemId;
            std::cout << "Item id: "; std::getline(std::cin, itemId);
            if (itemId.empty()) { std::cout << "Item id required.\n"; continue; }

            ReviewRecord r = store.recordGrading(itemId, askGrade());
            std::cout << "Next review in " << r.interval_days << " day(s), at " << formatTime(r.due_at) << "\n";
        }

        else if (choice == 2) {
            auto due = dueQuery.dailyBatch(store.now());
            if (due.empty()) {
                if (cfg.daily_review_limit > 0 && dueQuery.dueCount(store.now()) > 0)
                    std::cout << "Daily review limit reached.\n";
                else
                    std::cout << "No items due.\n";
                continue;
            }

            for (const auto& r : due) {
                std::cout << "\nReviewing: " << r.item_id << "\n";
                store.recordGrading(r.item_id, askGrade());
                std::cout << "Updated.\n";
            }
        }

        else if (choice == 3) {
            listAllRecords(dueQuery.dueItems(std::numeric_limits<std::time_t>::max()));
        }

        else if (choice == 4) {
            ReviewStats s = statsAggregator.stats(store.now());
            std::cout << "\n=== STATISTICS ===\n"
                << "Total:          " << s.total << "\n"
                << "Due:            " << s.due << "\n"
                << "Reviewed today: " << s.reviewed_today << "\n"
                << "Learning:       " << s.learning << "\n"
                << "Mature:         " << s.mature << "\n";
        }

        else if (choice == 5) {
            std::string itemId;
            std::cout << "Item id to reset: "; std::getline(std::cin, itemId);
            if (itemId.empty()) continue;
            if (store.resetItem(itemId)) std::cout << "Reset.\n";
            else std::cout << "Reset locally; removing it from disk failed.\n";
        }

        else if (choice == 6) {
            int pushed = backend->pollChanges();
            if (pushed < 0) std::cout << "Could not read the review file.\n";
            else std::cout << pushed << " change(s) picked up.\n";
        }

        else if (choice == 7) {
            break;
        }

        else std::cout << "Invalid.\n";
    }

    store.waitForPendingWrites();
    if (!store.lastPersistError().empty())
        std::cout << "Some changes may not have been saved: " << store.lastPersistError() << "\n";
    std::cout << "Goodbye!\n";
    return 0;
}
