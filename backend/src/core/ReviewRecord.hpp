#pragma once
#include <string>
#include <ctime>
#include <optional>
#include <variant>

enum class Grade {
    AGAIN = 0,
    HARD = 1,
    GOOD = 2,
    EASY = 3
};

// Quality score used by the ease update: AGAIN=0 .. EASY=3
int gradeQuality(Grade g);

const char* gradeName(Grade g);
std::optional<Grade> gradeFromName(const std::string& name);

// Scheduling state of one item for one learner.
class ReviewRecord {
public:
    std::string item_id;
    std::string owner_id;

    std::time_t due_at = 0;
    double ease_factor = 2.5;
    int interval_days = 0;        // 0 only while relearning after AGAIN
    int repetition_count = 0;
    Grade last_grade = Grade::GOOD;
    std::optional<std::time_t> last_reviewed_at;

    bool isDue(std::time_t now) const { return due_at <= now; }

    // true when `other` was reviewed strictly later than this record.
    // A missing timestamp on `other` never counts as newer.
    bool olderThan(const ReviewRecord& other) const;
};

// Previous state handed to the engine: either nothing yet, or a prior record.
struct NewItem {
    std::string item_id;
    std::string owner_id;
};

using PriorState = std::variant<NewItem, ReviewRecord>;
