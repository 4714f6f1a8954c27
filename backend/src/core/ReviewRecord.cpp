#include "ReviewRecord.hpp"

int gradeQuality(Grade g) {
    switch (g) {
    case Grade::AGAIN: return 0;
    case Grade::HARD:  return 1;
    case Grade::GOOD:  return 2;
    case Grade::EASY:  return 3;
    }
    return 0;
}

const char* gradeName(Grade g) {
    switch (g) {
    case Grade::AGAIN: return "again";
    case Grade::HARD:  return "hard";
    case Grade::GOOD:  return "good";
    case Grade::EASY:  return "easy";
    }
    return "again";
}

std::optional<Grade> gradeFromName(const std::string& name) {
    if (name == "again") return Grade::AGAIN;
    if (name == "hard") return Grade::HARD;
    if (name == "good") return Grade::GOOD;
    if (name == "easy") return Grade::EASY;
    return std::nullopt;
}

bool ReviewRecord::olderThan(const ReviewRecord& other) const {
    if (!other.last_reviewed_at) return false;
    if (!last_reviewed_at) return true;
    return *last_reviewed_at < *other.last_reviewed_at;
}
