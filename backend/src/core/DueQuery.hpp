#pragma once
#include <cstddef>
#include <ctime>
#include <string>
#include <vector>
#include "ReviewStore.hpp"

// Read-only views of what is due. Every call recomputes from the store.
class DueQuery {
public:
    explicit DueQuery(const ReviewStore& store);

    // Records with due_at <= now, ordered by (due_at, item_id).
    // limit > 0 truncates the sequence; 0 returns everything.
    std::vector<ReviewRecord> dueItems(std::time_t now, std::size_t limit = 0) const;

    std::size_t dueCount(std::time_t now) const;

    // dueItems() capped by what is left of SchedulingConfig::daily_review_limit
    // once the items already reviewed today are counted. Limit 0 means no cap.
    std::vector<ReviewRecord> dailyBatch(std::time_t now) const;

    // Catalog ids whose record is due, in catalog order. Untracked ids are not due.
    std::vector<std::string> filterDue(const std::vector<std::string>& catalogIds, std::time_t now) const;

private:
    const ReviewStore& store;
};
