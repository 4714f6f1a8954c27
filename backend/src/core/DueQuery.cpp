#include "DueQuery.hpp"
#include "ReviewStats.hpp"
#include <algorithm>
#include <unordered_set>

DueQuery::DueQuery(const ReviewStore& reviewStore)
    : store(reviewStore)
{
}

std::vector<ReviewRecord> DueQuery::dueItems(std::time_t now, std::size_t limit) const {
    std::vector<ReviewRecord> all = store.snapshot();
    std::vector<ReviewRecord> due;
    due.reserve(all.size() / 4 + 8);

    for (auto& r : all) {
        if (r.isDue(now)) due.push_back(std::move(r));
    }

    // earliest first; item id keeps equal due times in a stable order
    std::sort(due.begin(), due.end(),
        [](const ReviewRecord& a, const ReviewRecord& b) {
            if (a.due_at != b.due_at) return a.due_at < b.due_at;
            return a.item_id < b.item_id;
        });

    if (limit > 0 && due.size() > limit) due.resize(limit);

    spdlog::debug("dueItems(now={}): {} due", now, due.size());
    return due;
}

std::size_t DueQuery::dueCount(std::time_t now) const {
    std::vector<ReviewRecord> all = store.snapshot();
    return static_cast<std::size_t>(std::count_if(all.begin(), all.end(),
        [now](const ReviewRecord& r) { return r.isDue(now); }));
}

std::vector<ReviewRecord> DueQuery::dailyBatch(std::time_t now) const {
    const int limit = store.scheduler().config().daily_review_limit;
    if (limit <= 0) return dueItems(now);

    const std::size_t done = StatsAggregator(store).stats(now).reviewed_today;
    const std::size_t cap = static_cast<std::size_t>(limit);
    if (done >= cap) {
        spdlog::info("Daily review limit of {} reached ({} reviewed today)", limit, done);
        return {};
    }
    return dueItems(now, cap - done);
}

std::vector<std::string> DueQuery::filterDue(const std::vector<std::string>& catalogIds, std::time_t now) const {
    std::unordered_set<std::string> dueIds;
    for (const auto& r : store.snapshot())
        if (r.isDue(now)) dueIds.insert(r.item_id);

    std::vector<std::string> out;
    for (const auto& id : catalogIds)
        if (dueIds.count(id)) out.push_back(id);
    return out;
}
