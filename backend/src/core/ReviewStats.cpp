#include "ReviewStats.hpp"

StatsAggregator::StatsAggregator(const ReviewStore& reviewStore)
    : store(reviewStore)
{
}

long long StatsAggregator::dayIndex(std::time_t t, int utcOffsetMinutes) {
    const long long shifted = static_cast<long long>(t) + static_cast<long long>(utcOffsetMinutes) * 60;
    const long long perDay = 24LL * 60 * 60;
    // floor division so instants before the epoch land on the right day
    long long day = shifted / perDay;
    if (shifted % perDay < 0) --day;
    return day;
}

ReviewStats StatsAggregator::stats(std::time_t now) const {
    const Scheduler& engine = store.scheduler();
    const int offset = engine.config().day_utc_offset_minutes;
    const long long today = dayIndex(now, offset);

    ReviewStats s;
    for (const auto& r : store.snapshot()) {
        ++s.total;
        if (r.isDue(now)) ++s.due;
        if (r.last_reviewed_at && dayIndex(*r.last_reviewed_at, offset) == today) ++s.reviewed_today;

        switch (engine.classify(r)) {
        case Maturity::LEARNING: ++s.learning; break;
        case Maturity::MATURE: ++s.mature; break;
        case Maturity::REVIEWING: break;
        }
    }

    spdlog::debug("stats(now={}): total={} due={} today={} learning={} mature={}",
        now, s.total, s.due, s.reviewed_today, s.learning, s.mature);
    return s;
}
