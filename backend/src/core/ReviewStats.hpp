#pragma once
#include <cstddef>
#include <ctime>
#include "ReviewStore.hpp"

struct ReviewStats {
    std::size_t total = 0;
    std::size_t due = 0;
    std::size_t reviewed_today = 0;
    std::size_t learning = 0;
    std::size_t mature = 0;
};

/*
  Summary counters over a store.
  Calendar days are counted in one fixed zone: UTC shifted by
  SchedulingConfig::day_utc_offset_minutes. The host's local zone is never consulted.
*/
class StatsAggregator {
public:
    explicit StatsAggregator(const ReviewStore& store);

    ReviewStats stats(std::time_t now) const;

    // Day number of `t` in the configured zone.
    static long long dayIndex(std::time_t t, int utcOffsetMinutes);

private:
    const ReviewStore& store;
};
