#pragma once
#include <ctime>
#include <spdlog/spdlog.h>
#include "ReviewRecord.hpp"
#include "SchedulingConfig.hpp"

/*
  SM-2 style scheduler with a short relearning step for failures.

   - New items get their first interval from a per-grade table.
   - Known items update ease with the SM-2 quality formula (floored),
     then grow the interval by the new ease.
   - AGAIN penalizes ease but resets the interval to the relearn step,
     so one bad answer never compounds into the long-term schedule.

  Pure: no clock, no I/O, no hidden state.
*/

enum class Maturity {
    LEARNING,
    REVIEWING,
    MATURE
};

class Scheduler {
public:
    explicit Scheduler(const SchedulingConfig& cfg = SchedulingConfig());

    ReviewRecord computeNext(const PriorState& previous, Grade grade, std::time_t now) const;

    Maturity classify(const ReviewRecord& record) const;

    const SchedulingConfig& config() const { return cfg; }

private:
    SchedulingConfig cfg;

    ReviewRecord firstGrading(const NewItem& item, Grade q, std::time_t now) const;
    ReviewRecord nextGrading(const ReviewRecord& prev, Grade q, std::time_t now) const;

    double updatedEase(double ease, Grade q) const;
    int initialIntervalDays(Grade q) const;
    void relearn(ReviewRecord& rec, std::time_t now) const;
};
