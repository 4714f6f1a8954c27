#include "Scheduler.hpp"
#include <algorithm>
#include <cmath>
#include <type_traits>
#include <variant>

static constexpr std::time_t SECONDS_PER_DAY = 24 * 60 * 60;

Scheduler::Scheduler(const SchedulingConfig& config)
    : cfg(config)
{
    cfg.validate();
    spdlog::info("Scheduler (SM-2, relearn step {} min) initialized.", cfg.relearn_delay_minutes);
}

/*
  Public API:
    - computeNext(PriorState, Grade, now)
    - classify(ReviewRecord)
*/

ReviewRecord Scheduler::computeNext(const PriorState& previous, Grade grade, std::time_t now) const {
    ReviewRecord next = std::visit(
        [&](const auto& prior) -> ReviewRecord {
            using T = std::decay_t<decltype(prior)>;
            if constexpr (std::is_same_v<T, NewItem>)
                return firstGrading(prior, grade, now);
            else
                return nextGrading(prior, grade, now);
        },
        previous);

    next.last_grade = grade;
    next.last_reviewed_at = now;

    spdlog::debug("Schedule item '{}' | grade={} reps={} ease={:.3f} interval={}d due={}",
        next.item_id, gradeName(grade), next.repetition_count, next.ease_factor,
        next.interval_days, next.due_at);
    return next;
}

Maturity Scheduler::classify(const ReviewRecord& record) const {
    if (record.interval_days < cfg.learning_threshold_days) return Maturity::LEARNING;
    if (record.interval_days >= cfg.mature_threshold_days) return Maturity::MATURE;
    return Maturity::REVIEWING;
}

ReviewRecord Scheduler::firstGrading(const NewItem& item, Grade q, std::time_t now) const {
    ReviewRecord rec;
    rec.item_id = item.item_id;
    rec.owner_id = item.owner_id;
    rec.repetition_count = 1;
    rec.ease_factor = cfg.starting_ease;

    if (q == Grade::AGAIN) {
        relearn(rec, now);
        return rec;
    }

    rec.interval_days = initialIntervalDays(q);
    rec.due_at = now + rec.interval_days * SECONDS_PER_DAY;
    return rec;
}

ReviewRecord Scheduler::nextGrading(const ReviewRecord& prev, Grade q, std::time_t now) const {
    ReviewRecord rec = prev;
    rec.repetition_count = prev.repetition_count + 1;
    rec.ease_factor = updatedEase(prev.ease_factor, q);

    // penalty is kept in the ease, but the interval never grows from a failure
    if (q == Grade::AGAIN) {
        relearn(rec, now);
        return rec;
    }

    // capped before the cast; long GOOD/EASY runs would overflow int otherwise
    double grown = std::round(static_cast<double>(prev.interval_days) * rec.ease_factor);
    grown = std::min(grown, static_cast<double>(cfg.max_interval_days));
    rec.interval_days = std::max(1, static_cast<int>(grown));
    rec.due_at = now + rec.interval_days * SECONDS_PER_DAY;
    return rec;
}

/*
  SM-2 ease update on a 0..3 quality scale:
    ease' = ease + (0.1 - d * (0.08 + d * 0.02)),  d = 3 - q
  EASY +0.10, GOOD 0.00, HARD -0.14, AGAIN -0.32; floored at minimum_ease.
*/
double Scheduler::updatedEase(double ease, Grade q) const {
    // worked in hundredths so GOOD is exactly neutral
    const int d = 3 - gradeQuality(q);
    const int deltaHundredths = 10 - d * (8 + d * 2);
    return std::max(cfg.minimum_ease, ease + deltaHundredths / 100.0);
}

int Scheduler::initialIntervalDays(Grade q) const {
    switch (q) {
    case Grade::HARD: return cfg.initial_interval_hard;
    case Grade::GOOD: return cfg.initial_interval_good;
    case Grade::EASY: return cfg.initial_interval_easy;
    default: break;
    }
    return 0;
}

void Scheduler::relearn(ReviewRecord& rec, std::time_t now) const {
    rec.interval_days = 0;
    rec.due_at = now + static_cast<std::time_t>(cfg.relearn_delay_minutes) * 60;
}
