#pragma once
#include <string>

// Tunables for the scheduler and the reporting layer.
// Defaults reproduce the classic SM-2 variant with a 10 minute relearn step.
struct SchedulingConfig {
    double starting_ease = 2.5;
    double minimum_ease = 1.3;
    int relearn_delay_minutes = 10;

    int initial_interval_hard = 1;   // days
    int initial_interval_good = 1;
    int initial_interval_easy = 3;

    int max_interval_days = 365 * 50;  // growth stops here

    int learning_threshold_days = 7;   // interval < this -> learning
    int mature_threshold_days = 21;    // interval >= this -> mature

    // "Reviewed today" is judged on calendar days in UTC shifted by this offset.
    int day_utc_offset_minutes = 0;

    // Items that may be reviewed per calendar day (see day_utc_offset_minutes); 0 means no cap.
    int daily_review_limit = 0;

    // Throws std::invalid_argument on values the engine cannot work with.
    void validate() const;

    // "key: value" lines, one per field.
    std::string serialize() const;
    void deserialize(const std::string& data);

    static SchedulingConfig loadFile(const std::string& filename);
};
