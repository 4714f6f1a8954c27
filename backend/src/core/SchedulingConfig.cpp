#include "SchedulingConfig.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <spdlog/spdlog.h>

static constexpr double EASE_FLOOR = 1.3;

static std::string trimmed(const std::string& s) {
    std::string t = s;
    while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
    while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
    return t;
}

void SchedulingConfig::validate() const {
    // written so that NaN fails too
    if (!(minimum_ease >= EASE_FLOOR))
        throw std::invalid_argument("minimum_ease must be at least 1.3");
    if (!(starting_ease >= minimum_ease) || !std::isfinite(starting_ease))
        throw std::invalid_argument("starting_ease must be a number not below minimum_ease");
    if (!std::isfinite(minimum_ease))
        throw std::invalid_argument("minimum_ease must be finite");
    if (relearn_delay_minutes < 1)
        throw std::invalid_argument("relearn_delay_minutes must be >= 1");
    if (initial_interval_hard < 1 || initial_interval_good < 1 || initial_interval_easy < 1)
        throw std::invalid_argument("initial intervals must be >= 1 day");
    if (max_interval_days < initial_interval_hard || max_interval_days < initial_interval_good
        || max_interval_days < initial_interval_easy)
        throw std::invalid_argument("max_interval_days is below an initial interval");
    if (learning_threshold_days > mature_threshold_days)
        throw std::invalid_argument("learning_threshold_days exceeds mature_threshold_days");
    if (day_utc_offset_minutes < -14 * 60 || day_utc_offset_minutes > 14 * 60)
        throw std::invalid_argument("day_utc_offset_minutes out of range");
    if (daily_review_limit < 0)
        throw std::invalid_argument("daily_review_limit must be >= 0");
}

std::string SchedulingConfig::serialize() const {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10);
    oss << "starting_ease: " << starting_ease << "\n"
        << "minimum_ease: " << minimum_ease << "\n"
        << "relearn_delay_minutes: " << relearn_delay_minutes << "\n"
        << "initial_interval_hard: " << initial_interval_hard << "\n"
        << "initial_interval_good: " << initial_interval_good << "\n"
        << "initial_interval_easy: " << initial_interval_easy << "\n"
        << "max_interval_days: " << max_interval_days << "\n"
        << "learning_threshold_days: " << learning_threshold_days << "\n"
        << "mature_threshold_days: " << mature_threshold_days << "\n"
        << "day_utc_offset_minutes: " << day_utc_offset_minutes << "\n"
        << "daily_review_limit: " << daily_review_limit << "\n";
    return oss.str();
}

void SchedulingConfig::deserialize(const std::string& data) {
    std::istringstream iss(data);
    std::string line;
    int lineNo = 0;

    while (std::getline(iss, line)) {
        ++lineNo;
        line = trimmed(line);
        if (line.empty() || line.front() == '#') continue;

        auto pos = line.find(':');
        if (pos == std::string::npos) {
            spdlog::warn("Config line {} has no ':' separator; skipped", lineNo);
            continue;
        }

        std::string key = trimmed(line.substr(0, pos));
        std::string val = trimmed(line.substr(pos + 1));

        try {
            if (key == "starting_ease") starting_ease = std::stod(val);
            else if (key == "minimum_ease") minimum_ease = std::stod(val);
            else if (key == "relearn_delay_minutes") relearn_delay_minutes = std::stoi(val);
            else if (key == "initial_interval_hard") initial_interval_hard = std::stoi(val);
            else if (key == "initial_interval_good") initial_interval_good = std::stoi(val);
            else if (key == "initial_interval_easy") initial_interval_easy = std::stoi(val);
            else if (key == "max_interval_days") max_interval_days = std::stoi(val);
            else if (key == "learning_threshold_days") learning_threshold_days = std::stoi(val);
            else if (key == "mature_threshold_days") mature_threshold_days = std::stoi(val);
            else if (key == "day_utc_offset_minutes") day_utc_offset_minutes = std::stoi(val);
            else if (key == "daily_review_limit") daily_review_limit = std::stoi(val);
            else spdlog::warn("Unknown config key '{}' on line {}; ignored", key, lineNo);
        }
        catch (const std::logic_error& e) {
            spdlog::warn("Config value for '{}' on line {} is not a number ({}); skipped", key, lineNo, e.what());
        }
    }
}

SchedulingConfig SchedulingConfig::loadFile(const std::string& filename) {
    SchedulingConfig cfg;
    std::ifstream in(filename);
    if (!in) {
        spdlog::warn("Config file '{}' not found; using defaults", filename);
        return cfg;
    }

    std::stringstream buf;
    buf << in.rdbuf();
    cfg.deserialize(buf.str());
    cfg.validate();

    spdlog::info("Loaded scheduling config from '{}'", filename);
    return cfg;
}
