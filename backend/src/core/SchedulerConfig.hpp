#pragma once
#include <string>
#include <spdlog/spdlog.h>

// Tunable constants for one Scheduler instance. Stored as "key:value" lines.
struct SchedulerConfig {
    double target_retention = 0.90;

    // Bounds
    double minimum_stability = 0.1;     // days
    double maximum_stability = 36500.0; // days
    double minimum_difficulty = 1.0;
    double maximum_difficulty = 10.0;

    // Seeds used when a card leaves New
    double initial_difficulty = 5.0;
    double initial_stability_again = 0.4;
    double initial_stability_good = 3.0;

    // Memory model coefficients
    double stability_growth = 2.0;
    double stability_decay = 0.2;
    double recall_bonus = 2.0;
    double lapse_stability_factor = 0.35;
    double difficulty_increase = 2.0;
    double difficulty_decrease = 0.5;

    // Intervals
    double graduation_threshold_days = 1.0;
    double maximum_interval_days = 365.0;
    double learning_step_again_minutes = 1.0;
    double learning_step_good_minutes = 10.0;
    double relearning_step_minutes = 10.0;

    // Review service
    int max_update_attempts = 3;

    // Throws std::invalid_argument naming the offending key.
    void validate() const;

    std::string serialize() const;
    static SchedulerConfig deserialize(const std::string& data);
    static SchedulerConfig loadFile(const std::string& filename);
};
