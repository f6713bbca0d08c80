#include "SchedulerConfig.hpp"
#include "ForgettingCurve.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cmath>
#include <cctype>
#include <limits>

namespace {

struct DoubleKey {
    const char* name;
    double SchedulerConfig::* field;
};

const DoubleKey kDoubleKeys[] = {
    { "target_retention", &SchedulerConfig::target_retention },
    { "minimum_stability", &SchedulerConfig::minimum_stability },
    { "maximum_stability", &SchedulerConfig::maximum_stability },
    { "minimum_difficulty", &SchedulerConfig::minimum_difficulty },
    { "maximum_difficulty", &SchedulerConfig::maximum_difficulty },
    { "initial_difficulty", &SchedulerConfig::initial_difficulty },
    { "initial_stability_again", &SchedulerConfig::initial_stability_again },
    { "initial_stability_good", &SchedulerConfig::initial_stability_good },
    { "stability_growth", &SchedulerConfig::stability_growth },
    { "stability_decay", &SchedulerConfig::stability_decay },
    { "recall_bonus", &SchedulerConfig::recall_bonus },
    { "lapse_stability_factor", &SchedulerConfig::lapse_stability_factor },
    { "difficulty_increase", &SchedulerConfig::difficulty_increase },
    { "difficulty_decrease", &SchedulerConfig::difficulty_decrease },
    { "graduation_threshold_days", &SchedulerConfig::graduation_threshold_days },
    { "maximum_interval_days", &SchedulerConfig::maximum_interval_days },
    { "learning_step_again_minutes", &SchedulerConfig::learning_step_again_minutes },
    { "learning_step_good_minutes", &SchedulerConfig::learning_step_good_minutes },
    { "relearning_step_minutes", &SchedulerConfig::relearning_step_minutes },
};

void require(bool condition, const char* key, const char* rule) {
    if (!condition) {
        spdlog::error("Invalid scheduler config: {} {}", key, rule);
        throw std::invalid_argument(std::string("scheduler config '") + key + "' " + rule);
    }
}

std::string trim(const std::string& s) {
    std::string t = s;
    while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
    while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
    return t;
}

double parseNumber(const std::string& key, const std::string& text) {
    std::size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    }
    catch (const std::logic_error&) {
        throw std::invalid_argument("scheduler config '" + key + "' has non-numeric value '" + text + "'");
    }
    if (used != text.size()) {
        throw std::invalid_argument("scheduler config '" + key + "' has trailing characters in '" + text + "'");
    }
    return value;
}

} // namespace

void SchedulerConfig::validate() const {
    require(target_retention > 0.0 && target_retention < 1.0, "target_retention", "must be in (0, 1)");

    require(minimum_stability >= ForgettingCurve::kMinimumStability, "minimum_stability", "must be >= 0.1");
    require(maximum_stability > minimum_stability, "maximum_stability", "must exceed minimum_stability");
    require(minimum_difficulty > 0.0, "minimum_difficulty", "must be positive");
    require(maximum_difficulty > minimum_difficulty, "maximum_difficulty", "must exceed minimum_difficulty");

    require(initial_difficulty >= minimum_difficulty && initial_difficulty <= maximum_difficulty,
        "initial_difficulty", "must lie inside the difficulty bounds");
    require(initial_stability_again >= minimum_stability && initial_stability_again <= maximum_stability,
        "initial_stability_again", "must lie inside the stability bounds");
    require(initial_stability_good >= minimum_stability && initial_stability_good <= maximum_stability,
        "initial_stability_good", "must lie inside the stability bounds");

    require(stability_growth > 0.0, "stability_growth", "must be positive");
    require(stability_decay >= 0.0, "stability_decay", "must not be negative");
    require(recall_bonus >= 0.0, "recall_bonus", "must not be negative");
    require(lapse_stability_factor > 0.0 && lapse_stability_factor < 1.0,
        "lapse_stability_factor", "must be in (0, 1)");
    require(difficulty_increase >= 0.0, "difficulty_increase", "must not be negative");
    require(difficulty_decrease >= 0.0, "difficulty_decrease", "must not be negative");

    require(graduation_threshold_days > 0.0, "graduation_threshold_days", "must be positive");
    require(maximum_interval_days >= graduation_threshold_days,
        "maximum_interval_days", "must be at least graduation_threshold_days");
    require(learning_step_again_minutes > 0.0, "learning_step_again_minutes", "must be positive");
    require(learning_step_good_minutes > 0.0, "learning_step_good_minutes", "must be positive");
    require(relearning_step_minutes > 0.0, "relearning_step_minutes", "must be positive");

    require(max_update_attempts >= 1, "max_update_attempts", "must be at least 1");
}

std::string SchedulerConfig::serialize() const {
    std::ostringstream oss;
    oss.precision(17);
    for (const auto& k : kDoubleKeys) {
        oss << k.name << ":" << this->*(k.field) << "\n";
    }
    oss << "max_update_attempts:" << max_update_attempts << "\n";
    return oss.str();
}

SchedulerConfig SchedulerConfig::deserialize(const std::string& data) {
    SchedulerConfig cfg;
    std::istringstream iss(data);
    std::string line;

    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.empty() || line.front() == '#') continue;

        auto pos = line.find(':');
        if (pos == std::string::npos) {
            spdlog::warn("Ignoring malformed config line '{}'", line);
            continue;
        }

        std::string key = trim(line.substr(0, pos));
        std::string valStr = trim(line.substr(pos + 1));

        if (key == "max_update_attempts") {
            double v = parseNumber(key, valStr);
            if (v != std::floor(v)) {
                throw std::invalid_argument("scheduler config 'max_update_attempts' must be an integer");
            }
            if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
                throw std::invalid_argument("scheduler config 'max_update_attempts' is out of range");
            }
            cfg.max_update_attempts = static_cast<int>(v);
            continue;
        }

        bool known = false;
        for (const auto& k : kDoubleKeys) {
            if (key == k.name) {
                cfg.*(k.field) = parseNumber(key, valStr);
                known = true;
                break;
            }
        }
        if (!known) {
            spdlog::warn("Ignoring unknown config key '{}'", key);
        }
    }

    cfg.validate();
    return cfg;
}

SchedulerConfig SchedulerConfig::loadFile(const std::string& filename) {
    std::ifstream in(filename);
    if (!in) {
        spdlog::info("Config file '{}' not found; using defaults", filename);
        return SchedulerConfig{};
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    spdlog::info("Loading scheduler config from '{}'", filename);
    return deserialize(buffer.str());
}
