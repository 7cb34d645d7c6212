#pragma once

#include "agent_pool.hpp"
#include "logging.hpp"
#include "quality_monitor.hpp"
#include <cstddef>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace agent_weave {

/**
 * Flat key=value settings; dotted keys group executor, quality, log and agent options
 */
class Config {
public:
    static std::unique_ptr<Config> load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file) {
            throw std::runtime_error("Cannot open config file: " + filename);
        }
        return parse(file);
    }

    static std::unique_ptr<Config> parse(const std::string& text) {
        std::istringstream stream(text);
        return parse(stream);
    }

    static std::unique_ptr<Config> parse(std::istream& input) {
        auto config = std::make_unique<Config>();
        std::string line;

        while (std::getline(input, line)) {
            auto first = line.find_first_not_of(" \t\r");
            // Skip comments and empty lines
            if (first == std::string::npos || line[first] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos != std::string::npos) {
                config->set(trim(line.substr(0, pos)), trim(line.substr(pos + 1)));
            }
        }

        return config;
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    std::string get(const std::string& key, const std::string& default_value = "") const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_value;
    }

    int get_int(const std::string& key, int default_value = 0) const {
        if (!has(key)) {
            return default_value;
        }
        try {
            return std::stoi(get(key));
        } catch (const std::logic_error&) {
            logger()->warn("Config key '{}' is not an integer, using {}", key, default_value);
            return default_value;
        }
    }

    double get_double(const std::string& key, double default_value = 0.0) const {
        if (!has(key)) {
            return default_value;
        }
        try {
            return std::stod(get(key));
        } catch (const std::logic_error&) {
            logger()->warn("Config key '{}' is not a number, using {}", key, default_value);
            return default_value;
        }
    }

    bool get_bool(const std::string& key, bool default_value = false) const {
        auto value = get(key);
        if (value == "true" || value == "1" || value == "yes") {
            return true;
        }
        if (value == "false" || value == "0" || value == "no") {
            return false;
        }
        return default_value;
    }

    /**
     * Comma-separated list, entries trimmed, empty entries dropped
     */
    std::vector<std::string> get_list(const std::string& key) const {
        std::vector<std::string> items;
        std::istringstream stream(get(key));
        std::string item;
        while (std::getline(stream, item, ',')) {
            item = trim(item);
            if (!item.empty()) {
                items.push_back(item);
            }
        }
        return items;
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.find(key) != values_.end();
    }

    std::vector<std::string> keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        result.reserve(values_.size());
        for (const auto& [key, value] : values_) {
            result.push_back(key);
        }
        return result;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }

private:
    static std::string trim(std::string value) {
        value.erase(0, value.find_first_not_of(" \t\r"));
        value.erase(value.find_last_not_of(" \t\r") + 1);
        return value;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

/**
 * Tunables of one MultiAgentExecutor
 */
struct ExecutorConfig {
    size_t max_parallel{3};
    int max_iterations{10};
    std::string phase{"execution"};
    bool honor_convergence{false};
    std::string fallback_agent{"supervisor"};
    QualityMonitor::Options quality;

    static ExecutorConfig from_config(const Config& config) {
        ExecutorConfig result;
        auto max_parallel = config.get_int("executor.max_parallel", static_cast<int>(result.max_parallel));
        if (max_parallel < 1) {
            throw std::invalid_argument("executor.max_parallel must be at least 1");
        }
        result.max_parallel = static_cast<size_t>(max_parallel);
        result.max_iterations = config.get_int("executor.max_iterations", result.max_iterations);
        result.phase = config.get("executor.phase", result.phase);
        result.honor_convergence = config.get_bool("executor.honor_convergence", result.honor_convergence);
        result.fallback_agent = config.get("executor.fallback_agent", result.fallback_agent);

        result.quality.min_coverage_improvement =
            config.get_double("quality.min_coverage_improvement", result.quality.min_coverage_improvement);
        auto window = config.get_int("quality.max_iterations_without_improvement",
                                     static_cast<int>(result.quality.max_iterations_without_improvement));
        if (window < 1) {
            throw std::invalid_argument("quality.max_iterations_without_improvement must be at least 1");
        }
        result.quality.max_iterations_without_improvement = static_cast<size_t>(window);
        result.quality.similarity_threshold =
            config.get_double("quality.similarity_threshold", result.quality.similarity_threshold);

        if (config.has("log.level")) {
            set_log_level(config.get("log.level"));
        }
        return result;
    }
};

/**
 * Build the roster from "agents = a,b" and "agent.<name>.*" keys
 */
inline std::vector<AgentDefinition> load_roster(const Config& config) {
    std::vector<AgentDefinition> roster;
    for (const auto& name : config.get_list("agents")) {
        AgentDefinition definition;
        definition.name = name;
        definition.model = config.get("agent." + name + ".model");
        definition.capabilities = config.get_list("agent." + name + ".capabilities");
        definition.phase_affinity = config.get_list("agent." + name + ".phases");
        roster.push_back(std::move(definition));
    }
    return roster;
}

} // namespace agent_weave
