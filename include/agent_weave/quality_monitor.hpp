#pragma once

#include "task.hpp"
#include <openssl/sha.h>
#include <cstddef>
#include <cstdio>
#include <mutex>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace agent_weave {

/**
 * Hex-encoded SHA-256 of an output
 */
inline std::string output_digest(const std::string& output) {
    unsigned char md[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(output.data()), output.size(), md);
    char hex[SHA256_DIGEST_LENGTH * 2 + 1];
    for (size_t i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        std::snprintf(hex + i * 2, 3, "%02x", md[i]);
    }
    return std::string(hex, SHA256_DIGEST_LENGTH * 2);
}

/**
 * Iteration history, coverage-trend convergence check and
 * exact-repetition detection over task outputs
 */
class QualityMonitor {
public:
    struct Options {
        double min_coverage_improvement{0.05};
        size_t max_iterations_without_improvement{3};
        double similarity_threshold{0.95};
    };

    struct IterationRecord {
        int iteration{0};
        std::optional<double> coverage;
        std::optional<double> quality_score;
        size_t tasks_completed{0};
    };

    struct QualityMetrics {
        std::string status;   // "ok" or "no_data"
        size_t iterations{0};
        std::optional<double> current_coverage;
        std::optional<double> current_quality_score;
        size_t total_tasks_completed{0};
        std::string coverage_trend;
    };

    struct Decision {
        bool should_continue{true};
        std::string reason;
    };

    QualityMonitor() : QualityMonitor(Options{}) {}

    explicit QualityMonitor(Options options)
        : options_(options)
    {
        if (options_.max_iterations_without_improvement == 0) {
            throw std::invalid_argument("max_iterations_without_improvement must be positive");
        }
    }

    void record_iteration(int iteration,
                          std::optional<double> coverage = std::nullopt,
                          std::optional<double> quality_score = std::nullopt,
                          size_t tasks_completed = 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back(IterationRecord{iteration, coverage, quality_score, tasks_completed});
        if (coverage) {
            coverage_history_.push_back(*coverage);
        }
    }

    /**
     * 1.0 if this exact output was already seen for the task, 0.0 otherwise.
     * New outputs are remembered.
     */
    double check_output_similarity(const TaskId& task_id, const std::string& output) {
        auto digest = output_digest(output);
        std::lock_guard<std::mutex> lock(mutex_);
        auto& seen = output_hashes_[task_id];
        if (seen.count(digest) > 0) {
            return 1.0;
        }
        seen.insert(std::move(digest));
        return 0.0;
    }

    bool detect_loop(const TaskId& task_id, const std::string& output) {
        return check_output_similarity(task_id, output) >= options_.similarity_threshold;
    }

    Decision should_continue(int /*iteration*/) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (history_.size() < 2) {
            return {true, "insufficient_data"};
        }

        auto window = options_.max_iterations_without_improvement;
        if (coverage_history_.size() >= window) {
            auto first = coverage_history_.size() - window;
            bool improved = false;
            for (size_t i = first; i + 1 < coverage_history_.size(); ++i) {
                if (coverage_history_[i + 1] - coverage_history_[i] >= options_.min_coverage_improvement) {
                    improved = true;
                    break;
                }
            }
            if (!improved) {
                return {false, "No coverage improvement in " + std::to_string(window) + " iterations"};
            }
        }

        return {true, "quality_improving"};
    }

    QualityMetrics get_quality_metrics() const {
        std::lock_guard<std::mutex> lock(mutex_);
        QualityMetrics metrics;
        if (history_.empty()) {
            metrics.status = "no_data";
            return metrics;
        }

        const auto& latest = history_.back();
        metrics.status = "ok";
        metrics.iterations = history_.size();
        metrics.current_coverage = latest.coverage;
        metrics.current_quality_score = latest.quality_score;
        metrics.total_tasks_completed = std::accumulate(
            history_.begin(), history_.end(), size_t{0},
            [](size_t total, const IterationRecord& record) { return total + record.tasks_completed; });
        metrics.coverage_trend = calculate_trend(coverage_history_);
        return metrics;
    }

    /**
     * Direction over the last three values at most
     */
    static std::string calculate_trend(const std::vector<double>& values) {
        if (values.size() < 2) {
            return "insufficient_data";
        }

        auto first = values.size() >= 3 ? values.size() - 3 : 0;
        bool rising = true;
        bool falling = true;
        for (size_t i = first; i + 1 < values.size(); ++i) {
            rising = rising && values[i + 1] > values[i];
            falling = falling && values[i + 1] < values[i];
        }

        if (rising) return "improving";
        if (falling) return "declining";
        return "stable";
    }

    std::vector<IterationRecord> iteration_history() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return history_;
    }

    std::vector<double> coverage_history() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return coverage_history_;
    }

    size_t fingerprint_count(const TaskId& task_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = output_hashes_.find(task_id);
        return it == output_hashes_.end() ? 0 : it->second.size();
    }

    const Options& options() const noexcept { return options_; }

private:
    Options options_;
    mutable std::mutex mutex_;
    std::vector<IterationRecord> history_;
    std::vector<double> coverage_history_;
    std::unordered_map<TaskId, std::unordered_set<std::string>> output_hashes_;
};

} // namespace agent_weave
