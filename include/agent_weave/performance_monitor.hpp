#pragma once

#include "task.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agent_weave {

/**
 * One finished task execution, as reported to the performance sink
 */
struct AgentPerformanceEvent {
    std::string agent_name;
    TaskId task_id;
    bool success{false};
    std::string phase;
    double duration_seconds{0.0};
    std::optional<double> cost;
};

/**
 * One finished iteration of the executor loop
 */
struct IterationEvent {
    int iteration{0};
    size_t tasks_dispatched{0};
    size_t tasks_completed{0};
    size_t tasks_failed{0};
    double duration_seconds{0.0};
};

/**
 * Sink the executor reports performance into
 */
class PerformanceRecorder {
public:
    virtual ~PerformanceRecorder() = default;

    virtual void record_agent_performance(const AgentPerformanceEvent& event) = 0;

    virtual void record_iteration(const IterationEvent& /*event*/) {}
};

/**
 * In-memory recorder aggregating per-agent execution statistics
 */
class PerformanceMonitor : public PerformanceRecorder {
public:
    struct AgentStats {
        uint64_t tasks{0};
        uint64_t successes{0};
        uint64_t failures{0};
        double total_duration_seconds{0.0};
        double min_duration_seconds{std::numeric_limits<double>::max()};
        double max_duration_seconds{0.0};
        double total_cost{0.0};
    };

    struct Snapshot {
        uint64_t tasks_recorded{0};
        uint64_t tasks_succeeded{0};
        uint64_t tasks_failed{0};
        uint64_t iterations{0};
        double total_duration_seconds{0.0};
        double total_cost{0.0};
        std::map<std::string, AgentStats> agents;
    };

    PerformanceMonitor()
        : start_time_(Clock::now())
    {}

    void record_agent_performance(const AgentPerformanceEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);

        auto& stats = agents_[event.agent_name];
        ++stats.tasks;
        if (event.success) {
            ++stats.successes;
        } else {
            ++stats.failures;
        }
        stats.total_duration_seconds += event.duration_seconds;
        stats.min_duration_seconds = std::min(stats.min_duration_seconds, event.duration_seconds);
        stats.max_duration_seconds = std::max(stats.max_duration_seconds, event.duration_seconds);
        if (event.cost) {
            stats.total_cost += *event.cost;
        }
    }

    void record_iteration(const IterationEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        iterations_.push_back(event);
    }

    Snapshot snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        Snapshot snapshot;
        snapshot.iterations = iterations_.size();
        snapshot.agents = agents_;
        for (const auto& [name, stats] : agents_) {
            snapshot.tasks_recorded += stats.tasks;
            snapshot.tasks_succeeded += stats.successes;
            snapshot.tasks_failed += stats.failures;
            snapshot.total_duration_seconds += stats.total_duration_seconds;
            snapshot.total_cost += stats.total_cost;
        }
        return snapshot;
    }

    std::optional<AgentStats> agent_stats(const std::string& agent_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = agents_.find(agent_name); it != agents_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    double success_rate(const std::string& agent_name) const {
        auto stats = agent_stats(agent_name);
        if (!stats || stats->tasks == 0) return 0.0;
        return static_cast<double>(stats->successes) / static_cast<double>(stats->tasks);
    }

    double average_duration(const std::string& agent_name) const {
        auto stats = agent_stats(agent_name);
        if (!stats || stats->tasks == 0) return 0.0;
        return stats->total_duration_seconds / static_cast<double>(stats->tasks);
    }

    std::vector<AgentPerformanceEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::vector<IterationEvent> iterations() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return iterations_;
    }

    double uptime_seconds() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::chrono::duration<double>(Clock::now() - start_time_).count();
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
        iterations_.clear();
        agents_.clear();
        start_time_ = Clock::now();
    }

private:
    mutable std::mutex mutex_;
    std::vector<AgentPerformanceEvent> events_;
    std::vector<IterationEvent> iterations_;
    std::map<std::string, AgentStats> agents_;
    Clock::time_point start_time_;
};

} // namespace agent_weave
