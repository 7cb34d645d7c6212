#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace agent_weave {

using TaskId = std::string;
using TaskResult = std::string;
using Clock = std::chrono::steady_clock;

/**
 * Task lifecycle: Pending -> InProgress -> {Completed, Failed}
 */
enum class TaskStatus {
    Pending,
    InProgress,
    Completed,
    Failed
};

inline const char* to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::InProgress: return "in_progress";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
    }
    return "unknown";
}

/**
 * A subtask as produced by the decompose capability
 */
struct SubtaskSpec {
    TaskId task_id;
    std::string description;
    std::vector<TaskId> dependencies;
    std::vector<std::string> required_capabilities;
};

/**
 * Task record held by the TaskQueue for the life of a run
 */
struct QueuedTask {
    TaskId task_id;
    std::string description;
    std::vector<TaskId> dependencies;
    std::vector<std::string> required_capabilities;
    TaskStatus status{TaskStatus::Pending};
    std::optional<std::string> assigned_agent;
    std::optional<TaskResult> result;
    std::optional<std::string> error;

    Clock::time_point created_at{Clock::now()};
    std::optional<Clock::time_point> started_at;
    std::optional<Clock::time_point> completed_at;

    bool is_terminal() const noexcept {
        return status == TaskStatus::Completed || status == TaskStatus::Failed;
    }

    /**
     * Wall time between start and completion, zero until both are known
     */
    double duration_seconds() const {
        if (started_at && completed_at) {
            return std::chrono::duration<double>(*completed_at - *started_at).count();
        }
        return 0.0;
    }
};

} // namespace agent_weave
