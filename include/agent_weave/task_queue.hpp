#pragma once

#include "errors.hpp"
#include "task.hpp"
#include <algorithm>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace agent_weave {

/**
 * Dependency-aware task queue
 * Holds every task of a run in insertion order and enforces the status state machine
 */
class TaskQueue {
public:
    struct StatusSummary {
        size_t total{0};
        size_t pending{0};
        size_t in_progress{0};
        size_t completed{0};
        size_t failed{0};
        size_t blocked{0};   // pending tasks naming ids absent from the queue
    };

    TaskQueue() = default;
    ~TaskQueue() = default;

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    /**
     * Register a new Pending task
     */
    void add_task(const TaskId& task_id,
                  std::string description,
                  std::vector<TaskId> dependencies = {},
                  std::vector<std::string> required_capabilities = {}) {
        if (task_id.empty()) {
            throw std::invalid_argument("Task id must not be empty");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (index_.find(task_id) != index_.end()) {
            throw DuplicateTaskError(task_id);
        }

        QueuedTask task;
        task.task_id = task_id;
        task.description = std::move(description);
        task.dependencies = std::move(dependencies);
        task.required_capabilities = std::move(required_capabilities);

        index_.emplace(task_id, tasks_.size());
        tasks_.push_back(std::move(task));
    }

    void add_task(const SubtaskSpec& spec) {
        add_task(spec.task_id, spec.description, spec.dependencies, spec.required_capabilities);
    }

    /**
     * Pending tasks whose dependencies are all Completed, in insertion order
     */
    std::vector<QueuedTask> get_ready_tasks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<QueuedTask> ready;
        for (const auto& task : tasks_) {
            if (is_ready_locked(task)) {
                ready.push_back(task);
            }
        }
        return ready;
    }

    void mark_in_progress(const TaskId& task_id, const std::string& agent_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& task = find_locked(task_id);
        if (task.status != TaskStatus::Pending) {
            throw InvalidTransitionError(task_id, to_string(task.status), to_string(TaskStatus::InProgress));
        }
        task.status = TaskStatus::InProgress;
        task.assigned_agent = agent_name;
        task.started_at = Clock::now();
    }

    void mark_complete(const TaskId& task_id, std::optional<TaskResult> result = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& task = finish_locked(task_id, TaskStatus::Completed);
        task.result = std::move(result);
    }

    void mark_failed(const TaskId& task_id, std::string error) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& task = finish_locked(task_id, TaskStatus::Failed);
        task.error = std::move(error);
    }

    /**
     * True iff every task reached Completed. Failed tasks keep the queue incomplete.
     */
    bool is_complete() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::all_of(tasks_.begin(), tasks_.end(), [](const QueuedTask& task) {
            return task.status == TaskStatus::Completed;
        });
    }

    bool has_failures() const {
        return count(TaskStatus::Failed) > 0;
    }

    size_t count(TaskStatus status) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(tasks_.begin(), tasks_.end(), [status](const QueuedTask& task) {
            return task.status == status;
        }));
    }

    StatusSummary get_status_summary() const {
        std::lock_guard<std::mutex> lock(mutex_);
        StatusSummary summary;
        summary.total = tasks_.size();
        for (const auto& task : tasks_) {
            switch (task.status) {
                case TaskStatus::Pending:
                    if (has_unresolved_locked(task)) {
                        ++summary.blocked;
                    } else {
                        ++summary.pending;
                    }
                    break;
                case TaskStatus::InProgress: ++summary.in_progress; break;
                case TaskStatus::Completed: ++summary.completed; break;
                case TaskStatus::Failed: ++summary.failed; break;
            }
        }
        return summary;
    }

    /**
     * Dependency ids of a task that name no registered task
     */
    std::vector<TaskId> unresolved_dependencies(const TaskId& task_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(task_id);
        if (it == index_.end()) {
            throw UnknownTaskError(task_id);
        }
        std::vector<TaskId> missing;
        for (const auto& dep : tasks_[it->second].dependencies) {
            if (index_.find(dep) == index_.end()) {
                missing.push_back(dep);
            }
        }
        return missing;
    }

    std::optional<QueuedTask> get_task(const TaskId& task_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = index_.find(task_id); it != index_.end()) {
            return tasks_[it->second];
        }
        return std::nullopt;
    }

    std::vector<QueuedTask> get_all_tasks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_;
    }

    bool contains(const TaskId& task_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.find(task_id) != index_.end();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

private:
    QueuedTask& find_locked(const TaskId& task_id) {
        auto it = index_.find(task_id);
        if (it == index_.end()) {
            throw UnknownTaskError(task_id);
        }
        return tasks_[it->second];
    }

    QueuedTask& finish_locked(const TaskId& task_id, TaskStatus target) {
        auto& task = find_locked(task_id);
        if (task.status != TaskStatus::InProgress) {
            throw InvalidTransitionError(task_id, to_string(task.status), to_string(target));
        }
        task.status = target;
        task.completed_at = Clock::now();
        return task;
    }

    bool is_ready_locked(const QueuedTask& task) const {
        if (task.status != TaskStatus::Pending) {
            return false;
        }
        for (const auto& dep : task.dependencies) {
            auto it = index_.find(dep);
            if (it == index_.end() || tasks_[it->second].status != TaskStatus::Completed) {
                return false;
            }
        }
        return true;
    }

    bool has_unresolved_locked(const QueuedTask& task) const {
        return std::any_of(task.dependencies.begin(), task.dependencies.end(), [this](const TaskId& dep) {
            return index_.find(dep) == index_.end();
        });
    }

    mutable std::mutex mutex_;
    std::vector<QueuedTask> tasks_;
    std::unordered_map<TaskId, size_t> index_;
};

} // namespace agent_weave
