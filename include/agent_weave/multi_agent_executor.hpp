#pragma once

#include "agent_pool.hpp"
#include "concurrency_limiter.hpp"
#include "config.hpp"
#include "dependency_graph.hpp"
#include "logging.hpp"
#include "performance_monitor.hpp"
#include "quality_monitor.hpp"
#include "task.hpp"
#include "task_queue.hpp"
#include "thread_pool.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace agent_weave {

/**
 * What the execute capability reports for one task
 */
struct ExecutionOutcome {
    bool success{false};
    TaskResult result;
    std::string error;
    std::optional<double> cost;

    static ExecutionOutcome ok(TaskResult result, std::optional<double> cost = std::nullopt) {
        return ExecutionOutcome{true, std::move(result), {}, cost};
    }

    static ExecutionOutcome failure(std::string error, std::optional<double> cost = std::nullopt) {
        return ExecutionOutcome{false, {}, std::move(error), cost};
    }
};

struct QualitySample {
    std::optional<double> coverage;
    std::optional<double> quality_score;
};

/**
 * Caller-supplied strategies. decompose and execute are required; probe is optional
 * and feeds coverage/quality into the convergence check after every iteration.
 */
struct Capabilities {
    using DecomposeFn = std::function<std::vector<SubtaskSpec>(const std::string& objective)>;
    using ExecuteFn = std::function<ExecutionOutcome(const TaskId& task_id,
                                                     const std::string& description,
                                                     const AgentInstance& agent)>;
    using ProbeFn = std::function<std::optional<QualitySample>(int iteration)>;

    DecomposeFn decompose;
    ExecuteFn execute;
    ProbeFn probe;
};

struct RunSummary {
    std::string objective;
    size_t tasks_total{0};
    size_t tasks_completed{0};
    size_t tasks_failed{0};
    int iterations{0};
    double duration_seconds{0.0};
    std::string status;        // "completed" | "incomplete"
    std::string stop_reason;   // "completed" | "deadlock" | "iteration_budget" | "converged"
    size_t loops_detected{0};
};

struct Progress {
    TaskQueue::StatusSummary queue;
    AgentPool::PoolStatus agent_pool;
    std::vector<QueuedTask> tasks_in_queue;
};

/**
 * Per-run state; nothing here outlives the run that created it
 */
struct RunContext {
    RunContext(std::vector<AgentDefinition> roster, QualityMonitor::Options quality)
        : pool(std::move(roster))
        , monitor(quality)
    {}

    TaskQueue queue;
    AgentPool pool;
    QualityMonitor monitor;
};

/**
 * Drives a decomposed objective to completion:
 * ready tasks are batched up to max_parallel, assigned to agents and executed
 * concurrently; the loop ends on completion, deadlock, budget exhaustion or,
 * if enabled, a convergence stop.
 */
class MultiAgentExecutor {
public:
    MultiAgentExecutor(Capabilities capabilities,
                       std::vector<AgentDefinition> roster,
                       ExecutorConfig config = {},
                       std::shared_ptr<PerformanceRecorder> recorder = std::make_shared<PerformanceMonitor>())
        : capabilities_(std::move(capabilities))
        , roster_(std::move(roster))
        , config_(std::move(config))
        , recorder_(std::move(recorder))
    {
        if (!capabilities_.decompose || !capabilities_.execute) {
            throw std::invalid_argument("Both decompose and execute capabilities are required");
        }
        if (config_.max_parallel == 0) {
            throw std::invalid_argument("max_parallel must be at least 1");
        }
        context_ = make_context();
    }

    MultiAgentExecutor(const MultiAgentExecutor&) = delete;
    MultiAgentExecutor& operator=(const MultiAgentExecutor&) = delete;

    RunSummary execute_project(const std::string& objective) {
        auto log = logger();
        auto started = Clock::now();
        auto context = make_context();
        {
            std::lock_guard<std::mutex> lock(context_mutex_);
            context_ = context;
        }

        SPDLOG_LOGGER_INFO(log, "Decomposing objective: {}", objective);
        for (const auto& subtask : capabilities_.decompose(objective)) {
            context->queue.add_task(subtask);
        }
        report_structure(*context);

        // limiter must outlive the workers that release it
        ConcurrencyLimiter limiter(config_.max_parallel);
        ThreadPool workers(worker_threads());

        RunSummary summary;
        summary.objective = objective;

        int iteration = 0;
        while (!context->queue.is_complete() && iteration < config_.max_iterations) {
            ++iteration;

            auto ready = context->queue.get_ready_tasks();
            if (ready.empty()) {
                if (context->queue.count(TaskStatus::InProgress) == 0) {
                    auto status = context->queue.get_status_summary();
                    SPDLOG_LOGGER_WARN(log, "Deadlock at iteration {}: nothing ready, {} pending, {} blocked, {} failed",
                                       iteration, status.pending, status.blocked, status.failed);
                    summary.stop_reason = "deadlock";
                    break;
                }
                continue;
            }

            if (ready.size() > config_.max_parallel) {
                ready.resize(config_.max_parallel);
            }

            auto batch = run_batch(*context, ready, workers, limiter, iteration);
            summary.loops_detected += batch.loops_detected;

            std::optional<QualitySample> sample;
            if (capabilities_.probe) {
                sample = capabilities_.probe(iteration);
            }
            context->monitor.record_iteration(iteration,
                                              sample ? sample->coverage : std::nullopt,
                                              sample ? sample->quality_score : std::nullopt,
                                              batch.completed);
            if (recorder_) {
                recorder_->record_iteration(IterationEvent{
                    iteration, batch.dispatched, batch.completed, batch.failed, batch.duration_seconds});
            }

            if (config_.honor_convergence && !context->queue.is_complete()) {
                auto decision = context->monitor.should_continue(iteration);
                if (!decision.should_continue) {
                    SPDLOG_LOGGER_INFO(log, "Stopping after iteration {}: {}", iteration, decision.reason);
                    summary.stop_reason = "converged";
                    break;
                }
            }
        }

        bool complete = context->queue.is_complete();
        if (summary.stop_reason.empty()) {
            summary.stop_reason = complete ? "completed" : "iteration_budget";
        }

        summary.tasks_total = context->queue.size();
        summary.tasks_completed = context->queue.count(TaskStatus::Completed);
        summary.tasks_failed = context->queue.count(TaskStatus::Failed);
        summary.iterations = iteration;
        summary.duration_seconds = std::chrono::duration<double>(Clock::now() - started).count();
        summary.status = complete ? "completed" : "incomplete";

        SPDLOG_LOGGER_INFO(log, "Project {} ({}): {}/{} completed, {} failed, {} iterations, {:.3f}s",
                           summary.status, summary.stop_reason, summary.tasks_completed, summary.tasks_total,
                           summary.tasks_failed, summary.iterations, summary.duration_seconds);
        return summary;
    }

    /**
     * Snapshot of the current (or most recent) run
     */
    Progress get_progress() const {
        auto context = current_context();
        Progress progress;
        progress.queue = context->queue.get_status_summary();
        progress.agent_pool = context->pool.get_pool_status();
        progress.tasks_in_queue = context->queue.get_all_tasks();
        return progress;
    }

    QualityMonitor::QualityMetrics quality_metrics() const {
        return current_context()->monitor.get_quality_metrics();
    }

    WorkflowDag workflow() const {
        return WorkflowDag(current_context()->queue.get_all_tasks());
    }

    /**
     * Threads started per run: max_parallel, capped by the roster size
     * (an empty roster runs under the fallback agent and is not capped)
     */
    size_t worker_threads() const noexcept {
        if (roster_.empty()) {
            return config_.max_parallel;
        }
        return std::min(config_.max_parallel, roster_.size());
    }

    std::shared_ptr<RunContext> current_context() const {
        std::lock_guard<std::mutex> lock(context_mutex_);
        return context_;
    }

    const ExecutorConfig& config() const noexcept { return config_; }
    std::shared_ptr<PerformanceRecorder> recorder() const { return recorder_; }

private:
    struct Attempt {
        ExecutionOutcome outcome;
        double duration_seconds{0.0};
    };

    struct Dispatch {
        TaskId task_id;
        std::string description;
        std::string agent_name;
        bool pooled{true};
        std::future<Attempt> attempt;
    };

    struct BatchResult {
        size_t dispatched{0};
        size_t completed{0};
        size_t failed{0};
        size_t loops_detected{0};
        double duration_seconds{0.0};
    };

    std::shared_ptr<RunContext> make_context() const {
        return std::make_shared<RunContext>(roster_, config_.quality);
    }

    void report_structure(const RunContext& context) const {
        auto log = logger();
        WorkflowDag dag(context.queue.get_all_tasks());
        for (const auto& [task_id, missing] : dag.unresolved_dependencies()) {
            for (const auto& dep : missing) {
                SPDLOG_LOGGER_WARN(log, "Task {} depends on unknown task {}; it can never become ready", task_id, dep);
            }
        }
        if (dag.has_cycles()) {
            SPDLOG_LOGGER_WARN(log, "Task graph contains a dependency cycle");
        }
        SPDLOG_LOGGER_INFO(log, "Registered {} tasks ({} dependency edges)", dag.task_count(), dag.edge_count());
    }

    /**
     * Reserve an agent for the task: best capability match first, then the first free
     * agent. An empty roster runs everything under the fallback agent name.
     */
    std::optional<AgentInstance> reserve_agent(RunContext& context, const QueuedTask& task) const {
        if (context.pool.empty()) {
            AgentInstance fallback;
            fallback.name = config_.fallback_agent;
            fallback.current_task = task.task_id;
            return fallback;
        }

        auto name = context.pool.find_best_agent(task.required_capabilities, config_.phase);
        if (!name) {
            auto available = context.pool.get_available_agents();
            for (const auto& agent : available) {
                if (agent.accepts_phase(config_.phase)) {
                    name = agent.name;
                    break;
                }
            }
            if (!name && !available.empty()) {
                name = available.front().name;
            }
        }
        if (!name) {
            return std::nullopt;
        }
        return context.pool.assign_task_to_agent(task.task_id, *name);
    }

    BatchResult run_batch(RunContext& context,
                          const std::vector<QueuedTask>& ready,
                          ThreadPool& workers,
                          ConcurrencyLimiter& limiter,
                          int iteration) {
        auto log = logger();
        auto started = Clock::now();
        BatchResult result;

        // All queue and pool mutation for the batch happens here, before dispatch
        std::vector<Dispatch> dispatches;
        dispatches.reserve(ready.size());
        for (const auto& task : ready) {
            auto agent = reserve_agent(context, task);
            if (!agent) {
                SPDLOG_LOGGER_DEBUG(log, "No free agent for task {}, deferring", task.task_id);
                continue;
            }
            context.queue.mark_in_progress(task.task_id, agent->name);

            limiter.acquire();
            SPDLOG_LOGGER_DEBUG(log, "Dispatching task {} to {}", task.task_id, agent->name);
            auto attempt = workers.submit(
                [this, &limiter, task_id = task.task_id, description = task.description, worker = *agent]() {
                    ConcurrencyLimiter::Permit permit(limiter, std::adopt_lock);
                    return run_attempt(task_id, description, worker);
                });
            dispatches.push_back(Dispatch{task.task_id, task.description, agent->name, !context.pool.empty(), std::move(attempt)});
        }
        result.dispatched = dispatches.size();
        SPDLOG_LOGGER_INFO(log, "Iteration {}: dispatched {} of {} ready tasks",
                           iteration, result.dispatched, ready.size());

        for (auto& dispatch : dispatches) {
            auto attempt = dispatch.attempt.get();
            const auto& outcome = attempt.outcome;

            if (outcome.success) {
                context.queue.mark_complete(dispatch.task_id, outcome.result);
                ++result.completed;
                // keyed by description: identical work producing identical output
                if (context.monitor.detect_loop(dispatch.description, outcome.result)) {
                    ++result.loops_detected;
                    SPDLOG_LOGGER_WARN(log, "Task {} repeated the output of an earlier '{}' task",
                                       dispatch.task_id, dispatch.description);
                }
            } else {
                context.queue.mark_failed(dispatch.task_id, outcome.error);
                ++result.failed;
                SPDLOG_LOGGER_WARN(log, "Task {} failed on {}: {}", dispatch.task_id, dispatch.agent_name, outcome.error);
            }

            if (dispatch.pooled) {
                context.pool.mark_task_complete(dispatch.agent_name, outcome.success);
            }
            if (recorder_) {
                recorder_->record_agent_performance(AgentPerformanceEvent{
                    dispatch.agent_name, dispatch.task_id, outcome.success, config_.phase,
                    attempt.duration_seconds, outcome.cost});
            }
        }

        result.duration_seconds = std::chrono::duration<double>(Clock::now() - started).count();
        return result;
    }

    /**
     * Runs on a pool thread; touches no shared run state
     */
    Attempt run_attempt(const TaskId& task_id, const std::string& description, const AgentInstance& agent) const {
        auto started = Clock::now();
        Attempt attempt;
        try {
            attempt.outcome = capabilities_.execute(task_id, description, agent);
        } catch (const std::exception& e) {
            attempt.outcome = ExecutionOutcome::failure(e.what());
        } catch (...) {
            attempt.outcome = ExecutionOutcome::failure("unknown exception");
        }
        attempt.duration_seconds = std::chrono::duration<double>(Clock::now() - started).count();
        return attempt;
    }

    Capabilities capabilities_;
    std::vector<AgentDefinition> roster_;
    ExecutorConfig config_;
    std::shared_ptr<PerformanceRecorder> recorder_;

    mutable std::mutex context_mutex_;
    std::shared_ptr<RunContext> context_;
};

} // namespace agent_weave
