#include "agent_weave/agent_weave.hpp"
#include "agent_weave/test_framework.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace agent_weave;
using namespace agent_weave::testing;

namespace {

Capabilities::DecomposeFn fixed_plan(std::vector<SubtaskSpec> plan) {
    return [plan](const std::string&) { return plan; };
}

ExecutionOutcome echo(const TaskId& task_id, const std::string&, const AgentInstance&) {
    return ExecutionOutcome::ok("output of " + task_id);
}

std::vector<SubtaskSpec> independent_tasks(int count) {
    std::vector<SubtaskSpec> plan;
    for (int i = 0; i < count; ++i) {
        plan.push_back({"task" + std::to_string(i), "independent work", {}, {}});
    }
    return plan;
}

std::vector<SubtaskSpec> chain(int count) {
    std::vector<SubtaskSpec> plan;
    for (int i = 0; i < count; ++i) {
        std::vector<TaskId> deps;
        if (i > 0) {
            deps.push_back("step" + std::to_string(i - 1));
        }
        plan.push_back({"step" + std::to_string(i), "chained work", deps, {}});
    }
    return plan;
}

std::vector<AgentDefinition> roster_of(int count) {
    std::vector<AgentDefinition> roster;
    for (int i = 0; i < count; ++i) {
        AgentDefinition definition;
        definition.name = "agent" + std::to_string(i);
        definition.model = "test-model";
        definition.capabilities = {"general"};
        roster.push_back(std::move(definition));
    }
    return roster;
}

ExecutorConfig limits(size_t max_parallel, int max_iterations = 10) {
    ExecutorConfig config;
    config.max_parallel = max_parallel;
    config.max_iterations = max_iterations;
    return config;
}

class CountingRecorder : public PerformanceRecorder {
public:
    void record_agent_performance(const AgentPerformanceEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events.push_back(event);
    }

    void record_iteration(const IterationEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        iterations.push_back(event);
    }

    std::vector<AgentPerformanceEvent> events;
    std::vector<IterationEvent> iterations;

private:
    std::mutex mutex_;
};

} // namespace

int main(int argc, char** argv) {
    set_log_level("warn");
    TestSuite suite;

    TEST(RunsIndependentTasksInBatches) {
        MultiAgentExecutor executor({fixed_plan(independent_tasks(5)), echo, nullptr}, roster_of(2), limits(2));
        auto summary = executor.execute_project("five independent tasks");

        ASSERT_EQ(summary.status, "completed");
        ASSERT_EQ(summary.stop_reason, "completed");
        ASSERT_EQ(summary.tasks_total, 5u);
        ASSERT_EQ(summary.tasks_completed, 5u);
        ASSERT_EQ(summary.tasks_failed, 0u);
        ASSERT_EQ(summary.iterations, 3);
        ASSERT_EQ(summary.loops_detected, 0u);
        ASSERT_EQ(summary.objective, "five independent tasks");
    });

    TEST(NeverExceedsMaxParallel) {
        std::atomic<int> in_flight{0};
        std::atomic<int> peak{0};
        auto execute = [&in_flight, &peak](const TaskId& task_id, const std::string&, const AgentInstance&) {
            auto now = in_flight.fetch_add(1) + 1;
            auto seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            in_flight.fetch_sub(1);
            return ExecutionOutcome::ok(task_id);
        };

        MultiAgentExecutor executor({fixed_plan(independent_tasks(9)), execute, nullptr}, roster_of(9), limits(3));
        auto summary = executor.execute_project("bounded");

        ASSERT_EQ(summary.tasks_completed, 9u);
        ASSERT_EQ(summary.iterations, 3);
        ASSERT_TRUE(peak.load() <= 3);
        ASSERT_TRUE(peak.load() >= 1);
    });

    TEST(HonorsDependencyOrder) {
        std::mutex mutex;
        std::vector<TaskId> finished;
        auto execute = [&mutex, &finished](const TaskId& task_id, const std::string&, const AgentInstance&) {
            std::lock_guard<std::mutex> lock(mutex);
            finished.push_back(task_id);
            return ExecutionOutcome::ok(task_id);
        };
        std::vector<SubtaskSpec> plan = {
            {"D", "join", {"B", "C"}, {}},
            {"B", "left", {"A"}, {}},
            {"C", "right", {"A"}, {}},
            {"A", "root", {}, {}},
        };

        MultiAgentExecutor executor({fixed_plan(plan), execute, nullptr}, roster_of(4), limits(4));
        auto summary = executor.execute_project("diamond");

        ASSERT_EQ(summary.status, "completed");
        ASSERT_EQ(summary.iterations, 3);
        ASSERT_EQ(finished.size(), 4u);
        ASSERT_EQ(finished.front(), "A");
        ASSERT_EQ(finished.back(), "D");
    });

    TEST(DetectsDeadlock) {
        std::vector<SubtaskSpec> plan = {
            {"A", "needs B", {"B"}, {}},
            {"B", "needs A", {"A"}, {}},
        };
        MultiAgentExecutor executor({fixed_plan(plan), echo, nullptr}, roster_of(2), limits(2));
        auto summary = executor.execute_project("cycle");

        ASSERT_EQ(summary.status, "incomplete");
        ASSERT_EQ(summary.stop_reason, "deadlock");
        ASSERT_EQ(summary.iterations, 1);
        ASSERT_EQ(summary.tasks_completed, 0u);
    });

    TEST(MissingDependencyEndsInDeadlock) {
        std::vector<SubtaskSpec> plan = {
            {"build", "compile", {}, {}},
            {"ship", "release", {"biuld"}, {}},
        };
        MultiAgentExecutor executor({fixed_plan(plan), echo, nullptr}, roster_of(1), limits(2));
        auto summary = executor.execute_project("typo");

        ASSERT_EQ(summary.status, "incomplete");
        ASSERT_EQ(summary.stop_reason, "deadlock");
        ASSERT_EQ(summary.tasks_completed, 1u);
        ASSERT_EQ(executor.get_progress().queue.blocked, 1u);
    });

    TEST(FailureDoesNotHaltIndependentBranches) {
        std::vector<SubtaskSpec> plan = {
            {"flaky", "breaks", {}, {}},
            {"after_flaky", "never runs", {"flaky"}, {}},
            {"solid", "works", {}, {}},
            {"after_solid", "runs", {"solid"}, {}},
        };
        auto execute = [](const TaskId& task_id, const std::string&, const AgentInstance&) {
            if (task_id == "flaky") {
                return ExecutionOutcome::failure("model refused");
            }
            return ExecutionOutcome::ok(task_id);
        };

        MultiAgentExecutor executor({fixed_plan(plan), execute, nullptr}, roster_of(2), limits(2));
        auto summary = executor.execute_project("partial");

        ASSERT_EQ(summary.status, "incomplete");
        ASSERT_EQ(summary.stop_reason, "deadlock");
        ASSERT_EQ(summary.tasks_completed, 2u);
        ASSERT_EQ(summary.tasks_failed, 1u);

        auto flaky = executor.current_context()->queue.get_task("flaky");
        ASSERT_EQ(*flaky->error, "model refused");
        auto blocked = executor.current_context()->queue.get_task("after_flaky");
        ASSERT_EQ(static_cast<int>(blocked->status), static_cast<int>(TaskStatus::Pending));
    });

    TEST(ExecuteExceptionsBecomeFailures) {
        auto execute = [](const TaskId& task_id, const std::string&, const AgentInstance&) -> ExecutionOutcome {
            if (task_id == "task1") {
                throw std::runtime_error("connection reset");
            }
            return ExecutionOutcome::ok(task_id);
        };
        MultiAgentExecutor executor({fixed_plan(independent_tasks(3)), execute, nullptr}, roster_of(3), limits(3));
        auto summary = executor.execute_project("throwing");

        ASSERT_EQ(summary.tasks_completed, 2u);
        ASSERT_EQ(summary.tasks_failed, 1u);
        ASSERT_EQ(summary.status, "incomplete");
        ASSERT_EQ(summary.stop_reason, "deadlock");
        ASSERT_EQ(*executor.current_context()->queue.get_task("task1")->error, "connection reset");

        auto pool = executor.get_progress().agent_pool;
        ASSERT_EQ(pool.busy_agents, 0u);
    });

    TEST(NonStandardThrowsBecomeFailures) {
        auto execute = [](const TaskId& task_id, const std::string&, const AgentInstance&) -> ExecutionOutcome {
            if (task_id == "a") {
                throw 42;
            }
            return ExecutionOutcome::ok(task_id);
        };
        std::vector<SubtaskSpec> plan = {
            {"a", "throws an int", {}, {}},
            {"b", "works", {}, {}},
        };
        MultiAgentExecutor executor({fixed_plan(plan), execute, nullptr}, roster_of(2), limits(2));
        auto summary = executor.execute_project("odd throw");

        ASSERT_EQ(summary.tasks_failed, 1u);
        ASSERT_EQ(summary.tasks_completed, 1u);
        ASSERT_EQ(*executor.current_context()->queue.get_task("a")->error, "unknown exception");

        auto progress = executor.get_progress();
        ASSERT_EQ(progress.queue.in_progress, 0u);
        ASSERT_EQ(progress.agent_pool.busy_agents, 0u);
    });

    TEST(CountsRepeatedOutputsForSameWork) {
        auto same = [](const TaskId&, const std::string&, const AgentInstance&) {
            return ExecutionOutcome::ok("IDENTICAL");
        };
        MultiAgentExecutor executor({fixed_plan(independent_tasks(6)), same, nullptr}, roster_of(2), limits(2));
        auto summary = executor.execute_project("stuck agent");

        ASSERT_EQ(summary.tasks_completed, 6u);
        ASSERT_EQ(summary.loops_detected, 5u);
    });

    TEST(SameOutputForDifferentWorkIsNotARepeat) {
        auto same = [](const TaskId&, const std::string&, const AgentInstance&) {
            return ExecutionOutcome::ok("IDENTICAL");
        };
        std::vector<SubtaskSpec> plan = {
            {"lint", "run the linter", {}, {}},
            {"fmt", "run the formatter", {}, {}},
        };
        MultiAgentExecutor executor({fixed_plan(plan), same, nullptr}, roster_of(2), limits(2));
        auto summary = executor.execute_project("distinct work");

        ASSERT_EQ(summary.tasks_completed, 2u);
        ASSERT_EQ(summary.loops_detected, 0u);
    });

    TEST(WorkerThreadsCappedByRoster) {
        MultiAgentExecutor small_roster({fixed_plan({}), echo, nullptr}, roster_of(2), limits(8));
        ASSERT_EQ(small_roster.worker_threads(), 2u);

        MultiAgentExecutor large_roster({fixed_plan({}), echo, nullptr}, roster_of(10), limits(3));
        ASSERT_EQ(large_roster.worker_threads(), 3u);

        MultiAgentExecutor no_roster({fixed_plan({}), echo, nullptr}, {}, limits(4));
        ASSERT_EQ(no_roster.worker_threads(), 4u);
    });

    TEST(StopsAtIterationBudget) {
        MultiAgentExecutor executor({fixed_plan(chain(5)), echo, nullptr}, roster_of(1), limits(2, 2));
        auto summary = executor.execute_project("long chain");

        ASSERT_EQ(summary.status, "incomplete");
        ASSERT_EQ(summary.stop_reason, "iteration_budget");
        ASSERT_EQ(summary.iterations, 2);
        ASSERT_EQ(summary.tasks_completed, 2u);
    });

    TEST(StopsWhenCoverageConverges) {
        auto probe = [](int) { return std::optional<QualitySample>(QualitySample{50.0, 0.5}); };
        auto config = limits(1, 10);
        config.honor_convergence = true;

        MultiAgentExecutor executor({fixed_plan(chain(8)), echo, probe}, roster_of(1), config);
        auto summary = executor.execute_project("plateau");

        ASSERT_EQ(summary.stop_reason, "converged");
        ASSERT_EQ(summary.status, "incomplete");
        ASSERT_EQ(summary.iterations, 3);
        ASSERT_EQ(summary.tasks_completed, 3u);

        auto metrics = executor.quality_metrics();
        ASSERT_EQ(metrics.iterations, 3u);
        ASSERT_EQ(metrics.coverage_trend, "stable");
    });

    TEST(ConvergenceIsAdvisoryByDefault) {
        auto probe = [](int) { return std::optional<QualitySample>(QualitySample{50.0, std::nullopt}); };
        MultiAgentExecutor executor({fixed_plan(chain(6)), echo, probe}, roster_of(1), limits(1));
        auto summary = executor.execute_project("plateau ignored");

        ASSERT_EQ(summary.stop_reason, "completed");
        ASSERT_EQ(summary.tasks_completed, 6u);
        ASSERT_EQ(executor.quality_metrics().total_tasks_completed, 6u);
    });

    TEST(EmptyRosterUsesFallbackAgent) {
        MultiAgentExecutor executor({fixed_plan(chain(2)), echo, nullptr}, {}, limits(2));
        auto summary = executor.execute_project("no agents");

        ASSERT_EQ(summary.status, "completed");
        for (const auto& task : executor.get_progress().tasks_in_queue) {
            ASSERT_EQ(*task.assigned_agent, "supervisor");
        }
        ASSERT_EQ(executor.get_progress().agent_pool.total_agents, 0u);
    });

    TEST(RoutesTasksByCapability) {
        std::vector<AgentDefinition> roster(2);
        roster[0].name = "coder";
        roster[0].capabilities = {"python", "testing"};
        roster[1].name = "writer";
        roster[1].capabilities = {"documentation"};

        std::vector<SubtaskSpec> plan = {
            {"docs", "write the guide", {}, {"documentation"}},
            {"impl", "write the code", {}, {"python"}},
        };

        std::mutex mutex;
        std::map<TaskId, std::string> assignments;
        auto execute = [&mutex, &assignments](const TaskId& task_id, const std::string&, const AgentInstance& agent) {
            std::lock_guard<std::mutex> lock(mutex);
            assignments[task_id] = agent.name;
            return ExecutionOutcome::ok(task_id);
        };

        MultiAgentExecutor executor({fixed_plan(plan), execute, nullptr}, roster, limits(2));
        auto summary = executor.execute_project("routing");

        ASSERT_EQ(summary.iterations, 1);
        ASSERT_EQ(assignments["docs"], "writer");
        ASSERT_EQ(assignments["impl"], "coder");
    });

    TEST(ReportsToRecorder) {
        auto recorder = std::make_shared<CountingRecorder>();
        auto execute = [](const TaskId& task_id, const std::string&, const AgentInstance&) {
            return ExecutionOutcome::ok(task_id, 0.25);
        };
        MultiAgentExecutor executor({fixed_plan(independent_tasks(3)), execute, nullptr}, roster_of(2), limits(2),
                                    recorder);
        executor.execute_project("recorded");

        ASSERT_EQ(recorder->events.size(), 3u);
        ASSERT_EQ(recorder->iterations.size(), 2u);
        ASSERT_EQ(recorder->iterations[0].tasks_dispatched, 2u);
        ASSERT_EQ(recorder->iterations[1].tasks_completed, 1u);
        ASSERT_EQ(recorder->events[0].phase, "execution");
        ASSERT_NEAR(*recorder->events[0].cost, 0.25, 1e-9);
    });

    TEST(DefaultRecorderAggregatesPerAgent) {
        MultiAgentExecutor executor({fixed_plan(independent_tasks(4)), echo, nullptr}, roster_of(2), limits(2));
        executor.execute_project("aggregated");

        auto monitor = std::dynamic_pointer_cast<PerformanceMonitor>(executor.recorder());
        ASSERT_TRUE(monitor != nullptr);
        auto snapshot = monitor->snapshot();
        ASSERT_EQ(snapshot.tasks_recorded, 4u);
        ASSERT_EQ(snapshot.iterations, 2u);
        ASSERT_EQ(snapshot.agents.size(), 2u);
    });

    TEST(EachRunGetsFreshState) {
        MultiAgentExecutor executor({fixed_plan(independent_tasks(2)), echo, nullptr}, roster_of(2), limits(2));
        auto first = executor.execute_project("first");
        auto first_context = executor.current_context();
        auto second = executor.execute_project("second");

        ASSERT_EQ(first.status, "completed");
        ASSERT_EQ(second.status, "completed");
        ASSERT_EQ(second.tasks_total, 2u);
        ASSERT_TRUE(first_context != executor.current_context());
        ASSERT_EQ(executor.get_progress().queue.completed, 2u);
        ASSERT_EQ(executor.quality_metrics().iterations, 1u);
    });

    TEST(ProgressAndWorkflowSnapshots) {
        MultiAgentExecutor executor({fixed_plan(chain(3)), echo, nullptr}, roster_of(1), limits(1));
        auto before = executor.get_progress();
        ASSERT_EQ(before.queue.total, 0u);
        ASSERT_EQ(before.agent_pool.total_agents, 1u);

        auto summary = executor.execute_project("snapshot");
        auto progress = executor.get_progress();
        ASSERT_EQ(progress.queue.completed, 3u);
        ASSERT_EQ(progress.tasks_in_queue.size(), 3u);
        ASSERT_EQ(*progress.tasks_in_queue[1].result, "output of step1");

        auto dag = executor.workflow();
        ASSERT_TRUE((dag.critical_path() == std::vector<TaskId>{"step0", "step1", "step2"}));

        auto json = ProgressExporter::to_json(summary);
        ASSERT_TRUE(json.find("\"stop_reason\": \"completed\"") != std::string::npos);
        auto progress_json = ProgressExporter::to_json(progress);
        ASSERT_TRUE(progress_json.find("\"task_id\": \"step2\"") != std::string::npos);
    });

    TEST(RejectsIncompleteCapabilities) {
        ASSERT_THROWS(MultiAgentExecutor({fixed_plan({}), nullptr, nullptr}, {}), std::invalid_argument);
        ASSERT_THROWS(MultiAgentExecutor({nullptr, echo, nullptr}, {}), std::invalid_argument);
        ASSERT_THROWS(MultiAgentExecutor({fixed_plan({}), echo, nullptr}, {}, limits(0)), std::invalid_argument);
    });

    TEST(EmptyPlanCompletesImmediately) {
        MultiAgentExecutor executor({fixed_plan({}), echo, nullptr}, roster_of(1));
        auto summary = executor.execute_project("nothing to do");
        ASSERT_EQ(summary.status, "completed");
        ASSERT_EQ(summary.iterations, 0);
        ASSERT_EQ(summary.tasks_total, 0u);
    });

    return suite.run_all(argc, argv);
}
