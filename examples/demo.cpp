#include "agent_weave/agent_weave.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

using namespace agent_weave;

namespace {

std::vector<SubtaskSpec> plan_web_service(const std::string& objective) {
    return {
        {"design", "Design the API for: " + objective, {}, {"architecture"}},
        {"models", "Implement data models", {"design"}, {"python"}},
        {"routes", "Implement HTTP routes", {"design"}, {"python"}},
        {"tests", "Write integration tests", {"models", "routes"}, {"testing"}},
        {"docs", "Write the user guide", {"design"}, {"documentation"}},
        {"release", "Tag and publish", {"tests", "docs"}, {}},
    };
}

std::vector<AgentDefinition> default_roster() {
    std::vector<AgentDefinition> roster(3);
    roster[0].name = "architect";
    roster[0].model = "large";
    roster[0].capabilities = {"architecture", "documentation"};
    roster[1].name = "coder";
    roster[1].model = "medium";
    roster[1].capabilities = {"python", "testing"};
    roster[2].name = "tester";
    roster[2].model = "small";
    roster[2].capabilities = {"testing"};
    return roster;
}

} // namespace

int main(int argc, char** argv) {
    std::cout << "=== AgentWeave Demo ===\n\n";

    ExecutorConfig config;
    std::vector<AgentDefinition> roster = default_roster();
    if (argc > 1) {
        auto file_config = Config::load_from_file(argv[1]);
        config = ExecutorConfig::from_config(*file_config);
        auto configured = load_roster(*file_config);
        if (!configured.empty()) {
            roster = std::move(configured);
        }
    }

    Capabilities capabilities;
    capabilities.decompose = plan_web_service;
    capabilities.execute = [](const TaskId& task_id, const std::string& description, const AgentInstance& agent) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return ExecutionOutcome::ok(agent.name + " finished '" + description + "' (" + task_id + ")", 0.002);
    };
    capabilities.probe = [](int iteration) {
        return std::optional<QualitySample>(QualitySample{40.0 + 12.5 * iteration, 0.6 + 0.05 * iteration});
    };

    auto monitor = std::make_shared<PerformanceMonitor>();
    MultiAgentExecutor executor(capabilities, roster, config, monitor);

    std::cout << "1. Running project\n";
    std::cout << "------------------\n";
    auto summary = executor.execute_project("a small inventory web service");
    std::cout << ProgressExporter::to_json(summary) << "\n\n";

    std::cout << "2. Task graph\n";
    std::cout << "-------------\n";
    auto dag = executor.workflow();
    std::cout << dag.to_mermaid() << "\n\n";
    std::cout << "Critical path:";
    for (const auto& id : dag.critical_path()) {
        std::cout << " " << id;
    }
    std::cout << "\n\n";

    std::cout << "3. Progress\n";
    std::cout << "-----------\n";
    std::cout << ProgressExporter::to_json(executor.get_progress()) << "\n\n";

    std::cout << "4. Quality\n";
    std::cout << "----------\n";
    std::cout << ProgressExporter::to_json(executor.quality_metrics()) << "\n\n";

    std::cout << "5. Agent performance\n";
    std::cout << "--------------------\n";
    std::cout << ProgressExporter::to_csv(monitor->snapshot()) << "\n";

    std::cout << "=== Demo Complete ===\n";
    return summary.status == "completed" ? 0 : 1;
}
