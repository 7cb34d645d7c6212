#pragma once

#include "errors.hpp"
#include "task.hpp"
#include <algorithm>
#include <any>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace agent_weave {

/**
 * Static roster entry for one worker
 */
struct AgentDefinition {
    std::string name;
    std::string model;
    std::vector<std::string> capabilities;
    std::vector<std::string> phase_affinity;   // empty = eligible for every phase
    std::any handle;                           // opaque, handed to the execute capability
};

struct AgentInstance {
    std::string name;
    std::string model;
    std::vector<std::string> capabilities;
    std::vector<std::string> phase_affinity;
    std::any handle;
    std::optional<TaskId> current_task;
    uint64_t tasks_completed{0};
    uint64_t tasks_failed{0};

    bool is_available() const noexcept { return !current_task.has_value(); }

    double success_ratio() const noexcept {
        return static_cast<double>(tasks_completed) /
               static_cast<double>(tasks_completed + tasks_failed + 1);
    }

    bool accepts_phase(const std::string& phase) const {
        return phase_affinity.empty() ||
               std::find(phase_affinity.begin(), phase_affinity.end(), phase) != phase_affinity.end();
    }

    size_t capability_overlap(const std::vector<std::string>& required) const {
        size_t overlap = 0;
        for (const auto& capability : required) {
            if (std::find(capabilities.begin(), capabilities.end(), capability) != capabilities.end()) {
                ++overlap;
            }
        }
        return overlap;
    }
};

/**
 * Fixed roster of workers with availability tracking and
 * capability-aware, performance-weighted selection
 */
class AgentPool {
public:
    struct PoolStatus {
        size_t total_agents{0};
        size_t available_agents{0};
        size_t busy_agents{0};
    };

    AgentPool() = default;

    explicit AgentPool(std::vector<AgentDefinition> roster) {
        agents_.reserve(roster.size());
        for (auto& definition : roster) {
            if (index_.find(definition.name) != index_.end()) {
                throw std::invalid_argument("Duplicate agent name in roster: " + definition.name);
            }
            AgentInstance instance;
            instance.name = std::move(definition.name);
            instance.model = std::move(definition.model);
            instance.capabilities = std::move(definition.capabilities);
            instance.phase_affinity = std::move(definition.phase_affinity);
            instance.handle = std::move(definition.handle);
            index_.emplace(instance.name, agents_.size());
            agents_.push_back(std::move(instance));
        }
    }

    AgentPool(const AgentPool&) = delete;
    AgentPool& operator=(const AgentPool&) = delete;

    std::vector<AgentInstance> get_available_agents() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<AgentInstance> available;
        for (const auto& agent : agents_) {
            if (agent.is_available()) {
                available.push_back(agent);
            }
        }
        return available;
    }

    AgentInstance assign_task_to_agent(const TaskId& task_id, const std::string& agent_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& agent = find_locked(agent_name);
        if (!agent.is_available()) {
            throw AgentBusyError(agent_name, *agent.current_task);
        }
        agent.current_task = task_id;
        return agent;
    }

    /**
     * Release the agent's assignment and record the outcome
     */
    void mark_task_complete(const std::string& agent_name, bool success) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& agent = find_locked(agent_name);
        agent.current_task.reset();
        if (success) {
            ++agent.tasks_completed;
        } else {
            ++agent.tasks_failed;
        }
    }

    /**
     * Pick the available agent with the highest (capability overlap, success ratio).
     * Ties go to the agent declared first. Agents with no overlap are never chosen.
     */
    std::optional<std::string> find_best_agent(const std::vector<std::string>& required_capabilities,
                                               const std::optional<std::string>& phase = std::nullopt) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const AgentInstance* best = nullptr;
        size_t best_overlap = 0;
        double best_ratio = 0.0;

        for (const auto& agent : agents_) {
            if (!agent.is_available()) {
                continue;
            }
            if (phase && !agent.accepts_phase(*phase)) {
                continue;
            }
            auto overlap = agent.capability_overlap(required_capabilities);
            if (overlap == 0) {
                continue;
            }
            auto ratio = agent.success_ratio();
            if (!best || overlap > best_overlap || (overlap == best_overlap && ratio > best_ratio)) {
                best = &agent;
                best_overlap = overlap;
                best_ratio = ratio;
            }
        }

        if (!best) {
            return std::nullopt;
        }
        return best->name;
    }

    PoolStatus get_pool_status() const {
        std::lock_guard<std::mutex> lock(mutex_);
        PoolStatus status;
        status.total_agents = agents_.size();
        for (const auto& agent : agents_) {
            if (agent.is_available()) {
                ++status.available_agents;
            } else {
                ++status.busy_agents;
            }
        }
        return status;
    }

    std::optional<AgentInstance> get_agent(const std::string& agent_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = index_.find(agent_name); it != index_.end()) {
            return agents_[it->second];
        }
        return std::nullopt;
    }

    std::vector<AgentInstance> agents() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return agents_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return agents_.size();
    }

    bool empty() const { return size() == 0; }

private:
    AgentInstance& find_locked(const std::string& agent_name) {
        auto it = index_.find(agent_name);
        if (it == index_.end()) {
            throw UnknownAgentError(agent_name);
        }
        return agents_[it->second];
    }

    mutable std::mutex mutex_;
    std::vector<AgentInstance> agents_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace agent_weave
