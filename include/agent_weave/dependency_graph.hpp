#pragma once

#include "task.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <map>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace agent_weave {

/**
 * Static view over a snapshot of queued tasks
 * Supports level-wise topological ordering, cycle and dangling-id detection,
 * and rendering to Mermaid / Graphviz DOT
 */
class WorkflowDag {
public:
    explicit WorkflowDag(std::vector<QueuedTask> tasks)
        : tasks_(std::move(tasks))
    {
        for (size_t i = 0; i < tasks_.size(); ++i) {
            index_.emplace(tasks_[i].task_id, i);
        }
        dependents_.resize(tasks_.size());
        for (size_t i = 0; i < tasks_.size(); ++i) {
            for (const auto& dep : tasks_[i].dependencies) {
                auto it = index_.find(dep);
                if (it == index_.end()) {
                    continue;
                }
                edges_.emplace_back(it->second, i);
                dependents_[it->second].push_back(i);
            }
        }
    }

    /**
     * Batches of task ids that could run together; stops early on a cycle
     */
    std::vector<std::vector<TaskId>> execution_order() const {
        std::vector<size_t> indegree(tasks_.size(), 0);
        for (const auto& [source, target] : edges_) {
            ++indegree[target];
        }

        std::vector<std::vector<TaskId>> batches;
        std::vector<bool> placed(tasks_.size(), false);
        size_t remaining = tasks_.size();

        while (remaining > 0) {
            std::vector<size_t> batch;
            for (size_t i = 0; i < tasks_.size(); ++i) {
                if (!placed[i] && indegree[i] == 0) {
                    batch.push_back(i);
                }
            }
            if (batch.empty()) {
                break;
            }

            std::vector<TaskId> ids;
            ids.reserve(batch.size());
            for (auto node : batch) {
                placed[node] = true;
                --remaining;
                ids.push_back(tasks_[node].task_id);
                for (auto dependent : dependents_[node]) {
                    --indegree[dependent];
                }
            }
            batches.push_back(std::move(ids));
        }
        return batches;
    }

    bool has_cycles() const {
        size_t placed = 0;
        for (const auto& batch : execution_order()) {
            placed += batch.size();
        }
        return placed != tasks_.size();
    }

    /**
     * Task id -> dependency ids that name no task in the snapshot
     */
    std::map<TaskId, std::vector<TaskId>> unresolved_dependencies() const {
        std::map<TaskId, std::vector<TaskId>> missing;
        for (const auto& task : tasks_) {
            for (const auto& dep : task.dependencies) {
                if (index_.find(dep) == index_.end()) {
                    missing[task.task_id].push_back(dep);
                }
            }
        }
        return missing;
    }

    std::vector<TaskId> dependents(const TaskId& task_id) const {
        std::vector<TaskId> result;
        if (auto it = index_.find(task_id); it != index_.end()) {
            for (auto dependent : dependents_[it->second]) {
                result.push_back(tasks_[dependent].task_id);
            }
        }
        return result;
    }

    /**
     * Longest dependency chain by node count; earlier-inserted roots win ties
     */
    std::vector<TaskId> critical_path() const {
        auto order = execution_order();
        if (order.empty()) {
            return {};
        }

        // longest[i] = nodes on the longest chain starting at i
        std::vector<size_t> longest(tasks_.size(), 1);
        std::vector<size_t> next(tasks_.size(), tasks_.size());
        for (auto batch = order.rbegin(); batch != order.rend(); ++batch) {
            for (const auto& id : *batch) {
                auto node = index_.at(id);
                for (auto dependent : dependents_[node]) {
                    if (longest[dependent] + 1 > longest[node]) {
                        longest[node] = longest[dependent] + 1;
                        next[node] = dependent;
                    }
                }
            }
        }

        size_t start = index_.at(order.front().front());
        for (const auto& id : order.front()) {
            auto node = index_.at(id);
            if (longest[node] > longest[start]) {
                start = node;
            }
        }

        std::vector<TaskId> path;
        for (auto node = start; node < tasks_.size(); node = next[node]) {
            path.push_back(tasks_[node].task_id);
        }
        return path;
    }

    std::string to_mermaid() const {
        std::ostringstream oss;
        oss << "graph TD\n";
        for (const auto& task : tasks_) {
            oss << "    " << mermaid_id(task.task_id) << "[\"" << mermaid_label(task.description) << "\"]";
            switch (task.status) {
                case TaskStatus::Completed: oss << ":::completed"; break;
                case TaskStatus::Failed: oss << ":::failed"; break;
                case TaskStatus::InProgress: oss << ":::inprogress"; break;
                case TaskStatus::Pending: break;
            }
            oss << "\n";
        }
        for (const auto& [source, target] : edges_) {
            oss << "    " << mermaid_id(tasks_[source].task_id) << " --> "
                << mermaid_id(tasks_[target].task_id) << "\n";
        }
        oss << "\n";
        oss << "    classDef completed fill:#90EE90,stroke:#228B22\n";
        oss << "    classDef failed fill:#FFB6C1,stroke:#DC143C\n";
        oss << "    classDef inprogress fill:#87CEEB,stroke:#4169E1";
        return oss.str();
    }

    std::string to_dot() const {
        std::ostringstream oss;
        oss << "digraph workflow {\n";
        oss << "    rankdir=TB;\n";
        oss << "    node [shape=box, style=filled];\n";
        for (const auto& task : tasks_) {
            const char* color = "white";
            switch (task.status) {
                case TaskStatus::Completed: color = "lightgreen"; break;
                case TaskStatus::Failed: color = "lightcoral"; break;
                case TaskStatus::InProgress: color = "lightblue"; break;
                case TaskStatus::Pending: break;
            }
            oss << "    \"" << dot_escape(task.task_id) << "\" [label=\"" << dot_label(task.description)
                << "\", fillcolor=" << color << "];\n";
        }
        for (const auto& [source, target] : edges_) {
            oss << "    \"" << dot_escape(tasks_[source].task_id) << "\" -> \""
                << dot_escape(tasks_[target].task_id) << "\";\n";
        }
        oss << "}";
        return oss.str();
    }

    size_t task_count() const { return tasks_.size(); }
    size_t edge_count() const { return edges_.size(); }

private:
    static constexpr size_t kLabelLimit = 50;

    // Mermaid node ids only allow [A-Za-z0-9_]
    static std::string mermaid_id(std::string id) {
        for (auto& c : id) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
                c = '_';
            }
        }
        return id;
    }

    static std::string mermaid_label(const std::string& description) {
        auto label = description.substr(0, kLabelLimit);
        std::replace(label.begin(), label.end(), '"', '\'');
        return label;
    }

    static std::string dot_label(const std::string& description) {
        return dot_escape(description.substr(0, kLabelLimit));
    }

    static std::string dot_escape(const std::string& text) {
        std::string escaped;
        for (char c : text) {
            if (c == '"' || c == '\\') {
                escaped += '\\';
            }
            escaped += c;
        }
        return escaped;
    }

    std::vector<QueuedTask> tasks_;
    std::unordered_map<TaskId, size_t> index_;
    std::vector<std::pair<size_t, size_t>> edges_;   // dependency -> dependent
    std::vector<std::vector<size_t>> dependents_;
};

} // namespace agent_weave
