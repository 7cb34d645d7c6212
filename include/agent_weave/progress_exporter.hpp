#pragma once

#include "multi_agent_executor.hpp"
#include "performance_monitor.hpp"
#include "quality_monitor.hpp"
#include <cstdio>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace agent_weave {

/**
 * Renders run state for display and for external session stores
 */
class ProgressExporter {
public:
    static std::string to_json(const RunSummary& summary) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3);
        oss << "{\n";
        oss << "  \"objective\": " << quote(summary.objective) << ",\n";
        oss << "  \"tasks_total\": " << summary.tasks_total << ",\n";
        oss << "  \"tasks_completed\": " << summary.tasks_completed << ",\n";
        oss << "  \"tasks_failed\": " << summary.tasks_failed << ",\n";
        oss << "  \"iterations\": " << summary.iterations << ",\n";
        oss << "  \"duration_seconds\": " << summary.duration_seconds << ",\n";
        oss << "  \"status\": " << quote(summary.status) << ",\n";
        oss << "  \"stop_reason\": " << quote(summary.stop_reason) << ",\n";
        oss << "  \"loops_detected\": " << summary.loops_detected << "\n";
        oss << "}";
        return oss.str();
    }

    static std::string to_json(const Progress& progress) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3);
        oss << "{\n";
        oss << "  \"queue\": {"
            << "\"total\": " << progress.queue.total
            << ", \"pending\": " << progress.queue.pending
            << ", \"in_progress\": " << progress.queue.in_progress
            << ", \"completed\": " << progress.queue.completed
            << ", \"failed\": " << progress.queue.failed
            << ", \"blocked\": " << progress.queue.blocked << "},\n";
        oss << "  \"agent_pool\": {"
            << "\"total_agents\": " << progress.agent_pool.total_agents
            << ", \"available_agents\": " << progress.agent_pool.available_agents
            << ", \"busy_agents\": " << progress.agent_pool.busy_agents << "},\n";
        oss << "  \"tasks_in_queue\": [";
        for (size_t i = 0; i < progress.tasks_in_queue.size(); ++i) {
            const auto& task = progress.tasks_in_queue[i];
            oss << (i == 0 ? "\n" : ",\n");
            oss << "    {\"task_id\": " << quote(task.task_id)
                << ", \"description\": " << quote(task.description)
                << ", \"status\": " << quote(to_string(task.status))
                << ", \"dependencies\": [";
            for (size_t d = 0; d < task.dependencies.size(); ++d) {
                oss << (d == 0 ? "" : ", ") << quote(task.dependencies[d]);
            }
            oss << "]"
                << ", \"agent\": " << (task.assigned_agent ? quote(*task.assigned_agent) : "null")
                << ", \"error\": " << (task.error ? quote(*task.error) : "null")
                << ", \"duration_seconds\": " << task.duration_seconds() << "}";
        }
        oss << (progress.tasks_in_queue.empty() ? "]\n" : "\n  ]\n");
        oss << "}";
        return oss.str();
    }

    static std::string to_json(const QualityMonitor::QualityMetrics& metrics) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2);
        if (metrics.status == "no_data") {
            oss << "{\"status\": \"no_data\"}";
            return oss.str();
        }
        oss << "{\n";
        oss << "  \"iterations\": " << metrics.iterations << ",\n";
        oss << "  \"current_coverage\": " << number_or_null(metrics.current_coverage) << ",\n";
        oss << "  \"current_quality_score\": " << number_or_null(metrics.current_quality_score) << ",\n";
        oss << "  \"total_tasks_completed\": " << metrics.total_tasks_completed << ",\n";
        oss << "  \"coverage_trend\": " << quote(metrics.coverage_trend) << "\n";
        oss << "}";
        return oss.str();
    }

    static std::string to_json(const PerformanceMonitor::Snapshot& snapshot) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3);
        oss << "{\n";
        oss << "  \"tasks_recorded\": " << snapshot.tasks_recorded << ",\n";
        oss << "  \"tasks_succeeded\": " << snapshot.tasks_succeeded << ",\n";
        oss << "  \"tasks_failed\": " << snapshot.tasks_failed << ",\n";
        oss << "  \"iterations\": " << snapshot.iterations << ",\n";
        oss << "  \"total_duration_seconds\": " << snapshot.total_duration_seconds << ",\n";
        oss << "  \"total_cost\": " << snapshot.total_cost << ",\n";
        oss << "  \"agents\": {";
        bool first = true;
        for (const auto& [name, stats] : snapshot.agents) {
            oss << (first ? "\n" : ",\n");
            first = false;
            oss << "    " << quote(name) << ": {"
                << "\"tasks\": " << stats.tasks
                << ", \"successes\": " << stats.successes
                << ", \"failures\": " << stats.failures
                << ", \"total_duration_seconds\": " << stats.total_duration_seconds
                << ", \"max_duration_seconds\": " << stats.max_duration_seconds
                << ", \"total_cost\": " << stats.total_cost << "}";
        }
        oss << (snapshot.agents.empty() ? "}\n" : "\n  }\n");
        oss << "}";
        return oss.str();
    }

    /**
     * One row per agent; agent names are quoted
     */
    static std::string to_csv(const PerformanceMonitor::Snapshot& snapshot) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3);
        oss << "agent,tasks,successes,failures,total_duration_seconds,max_duration_seconds,total_cost\n";
        for (const auto& [name, stats] : snapshot.agents) {
            oss << csv_field(name) << "," << stats.tasks << "," << stats.successes << "," << stats.failures << ","
                << stats.total_duration_seconds << "," << stats.max_duration_seconds << ","
                << stats.total_cost << "\n";
        }
        return oss.str();
    }

    static std::string quote(const std::string& value) {
        std::string out = "\"";
        for (char c : value) {
            switch (c) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                        out += buf;
                    } else {
                        out += c;
                    }
            }
        }
        out += "\"";
        return out;
    }

    /**
     * RFC 4180 field: always quoted, embedded quotes doubled
     */
    static std::string csv_field(const std::string& value) {
        std::string out = "\"";
        for (char c : value) {
            if (c == '"') {
                out += '"';
            }
            out += c;
        }
        out += "\"";
        return out;
    }

private:
    static std::string number_or_null(const std::optional<double>& value) {
        if (!value) {
            return "null";
        }
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << *value;
        return oss.str();
    }
};

} // namespace agent_weave
