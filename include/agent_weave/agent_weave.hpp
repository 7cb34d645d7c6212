#pragma once

/**
 * AgentWeave - dependency-aware multi-agent task execution
 *
 * Main header file that includes all components
 */

#include "errors.hpp"
#include "task.hpp"
#include "task_queue.hpp"
#include "dependency_graph.hpp"
#include "agent_pool.hpp"
#include "quality_monitor.hpp"
#include "concurrency_limiter.hpp"
#include "thread_pool.hpp"
#include "performance_monitor.hpp"
#include "logging.hpp"
#include "config.hpp"
#include "multi_agent_executor.hpp"
#include "progress_exporter.hpp"
