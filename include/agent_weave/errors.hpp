#pragma once

#include <stdexcept>
#include <string>

namespace agent_weave {

/**
 * Base class for definitional errors raised by the queue and the pool.
 * Execution failures never surface through these.
 */
class WeaveError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DuplicateTaskError : public WeaveError {
public:
    explicit DuplicateTaskError(const std::string& task_id)
        : WeaveError("Task already registered: " + task_id)
        , task_id_(task_id)
    {}

    const std::string& task_id() const noexcept { return task_id_; }

private:
    std::string task_id_;
};

class UnknownTaskError : public WeaveError {
public:
    explicit UnknownTaskError(const std::string& task_id)
        : WeaveError("Unknown task: " + task_id)
        , task_id_(task_id)
    {}

    const std::string& task_id() const noexcept { return task_id_; }

private:
    std::string task_id_;
};

class InvalidTransitionError : public WeaveError {
public:
    InvalidTransitionError(const std::string& task_id, const std::string& from, const std::string& to)
        : WeaveError("Task " + task_id + " cannot move from " + from + " to " + to)
    {}
};

class UnknownAgentError : public WeaveError {
public:
    explicit UnknownAgentError(const std::string& agent_name)
        : WeaveError("Unknown agent: " + agent_name)
    {}
};

class AgentBusyError : public WeaveError {
public:
    AgentBusyError(const std::string& agent_name, const std::string& current_task)
        : WeaveError("Agent " + agent_name + " is already assigned to " + current_task)
    {}
};

} // namespace agent_weave
