#ifndef DURABLEFLOW_COMMON_ERRORS_H
#define DURABLEFLOW_COMMON_ERRORS_H

#include <stdexcept>
#include <string>
#include <utility>

namespace durableflow {

// 所有引擎错误的基类。kind() 用于跨 activity 边界传递错误类别
class DurableFlowError : public std::runtime_error {
public:
    DurableFlowError(std::string kind, const std::string& message, bool retryable)
        : std::runtime_error(message), kind_(std::move(kind)), retryable_(retryable) {}

    const std::string& kind() const noexcept { return kind_; }
    bool retryable() const noexcept { return retryable_; }

private:
    std::string kind_;
    bool retryable_;
};

// Missing or invalid agent, workflow or engine configuration
class ConfigError : public DurableFlowError {
public:
    explicit ConfigError(const std::string& message)
        : DurableFlowError("ConfigError", message, false) {}
};

class DependencyFailedError : public DurableFlowError {
public:
    explicit DependencyFailedError(const std::string& message = "Dependency failed")
        : DurableFlowError("DependencyFailedError", message, false) {}
};

class ExecutorError : public DurableFlowError {
public:
    explicit ExecutorError(const std::string& message)
        : DurableFlowError("ExecutorError", message, true) {}

protected:
    ExecutorError(std::string kind, const std::string& message, bool retryable)
        : DurableFlowError(std::move(kind), message, retryable) {}
};

class NodeNotImplementedError : public ExecutorError {
public:
    explicit NodeNotImplementedError(const std::string& node_type)
        : ExecutorError("NodeNotImplementedError", "Node type '" + node_type + "' is not implemented", false) {}
};

class TimeoutError : public DurableFlowError {
public:
    explicit TimeoutError(const std::string& message)
        : DurableFlowError("TimeoutError", message, false) {}
};

class LlmError : public DurableFlowError {
public:
    explicit LlmError(const std::string& message)
        : DurableFlowError("LlmError", message, true) {}
};

class ToolError : public DurableFlowError {
public:
    explicit ToolError(const std::string& message)
        : DurableFlowError("ToolError", message, true) {}
};

class TelemetryError : public DurableFlowError {
public:
    explicit TelemetryError(const std::string& message)
        : DurableFlowError("TelemetryError", message, false) {}
};

// An attempt ran past its start-to-close deadline or missed a heartbeat
class ActivityTimeoutError : public DurableFlowError {
public:
    explicit ActivityTimeoutError(const std::string& message)
        : DurableFlowError("ActivityTimeoutError", message, true) {}
};

// Terminal failure of an activity once its retry policy is exhausted
class ActivityFailure : public DurableFlowError {
public:
    ActivityFailure(std::string activity, std::string cause_kind, const std::string& message, int attempts)
        : DurableFlowError("ActivityFailure", message, false),
          activity_(std::move(activity)),
          cause_kind_(std::move(cause_kind)),
          attempts_(attempts) {}

    const std::string& activity() const noexcept { return activity_; }
    const std::string& cause_kind() const noexcept { return cause_kind_; }
    int attempts() const noexcept { return attempts_; }

private:
    std::string activity_;
    std::string cause_kind_;
    int attempts_;
};

// Replayed orchestration issued a command that does not match its history
class NonDeterminismError : public DurableFlowError {
public:
    explicit NonDeterminismError(const std::string& message)
        : DurableFlowError("NonDeterminismError", message, false) {}
};

class ExecutionStateError : public DurableFlowError {
public:
    explicit ExecutionStateError(const std::string& message)
        : DurableFlowError("ExecutionStateError", message, false) {}
};

} // namespace durableflow

#endif // DURABLEFLOW_COMMON_ERRORS_H
