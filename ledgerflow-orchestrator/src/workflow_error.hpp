/**
 * @file workflow_error.hpp
 * @brief Error taxonomy for workflow resolution and execution
 *
 * Registry and structural errors are raised before any node runs. Node and
 * timeout failures happen mid-run and are normally reported through
 * WorkflowResult; WorkflowResult::throw_if_failed() turns them back into the
 * exceptions below.
 */

#ifndef LEDGERFLOW_WORKFLOW_ERROR_HPP
#define LEDGERFLOW_WORKFLOW_ERROR_HPP

#include <stdexcept>
#include <string>

namespace ledgerflow {

/**
 * @brief Error categories reported in a WorkflowResult
 */
enum class ErrorKind {
    None,
    NodeNotFound,    ///< Type identifier not in the registry
    Structural,      ///< Empty workflow, unknown edge endpoint, cycle
    Registration,    ///< Duplicate registration
    NodeExecution,   ///< A node threw during run()
    Timeout          ///< Caller deadline passed before the run finished
};

/**
 * @brief Convert error kind to its wire name
 */
inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::NodeNotFound: return "NodeNotFound";
        case ErrorKind::Structural: return "Structural";
        case ErrorKind::Registration: return "Registration";
        case ErrorKind::NodeExecution: return "NodeExecution";
        case ErrorKind::Timeout: return "Timeout";
        default: return "Unknown";
    }
}

/**
 * @brief Base exception for workflow errors
 */
class WorkflowError : public std::runtime_error {
public:
    explicit WorkflowError(const std::string& message)
        : std::runtime_error(message) {}

    virtual ErrorKind kind() const = 0;
};

/**
 * @brief Raised when a node type identifier is not registered
 */
class NodeNotFoundError : public WorkflowError {
public:
    explicit NodeNotFoundError(const std::string& message)
        : WorkflowError(message) {}

    ErrorKind kind() const override { return ErrorKind::NodeNotFound; }
};

/**
 * @brief Raised when a workflow definition is malformed
 */
class StructuralError : public WorkflowError {
public:
    explicit StructuralError(const std::string& message)
        : WorkflowError("Invalid workflow: " + message) {}

    ErrorKind kind() const override { return ErrorKind::Structural; }
};

/**
 * @brief Raised when a type identifier is registered twice
 */
class RegistrationError : public WorkflowError {
public:
    explicit RegistrationError(const std::string& message)
        : WorkflowError(message) {}

    ErrorKind kind() const override { return ErrorKind::Registration; }
};

/**
 * @brief Raised when a node fails during run()
 */
class NodeExecutionError : public WorkflowError {
public:
    NodeExecutionError(const std::string& node_id, const std::string& message)
        : WorkflowError("Node '" + node_id + "' failed: " + message),
          node_id_(node_id) {}

    ErrorKind kind() const override { return ErrorKind::NodeExecution; }
    const std::string& node_id() const { return node_id_; }

private:
    std::string node_id_;
};

/**
 * @brief Raised when the execution deadline passes
 */
class TimeoutError : public WorkflowError {
public:
    explicit TimeoutError(const std::string& message)
        : WorkflowError("Timeout: " + message) {}

    ErrorKind kind() const override { return ErrorKind::Timeout; }
};

} // namespace ledgerflow

#endif // LEDGERFLOW_WORKFLOW_ERROR_HPP
