#ifndef LEDGERFLOW_NODE_ERROR_HPP
#define LEDGERFLOW_NODE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace ledgerflow {

/**
 * @brief Raised by a node when it cannot complete run()
 *
 * The executors wrap it with the failing node id; nothing downstream ever sees
 * the half-built output of a node that threw.
 */
class NodeError : public std::runtime_error {
public:
    explicit NodeError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when a node parameter has the wrong type or an invalid value
 */
class InvalidParameterError : public NodeError {
public:
    InvalidParameterError(const std::string& parameter, const std::string& message)
        : NodeError("Invalid parameter '" + parameter + "': " + message),
          parameter_(parameter) {}

    const std::string& parameter() const { return parameter_; }

private:
    std::string parameter_;
};

} // namespace ledgerflow

#endif // LEDGERFLOW_NODE_ERROR_HPP
