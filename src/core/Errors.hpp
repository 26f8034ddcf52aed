#pragma once

#include <stdexcept>
#include <string>

namespace flowrelay {

/**
 * Base class for every error the relay reports.
 *
 * Each error knows the HTTP status it maps to, so the HTTP layer can
 * translate exceptions without a per-type switch.
 */
class RelayError : public std::runtime_error {
public:
    RelayError(const std::string& message, unsigned httpStatus)
        : std::runtime_error(message)
        , m_httpStatus(httpStatus)
    {}

    unsigned httpStatus() const { return m_httpStatus; }

private:
    unsigned m_httpStatus;
};

// === Startup ===

class ConfigError : public RelayError {
public:
    explicit ConfigError(const std::string& message) : RelayError(message, 500) {}
};

class LoadError : public RelayError {
public:
    explicit LoadError(const std::string& message) : RelayError(message, 500) {}
};

// === Workflow mutation (user input) ===

/// Missing fields or unparsable body on an HTTP request
class BadRequest : public RelayError {
public:
    explicit BadRequest(const std::string& message) : RelayError(message, 400) {}
};

class NodeNotFound : public RelayError {
public:
    explicit NodeNotFound(const std::string& nodeId)
        : RelayError("Node ID " + nodeId + " not found in workflow", 404)
        , m_nodeId(nodeId)
    {}

    const std::string& nodeId() const { return m_nodeId; }

private:
    std::string m_nodeId;
};

class FieldNotAccepted : public RelayError {
public:
    FieldNotAccepted(const std::string& nodeId, const std::string& field)
        : RelayError("Node ID " + nodeId + " has no input field '" + field + "'", 422)
    {}

    /// The node has the field but may not take this write (wrong node class, linked input)
    FieldNotAccepted(const std::string& nodeId, const std::string& field, const std::string& reason)
        : RelayError("Node ID " + nodeId + " cannot take '" + field + "': " + reason, 422)
    {}
};

class NoTextFieldFound : public RelayError {
public:
    explicit NoTextFieldFound(const std::string& nodeId)
        : RelayError("Node ID " + nodeId + " doesn't have any recognized text input field", 422)
    {}
};

// === Upstream engine ===

class UpstreamUnreachable : public RelayError {
public:
    explicit UpstreamUnreachable(const std::string& message) : RelayError(message, 503) {}
};

class SubmissionRejected : public RelayError {
public:
    explicit SubmissionRejected(const std::string& message) : RelayError(message, 502) {}
};

// === Execution ===

class ExecutionFailed : public RelayError {
public:
    explicit ExecutionFailed(const std::string& message) : RelayError(message, 500) {}
};

class ExecutionTimeout : public RelayError {
public:
    explicit ExecutionTimeout(const std::string& message) : RelayError(message, 504) {}
};

class AlreadyRunning : public RelayError {
public:
    AlreadyRunning() : RelayError("Workflow is already running", 409) {}
};

} // namespace flowrelay
