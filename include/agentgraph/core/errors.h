#ifndef AGENTGRAPH_CORE_ERRORS_H
#define AGENTGRAPH_CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace agentgraph {

// Base of every error raised by the engine.
class WorkflowError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Partial update or input touches an undeclared field, or a field is redeclared
// with another policy. Fatal: the workflow definition is malformed.
class SchemaViolation : public WorkflowError {
public:
    using WorkflowError::WorkflowError;
};

// Router returned a label that its edge does not declare. Fatal.
class UnknownRoute : public WorkflowError {
public:
    using WorkflowError::WorkflowError;
};

// Graph construction failed (dangling edge, stage without outgoing edge, ...).
class GraphError : public WorkflowError {
public:
    using WorkflowError::WorkflowError;
};

// Not fatal: callers treat it as "start a new session".
class SessionNotFound : public WorkflowError {
public:
    explicit SessionNotFound(const std::string& session_id)
        : WorkflowError("Session not found: " + session_id), session_id_(session_id) {}
    const std::string& session_id() const { return session_id_; }

private:
    std::string session_id_;
};

class SessionLocked : public WorkflowError {
public:
    explicit SessionLocked(const std::string& session_id)
        : WorkflowError("Session is locked by another run: " + session_id) {}
};

// LLM / search / fetch / process failure. Stages catch it and emit a sentinel.
class ExternalServiceError : public WorkflowError {
public:
    using WorkflowError::WorkflowError;
};

class ConfigError : public WorkflowError {
public:
    using WorkflowError::WorkflowError;
};

} // namespace agentgraph

#endif // AGENTGRAPH_CORE_ERRORS_H
