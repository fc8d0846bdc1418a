#pragma once

#include "agentsync/types.hpp"
#include "agentsync/identifiers.hpp"

#include <stdexcept>
#include <string>

namespace agentsync {

class AgentSyncException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidIdentifierException : public AgentSyncException {
public:
    using AgentSyncException::AgentSyncException;
};

class ValidationFailedException : public AgentSyncException {
public:
    explicit ValidationFailedException(const std::string& message)
        : AgentSyncException("Validation failed: " + message) {}
};

// ==================== Lifecycle ====================

class LifecycleException : public AgentSyncException {
public:
    using AgentSyncException::AgentSyncException;
};

class InvalidTransitionException : public LifecycleException {
public:
    InvalidTransitionException(LifecycleState from, LifecycleState to)
        : LifecycleException(std::string("Invalid transition from ") +
                             to_string(from) + " to " + to_string(to))
        , from_(from)
        , to_(to) {}

    LifecycleState from() const noexcept { return from_; }
    LifecycleState to() const noexcept { return to_; }

private:
    LifecycleState from_;
    LifecycleState to_;
};

// ==================== Conflict resolution ====================

class ConflictException : public AgentSyncException {
public:
    using AgentSyncException::AgentSyncException;
};

class HandlerNotFoundException : public ConflictException {
public:
    explicit HandlerNotFoundException(std::string handler_name)
        : ConflictException("Conflict handler not found: " + handler_name)
        , handler_name_(std::move(handler_name)) {}

    const std::string& handler_name() const noexcept { return handler_name_; }

private:
    std::string handler_name_;
};

class HandlerAlreadyRegisteredException : public ConflictException {
public:
    explicit HandlerAlreadyRegisteredException(std::string handler_name)
        : ConflictException("Conflict handler already registered: " + handler_name)
        , handler_name_(std::move(handler_name)) {}

    const std::string& handler_name() const noexcept { return handler_name_; }

private:
    std::string handler_name_;
};

class ManualResolutionRequiredException : public ConflictException {
public:
    explicit ManualResolutionRequiredException(ConflictId id)
        : ConflictException("Manual resolution required for conflict: " + id.str())
        , conflict_id_(std::move(id)) {}

    const ConflictId& conflict_id() const noexcept { return conflict_id_; }

private:
    ConflictId conflict_id_;
};

class UnsupportedStrategyException : public ConflictException {
public:
    explicit UnsupportedStrategyException(std::string strategy)
        : ConflictException("Unsupported resolution strategy: " + strategy)
        , strategy_(std::move(strategy)) {}

    const std::string& strategy() const noexcept { return strategy_; }

private:
    std::string strategy_;
};

// Unknown conflict id (absent from the active set)
class ConflictNotFoundException : public ConflictException {
public:
    explicit ConflictNotFoundException(ConflictId id)
        : ConflictException("Conflict not found: " + id.str())
        , conflict_id_(std::move(id)) {}

    const ConflictId& conflict_id() const noexcept { return conflict_id_; }

private:
    ConflictId conflict_id_;
};

// ==================== Coordinator ====================

class AgentNotFoundException : public AgentSyncException {
public:
    explicit AgentNotFoundException(AgentId id)
        : AgentSyncException("Agent not found: " + id.str())
        , agent_id_(std::move(id)) {}

    const AgentId& agent_id() const noexcept { return agent_id_; }

private:
    AgentId agent_id_;
};

class AgentAlreadyRegisteredException : public AgentSyncException {
public:
    explicit AgentAlreadyRegisteredException(AgentId id)
        : AgentSyncException("Agent already registered: " + id.str())
        , agent_id_(std::move(id)) {}

    const AgentId& agent_id() const noexcept { return agent_id_; }

private:
    AgentId agent_id_;
};

class CapacityExceededException : public AgentSyncException {
public:
    explicit CapacityExceededException(std::size_t max_agents)
        : AgentSyncException("Agent capacity exceeded (max " +
                             std::to_string(max_agents) + ")") {}
};

} // namespace agentsync
