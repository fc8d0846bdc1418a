#pragma once

#include "agentsync/conflict.hpp"

#include <functional>
#include <string>
#include <vector>

namespace agentsync {

// Pluggable resolution strategy, selected by ConflictStrategy::custom(name).
// resolve_conflict() may block (e.g. on I/O); it runs with no resolver lock
// held and receives the resolver's own copy of the conflict.
class ConflictHandler {
public:
    virtual ~ConflictHandler() = default;

    virtual ResolutionResult resolve_conflict(const Conflict& conflict) = 0;

    virtual std::string name() const = 0;

    virtual std::vector<ConflictType> supported_conflict_types() const = 0;
};

// Prefers whichever snapshot reports the better "health" field:
// healthy over degraded, local over remote on ties, local by default.
class AgentStateConflictHandler : public ConflictHandler {
public:
    static constexpr const char* kName = "agent_state_handler";

    ResolutionResult resolve_conflict(const Conflict& conflict) override;
    std::string name() const override { return kName; }
    std::vector<ConflictType> supported_conflict_types() const override;
};

// Adapts a callable so handlers can be registered at runtime without
// subclassing.
class FunctionConflictHandler : public ConflictHandler {
public:
    using ResolveFn = std::function<ResolutionResult(const Conflict&)>;

    FunctionConflictHandler(std::string name, ResolveFn fn,
                            std::vector<ConflictType> supported_types = {});

    ResolutionResult resolve_conflict(const Conflict& conflict) override;
    std::string name() const override { return name_; }
    std::vector<ConflictType> supported_conflict_types() const override {
        return supported_types_;
    }

private:
    std::string name_;
    ResolveFn fn_;
    std::vector<ConflictType> supported_types_;
};

} // namespace agentsync
