#include "agentsync/conflict_handler.hpp"
#include "agentsync/exceptions.hpp"

namespace agentsync {

namespace {

std::string health_field(const Json& snapshot) {
    if (!snapshot.is_object()) return {};
    auto it = snapshot.find("health");
    if (it == snapshot.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

} // anonymous namespace

// ========== AgentStateConflictHandler ==========

ResolutionResult AgentStateConflictHandler::resolve_conflict(const Conflict& conflict) {
    if (conflict.type().kind != ConflictKind::AgentState) {
        throw UnsupportedStrategyException(kName);
    }

    const std::string local = health_field(conflict.local_state());
    const std::string remote = health_field(conflict.remote_state());

    const Json* chosen = &conflict.local_state();
    if (local == "healthy") {
        chosen = &conflict.local_state();
    } else if (remote == "healthy") {
        chosen = &conflict.remote_state();
    } else if (local == "degraded") {
        chosen = &conflict.local_state();
    } else if (remote == "degraded") {
        chosen = &conflict.remote_state();
    }

    return ResolutionResult::make_success(ConflictStrategy::custom("agent_state"), *chosen,
                                          "Resolved agent state conflict based on health");
}

std::vector<ConflictType> AgentStateConflictHandler::supported_conflict_types() const {
    return {ConflictType{ConflictKind::AgentState, {}}};
}

// ========== FunctionConflictHandler ==========

FunctionConflictHandler::FunctionConflictHandler(std::string name, ResolveFn fn,
                                                 std::vector<ConflictType> supported_types)
    : name_(std::move(name))
    , fn_(std::move(fn))
    , supported_types_(std::move(supported_types)) {
    if (name_.empty()) {
        throw ValidationFailedException("handler name cannot be empty");
    }
    if (!fn_) {
        throw ValidationFailedException("handler '" + name_ + "' has no resolve function");
    }
}

ResolutionResult FunctionConflictHandler::resolve_conflict(const Conflict& conflict) {
    if (!supported_types_.empty()) {
        bool supported = false;
        for (const auto& t : supported_types_) {
            if (t == conflict.type()) {
                supported = true;
                break;
            }
        }
        if (!supported) {
            throw UnsupportedStrategyException(name_);
        }
    }
    return fn_(conflict);
}

} // namespace agentsync
