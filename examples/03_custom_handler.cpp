// 03_custom_handler.cpp
//
// Plugging in resolution logic.
//
// Scenario:
//   - A subclassed handler settles task-assignment disputes by keeping
//     the claim with the lower sequence number.
//   - A FunctionConflictHandler registered from a lambda sums counters
//     reported by two replicas.
//   - The built-in AgentStateConflictHandler keeps the healthier view.
//   - A MetricsMonitor tallies what happened.

#include <agentsync/agentsync.hpp>

#include <iostream>
#include <memory>

using namespace agentsync;

// ---------------------------------------------------------------------------
// Earliest claim wins
// ---------------------------------------------------------------------------
class FirstClaimHandler : public ConflictHandler {
public:
    ResolutionResult resolve_conflict(const Conflict& conflict) override {
        if (conflict.type().kind != ConflictKind::TaskAssignment) {
            throw UnsupportedStrategyException(name());
        }
        auto local_seq  = conflict.local_state().value("seq", 0);
        auto remote_seq = conflict.remote_state().value("seq", 0);
        const Json& winner = remote_seq < local_seq ? conflict.remote_state()
                                                    : conflict.local_state();
        return ResolutionResult::make_success(ConflictStrategy::custom(name()), winner,
                                              "Kept earliest claim");
    }

    std::string name() const override { return "first_claim"; }

    std::vector<ConflictType> supported_conflict_types() const override {
        return {ConflictType{ConflictKind::TaskAssignment}};
    }
};

int main() {
    std::cout << "=== AgentSync: Custom Handler Example ===\n\n";

    ConflictResolver resolver;
    auto metrics = std::make_shared<MetricsMonitor>();
    resolver.set_monitor(metrics);

    resolver.add_handler(std::make_shared<FirstClaimHandler>());
    resolver.add_handler(std::make_shared<AgentStateConflictHandler>());
    resolver.add_handler(std::make_shared<FunctionConflictHandler>(
        "sum_counters",
        [](const Conflict& c) {
            Json merged = merge_objects(c.local_state(), c.remote_state());
            merged["count"] = c.local_state().value("count", 0) +
                              c.remote_state().value("count", 0);
            return ResolutionResult::make_success(ConflictStrategy::custom("sum_counters"),
                                                  merged, "Summed counters");
        },
        std::vector<ConflictType>{ConflictType::custom("counter")}));

    std::cout << "Handlers:";
    for (const auto& name : resolver.handler_names()) std::cout << " " << name;
    std::cout << "\n\n";

    // ----------------------------------------------------------------
    // 1. Task assignment dispute.
    // ----------------------------------------------------------------
    auto claim = resolver.detect_conflict(ConflictType{ConflictKind::TaskAssignment},
                                          Json{{"task", "t-1"}, {"agent", "a1"}, {"seq", 7}},
                                          Json{{"task", "t-1"}, {"agent", "a2"}, {"seq", 4}});
    auto r1 = resolver.attempt_resolution(claim->id(), ConflictStrategy::custom("first_claim"));
    std::cout << r1.message << ": " << r1.resolved_state.dump() << "\n";

    // ----------------------------------------------------------------
    // 2. Counter reconciliation through a lambda.
    // ----------------------------------------------------------------
    auto counter = resolver.detect_conflict(ConflictType::custom("counter"),
                                            Json{{"name", "requests"}, {"count", 40}},
                                            Json{{"name", "requests"}, {"count", 2}});
    auto r2 = resolver.attempt_resolution(counter->id(), ConflictStrategy::custom("sum_counters"));
    std::cout << r2.message << ": " << r2.resolved_state.dump() << "\n";

    // ----------------------------------------------------------------
    // 3. Agent state: the healthier replica wins.
    // ----------------------------------------------------------------
    resolver.set_strategy(ConflictStrategy::custom(AgentStateConflictHandler::kName));
    auto health = resolver.detect_conflict(ConflictType{ConflictKind::AgentState},
                                           Json{{"id", "a1"}, {"health", "unhealthy"}},
                                           Json{{"id", "a1"}, {"health", "degraded"}});
    auto r3 = resolver.attempt_resolution(health->id());
    std::cout << r3.message << ": " << r3.resolved_state.dump() << "\n";

    // ----------------------------------------------------------------
    // 4. A handler asked to resolve a type it does not support.
    // ----------------------------------------------------------------
    auto stray = resolver.detect_conflict(ConflictType{ConflictKind::Resource},
                                          Json{{"slots", 1}}, Json{{"slots", 2}});
    try {
        resolver.attempt_resolution(stray->id(), ConflictStrategy::custom("first_claim"));
    } catch (const AgentSyncException& e) {
        std::cout << "Failed as expected: " << e.what() << "\n";
    }
    resolver.attempt_resolution(stray->id(), ConflictStrategy{StrategyKind::KeepLocal});

    // ----------------------------------------------------------------
    // 5. Metrics.
    // ----------------------------------------------------------------
    auto m = metrics->get_metrics();
    std::cout << "\nDetected: " << m.conflicts_detected
              << "  Resolved: " << m.conflicts_resolved
              << "  Failed: " << m.resolution_failures
              << "  Avg ms: " << m.average_resolution_ms << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
