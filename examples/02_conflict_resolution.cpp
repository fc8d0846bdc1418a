// 02_conflict_resolution.cpp
//
// Built-in resolution strategies.
//
// Scenario:
//   - Two replicas disagree about a shared configuration object.
//   - The same divergence is resolved with AutoMerge, KeepLocal and
//     KeepRemote to show how each picks the final state.
//   - A Manual strategy refuses to resolve until retried explicitly.
//   - Resolver statistics and history summarize the session.

#include <agentsync/agentsync.hpp>

#include <iostream>

using namespace agentsync;

namespace {

void resolve_with(ConflictResolver& resolver, const ConflictStrategy& strategy,
                  const Json& local, const Json& remote) {
    auto conflict = resolver.detect_conflict(ConflictType{ConflictKind::Configuration},
                                             ConflictSeverity::Medium,
                                             "Replica configuration diverged",
                                             local, remote);
    if (!conflict) {
        std::cout << "No conflict\n";
        return;
    }
    auto result = resolver.attempt_resolution(conflict->id(), strategy);
    std::cout << "[" << strategy.key() << "] " << result.message << "\n"
              << "  resolved: " << result.resolved_state.dump() << "\n";
}

} // anonymous namespace

int main() {
    std::cout << "=== AgentSync: Conflict Resolution Example ===\n\n";

    ConflictResolver resolver;
    resolver.set_monitor(
        std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));

    Json local  = {{"model", "small"}, {"temperature", 0.2}, {"max_tokens", 512}};
    Json remote = {{"model", "large"}, {"temperature", 0.2}, {"top_p", 0.9}};

    // ----------------------------------------------------------------
    // 1. Identical snapshots never produce a conflict.
    // ----------------------------------------------------------------
    resolve_with(resolver, ConflictStrategy{}, local, local);

    // ----------------------------------------------------------------
    // 2. Each built-in strategy on the same divergence.
    // ----------------------------------------------------------------
    resolve_with(resolver, ConflictStrategy{StrategyKind::AutoMerge}, local, remote);
    resolve_with(resolver, ConflictStrategy{StrategyKind::KeepLocal}, local, remote);
    resolve_with(resolver, ConflictStrategy{StrategyKind::KeepRemote}, local, remote);
    std::cout << "\n";

    // ----------------------------------------------------------------
    // 3. Manual: the conflict stays active until someone decides.
    // ----------------------------------------------------------------
    resolver.set_strategy(ConflictStrategy{StrategyKind::Manual});
    auto pending = resolver.detect_conflict(ConflictType{ConflictKind::TaskAssignment},
                                            Json{{"task", "t-9"}, {"owner", "a1"}},
                                            Json{{"task", "t-9"}, {"owner", "a2"}});
    try {
        resolver.attempt_resolution(pending->id());
    } catch (const ManualResolutionRequiredException& e) {
        std::cout << "Manual: " << e.what() << "\n";
    }
    std::cout << "Active conflicts: " << resolver.active_conflict_count() << "\n";

    auto decided = resolver.attempt_resolution(pending->id(),
                                               ConflictStrategy{StrategyKind::KeepRemote});
    std::cout << "Operator chose remote: " << decided.resolved_state.dump() << "\n\n";

    // ----------------------------------------------------------------
    // 4. Statistics and history.
    // ----------------------------------------------------------------
    std::cout << "Statistics:\n" << Json(resolver.get_statistics()).dump(2) << "\n";
    std::cout << "History entries: " << resolver.get_conflict_history().size() << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
