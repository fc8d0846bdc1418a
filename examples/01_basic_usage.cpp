// 01_basic_usage.cpp
//
// Minimal AgentSync example: one agent, its health model and its lifecycle.
//
// Scenario:
//   - A "researcher" agent is created with a couple of capabilities.
//   - It walks the allow-listed lifecycle Creating -> ... -> Running.
//   - An illegal jump (Running -> Destroyed) is rejected and leaves the
//     machine untouched.
//   - Task bookkeeping updates its metrics and load-balancing score.

#include <agentsync/agentsync.hpp>

#include <iostream>
#include <string>

using namespace agentsync;

int main() {
    std::cout << "=== AgentSync: Basic Usage Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Build an agent state and validate it.
    // ----------------------------------------------------------------
    AgentState agent(AgentId("researcher-1"), "Researcher", "llm-worker");
    agent.set_priority(PRIORITY_HIGH);
    agent.add_capability("web_search");
    agent.add_capability("summarize");
    agent.set_endpoint(std::string("http://localhost:9001"));
    agent.validate();

    std::cout << "Agent " << agent.id() << " health=" << to_string(agent.health())
              << " status=" << to_string(agent.status())
              << " score=" << agent.score() << "\n\n";

    // ----------------------------------------------------------------
    // 2. Drive its lifecycle.
    // ----------------------------------------------------------------
    AgentLifecycle lifecycle(agent.id());
    lifecycle.add_state_change_callback(
        LifecycleState::Running, [](const AgentId& id, const LifecycleState&) {
            std::cout << "  callback: " << id << " is running\n";
        });

    lifecycle.transition_to(LifecycleState::Initializing);
    lifecycle.transition_to(LifecycleState::Ready, std::string("config loaded"));
    lifecycle.transition_to(LifecycleState::Starting);
    lifecycle.transition_to(LifecycleState::Running);

    std::cout << "Lifecycle: " << to_string(lifecycle.get_lifecycle_stats()) << "\n";

    // Running -> Destroyed skips the shutdown phases
    try {
        lifecycle.transition_to(LifecycleState::Destroyed);
    } catch (const InvalidTransitionException& e) {
        std::cout << "Rejected: " << e.what() << "\n";
    }
    std::cout << "Still in " << to_string(lifecycle.current_state()) << "\n\n";

    // ----------------------------------------------------------------
    // 3. Task bookkeeping.
    // ----------------------------------------------------------------
    agent.record_task_start();
    agent.record_task_start();
    std::cout << "Two tasks running, score=" << agent.score() << "\n";
    agent.record_task_completion(250);
    agent.record_task_failure();
    std::cout << "After finishing: completed=" << agent.metrics().tasks_completed()
              << " failed=" << agent.metrics().tasks_failed()
              << " success_rate=" << agent.metrics().success_rate() << "%"
              << " score=" << agent.score() << "\n\n";

    // ----------------------------------------------------------------
    // 4. Snapshot.
    // ----------------------------------------------------------------
    std::cout << "Snapshot:\n" << Json(agent).dump(2) << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
