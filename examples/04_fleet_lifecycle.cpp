// 04_fleet_lifecycle.cpp
//
// Coordinating a small fleet.
//
// Scenario:
//   - Three workers are registered with a Coordinator and brought online.
//   - Tasks are routed to the best-scoring available agent.
//   - A replica reports a diverging view of one agent; the Coordinator
//     detects the conflict, resolves it and applies the outcome.
//   - One agent crashes and recovers; the fleet is then shut down.

#include <agentsync/agentsync.hpp>

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

using namespace agentsync;
using namespace std::chrono_literals;

namespace {

void print_fleet(const Coordinator& coord) {
    auto agents = coord.get_all_agents();
    std::sort(agents.begin(), agents.end(),
              [](const AgentState& a, const AgentState& b) { return a.id() < b.id(); });
    for (const auto& a : agents) {
        std::cout << "  " << a.id() << " [" << to_string(coord.lifecycle_state(a.id())) << "]"
                  << " health=" << to_string(a.health())
                  << " status=" << to_string(a.status())
                  << " score=" << a.score() << "\n";
    }
    auto stats = coord.get_statistics();
    std::cout << "  total=" << stats.total_agents << " healthy=" << stats.healthy_agents
              << " available=" << stats.available_agents
              << " conflicts=" << stats.active_conflicts << "\n\n";
}

void bring_up(Coordinator& coord, const AgentId& id) {
    coord.transition_agent(id, LifecycleState::Initializing);
    coord.transition_agent(id, LifecycleState::Ready);
    coord.transition_agent(id, LifecycleState::Starting);
    coord.transition_agent(id, LifecycleState::Running);
}

} // anonymous namespace

int main() {
    std::cout << "=== AgentSync: Fleet Lifecycle Example ===\n\n";

    log::init_logger(spdlog::level::warn);

    Config config;
    config.max_agents = 16;
    config.heartbeat_timeout = 30s;
    Coordinator coord(config);
    coord.set_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));

    // ----------------------------------------------------------------
    // 1. Register and bring up the fleet.
    // ----------------------------------------------------------------
    struct Spec { const char* id; Priority priority; std::vector<std::string> caps; };
    const std::vector<Spec> fleet = {
        {"planner", PRIORITY_HIGH,   {"plan"}},
        {"coder-1", PRIORITY_NORMAL, {"code", "test"}},
        {"coder-2", PRIORITY_NORMAL, {"code"}},
    };
    for (const auto& spec : fleet) {
        AgentState s(AgentId(spec.id), spec.id, "worker");
        s.set_priority(spec.priority);
        for (const auto& c : spec.caps) s.add_capability(c);
        coord.register_agent(std::move(s));
        bring_up(coord, AgentId(spec.id));
    }
    std::cout << "Fleet online:\n";
    print_fleet(coord);

    // ----------------------------------------------------------------
    // 2. Route work.
    // ----------------------------------------------------------------
    auto coder = coord.select_agent(std::string("code"));
    std::cout << "Routing coding task to " << *coder << "\n";
    coord.record_task_start(*coder, TaskId("task-42"));

    auto next = coord.select_agent(std::string("code"));
    std::cout << "Next coding task goes to " << *next << "\n\n";
    coord.record_task_completion(*coder, 1800);

    // ----------------------------------------------------------------
    // 3. Reconcile a diverging replica.
    // ----------------------------------------------------------------
    AgentId target("coder-2");
    Json remote = Json(*coord.get_agent(target));
    remote["health"] = "degraded";

    if (auto conflict = coord.reconcile(target, remote)) {
        auto result = coord.resolver().attempt_resolution(conflict->id());
        if (!coord.apply_resolution(target, result)) {
            std::cout << "Resolution not applied: " << result.message << "\n";
        }
    }
    std::cout << "After reconciliation:\n";
    print_fleet(coord);

    // ----------------------------------------------------------------
    // 4. Crash and recovery.
    // ----------------------------------------------------------------
    AgentId planner("planner");
    coord.transition_agent(planner, LifecycleState::Error, std::string("out of memory"));
    coord.transition_agent(planner, LifecycleState::Starting, std::string("restarting"));
    coord.transition_agent(planner, LifecycleState::Running);
    std::cout << "Planner lifecycle: " << to_string(coord.lifecycle_stats(planner)) << "\n\n";

    // ----------------------------------------------------------------
    // 5. Shut down.
    // ----------------------------------------------------------------
    for (const auto& spec : fleet) {
        AgentId id(spec.id);
        coord.transition_agent(id, LifecycleState::Stopping);
        coord.transition_agent(id, LifecycleState::Stopped);
        coord.transition_agent(id, LifecycleState::Destroying);
        coord.transition_agent(id, LifecycleState::Destroyed);
    }
    std::cout << "Fleet shut down:\n";
    print_fleet(coord);

    for (const auto& spec : fleet) coord.deregister_agent(AgentId(spec.id));

    std::cout << "=== Done ===\n";
    return 0;
}
