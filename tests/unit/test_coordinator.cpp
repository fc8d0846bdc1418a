#include <gtest/gtest.h>
#include <agentsync/agentsync.hpp>

using namespace agentsync;
using namespace std::chrono_literals;

namespace {

AgentState make_agent(const std::string& id, Priority priority = PRIORITY_NORMAL) {
    AgentState s(AgentId(id), "Agent " + id, "worker");
    s.set_priority(priority);
    return s;
}

} // anonymous namespace

class CoordinatorTest : public ::testing::Test {
protected:
    Config cfg;
    std::unique_ptr<Coordinator> coord;

    void SetUp() override {
        cfg.max_agents = 4;
        coord = std::make_unique<Coordinator>(cfg);
    }

    void bring_up(const AgentId& id) {
        coord->transition_agent(id, LifecycleState::Initializing);
        coord->transition_agent(id, LifecycleState::Ready);
        coord->transition_agent(id, LifecycleState::Starting);
        coord->transition_agent(id, LifecycleState::Running);
    }
};

// ===========================================================================
// Registry
// ===========================================================================

TEST_F(CoordinatorTest, RegisterAndQuery) {
    coord->register_agent(make_agent("a1"));
    EXPECT_EQ(coord->agent_count(), 1u);

    auto a = coord->get_agent(AgentId("a1"));
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->name(), "Agent a1");
    EXPECT_EQ(coord->lifecycle_state(AgentId("a1")), LifecycleState::Creating);
    EXPECT_FALSE(coord->get_agent(AgentId("zz")).has_value());
}

TEST_F(CoordinatorTest, RejectsDuplicatesInvalidAndOverCapacity) {
    coord->register_agent(make_agent("a1"));
    EXPECT_THROW(coord->register_agent(make_agent("a1")), AgentAlreadyRegisteredException);
    EXPECT_THROW(coord->register_agent(AgentState(AgentId("a2"), "", "worker")),
                 ValidationFailedException);

    coord->register_agent(make_agent("a2"));
    coord->register_agent(make_agent("a3"));
    coord->register_agent(make_agent("a4"));
    EXPECT_THROW(coord->register_agent(make_agent("a5")), CapacityExceededException);
    EXPECT_EQ(coord->agent_count(), 4u);
}

TEST_F(CoordinatorTest, Deregister) {
    coord->register_agent(make_agent("a1"));
    coord->deregister_agent(AgentId("a1"));
    EXPECT_EQ(coord->agent_count(), 0u);
    EXPECT_THROW(coord->deregister_agent(AgentId("a1")), AgentNotFoundException);
    EXPECT_THROW(coord->lifecycle_state(AgentId("a1")), AgentNotFoundException);
}

// ===========================================================================
// Lifecycle-driven status
// ===========================================================================

TEST_F(CoordinatorTest, LifecycleDrivesStatus) {
    AgentId id("a1");
    coord->register_agent(make_agent("a1"));

    coord->transition_agent(id, LifecycleState::Initializing);
    coord->transition_agent(id, LifecycleState::Ready);
    coord->transition_agent(id, LifecycleState::Starting);
    EXPECT_EQ(coord->get_agent(id)->status(), AgentStatus::Starting);

    coord->transition_agent(id, LifecycleState::Running);
    EXPECT_EQ(coord->get_agent(id)->status(), AgentStatus::Idle);

    coord->transition_agent(id, LifecycleState::Stopping);
    EXPECT_EQ(coord->get_agent(id)->status(), AgentStatus::ShuttingDown);

    coord->transition_agent(id, LifecycleState::Stopped);
    EXPECT_EQ(coord->get_agent(id)->status(), AgentStatus::Maintenance);

    coord->transition_agent(id, LifecycleState::Starting);
    coord->transition_agent(id, LifecycleState::Error);
    EXPECT_EQ(coord->get_agent(id)->status(), AgentStatus::Error);

    auto stats = coord->lifecycle_stats(id);
    EXPECT_EQ(stats.total_transitions, 8u);
    EXPECT_EQ(stats.state_counts[LifecycleState::Starting], 2u);
    EXPECT_EQ(coord->lifecycle_events(id).size(), 8u);
}

TEST_F(CoordinatorTest, RejectedTransitionChangesNothing) {
    AgentId id("a1");
    coord->register_agent(make_agent("a1"));
    EXPECT_THROW(coord->transition_agent(id, LifecycleState::Running), InvalidTransitionException);
    EXPECT_EQ(coord->lifecycle_state(id), LifecycleState::Creating);
    EXPECT_EQ(coord->get_agent(id)->status(), AgentStatus::Idle);
    EXPECT_EQ(coord->lifecycle_stats(id).total_transitions, 0u);
}

TEST_F(CoordinatorTest, TransitionUnknownAgent) {
    EXPECT_THROW(coord->transition_agent(AgentId("x"), LifecycleState::Initializing),
                 AgentNotFoundException);
}

// ===========================================================================
// Selection and work
// ===========================================================================

TEST_F(CoordinatorTest, SelectsHighestScoringAvailableAgent) {
    coord->register_agent(make_agent("low", PRIORITY_LOW));
    coord->register_agent(make_agent("high", PRIORITY_HIGH));
    coord->register_agent(make_agent("mid", PRIORITY_NORMAL));

    EXPECT_EQ(coord->select_agent(), std::optional<AgentId>(AgentId("high")));

    coord->update_health(AgentId("high"), AgentHealth::Degraded);
    EXPECT_EQ(coord->select_agent(), std::optional<AgentId>(AgentId("mid")));
    EXPECT_EQ(coord->get_available_agents().size(), 2u);
}

TEST_F(CoordinatorTest, SelectionHonoursCapability) {
    auto gpu = make_agent("gpu", PRIORITY_LOW);
    gpu.add_capability("cuda");
    coord->register_agent(std::move(gpu));
    coord->register_agent(make_agent("cpu", PRIORITY_HIGH));

    EXPECT_EQ(coord->select_agent(std::string("cuda")), std::optional<AgentId>(AgentId("gpu")));
    EXPECT_FALSE(coord->select_agent(std::string("tpu")).has_value());
}

TEST_F(CoordinatorTest, TaskTrackingMovesBetweenIdleAndBusy) {
    AgentId id("a1");
    coord->register_agent(make_agent("a1"));

    coord->record_task_start(id, TaskId("task-1"));
    auto busy = coord->get_agent(id);
    EXPECT_EQ(busy->status(), AgentStatus::Busy);
    EXPECT_EQ(busy->current_task(), std::optional<TaskId>(TaskId("task-1")));
    EXPECT_FALSE(coord->select_agent().has_value());

    coord->record_task_completion(id, 250);
    auto idle = coord->get_agent(id);
    EXPECT_EQ(idle->status(), AgentStatus::Idle);
    EXPECT_FALSE(idle->current_task().has_value());
    EXPECT_DOUBLE_EQ(idle->metrics().avg_task_time_ms(), 250.0);

    coord->record_task_start(id);
    coord->record_task_failure(id);
    EXPECT_EQ(coord->get_agent(id)->metrics().tasks_failed(), 1u);
    EXPECT_EQ(coord->get_agent(id)->status(), AgentStatus::Idle);
}

TEST_F(CoordinatorTest, StaleAgents) {
    Config short_cfg;
    short_cfg.heartbeat_timeout = Duration(-1);
    Coordinator c(short_cfg);
    c.register_agent(make_agent("a1"));
    c.register_agent(make_agent("a2"));
    EXPECT_EQ(c.find_stale_agents(), (std::vector<AgentId>{AgentId("a1"), AgentId("a2")}));

    coord->register_agent(make_agent("fresh"));
    coord->record_heartbeat(AgentId("fresh"));
    EXPECT_TRUE(coord->find_stale_agents().empty());
}

TEST_F(CoordinatorTest, StuckAgents) {
    Config stuck_cfg;
    stuck_cfg.lifecycle.initialization_timeout = Duration(-1);
    Coordinator c(stuck_cfg);
    c.register_agent(make_agent("slow"));
    c.register_agent(make_agent("idle"));
    c.transition_agent(AgentId("slow"), LifecycleState::Initializing);

    EXPECT_EQ(c.find_stuck_agents(), std::vector<AgentId>{AgentId("slow")});

    c.transition_agent(AgentId("slow"), LifecycleState::Ready);
    EXPECT_TRUE(c.find_stuck_agents().empty());
}

// ===========================================================================
// Reconciliation
// ===========================================================================

TEST_F(CoordinatorTest, ReconcileIdenticalSnapshotIsNoConflict) {
    coord->register_agent(make_agent("a1"));
    Json snapshot = *coord->get_agent(AgentId("a1"));
    EXPECT_FALSE(coord->reconcile(AgentId("a1"), snapshot).has_value());
}

TEST_F(CoordinatorTest, ReconcileAndApplyHealthierRemote) {
    AgentId id("a1");
    coord->register_agent(make_agent("a1"));
    coord->update_health(id, AgentHealth::Degraded);
    coord->resolver().add_handler(std::make_shared<AgentStateConflictHandler>());

    Json remote = *coord->get_agent(id);
    remote["health"] = "healthy";
    remote["priority"] = 210;
    remote["capabilities"] = Json::array({"deploy"});

    auto conflict = coord->reconcile(id, remote);
    ASSERT_TRUE(conflict.has_value());
    EXPECT_EQ(conflict->type().kind, ConflictKind::AgentState);
    EXPECT_EQ(coord->get_statistics().active_conflicts, 1u);

    auto result = coord->resolver().attempt_resolution(
        conflict->id(), ConflictStrategy::custom(AgentStateConflictHandler::kName));
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(coord->apply_resolution(id, result));

    auto agent = coord->get_agent(id);
    EXPECT_EQ(agent->health(), AgentHealth::Healthy);
    EXPECT_EQ(agent->priority(), 210);
    EXPECT_TRUE(agent->has_capability("deploy"));
    EXPECT_EQ(coord->get_statistics().active_conflicts, 0u);
}

TEST_F(CoordinatorTest, ApplyFailedResolutionIsIgnored) {
    coord->register_agent(make_agent("a1"));
    auto failed = ResolutionResult::make_failure(ConflictStrategy{}, "no");
    EXPECT_FALSE(coord->apply_resolution(AgentId("a1"), failed));
}

TEST_F(CoordinatorTest, ApplyMalformedResolutionThrows) {
    coord->register_agent(make_agent("a1"));
    auto bad = ResolutionResult::make_success(ConflictStrategy{}, Json{{"health", "radiant"}}, "x");
    EXPECT_THROW(coord->apply_resolution(AgentId("a1"), bad), ValidationFailedException);
    EXPECT_EQ(coord->get_agent(AgentId("a1"))->health(), AgentHealth::Healthy);
}

TEST_F(CoordinatorTest, ApplyResolutionRejectsNonBytePriority) {
    AgentId id("a1");
    coord->register_agent(make_agent("a1", 40));

    for (const Json& p : {Json(4294967396ULL), Json(3.9), Json(-5), Json(256)}) {
        auto r = ResolutionResult::make_success(ConflictStrategy{},
                                                Json{{"health", "degraded"}, {"priority", p}}, "x");
        EXPECT_THROW(coord->apply_resolution(id, r), ValidationFailedException) << p.dump();
    }
    auto agent = coord->get_agent(id);
    EXPECT_EQ(agent->priority(), 40);
    EXPECT_EQ(agent->health(), AgentHealth::Healthy);
}

// ===========================================================================
// Statistics and events
// ===========================================================================

TEST_F(CoordinatorTest, Statistics) {
    coord->register_agent(make_agent("a1"));
    coord->register_agent(make_agent("a2"));
    coord->register_agent(make_agent("a3"));
    coord->update_health(AgentId("a2"), AgentHealth::Degraded);
    coord->update_health(AgentId("a3"), AgentHealth::Offline);

    auto stats = coord->get_statistics();
    EXPECT_EQ(stats.total_agents, 3u);
    EXPECT_EQ(stats.healthy_agents, 2u);
    EXPECT_EQ(stats.available_agents, 1u);
    EXPECT_EQ(stats.stale_agents, 0u);
    EXPECT_EQ(stats.active_conflicts, 0u);
}

TEST_F(CoordinatorTest, MonitorReceivesCoordinatorAndResolverEvents) {
    auto metrics = std::make_shared<MetricsMonitor>();
    coord->set_monitor(metrics);

    AgentId id("a1");
    coord->register_agent(make_agent("a1"));
    coord->transition_agent(id, LifecycleState::Initializing);
    EXPECT_THROW(coord->transition_agent(id, LifecycleState::Running), InvalidTransitionException);

    Json remote = *coord->get_agent(id);
    remote["status"] = "busy";
    ASSERT_TRUE(coord->reconcile(id, remote).has_value());

    auto m = metrics->get_metrics();
    EXPECT_EQ(m.transitions, 1u);
    EXPECT_EQ(m.rejected_transitions, 1u);
    EXPECT_EQ(m.conflicts_detected, 1u);
}
