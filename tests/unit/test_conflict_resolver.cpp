#include <gtest/gtest.h>
#include <agentsync/agentsync.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace agentsync;
using namespace std::chrono_literals;

namespace {

ConflictType agent_state_type() {
    return ConflictType{ConflictKind::AgentState, {}};
}

} // anonymous namespace

class ConflictResolverTest : public ::testing::Test {
protected:
    ConflictResolver resolver;

    ConflictId detect(Json local, Json remote) {
        auto c = resolver.detect_conflict(agent_state_type(), std::move(local), std::move(remote));
        EXPECT_TRUE(c.has_value());
        return c->id();
    }
};

// ===========================================================================
// Detection
// ===========================================================================

TEST_F(ConflictResolverTest, EqualSnapshotsAreNotAConflict) {
    auto c = resolver.detect_conflict(agent_state_type(), Json{{"a", 1}}, Json{{"a", 1}});
    EXPECT_FALSE(c.has_value());
    EXPECT_EQ(resolver.active_conflict_count(), 0u);
    EXPECT_EQ(resolver.get_statistics().total_conflicts, 0u);
}

TEST_F(ConflictResolverTest, DetectionIsDeepEquality) {
    Json local{{"nested", {{"list", {1, 2, 3}}}}};
    Json remote{{"nested", {{"list", {1, 2, 4}}}}};
    EXPECT_TRUE(resolver.detect_conflict(agent_state_type(), local, remote).has_value());
    EXPECT_FALSE(resolver.detect_conflict(agent_state_type(), local, local).has_value());
}

TEST_F(ConflictResolverTest, DetectedConflictIsActiveWithDefaults) {
    auto c = resolver.detect_conflict(agent_state_type(), Json{{"a", 1}}, Json{{"a", 2}});
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->severity(), ConflictSeverity::Medium);
    EXPECT_EQ(c->description(), "State conflict detected");
    EXPECT_EQ(c->id().str().rfind("conflict-", 0), 0u);

    auto active = resolver.get_active_conflicts();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0].id(), c->id());
    EXPECT_TRUE(resolver.get_conflict(c->id()).has_value());

    auto stats = resolver.get_statistics();
    EXPECT_EQ(stats.total_conflicts, 1u);
    EXPECT_EQ(stats.conflicts_by_type["agent_state"], 1u);
}

TEST_F(ConflictResolverTest, DetectionOverloadKeepsSeverityAndDescription) {
    auto c = resolver.detect_conflict(ConflictType::custom("lease"), ConflictSeverity::Critical,
                                      "lease split-brain", Json(1), Json(2));
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->severity(), ConflictSeverity::Critical);
    EXPECT_EQ(c->description(), "lease split-brain");
    EXPECT_EQ(resolver.get_statistics().conflicts_by_type["custom_lease"], 1u);
}

TEST_F(ConflictResolverTest, AddConflictCountsOnceEvenWhenReplaced) {
    Conflict c(ConflictId("ext-1"), agent_state_type(), ConflictSeverity::Low, "external",
               Json(1), Json(2));
    resolver.add_conflict(c);
    resolver.add_conflict(c);
    EXPECT_EQ(resolver.active_conflict_count(), 1u);
    EXPECT_EQ(resolver.get_statistics().total_conflicts, 1u);
}

// ===========================================================================
// Built-in strategies
// ===========================================================================

TEST_F(ConflictResolverTest, AutoMergeUnionsObjectsRemoteWins) {
    auto id = detect(Json{{"a", 1}, {"b", 2}}, Json{{"b", 3}, {"c", 4}});
    auto r = resolver.attempt_resolution(id);
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.strategy.kind, StrategyKind::AutoMerge);
    EXPECT_EQ(r.resolved_state, (Json{{"a", 1}, {"b", 3}, {"c", 4}}));
}

TEST_F(ConflictResolverTest, AutoMergeNonObjectsKeepsLocal) {
    auto id = detect(Json::array({1, 2}), Json::array({3}));
    EXPECT_EQ(resolver.attempt_resolution(id).resolved_state, Json::array({1, 2}));
}

TEST_F(ConflictResolverTest, LastWriterWinsMatchesAutoMergeForObjects) {
    auto id = detect(Json{{"a", 1}, {"b", 2}}, Json{{"b", 3}});
    auto r = resolver.attempt_resolution(id, ConflictStrategy{StrategyKind::LastWriterWins});
    EXPECT_EQ(r.resolved_state, (Json{{"a", 1}, {"b", 3}}));
    EXPECT_EQ(r.strategy.kind, StrategyKind::LastWriterWins);
}

TEST_F(ConflictResolverTest, LastWriterWinsNonObjectsTakesRemote) {
    auto id = detect(Json("local"), Json("remote"));
    auto r = resolver.attempt_resolution(id, ConflictStrategy{StrategyKind::LastWriterWins});
    EXPECT_EQ(r.resolved_state, Json("remote"));
}

TEST_F(ConflictResolverTest, KeepLocalAndKeepRemote) {
    auto a = detect(Json{{"v", "L"}}, Json{{"v", "R"}});
    auto b = detect(Json{{"v", "L"}}, Json{{"v", "R"}});
    EXPECT_EQ(resolver.attempt_resolution(a, ConflictStrategy{StrategyKind::KeepLocal}).resolved_state,
              (Json{{"v", "L"}}));
    EXPECT_EQ(resolver.attempt_resolution(b, ConflictStrategy{StrategyKind::KeepRemote}).resolved_state,
              (Json{{"v", "R"}}));
}

TEST_F(ConflictResolverTest, ConfiguredStrategyIsUsedByDefault) {
    resolver.set_strategy(ConflictStrategy{StrategyKind::KeepRemote});
    EXPECT_EQ(resolver.strategy().kind, StrategyKind::KeepRemote);

    auto id = detect(Json(1), Json(2));
    EXPECT_EQ(resolver.attempt_resolution(id).resolved_state, Json(2));
}

TEST(ConflictResolverConfigTest, DefaultStrategyFromConfig) {
    ResolverConfig cfg;
    cfg.default_strategy = ConflictStrategy{StrategyKind::KeepLocal};
    ConflictResolver resolver(cfg);
    EXPECT_EQ(resolver.strategy().kind, StrategyKind::KeepLocal);
}

// ===========================================================================
// Success bookkeeping
// ===========================================================================

TEST_F(ConflictResolverTest, SuccessRetiresConflictAndUpdatesStats) {
    auto id = detect(Json{{"a", 1}}, Json{{"a", 2}});
    resolver.attempt_resolution(id);

    EXPECT_FALSE(resolver.get_conflict(id).has_value());
    EXPECT_EQ(resolver.active_conflict_count(), 0u);

    auto history = resolver.get_conflict_history();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].conflict_id, id);
    EXPECT_TRUE(history[0].success);
    EXPECT_TRUE(history[0].error.empty());

    auto stats = resolver.get_statistics();
    EXPECT_EQ(stats.total_resolved, 1u);
    EXPECT_EQ(stats.total_failed, 0u);
    EXPECT_DOUBLE_EQ(stats.success_rate, 100.0);
    EXPECT_EQ(stats.conflicts_by_strategy["auto_merge"], 1u);
    EXPECT_GE(stats.avg_resolution_time_ms, 0.0);
}

TEST_F(ConflictResolverTest, ResolvedConflictIsArchived) {
    auto id = detect(Json(1), Json(2));
    resolver.attempt_resolution(id, ConflictStrategy{StrategyKind::KeepLocal});

    auto archived = resolver.get_resolved_conflict(id);
    ASSERT_TRUE(archived.has_value());
    EXPECT_TRUE(archived->is_resolved());
    EXPECT_EQ(archived->resolution_strategy()->kind, StrategyKind::KeepLocal);
    EXPECT_EQ(*archived->resolution_result(), Json(1));
}

TEST_F(ConflictResolverTest, ResolvingTwiceReportsNotFound) {
    auto id = detect(Json(1), Json(2));
    resolver.attempt_resolution(id);
    EXPECT_THROW(resolver.attempt_resolution(id), ConflictNotFoundException);

    // No bookkeeping for the missing id
    EXPECT_EQ(resolver.get_conflict_history().size(), 1u);
    EXPECT_EQ(resolver.get_statistics().total_failed, 0u);
}

TEST_F(ConflictResolverTest, UnknownIdThrowsWithoutSideEffects) {
    EXPECT_THROW(resolver.attempt_resolution(ConflictId("missing")), ConflictNotFoundException);
    EXPECT_TRUE(resolver.get_conflict_history().empty());
    EXPECT_EQ(resolver.get_statistics().total_failed, 0u);
}

TEST_F(ConflictResolverTest, SuccessRateOverAllDetected) {
    auto a = detect(Json(1), Json(2));
    detect(Json(3), Json(4));
    resolver.attempt_resolution(a);
    EXPECT_DOUBLE_EQ(resolver.get_statistics().success_rate, 50.0);
}

// ===========================================================================
// Failures and retry
// ===========================================================================

TEST_F(ConflictResolverTest, ManualLeavesConflictPending) {
    auto id = detect(Json{{"a", 1}}, Json{{"a", 2}});
    try {
        resolver.attempt_resolution(id, ConflictStrategy{StrategyKind::Manual});
        FAIL() << "expected ManualResolutionRequiredException";
    } catch (const ManualResolutionRequiredException& e) {
        EXPECT_EQ(e.conflict_id(), id);
    }

    EXPECT_TRUE(resolver.get_conflict(id).has_value());
    auto history = resolver.get_conflict_history();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_FALSE(history[0].success);
    EXPECT_FALSE(history[0].error.empty());

    auto stats = resolver.get_statistics();
    EXPECT_EQ(stats.total_failed, 1u);
    EXPECT_EQ(stats.total_resolved, 0u);
    EXPECT_EQ(stats.conflicts_by_strategy["manual"], 1u);
}

TEST_F(ConflictResolverTest, RetryWithDifferentStrategyAfterManual) {
    resolver.set_strategy(ConflictStrategy{StrategyKind::Manual});
    auto id = detect(Json{{"v", 1}}, Json{{"v", 2}});
    EXPECT_THROW(resolver.attempt_resolution(id), ManualResolutionRequiredException);

    auto r = resolver.attempt_resolution(id, ConflictStrategy{StrategyKind::KeepRemote});
    EXPECT_TRUE(r.success);
    EXPECT_FALSE(resolver.get_conflict(id).has_value());

    auto history = resolver.get_conflict_history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_FALSE(history[0].success);
    EXPECT_TRUE(history[1].success);
    EXPECT_EQ(resolver.get_statistics().total_resolved, 1u);
}

TEST_F(ConflictResolverTest, MissingHandlerThenRegistered) {
    resolver.set_strategy(ConflictStrategy::custom("late"));
    auto id = detect(Json(1), Json(2));
    EXPECT_THROW(resolver.attempt_resolution(id), HandlerNotFoundException);
    EXPECT_TRUE(resolver.get_conflict(id).has_value());

    resolver.add_handler(std::make_shared<FunctionConflictHandler>(
        "late", [](const Conflict& c) {
            return ResolutionResult::make_success(ConflictStrategy::custom("late"),
                                                  c.remote_state(), "late handler");
        }));
    auto r = resolver.attempt_resolution(id);
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.resolved_state, Json(2));
    EXPECT_EQ(resolver.get_statistics().conflicts_by_strategy["custom_late"], 2u);
}

TEST_F(ConflictResolverTest, HandlerFailureResultKeepsConflict) {
    resolver.add_handler(std::make_shared<FunctionConflictHandler>(
        "refuser", [](const Conflict&) {
            return ResolutionResult::make_failure(ConflictStrategy::custom("refuser"), "no quorum");
        }));
    auto id = detect(Json(1), Json(2));
    auto r = resolver.attempt_resolution(id, ConflictStrategy::custom("refuser"));
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(resolver.get_conflict(id).has_value());
    EXPECT_EQ(resolver.get_conflict_history().back().error, "no quorum");
    EXPECT_EQ(resolver.get_statistics().total_failed, 1u);
}

TEST_F(ConflictResolverTest, HandlerExceptionPropagatesAfterBookkeeping) {
    resolver.add_handler(std::make_shared<FunctionConflictHandler>(
        "thrower", [](const Conflict&) -> ResolutionResult {
            throw std::runtime_error("backend down");
        }));
    auto id = detect(Json(1), Json(2));
    EXPECT_THROW(resolver.attempt_resolution(id, ConflictStrategy::custom("thrower")),
                 std::runtime_error);
    EXPECT_TRUE(resolver.get_conflict(id).has_value());
    EXPECT_EQ(resolver.get_conflict_history().back().error, "backend down");
}

TEST_F(ConflictResolverTest, HistoryIsBoundedWhenConfigured) {
    ResolverConfig cfg;
    cfg.default_strategy = ConflictStrategy{StrategyKind::Manual};
    cfg.max_history_size = 3;
    ConflictResolver bounded(cfg);

    auto c = bounded.detect_conflict(agent_state_type(), Json(1), Json(2));
    ASSERT_TRUE(c.has_value());
    for (int i = 0; i < 5; ++i) {
        EXPECT_THROW(bounded.attempt_resolution(c->id()), ManualResolutionRequiredException);
    }
    EXPECT_EQ(bounded.get_conflict_history().size(), 3u);
    EXPECT_EQ(bounded.get_statistics().total_failed, 5u);
}

TEST_F(ConflictResolverTest, NonStandardThrowIsStillRecorded) {
    resolver.add_handler(std::make_shared<FunctionConflictHandler>(
        "odd", [](const Conflict&) -> ResolutionResult { throw 42; }));
    auto id = detect(Json(1), Json(2));
    EXPECT_THROW(resolver.attempt_resolution(id, ConflictStrategy::custom("odd")), int);

    EXPECT_TRUE(resolver.get_conflict(id).has_value());
    auto history = resolver.get_conflict_history();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_FALSE(history[0].success);
    EXPECT_EQ(history[0].error, "unknown error");
    EXPECT_EQ(resolver.get_statistics().total_failed, 1u);
    EXPECT_EQ(resolver.get_statistics().conflicts_by_strategy["custom_odd"], 1u);
}

TEST_F(ConflictResolverTest, FailedAttemptsDoNotBlockLaterResolution) {
    auto id = detect(Json{{"a", 1}}, Json{{"a", 2}});
    for (int i = 0; i < 3; ++i) {
        EXPECT_THROW(resolver.attempt_resolution(id, ConflictStrategy{StrategyKind::Manual}),
                     ManualResolutionRequiredException);
    }

    std::atomic<int> ok{0};
    std::atomic<int> missing{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            try {
                if (resolver.attempt_resolution(id).success) ok.fetch_add(1);
            } catch (const ConflictNotFoundException&) {
                missing.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(ok.load(), 1);
    EXPECT_EQ(missing.load(), 7);
    EXPECT_EQ(resolver.get_statistics().total_failed, 3u);
    EXPECT_EQ(resolver.get_statistics().total_resolved, 1u);
}

TEST_F(ConflictResolverTest, ResolvedArchiveIsBoundedWhenConfigured) {
    ResolverConfig cfg;
    cfg.max_history_size = 2;
    ConflictResolver bounded(cfg);

    std::vector<ConflictId> ids;
    for (int i = 0; i < 4; ++i) {
        auto c = bounded.detect_conflict(agent_state_type(), Json(i), Json(i + 100));
        ASSERT_TRUE(c.has_value());
        ids.push_back(c->id());
        EXPECT_TRUE(bounded.attempt_resolution(c->id()).success);
    }

    EXPECT_EQ(bounded.resolved_conflict_count(), 2u);
    EXPECT_FALSE(bounded.get_resolved_conflict(ids[0]).has_value());
    EXPECT_FALSE(bounded.get_resolved_conflict(ids[1]).has_value());
    EXPECT_TRUE(bounded.get_resolved_conflict(ids[2]).has_value());
    EXPECT_TRUE(bounded.get_resolved_conflict(ids[3]).has_value());
    EXPECT_EQ(bounded.get_statistics().total_resolved, 4u);
}

TEST_F(ConflictResolverTest, ResolvedArchiveUnboundedByDefault) {
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(resolver.attempt_resolution(detect(Json(i), Json(-i - 1))).success);
    }
    EXPECT_EQ(resolver.resolved_conflict_count(), 5u);
}

// ===========================================================================
// Handler registry
// ===========================================================================

TEST_F(ConflictResolverTest, RegistryAddRemove) {
    resolver.add_handler(std::make_shared<AgentStateConflictHandler>());
    EXPECT_TRUE(resolver.has_handler("agent_state_handler"));
    EXPECT_EQ(resolver.handler_names(), std::vector<std::string>{"agent_state_handler"});

    EXPECT_THROW(resolver.add_handler(std::make_shared<AgentStateConflictHandler>()),
                 HandlerAlreadyRegisteredException);

    resolver.remove_handler("agent_state_handler");
    EXPECT_FALSE(resolver.has_handler("agent_state_handler"));
    EXPECT_THROW(resolver.remove_handler("agent_state_handler"), HandlerNotFoundException);
}

TEST_F(ConflictResolverTest, NullHandlerRejected) {
    EXPECT_THROW(resolver.add_handler(nullptr), ValidationFailedException);
}

TEST_F(ConflictResolverTest, HandlerReceivesConflictCopy) {
    ConflictId seen;
    Json seen_local;
    resolver.add_handler(std::make_shared<FunctionConflictHandler>(
        "inspect", [&](const Conflict& c) {
            seen = c.id();
            seen_local = c.local_state();
            return ResolutionResult::make_success(ConflictStrategy::custom("inspect"),
                                                  c.local_state(), "ok");
        }));
    auto id = detect(Json{{"k", "local"}}, Json{{"k", "remote"}});
    resolver.attempt_resolution(id, ConflictStrategy::custom("inspect"));
    EXPECT_EQ(seen, id);
    EXPECT_EQ(seen_local["k"], "local");
}

// ===========================================================================
// Async
// ===========================================================================

TEST_F(ConflictResolverTest, AsyncResolution) {
    auto id = detect(Json(1), Json(2));
    auto fut = resolver.attempt_resolution_async(id);
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(fut.get().success);
    EXPECT_EQ(resolver.active_conflict_count(), 0u);
}

TEST_F(ConflictResolverTest, AsyncResolutionPropagatesErrors) {
    auto fut = resolver.attempt_resolution_async(ConflictId("nope"));
    EXPECT_THROW(fut.get(), ConflictNotFoundException);
}

// ===========================================================================
// Monitoring
// ===========================================================================

TEST_F(ConflictResolverTest, MonitorSeesDetectionAndResolution) {
    auto metrics = std::make_shared<MetricsMonitor>();
    resolver.set_monitor(metrics);

    auto a = detect(Json(1), Json(2));
    auto b = detect(Json(3), Json(4));
    resolver.attempt_resolution(a);
    EXPECT_THROW(resolver.attempt_resolution(b, ConflictStrategy{StrategyKind::Manual}),
                 ManualResolutionRequiredException);

    auto m = metrics->get_metrics();
    EXPECT_EQ(m.conflicts_detected, 2u);
    EXPECT_EQ(m.conflicts_resolved, 1u);
    EXPECT_EQ(m.resolution_failures, 1u);
}
