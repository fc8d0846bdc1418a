#include <gtest/gtest.h>
#include <agentsync/agentsync.hpp>

using namespace agentsync;

// ===========================================================================
// Conflict model
// ===========================================================================

TEST(ConflictTest, ConstructionFixesSnapshots) {
    Conflict c(ConflictType{ConflictKind::Resource}, ConflictSeverity::High,
               "gpu lease diverged", Json{{"owner", "a"}}, Json{{"owner", "b"}},
               {{"source", Json("replica-2")}});

    EXPECT_EQ(c.id().str().rfind("conflict-", 0), 0u);
    EXPECT_EQ(c.type().kind, ConflictKind::Resource);
    EXPECT_EQ(c.severity(), ConflictSeverity::High);
    EXPECT_EQ(c.description(), "gpu lease diverged");
    EXPECT_EQ(c.local_state()["owner"], "a");
    EXPECT_EQ(c.remote_state()["owner"], "b");
    EXPECT_EQ(c.metadata().at("source"), "replica-2");
    EXPECT_FALSE(c.is_resolved());
    EXPECT_FALSE(c.resolution_strategy().has_value());
}

TEST(ConflictTest, SuppliedIdIsKept) {
    Conflict c(ConflictId("c-1"), ConflictType::custom("schema"), ConflictSeverity::Low,
               "d", Json(1), Json(2));
    EXPECT_EQ(c.id(), ConflictId("c-1"));
    EXPECT_EQ(c.type().key(), "custom_schema");
}

TEST(ConflictTest, ResolvedCopyLeavesOriginalUntouched) {
    Conflict c(ConflictType{}, ConflictSeverity::Medium, "d", Json(1), Json(2));
    auto when = Clock::now();
    auto done = c.resolved(ConflictStrategy{StrategyKind::KeepRemote}, Json(2), when);

    EXPECT_TRUE(done.is_resolved());
    EXPECT_EQ(*done.resolved_at(), when);
    EXPECT_EQ(done.resolution_strategy()->kind, StrategyKind::KeepRemote);
    EXPECT_EQ(*done.resolution_result(), Json(2));
    EXPECT_EQ(done.id(), c.id());
    EXPECT_FALSE(c.is_resolved());
}

TEST(ConflictTest, SeverityIsOrdered) {
    EXPECT_LT(ConflictSeverity::Low, ConflictSeverity::Medium);
    EXPECT_LT(ConflictSeverity::High, ConflictSeverity::Critical);
}

TEST(ResolutionResultTest, Factories) {
    auto ok = ResolutionResult::make_success(ConflictStrategy{StrategyKind::KeepLocal},
                                             Json{{"x", 1}}, "kept");
    EXPECT_TRUE(ok.success);
    EXPECT_EQ(ok.resolved_state["x"], 1);
    EXPECT_EQ(ok.message, "kept");

    auto bad = ResolutionResult::make_failure(ConflictStrategy::custom("h"), "nope");
    EXPECT_FALSE(bad.success);
    EXPECT_TRUE(bad.resolved_state.is_null());
    EXPECT_EQ(bad.strategy, ConflictStrategy::custom("h"));
}

TEST(ConflictJsonTest, ConflictEncoding) {
    Conflict c(ConflictId("c-9"), ConflictType::custom("schema"), ConflictSeverity::Critical,
               "d", Json{{"v", 1}}, Json{{"v", 2}});
    Json j = c;
    EXPECT_EQ(j["id"], "c-9");
    EXPECT_EQ(j["type"]["kind"], "custom");
    EXPECT_EQ(j["type"]["name"], "schema");
    EXPECT_EQ(j["severity"], "Critical");
    EXPECT_FALSE(j.contains("resolved_at"));

    Json resolved = c.resolved(ConflictStrategy::custom("h"), Json{{"v", 2}}, Clock::now());
    EXPECT_EQ(resolved["resolution_strategy"]["handler_name"], "h");
    EXPECT_EQ(resolved["resolution_result"]["v"], 2);
}

TEST(ConflictJsonTest, StatisticsEncoding) {
    ConflictStatistics s;
    s.total_conflicts = 4;
    s.total_resolved = 3;
    s.success_rate = 75.0;
    s.conflicts_by_type["agent_state"] = 4;

    Json j = s;
    EXPECT_EQ(j["total_conflicts"], 4);
    EXPECT_EQ(j["success_rate"], 75.0);
    EXPECT_EQ(j["conflicts_by_type"]["agent_state"], 4);
}

// ===========================================================================
// merge_objects
// ===========================================================================

TEST(MergeObjectsTest, RemoteWinsPerKey) {
    Json local{{"a", 1}, {"b", 2}};
    Json remote{{"b", 3}, {"c", 4}};
    EXPECT_EQ(merge_objects(local, remote), (Json{{"a", 1}, {"b", 3}, {"c", 4}}));
}

TEST(MergeObjectsTest, MergeIsShallow) {
    Json local{{"cfg", {{"x", 1}, {"y", 1}}}};
    Json remote{{"cfg", {{"x", 2}}}};
    EXPECT_EQ(merge_objects(local, remote), (Json{{"cfg", {{"x", 2}}}}));
}

TEST(MergeObjectsTest, NonObjectsYieldOverlay) {
    EXPECT_EQ(merge_objects(Json::array({1}), Json(5)), Json(5));
}
