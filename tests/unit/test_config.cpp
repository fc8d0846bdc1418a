#include <gtest/gtest.h>
#include <agentsync/agentsync.hpp>

using namespace agentsync;
using namespace std::chrono_literals;

TEST(ConfigTest, Defaults) {
    Config cfg;
    EXPECT_EQ(cfg.max_agents, 1024u);
    EXPECT_EQ(cfg.heartbeat_timeout, Duration(90s));
    EXPECT_EQ(cfg.lifecycle.initialization_timeout, Duration(30s));
    EXPECT_EQ(cfg.lifecycle.startup_timeout, Duration(60s));
    EXPECT_EQ(cfg.lifecycle.shutdown_timeout, Duration(30s));
    EXPECT_EQ(cfg.lifecycle.destroy_timeout, Duration(30s));
    EXPECT_EQ(cfg.resolver.default_strategy.kind, StrategyKind::AutoMerge);
    EXPECT_EQ(cfg.resolver.max_history_size, 0u);
}

TEST(ConfigTest, EmptyObjectKeepsDefaults) {
    auto cfg = config_from_json(Json::object());
    EXPECT_EQ(cfg.max_agents, 1024u);
    EXPECT_EQ(cfg.heartbeat_timeout, Duration(90s));
}

TEST(ConfigTest, ParsesAllSections) {
    auto cfg = config_from_json(Json::parse(R"({
        "max_agents": 64,
        "heartbeat_timeout_s": 15,
        "lifecycle": {"startup_timeout_s": 10, "destroy_timeout_s": 5},
        "resolver": {"default_strategy": "keep_local", "max_history_size": 500},
        "unknown_key": true
    })"));

    EXPECT_EQ(cfg.max_agents, 64u);
    EXPECT_EQ(cfg.heartbeat_timeout, Duration(15s));
    EXPECT_EQ(cfg.lifecycle.startup_timeout, Duration(10s));
    EXPECT_EQ(cfg.lifecycle.destroy_timeout, Duration(5s));
    EXPECT_EQ(cfg.lifecycle.shutdown_timeout, Duration(30s));
    EXPECT_EQ(cfg.resolver.default_strategy.kind, StrategyKind::KeepLocal);
    EXPECT_EQ(cfg.resolver.max_history_size, 500u);
}

TEST(ConfigTest, CustomStrategyName) {
    auto cfg = config_from_json(Json{{"resolver", {{"default_strategy", "custom:agent_state_handler"}}}});
    EXPECT_EQ(cfg.resolver.default_strategy, ConflictStrategy::custom("agent_state_handler"));
}

TEST(ConfigTest, EveryStrategyNameRoundTrips) {
    const std::vector<ConflictStrategy> strategies = {
        ConflictStrategy{StrategyKind::AutoMerge},
        ConflictStrategy{StrategyKind::KeepLocal},
        ConflictStrategy{StrategyKind::KeepRemote},
        ConflictStrategy{StrategyKind::Manual},
        ConflictStrategy{StrategyKind::LastWriterWins},
        ConflictStrategy::custom("my_handler"),
    };
    for (const auto& s : strategies) {
        Config cfg;
        cfg.resolver.default_strategy = s;
        auto back = config_from_json(config_to_json(cfg));
        EXPECT_EQ(back.resolver.default_strategy, s) << s.key();
    }
}

TEST(ConfigTest, ToJsonRoundTripsDurations) {
    Config cfg;
    cfg.max_agents = 7;
    cfg.heartbeat_timeout = 42s;
    cfg.lifecycle.initialization_timeout = 3s;
    auto back = config_from_json(config_to_json(cfg));
    EXPECT_EQ(back.max_agents, 7u);
    EXPECT_EQ(back.heartbeat_timeout, Duration(42s));
    EXPECT_EQ(back.lifecycle.initialization_timeout, Duration(3s));
}

TEST(ConfigTest, MalformedValuesThrow) {
    EXPECT_THROW(config_from_json(Json::array()), ValidationFailedException);
    EXPECT_THROW(config_from_json(Json{{"max_agents", -1}}), ValidationFailedException);
    EXPECT_THROW(config_from_json(Json{{"max_agents", 0}}), ValidationFailedException);
    EXPECT_THROW(config_from_json(Json{{"heartbeat_timeout_s", "soon"}}), ValidationFailedException);
    EXPECT_THROW(config_from_json(Json{{"lifecycle", 5}}), ValidationFailedException);
    EXPECT_THROW(config_from_json(Json{{"resolver", {{"default_strategy", "coin_flip"}}}}),
                 ValidationFailedException);
    EXPECT_THROW(config_from_json(Json{{"resolver", {{"default_strategy", 3}}}}),
                 ValidationFailedException);
}

TEST(ConfigTest, TimeoutsBeyondDurationRangeThrow) {
    EXPECT_THROW(config_from_json(Json{{"heartbeat_timeout_s", 10000000000ULL}}),
                 ValidationFailedException);
    EXPECT_THROW(config_from_json(Json{{"lifecycle", {{"startup_timeout_s", 18446744073709551615ULL}}}}),
                 ValidationFailedException);

    auto cfg = config_from_json(Json{{"heartbeat_timeout_s", 9000000000ULL}});
    EXPECT_GT(cfg.heartbeat_timeout, Duration::zero());
}
