#include <gtest/gtest.h>
#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "../AppConfig.hpp"
#include "../core/Exception.hpp"

using namespace meshquiz;
using namespace std::chrono_literals;

namespace
{
    struct FakeEnv
    {
        std::map<std::string, std::string> vars;

        auto Lookup() const -> EnvLookup
        {
            return [this](char const* name) -> char const*
            {
                auto const it = vars.find(name);
                return it == vars.end() ? nullptr : it->second.c_str();
            };
        }
    };

    auto Parse(std::vector<char const*> args, FakeEnv const& env = {}) -> AppConfig
    {
        args.insert(args.begin(), "meshquiz_bot");
        return ParseArgs(static_cast<int>(args.size()), args.data(), env.Lookup());
    }
}

TEST(AppConfig, Defaults)
{
    AppConfig const cfg = Parse({});
    EXPECT_EQ(cfg.session.answer_window, 120s);
    EXPECT_EQ(cfg.session.question_interval, 180s);
    EXPECT_EQ(cfg.session.max_rounds, 10u);
    EXPECT_TRUE(cfg.session.admin_ids.empty());
    EXPECT_EQ(cfg.game_channel, 0u);
    EXPECT_FALSE(cfg.show_help);
}

TEST(AppConfig, EnvironmentThenFlags)
{
    FakeEnv env;
    env.vars = {
        {"HJ_ADMIN_NODE_IDS", "!AAAA,!bbbb"},
        {"HJ_ANSWER_WINDOW", "90"},
        {"HJ_QUESTION_INTERVAL", "5m"},
        {"HJ_MAX_ROUNDS", "4"},
        {"HJ_GAME_CHANNEL", "2"},
        {"HJ_QUESTIONS_FILE", "env.txt"},
    };

    AppConfig const cfg = Parse({"--max-rounds", "7", "--questions=flag.txt"}, env);
    ASSERT_EQ(cfg.session.admin_ids.size(), 2u);
    EXPECT_EQ(cfg.session.admin_ids[0], "aaaa");
    EXPECT_EQ(cfg.session.answer_window, 90s);
    EXPECT_EQ(cfg.session.question_interval, 300s);
    EXPECT_EQ(cfg.session.max_rounds, 7u);
    EXPECT_EQ(cfg.game_channel, 2u);
    EXPECT_EQ(cfg.questions_file, "flag.txt");
}

TEST(AppConfig, EmptyEnvironmentValuesAreIgnored)
{
    FakeEnv env;
    env.vars = {{"HJ_MAX_ROUNDS", ""}};
    EXPECT_EQ(Parse({}, env).session.max_rounds, 10u);
}

TEST(AppConfig, DurationsAndRanges)
{
    EXPECT_EQ(Parse({"--answer-window", "45s"}).session.answer_window, 45s);
    EXPECT_EQ(Parse({"--question-interval", "2M"}).session.question_interval, 120s);
    EXPECT_EQ(Parse({"--settle-attempts", "5"}).session.settle_attempts, 5u);
    EXPECT_EQ(Parse({"--gateway", "ws://10.0.0.2:4403/mesh"}).gateway_uri, "ws://10.0.0.2:4403/mesh");

    EXPECT_THROW((void)Parse({"--answer-window", "0"}), core::error::ConfigError);
    EXPECT_THROW((void)Parse({"--answer-window", "two"}), core::error::ConfigError);
    EXPECT_THROW((void)Parse({"--max-rounds", "0"}), core::error::ConfigError);
    EXPECT_THROW((void)Parse({"--max-rounds", "1001"}), core::error::ConfigError);
    EXPECT_THROW((void)Parse({"--channel", "8"}), core::error::ConfigError);
    EXPECT_THROW((void)Parse({"--settle-attempts", "11"}), core::error::ConfigError);
}

TEST(AppConfig, BadCommandLines)
{
    EXPECT_THROW((void)Parse({"--colour", "blue"}), core::error::ConfigError);
    EXPECT_THROW((void)Parse({"stray"}), core::error::ConfigError);
    EXPECT_THROW((void)Parse({"--max-rounds"}), core::error::ConfigError);

    FakeEnv env;
    env.vars = {{"HJ_MAX_ROUNDS", "lots"}};
    EXPECT_THROW((void)Parse({}, env), core::error::ConfigError);
}

TEST(AppConfig, HelpFlag)
{
    EXPECT_TRUE(Parse({"-h"}).show_help);
    EXPECT_TRUE(Parse({"--help"}).show_help);
    EXPECT_NE(Usage("meshquiz_bot").find("--answer-window"), std::string::npos);
}
