#include <gtest/gtest.h>
#include <format>
#include <string>
#include <variant>

#include "../core/Commands.hpp"
#include "../core/HackerJeopardy.hpp"
#include "TestSupport.hpp"

using namespace meshquiz::core;
using namespace meshquiz::test;

TEST(ParseCommand, AdminVerbs)
{
    EXPECT_TRUE(std::holds_alternative<StartCmd>(ParseCommand("!hj start")));
    EXPECT_TRUE(std::holds_alternative<StopCmd>(ParseCommand("  !HJ STOP ")));
    EXPECT_TRUE(std::holds_alternative<NextCmd>(ParseCommand("!hj next")));
    EXPECT_TRUE(std::holds_alternative<ResetCmd>(ParseCommand("!hj reset")));

    Command const ban = ParseCommand("!hj ban !A1B2");
    ASSERT_TRUE(std::holds_alternative<BanCmd>(ban));
    EXPECT_EQ(std::get<BanCmd>(ban).target, "!A1B2");

    Command const bare = ParseCommand("!hj unban");
    ASSERT_TRUE(std::holds_alternative<UnbanCmd>(bare));
    EXPECT_TRUE(std::get<UnbanCmd>(bare).target.empty());

    EXPECT_TRUE(IsAdminCommand(ban));
    EXPECT_FALSE(IsAdminCommand(ParseCommand("!hj status")));
}

TEST(ParseCommand, PlayerVerbsAndAliases)
{
    EXPECT_TRUE(std::holds_alternative<StatusCmd>(ParseCommand("!hj status")));
    EXPECT_TRUE(std::holds_alternative<StatusCmd>(ParseCommand("!hj info")));
    EXPECT_TRUE(std::holds_alternative<ScoresCmd>(ParseCommand("!hj scores")));
    EXPECT_TRUE(std::holds_alternative<ScoresCmd>(ParseCommand("!hj leaderboard")));
    EXPECT_TRUE(std::holds_alternative<JoinCmd>(ParseCommand("!hj join")));
    EXPECT_TRUE(std::holds_alternative<JoinCmd>(ParseCommand("!JOIN")));
    EXPECT_TRUE(std::holds_alternative<HelpCmd>(ParseCommand("!hj help")));
}

TEST(ParseCommand, UnknownAndFreeText)
{
    EXPECT_TRUE(std::holds_alternative<UnknownCmd>(ParseCommand("!hj")));
    EXPECT_TRUE(std::holds_alternative<UnknownCmd>(ParseCommand("!hj start now")));
    EXPECT_TRUE(std::holds_alternative<UnknownCmd>(ParseCommand("!hj dance")));
    EXPECT_TRUE(std::holds_alternative<UnknownCmd>(ParseCommand("!weather")));
    EXPECT_TRUE(std::holds_alternative<UnknownCmd>(ParseCommand("!join please")));

    Command const text = ParseCommand("  cross-site scripting ");
    ASSERT_TRUE(std::holds_alternative<FreeText>(text));
    EXPECT_EQ(std::get<FreeText>(text).text, "cross-site scripting");

    EXPECT_EQ(CommandName(ParseCommand("!hj leaderboard")), "scores");
    EXPECT_EQ(CommandName(text), "answer");
}

TEST(HackerJeopardy, FullRoundOverTheRouter)
{
    BotRig bot;

    bot.Dm("!p1", "22");
    EXPECT_EQ(bot.LastTo("!p1"), "No game in progress. Wait for an admin to start one!");
    bot.Dm("!p1", "!hj status");
    EXPECT_EQ(bot.LastTo("!p1"), "No game in progress.");

    bot.Dm("!admin1", "!hj start");
    EXPECT_EQ(bot.LastTo("!admin1"), "Game #1 started. Round 1 is up!");
    auto const on_channel = bot.transport.To("");
    ASSERT_EQ(on_channel.size(), 2u);
    EXPECT_TRUE(on_channel[0].starts_with("HACKER JEOPARDY #1 - GAME ON!"));
    EXPECT_TRUE(on_channel[1].starts_with("ROUND 1/3 - 200 POINTS"));

    bot.Dm("!p1", "!hj join");
    EXPECT_TRUE(bot.LastTo("!p1").starts_with("You're in! 1 players joined."));
    EXPECT_NE(bot.LastTo("!p1").find("What port does SSH"), std::string::npos);
    bot.Dm("!p1", "!hj join");
    EXPECT_EQ(bot.LastTo("!p1"), "You're already in the game!");

    bot.Dm("!p1", "Twenty-Two");
    EXPECT_EQ(bot.LastTo("!p1"), "Answer locked in for round 1. Results when the window closes!");
    bot.Dm("!p1", "22");
    EXPECT_EQ(bot.LastTo("!p1"), "You already answered this question!");

    bot.Dm("!p1", "!hj status");
    EXPECT_NE(bot.LastTo("!p1").find("Round 1/3 | 1 players joined"), std::string::npos);
    EXPECT_NE(bot.LastTo("!p1").find("Question open, 2 min left"), std::string::npos);

    bot.clock.Advance(120s);
    auto const after = bot.transport.To("");
    ASSERT_EQ(after.size(), 3u);
    EXPECT_TRUE(after[2].starts_with("ROUND 1 CLOSED. Answer: 22"));

    bot.Dm("!p1", "443");
    EXPECT_EQ(bot.LastTo("!p1"), "No active question right now. Wait for the next one!");

    bot.Dm("!p1", "!hj scores");
    EXPECT_EQ(bot.LastTo("!p1"), "LEADERBOARD:\n1. !p1: 200 pts");
}

TEST(HackerJeopardy, AdminRepliesAndRefusals)
{
    BotRig bot;

    bot.Dm("!mallory", "!hj start");
    EXPECT_EQ(bot.LastTo("!mallory"), "Only admins can start!");

    bot.Dm("!admin1", "!hj start");
    bot.Dm("!admin1", "!hj start");
    EXPECT_EQ(bot.LastTo("!admin1"), "A game is already running.");

    bot.Dm("!mallory", "!hj stop");
    EXPECT_EQ(bot.LastTo("!mallory"), "Only admins can stop!");
    EXPECT_EQ(bot.session.Status().state, SessionState::Running);

    bot.Dm("!admin1", "!hj ban");
    EXPECT_EQ(bot.LastTo("!admin1"), "Usage: !hj ban <node-id>");
    bot.Dm("!admin1", "!hj ban !P2");
    EXPECT_EQ(bot.LastTo("!admin1"), "Banned !p2");
    bot.Dm("!admin1", "!hj ban p2");
    EXPECT_EQ(bot.LastTo("!admin1"), "!p2 was already banned");

    bot.Dm("!p2", "22");
    EXPECT_EQ(bot.LastTo("!p2"), "You are banned from playing.");

    bot.Dm("!admin1", "!hj unban !p2");
    EXPECT_EQ(bot.LastTo("!admin1"), "Unbanned !p2");
    bot.Dm("!admin1", "!hj unban !p2");
    EXPECT_EQ(bot.LastTo("!admin1"), "!p2 was not banned");

    bot.Dm("!admin1", "!hj next");
    EXPECT_EQ(bot.LastTo("!admin1"), "Round 1 skipped.");
    bot.Dm("!admin1", "!hj next");
    EXPECT_EQ(bot.LastTo("!admin1"), "Can't next now: no open round.");

    bot.Dm("!p2", "!hj dance");
    EXPECT_EQ(bot.LastTo("!p2"), "Unknown command. Use !hj help for commands.");

    bot.Dm("!p2", "!hj help");
    EXPECT_EQ(bot.LastTo("!p2").find("Admin:"), std::string::npos);
    bot.Dm("!admin1", "!hj help");
    EXPECT_NE(bot.LastTo("!admin1").find("Admin:"), std::string::npos);

    bot.Dm("!admin1", "!hj stop");
    EXPECT_EQ(bot.LastTo("!admin1"), "Game stopped. Final scores posted to the channel.");
    EXPECT_TRUE(bot.transport.To("").back().starts_with("GAME OVER"));

    bot.Dm("!admin1", "!hj reset");
    EXPECT_EQ(bot.LastTo("!admin1"), "All cumulative scores cleared.");
}

TEST(HackerJeopardy, PublicTrafficRules)
{
    BotRig bot;
    bot.Dm("!admin1", "!hj start");
    bot.transport.Clear();

    // other channels are not ours
    bot.Say("!p2", 3, "!hj join");
    EXPECT_TRUE(bot.transport.Sent().empty());

    // answers only count by DM; chatter on the game channel gets no reply
    bot.Say("!p2", 0, "22");
    EXPECT_TRUE(bot.transport.Sent().empty());
    EXPECT_TRUE(bot.session.Leaderboard(5).empty());

    // commands on the game channel are answered by DM
    bot.Say("!p2", 0, "!hj join");
    EXPECT_TRUE(bot.LastTo("!p2").starts_with("You're in! 1 players joined."));
}

TEST(HackerJeopardy, LongRepliesAreSplitForTheRadio)
{
    std::vector<Question> qs;
    for (uint32_t i = 1; i <= 8; ++i)
    {
        qs.push_back(MakeQuestion(i, "q", 100, {"a"}));
    }
    BotRig bot(TestConfig(8), std::move(qs));
    bot.Dm("!admin1", "!hj start");

    // a long leaderboard
    for (int p = 0; p < 12; ++p)
    {
        std::string const node = std::format("!player-with-a-long-name-{:02}", p);
        bot.Dm(node, "a");
    }
    bot.clock.Advance(120s);

    // the settlement lists all twelve and goes out in pieces
    auto const channel = bot.transport.To("");
    EXPECT_GT(channel.size(), 3u);

    bot.transport.Clear();
    bot.Dm("!admin1", "!hj scores");
    EXPECT_GE(bot.transport.To("!admin1").size(), 2u);

    for (auto const& pkt : bot.transport.Sent())
    {
        EXPECT_LE(pkt.text.size(), meshquiz::net::MaxMeshText);
        EXPECT_EQ(pkt.channel, 0u);
    }
    for (auto const& pkt : channel)
    {
        EXPECT_LE(pkt.size(), meshquiz::net::MaxMeshText);
    }
}
