#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <format>
#include <print>
#include <random>
#include <string>
#include <vector>

#include "../core/Exception.hpp"
#include "../core/QuestionBank.hpp"
#include "../debug/AuditLogger.hpp"
#include "../debug/Invariants.hpp"
#include "TestSupport.hpp"

using namespace meshquiz::core;
using namespace meshquiz::test;

namespace
{
    auto make_config() -> SessionConfig
    {
        SessionConfig cfg = TestConfig(5);
        cfg.question_interval = std::chrono::seconds(90);
        cfg.answer_window = std::chrono::seconds(60);
        return cfg;
    }

    auto make_questions() -> std::vector<Question>
    {
        std::vector<Question> qs = DefaultQuestions();
        qs.push_back(MakeQuestion(4, "Which layer does TCP live on?", 300, {"transport", "4"}));
        qs.push_back(MakeQuestion(5, "Name the tool that maps open ports.", 400, {"nmap"}));
        return qs;
    }

    // Random chatter a mesh channel could produce during a game
    auto random_line(std::mt19937_64& rng, Question const* live) -> std::string
    {
        static std::vector<std::string> const noise = {
            "!hj status", "!hj scores", "!hj join", "!hj help", "!hj", "!hj dance", "lol", "  ", "!join"
        };
        std::uniform_int_distribution<int> pick(0, 9);
        int const roll = pick(rng);
        if (roll < 4 && live && !live->answers.empty())
        {
            return live->answers[static_cast<size_t>(roll) % live->answers.size()];
        }
        if (roll < 6)
        {
            return "wrong answer";
        }
        return noise[std::uniform_int_distribution<size_t>(0, noise.size() - 1)(rng)];
    }
} // anonymous namespace

TEST(SelfPlay, Transcripts_And_End)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    try
    {
        for (std::uint64_t seed : {111ull, 222ull, 333ull})
        {
            std::mt19937_64 rng(seed);
            BotRig bot(make_config(), make_questions());
            debug::AuditLogger log(std::format("_artifacts/session_{}.log", seed));
            bot.router.SetAudit(&log);
            log.start(bot.session.Settings(), bot.session.QuestionCount());

            std::vector<std::string> nodes;
            for (int i = 0; i < 6; ++i)
            {
                nodes.push_back(std::format("!{:08x}", rng() & 0xffffffffu));
            }

            bot.Dm("!admin1", "!hj start");
            debug::CheckInvariants(bot.session);

            std::uniform_int_distribution<int> who(0, 5);
            std::uniform_int_distribution<int> step(1, 40);
            std::uniform_int_distribution<int> admin_roll(0, 99);

            int events = 0;
            while (bot.session.Status().state == SessionState::Running && events < 5000)
            {
                ++events;
                auto const st = bot.session.Status();
                Question const* live = (st.current && st.current->status == RoundStatus::Open)
                                           ? st.current->question.get() : nullptr;

                std::string const& node = nodes[static_cast<size_t>(who(rng))];
                if (admin_roll(rng) < 90)
                {
                    bot.Dm(node, random_line(rng, live));
                }
                else
                {
                    bot.Say(node, 0, "!hj join");
                }

                int const a = admin_roll(rng);
                if (a < 3) bot.Dm("!admin1", "!hj next");
                else if (a < 5) bot.Dm("!admin1", std::format("!hj ban {}", node));
                else if (a < 8) bot.Dm("!admin1", std::format("!hj unban {}", node));

                debug::CheckInvariants(bot.session);
                bot.clock.Advance(std::chrono::seconds(step(rng)));
                debug::CheckInvariants(bot.session);
                log.status(bot.session.Status());
            }

            auto const end = bot.session.Status();
            ASSERT_EQ(end.state, SessionState::Stopped) << "game did not finish for seed " << seed;
            EXPECT_EQ(end.round_number, 5u);
            EXPECT_EQ(bot.clock.Pending(), 0u);
            log.end(bot.session);

            // every delta is a whole question value
            Points sum = 0;
            for (NamedStanding const& s : bot.session.Leaderboard(100)) sum += s.total;
            EXPECT_EQ(sum % 100, 0);

            auto const path = fs::path(std::format("_artifacts/session_{}.log", seed));
            ASSERT_TRUE(fs::exists(path));
            ASSERT_GT(fs::file_size(path), 0u);
            EXPECT_GT(log.Lines(), 0u);
        }
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print("{}", e.to_str());
        FAIL() << e.message();
    }
}
