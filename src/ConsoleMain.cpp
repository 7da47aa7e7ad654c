// File: src/ConsoleMain.cpp
//
// Local harness: plays the radio from stdin. Each line is "<node-id> <text>", sent as a
// DM to the bot; prefix the line with '#' to post it on the game channel instead.
// Outbound packets are printed. "/quit" or EOF ends the run.
//

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <print>
#include <string>
#include <string_view>

#include "AppConfig.hpp"
#include "core/Exception.hpp"
#include "core/GameSession.hpp"
#include "core/HackerJeopardy.hpp"
#include "core/Ledger.hpp"
#include "core/QuestionBank.hpp"
#include "core/Scheduler.hpp"
#include "core/Util.hpp"
#include "debug/AuditLogger.hpp"
#include "net/Router.hpp"
#include "net/codec.hpp"

namespace
{
    class ConsoleTransport final : public meshquiz::net::Transport
    {
    public:
        auto SendText(meshquiz::core::net::OutboundText out) -> bool override
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (out.to.empty())
            {
                std::print("  >> [ch {}] {}\n", out.channel, out.text);
            }
            else
            {
                std::print("  >> [{}] {}\n", out.to, out.text);
            }
            return true;
        }

    private:
        std::mutex mtx_;
    };

    auto Run(meshquiz::AppConfig const& cfg) -> int
    {
        using namespace meshquiz;
        using namespace meshquiz::core;

        auto questions = LoadQuestions(cfg.questions_file);
        if (!questions)
        {
            std::print("[console] {}:{}: {}\n", cfg.questions_file, questions.error().line, questions.error().message);
            return 2;
        }
        if (questions->empty())
        {
            *questions = DefaultQuestions();
        }

        std::unique_ptr<debug::AuditLogger> audit;
        if (!cfg.audit_path.empty())
        {
            audit = std::make_unique<debug::AuditLogger>(cfg.audit_path);
            audit->start(cfg.session, questions->size());
        }

        MemoryLedger ledger;
        AsioScheduler scheduler;
        ConsoleTransport transport;
        net::Router router(transport, cfg.game_channel);
        router.SetAudit(audit.get());

        GameSession session(cfg.session, std::move(*questions), scheduler, ledger, router);
        HackerJeopardy game(session);
        router.BindPersonality(game);

        std::print("[console] {} questions loaded. Lines: \"<node-id> <text>\", '#' prefix = channel {}\n",
                   session.QuestionCount(), cfg.game_channel);

        std::string line;
        while (std::getline(std::cin, line))
        {
            std::string_view body = util::Trim(line);
            if (body.empty()) continue;
            if (body == "/quit") break;

            bool const on_channel = body.front() == '#';
            if (on_channel) body.remove_prefix(1);

            auto const [sender, text] = util::SplitFirstWord(body);
            if (sender.empty() || text.empty())
            {
                std::print("[console] expected \"<node-id> <text>\"\n");
                continue;
            }

            InboundMessage const typed{
                .sender = std::string(sender),
                .sender_name = std::string(sender),
                .channel = ChannelContext{.direct = !on_channel, .index = cfg.game_channel},
                .text = std::string(text)
            };

            // same path a gateway frame takes
            auto const frame = net::BuildTextPacket(typed);
            auto decoded = net::DecodeInbound(net::AsBytes(frame));
            if (!decoded)
            {
                std::print("[console] frame rejected: {}\n", decoded.error().message);
                continue;
            }
            router.OnInbound(*decoded);
        }

        scheduler.Shutdown();
        if (audit)
        {
            audit->end(session);
        }
        std::print("[console] bye\n");
        return 0;
    }
} // anon

int main(int argc, char** argv)
{
    using namespace meshquiz;

    AppConfig cfg{};
    try
    {
        cfg = ParseArgs(argc, argv, [](char const* name) { return std::getenv(name); });
    }
    catch (core::error::ConfigError const& e)
    {
        std::print("[console] {}\n{}", e.message(), Usage(argv[0]));
        return 2;
    }
    if (cfg.show_help)
    {
        std::print("{}", Usage(argv[0]));
        return 0;
    }

    try
    {
        return Run(cfg);
    }
    catch (std::exception const& e)
    {
        std::print("[console] FATAL: {}\n", e.what());
    }
    return 1;
}
