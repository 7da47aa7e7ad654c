//
// main.cpp: Hacker Jeopardy bot on a mesh gateway (WebSocket++ client)
//

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <memory>
#include <print>
#include <string>
#include <thread>
#include <vector>

#include "AppConfig.hpp"
#include "core/Exception.hpp"
#include "core/GameSession.hpp"
#include "core/HackerJeopardy.hpp"
#include "core/Ledger.hpp"
#include "core/QuestionBank.hpp"
#include "core/Scheduler.hpp"
#include "debug/AuditLogger.hpp"
#include "net/MeshLink.hpp"
#include "net/Router.hpp"

namespace
{
    std::atomic<bool> g_stop{false};

    void OnSignal(int)
    {
        g_stop = true;
    }

    auto Run(meshquiz::AppConfig const& cfg) -> int
    {
        using namespace meshquiz;
        using namespace meshquiz::core;

        auto questions = LoadQuestions(cfg.questions_file);
        if (!questions)
        {
            std::print("[meshquiz] {}:{}: {}\n", cfg.questions_file, questions.error().line, questions.error().message);
            return 2;
        }
        if (questions->empty())
        {
            std::print("[meshquiz] {} holds no usable questions, using the built-in set\n", cfg.questions_file);
            *questions = DefaultQuestions();
        }

        JournalLedger ledger(cfg.ledger_path);
        std::print("[meshquiz] ledger {} ({} players, {} journal lines)\n",
                   cfg.ledger_path, ledger.PlayerCount(), ledger.ReplayedLines());

        std::unique_ptr<debug::AuditLogger> audit;
        if (!cfg.audit_path.empty())
        {
            audit = std::make_unique<debug::AuditLogger>(cfg.audit_path);
            audit->start(cfg.session, questions->size());
        }

        AsioScheduler scheduler;

        // bound before the link starts, read on the link thread afterwards
        net::Router* inbound_to = nullptr;
        net::MeshLink link(net::LinkConfig{.uri = cfg.gateway_uri}, [&inbound_to](InboundMessage const& msg)
        {
            if (inbound_to)
            {
                inbound_to->OnInbound(msg);
            }
        });

        net::Router router(link, cfg.game_channel);
        router.SetAudit(audit.get());

        GameSession session(cfg.session, std::move(*questions), scheduler, ledger, router);
        HackerJeopardy game(session);
        router.BindPersonality(game);
        inbound_to = &router;

        std::print("[meshquiz] {} ready: {} questions, {} rounds, window {}s, interval {}s, channel {}\n",
                   game.Name(), session.QuestionCount(), cfg.session.max_rounds,
                   cfg.session.answer_window.count(), cfg.session.question_interval.count(), cfg.game_channel);

        link.Start();

        while (!g_stop.load())
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        std::print("[meshquiz] shutting down\n");
        // inbound first, then timers; the session must see no callbacks once it is gone
        link.Stop();
        scheduler.Shutdown();
        if (audit)
        {
            audit->end(session);
        }
        return 0;
    }
}

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
        std::print("[meshquiz] {}\n{}", e.message(), Usage(argv[0]));
        return 2;
    }
    if (cfg.show_help)
    {
        std::print("{}", Usage(argv[0]));
        return 0;
    }
    if (cfg.session.admin_ids.empty())
    {
        std::print("[meshquiz] WARNING: no admin node ids configured (HJ_ADMIN_NODE_IDS)\n");
    }

    std::signal(SIGINT, OnSignal);
    std::signal(SIGTERM, OnSignal);

    try
    {
        return Run(cfg);
    }
    catch (core::OmegaException<core::error::Code> const& e)
    {
        std::print("[meshquiz] FATAL: {}\n{}", e.message(), e.to_str());
    }
    catch (std::exception const& e)
    {
        std::print("[meshquiz] FATAL: {}\n", e.what());
    }
    return 1;
}
