#ifndef MESHQUIZ_TESTSUPPORT_HPP
#define MESHQUIZ_TESTSUPPORT_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../core/GameSession.hpp"
#include "../core/HackerJeopardy.hpp"
#include "../core/Ledger.hpp"
#include "../debug/ManualScheduler.hpp"
#include "../debug/RecordingAnnouncer.hpp"
#include "../net/Router.hpp"

namespace meshquiz::test
{
    using namespace std::chrono_literals;

    inline auto MakeQuestion(uint32_t id, std::string prompt, core::Points value, std::vector<std::string> answers)
        -> core::Question
    {
        return core::Question{.id = id, .prompt = std::move(prompt), .value = value, .answers = std::move(answers)};
    }

    inline auto ThreeQuestions() -> std::vector<core::Question>
    {
        return {
            MakeQuestion(1, "What port does SSH use by default?", 200, {"22", "twenty-two"}),
            MakeQuestion(2, "Default HTTPS port?", 100, {"443"}),
            MakeQuestion(3, "Protocol that turns names into addresses?", 300, {"dns"}),
        };
    }

    inline auto TestConfig(uint32_t max_rounds = 3) -> core::SessionConfig
    {
        core::SessionConfig cfg{};
        cfg.admin_ids = {"!ADMIN1"};
        cfg.answer_window = 120s;
        cfg.question_interval = 180s;
        cfg.max_rounds = max_rounds;
        return cfg;
    }

    // Captures outbound packets instead of keying a radio
    class RecordingTransport final : public net::Transport
    {
    public:
        auto SendText(core::net::OutboundText out) -> bool override
        {
            std::lock_guard<std::mutex> lock(mtx_);
            sent_.push_back(std::move(out));
            return true;
        }

        auto Sent() const -> std::vector<core::net::OutboundText>
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return sent_;
        }

        auto To(std::string const& node) const -> std::vector<std::string>
        {
            std::lock_guard<std::mutex> lock(mtx_);
            std::vector<std::string> out;
            for (auto const& s : sent_)
            {
                if (s.to == node) out.push_back(s.text);
            }
            return out;
        }

        auto Clear() -> void
        {
            std::lock_guard<std::mutex> lock(mtx_);
            sent_.clear();
        }

    private:
        mutable std::mutex mtx_;
        std::vector<core::net::OutboundText> sent_;
    };

    // Session on a virtual clock with every announcement recorded
    struct SessionRig
    {
        explicit SessionRig(core::SessionConfig const& cfg = TestConfig(),
                            std::vector<core::Question> questions = ThreeQuestions(),
                            std::unique_ptr<core::Rules> rules = nullptr)
            : session(cfg, std::move(questions), clock, ledger, announcer, std::move(rules))
        {
        }

        core::debug::ManualScheduler clock;
        core::MemoryLedger ledger;
        core::debug::RecordingAnnouncer announcer;
        core::GameSession session;
    };

    // Full inbound path: router -> personality -> session, announcements back out the router
    struct BotRig
    {
        explicit BotRig(core::SessionConfig const& cfg = TestConfig(),
                        std::vector<core::Question> questions = ThreeQuestions())
            : router(transport, 0),
              session(cfg, std::move(questions), clock, ledger, router),
              game(session)
        {
            router.BindPersonality(game);
        }

        auto Dm(std::string const& from, std::string const& text) -> void
        {
            router.OnInbound(core::InboundMessage{
                .sender = from, .sender_name = from,
                .channel = core::ChannelContext{.direct = true, .index = 0}, .text = text
            });
        }

        auto Say(std::string const& from, uint32_t channel, std::string const& text) -> void
        {
            router.OnInbound(core::InboundMessage{
                .sender = from, .sender_name = from,
                .channel = core::ChannelContext{.direct = false, .index = channel}, .text = text
            });
        }

        // Last DM the bot sent to `node`, or "" if none
        auto LastTo(std::string const& node) const -> std::string
        {
            auto const all = transport.To(node);
            return all.empty() ? std::string{} : all.back();
        }

        core::debug::ManualScheduler clock;
        core::MemoryLedger ledger;
        RecordingTransport transport;
        net::Router router;
        core::GameSession session;
        core::HackerJeopardy game;
    };
}

#endif //MESHQUIZ_TESTSUPPORT_HPP
