#ifndef MESHQUIZ_HACKERJEOPARDY_HPP
#define MESHQUIZ_HACKERJEOPARDY_HPP

#include <optional>
#include <string>
#include <string_view>

#include "Commands.hpp"
#include "Exception.hpp"
#include "GameSession.hpp"
#include "Personality.hpp"

namespace meshquiz::core
{
    // Timed quiz mode: turns "!hj ..." commands into GameSession calls and direct
    // messages into answers. Owns no game state; the session is the orchestrator's.
    class HackerJeopardy final : public Personality
    {
    public:
        explicit HackerJeopardy(GameSession& session);

        auto Name() const -> std::string_view override { return "hacker_jeopardy"; }
        auto HandleMessage(InboundMessage const& msg) -> std::optional<std::string> override;
        auto Help(bool for_admin) const -> std::string override;

        // Text sent to a user for a refused command or answer
        auto ReplyFor(error::Rejection const& r) const -> std::string;

    private:
        auto Dispatch(InboundMessage const& msg, Command const& cmd) -> std::optional<std::string>;
        auto HandleAnswer(InboundMessage const& msg, std::string const& text) -> std::optional<std::string>;

        GameSession& session_;
    };
}

#endif //MESHQUIZ_HACKERJEOPARDY_HPP
