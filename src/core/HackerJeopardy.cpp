#include "HackerJeopardy.hpp"

#include <exception>
#include <format>
#include <print>
#include <type_traits>
#include <variant>

#include "Announcements.hpp"
#include "Util.hpp"

namespace meshquiz::core
{
    HackerJeopardy::HackerJeopardy(GameSession& session) :
        session_(session)
    {
    }

    auto HackerJeopardy::Help(bool const for_admin) const -> std::string
    {
        return FormatHelp(for_admin);
    }

    auto HackerJeopardy::HandleMessage(InboundMessage const& msg) -> std::optional<std::string>
    {
        Command const cmd = ParseCommand(msg.text);
        try
        {
            return Dispatch(msg, cmd);
        }
        catch (OmegaException<error::Code> const& e)
        {
            std::print("[{}] [HackerJeopardy] {} from {} failed:\n{}", util::Stamp(),
                       CommandName(cmd), msg.sender, e.to_str());
        }
        catch (std::exception const& e)
        {
            std::print("[{}] [HackerJeopardy] {} from {} failed: {}\n", util::Stamp(),
                       CommandName(cmd), msg.sender, e.what());
        }
        return ReplyFor(error::Reject(error::RejectCode::InternalFault).with_command(std::string(CommandName(cmd))));
    }

    auto HackerJeopardy::Dispatch(InboundMessage const& msg, Command const& cmd) -> std::optional<std::string>
    {
        std::string_view const who = msg.sender;

        return std::visit([&]<typename T0>(T0 const& c) -> std::optional<std::string>
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, FreeText>)
            {
                return HandleAnswer(msg, c.text);
            }
            else if constexpr (std::is_same_v<T, StartCmd>)
            {
                auto const res = session_.Start(who);
                if (!res) return ReplyFor(res.error());
                return std::format("Game #{} started. Round 1 is up!", res->session_no);
            }
            else if constexpr (std::is_same_v<T, StopCmd>)
            {
                auto const res = session_.Stop(who);
                if (!res) return ReplyFor(res.error());
                return std::string("Game stopped. Final scores posted to the channel.");
            }
            else if constexpr (std::is_same_v<T, NextCmd>)
            {
                auto const res = session_.Skip(who);
                if (!res) return ReplyFor(res.error());
                return std::format("Round {} skipped.", res->number);
            }
            else if constexpr (std::is_same_v<T, BanCmd>)
            {
                auto const res = session_.Ban(who, c.target);
                if (!res) return ReplyFor(res.error());
                NodeId const id = NormalizeNodeId(c.target);
                return *res ? std::format("Banned !{}", id) : std::format("!{} was already banned", id);
            }
            else if constexpr (std::is_same_v<T, UnbanCmd>)
            {
                auto const res = session_.Unban(who, c.target);
                if (!res) return ReplyFor(res.error());
                NodeId const id = NormalizeNodeId(c.target);
                return *res ? std::format("Unbanned !{}", id) : std::format("!{} was not banned", id);
            }
            else if constexpr (std::is_same_v<T, ResetCmd>)
            {
                auto const res = session_.ResetScores(who);
                if (!res) return ReplyFor(res.error());
                return std::string("All cumulative scores cleared.");
            }
            else if constexpr (std::is_same_v<T, StatusCmd>)
            {
                return FormatStatus(session_.Status(), session_.Now());
            }
            else if constexpr (std::is_same_v<T, ScoresCmd>)
            {
                return FormatScores(session_.Leaderboard(session_.Settings().final_top_n));
            }
            else if constexpr (std::is_same_v<T, HelpCmd>)
            {
                return Help(session_.IsAdmin(who));
            }
            else if constexpr (std::is_same_v<T, JoinCmd>)
            {
                auto const res = session_.Join(who, msg.sender_name);
                if (!res) return ReplyFor(res.error());
                if (!res->newly_joined) return std::string("You're already in the game!");

                std::string s = std::format("You're in! {} players joined. Good luck!", res->players);
                if (res->open_round)
                {
                    // late joiners get the live question straight away
                    s += "\n";
                    s += FormatRoundOpened(*res->open_round, session_.Settings().answer_window);
                }
                return s;
            }
            else
            {
                return ReplyFor(error::Reject(error::RejectCode::UnknownCommand).with_command(c.word));
            }
        }, cmd);
    }

    auto HackerJeopardy::HandleAnswer(InboundMessage const& msg, std::string const& text)
        -> std::optional<std::string>
    {
        // chatter on the public channel is not ours to answer
        if (!msg.channel.direct || text.empty())
        {
            return std::nullopt;
        }

        auto const res = session_.Answer(msg.sender, msg.sender_name, text);
        if (!res)
        {
            return ReplyFor(res.error());
        }
        return std::format("Answer locked in for round {}. Results when the window closes!", res->round_number);
    }

    auto HackerJeopardy::ReplyFor(error::Rejection const& r) const -> std::string
    {
        using error::RejectCode;
        std::string const cmd = r.command.value_or("do that");

        switch (r.code)
        {
        case RejectCode::Unauthorized:
            return std::format("Only admins can {}!", cmd);
        case RejectCode::InvalidState:
            if (r.detail) return std::format("Can't {} now: {}.", cmd, *r.detail);
            if (r.state == SessionState::Running) return "A game is already running.";
            return "No game in progress. Wait for an admin to start one!";
        case RejectCode::Banned:
            return "You are banned from playing.";
        case RejectCode::NoOpenRound:
        {
            if (r.detail) return "Too late! Answer window closed.";
            if (session_.Status().state != SessionState::Running)
                return "No game in progress. Wait for an admin to start one!";
            return "No active question right now. Wait for the next one!";
        }
        case RejectCode::DuplicateSubmission:
            return "You already answered this question!";
        case RejectCode::UnknownCommand:
            return "Unknown command. Use !hj help for commands.";
        case RejectCode::InvalidArgument:
            return std::format("Usage: !hj {} <node-id>", cmd);
        case RejectCode::InternalFault:
            return "Something went wrong on our side, try again.";
        }
        return error::describe(r);
    }
}
