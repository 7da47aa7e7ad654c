#include "Commands.hpp"

#include <type_traits>

#include "Util.hpp"

namespace meshquiz::core
{
    auto ParseCommand(std::string_view const text) -> Command
    {
        std::string_view const trimmed = util::Trim(text);
        if (trimmed.empty() || trimmed.front() != '!')
        {
            return FreeText{std::string(trimmed)};
        }

        auto const [head, rest] = util::SplitFirstWord(trimmed);
        std::string const prefix = util::ToLower(head);

        if (prefix == "!join")
        {
            if (rest.empty()) return JoinCmd{};
            return UnknownCmd{prefix};
        }
        if (prefix != "!hj")
        {
            return UnknownCmd{prefix};
        }

        auto const [verb_raw, arg] = util::SplitFirstWord(rest);
        std::string const verb = util::ToLower(verb_raw);

        if (verb == "ban") return BanCmd{std::string(arg)};
        if (verb == "unban") return UnbanCmd{std::string(arg)};

        if (!arg.empty()) return UnknownCmd{verb};

        if (verb == "start") return StartCmd{};
        if (verb == "stop") return StopCmd{};
        if (verb == "next") return NextCmd{};
        if (verb == "reset") return ResetCmd{};
        if (verb == "status" || verb == "info") return StatusCmd{};
        if (verb == "scores" || verb == "leaderboard") return ScoresCmd{};
        if (verb == "join") return JoinCmd{};
        if (verb == "help") return HelpCmd{};

        return UnknownCmd{verb.empty() ? prefix : verb};
    }

    auto CommandName(Command const& c) -> std::string_view
    {
        return std::visit([]<typename T0>(T0 const&) -> std::string_view
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, StartCmd>) return "start";
            else if constexpr (std::is_same_v<T, StopCmd>) return "stop";
            else if constexpr (std::is_same_v<T, NextCmd>) return "next";
            else if constexpr (std::is_same_v<T, BanCmd>) return "ban";
            else if constexpr (std::is_same_v<T, UnbanCmd>) return "unban";
            else if constexpr (std::is_same_v<T, ResetCmd>) return "reset";
            else if constexpr (std::is_same_v<T, StatusCmd>) return "status";
            else if constexpr (std::is_same_v<T, ScoresCmd>) return "scores";
            else if constexpr (std::is_same_v<T, JoinCmd>) return "join";
            else if constexpr (std::is_same_v<T, HelpCmd>) return "help";
            else if constexpr (std::is_same_v<T, UnknownCmd>) return "unknown";
            else return "answer";
        }, c);
    }
}
