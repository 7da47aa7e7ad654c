#ifndef MESHQUIZ_COMMANDS_HPP
#define MESHQUIZ_COMMANDS_HPP

#include <string>
#include <string_view>
#include <variant>

#include "Types.hpp"

namespace meshquiz::core
{
    // admin
    struct StartCmd  {};
    struct StopCmd   {};
    struct NextCmd   {};
    struct BanCmd    { std::string target; };
    struct UnbanCmd  { std::string target; };
    struct ResetCmd  {};

    // anyone
    struct StatusCmd {};
    struct ScoresCmd {};
    struct JoinCmd   {};
    struct HelpCmd   {};

    // "!something" we do not know
    struct UnknownCmd { std::string word; };
    // anything not starting with '!' (an answer attempt when it arrives by DM)
    struct FreeText   { std::string text; };

    using Command = std::variant<
      StartCmd, StopCmd, NextCmd, BanCmd, UnbanCmd, ResetCmd,
      StatusCmd, ScoresCmd, JoinCmd, HelpCmd, UnknownCmd, FreeText>;

    // Case-insensitive. "!hj <verb> [arg]" or the "!join" shortcut; verbs that take no
    // argument must stand alone ("!hj start now" is unknown).
    auto ParseCommand(std::string_view text) -> Command;

    // Verb as typed by users, for logs and rejection text
    auto CommandName(Command const& c) -> std::string_view;

    inline auto IsAdminCommand(Command const& c) -> bool
    {
        return std::holds_alternative<StartCmd>(c) || std::holds_alternative<StopCmd>(c) ||
               std::holds_alternative<NextCmd>(c) || std::holds_alternative<BanCmd>(c) ||
               std::holds_alternative<UnbanCmd>(c) || std::holds_alternative<ResetCmd>(c);
    }
} // namespace meshquiz::core

#endif //MESHQUIZ_COMMANDS_HPP
