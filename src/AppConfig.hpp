#ifndef MESHQUIZ_APPCONFIG_HPP
#define MESHQUIZ_APPCONFIG_HPP

#include <cstdint>
#include <functional>
#include <string>

#include "core/Types.hpp"

namespace meshquiz
{
    struct AppConfig
    {
        core::SessionConfig session{};

        std::string gateway_uri{"ws://127.0.0.1:4403/mesh"};
        std::string questions_file{"data/hacker_jeopardy.txt"};
        uint32_t game_channel{0};
        std::string ledger_path{"data/ledger.journal"};
        std::string audit_path{};    // empty = no transcript
        bool show_help{false};
    };

    using EnvLookup = std::function<char const*(char const*)>;

    // Environment first (HJ_ADMIN_NODE_IDS, HJ_ANSWER_WINDOW, HJ_QUESTION_INTERVAL,
    // HJ_MAX_ROUNDS, HJ_QUESTIONS_FILE, HJ_GAME_CHANNEL, HJ_LEDGER_PATH), then flags on top.
    // Durations are seconds, or minutes with an "m" suffix. Throws error::ConfigError.
    auto ParseArgs(int argc, char const* const* argv, EnvLookup const& env) -> AppConfig;

    auto Usage(char const* prog) -> std::string;
}

#endif //MESHQUIZ_APPCONFIG_HPP
