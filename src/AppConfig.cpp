#include "AppConfig.hpp"

#include <charconv>
#include <chrono>
#include <format>
#include <string_view>
#include <utility>

#include "core/AdminGate.hpp"
#include "core/Exception.hpp"
#include "core/Util.hpp"

namespace meshquiz
{
    namespace
    {
        auto ParseUint(std::string_view const what, std::string_view s) -> uint64_t
        {
            s = core::util::Trim(s);
            uint64_t v{};
            auto const res = std::from_chars(s.data(), s.data() + s.size(), v);
            if (s.empty() || res.ec != std::errc{} || res.ptr != s.data() + s.size())
            {
                MQZ_THROW(core::error::Code::Config, std::format("{}: '{}' is not a number", what, s));
            }
            return v;
        }

        // "90" -> 90 s, "3m" -> 180 s
        auto ParseSeconds(std::string_view const what, std::string_view s) -> std::chrono::seconds
        {
            s = core::util::Trim(s);
            uint64_t mult = 1;
            if (!s.empty() && (s.back() == 'm' || s.back() == 'M'))
            {
                mult = 60;
                s.remove_suffix(1);
            }
            else if (!s.empty() && (s.back() == 's' || s.back() == 'S'))
            {
                s.remove_suffix(1);
            }
            uint64_t const v = ParseUint(what, s) * mult;
            if (v == 0)
            {
                MQZ_THROW(core::error::Code::Config, std::format("{} must be positive", what));
            }
            return std::chrono::seconds(static_cast<std::chrono::seconds::rep>(v));
        }

        auto Apply(AppConfig& cfg, std::string_view const key, std::string_view const val) -> void
        {
            if (key == "admins")
            {
                cfg.session.admin_ids = core::ParseIdList(val);
            }
            else if (key == "answer-window")
            {
                cfg.session.answer_window = ParseSeconds(key, val);
            }
            else if (key == "question-interval")
            {
                cfg.session.question_interval = ParseSeconds(key, val);
            }
            else if (key == "max-rounds")
            {
                uint64_t const v = ParseUint(key, val);
                if (v == 0 || v > 1000)
                {
                    MQZ_THROW(core::error::Code::Config, std::format("max-rounds {} outside 1..1000", v));
                }
                cfg.session.max_rounds = static_cast<uint32_t>(v);
            }
            else if (key == "settle-attempts")
            {
                uint64_t const v = ParseUint(key, val);
                if (v == 0 || v > 10)
                {
                    MQZ_THROW(core::error::Code::Config, std::format("settle-attempts {} outside 1..10", v));
                }
                cfg.session.settle_attempts = static_cast<uint32_t>(v);
            }
            else if (key == "questions")
            {
                cfg.questions_file = std::string(val);
            }
            else if (key == "channel")
            {
                uint64_t const v = ParseUint(key, val);
                if (v > 7)
                {
                    MQZ_THROW(core::error::Code::Config, std::format("channel {} outside 0..7", v));
                }
                cfg.game_channel = static_cast<uint32_t>(v);
            }
            else if (key == "ledger")
            {
                cfg.ledger_path = std::string(val);
            }
            else if (key == "gateway")
            {
                cfg.gateway_uri = std::string(val);
            }
            else if (key == "audit")
            {
                cfg.audit_path = std::string(val);
            }
            else
            {
                MQZ_THROW(core::error::Code::Config, std::format("unknown option --{}", key));
            }
        }
    }

    auto ParseArgs(int const argc, char const* const* argv, EnvLookup const& env) -> AppConfig
    {
        AppConfig cfg{};

        static constexpr std::pair<char const*, char const*> env_keys[] = {
            {"HJ_ADMIN_NODE_IDS", "admins"},
            {"HJ_ANSWER_WINDOW", "answer-window"},
            {"HJ_QUESTION_INTERVAL", "question-interval"},
            {"HJ_MAX_ROUNDS", "max-rounds"},
            {"HJ_QUESTIONS_FILE", "questions"},
            {"HJ_GAME_CHANNEL", "channel"},
            {"HJ_LEDGER_PATH", "ledger"},
        };
        if (env)
        {
            for (auto const& [var, key] : env_keys)
            {
                if (char const* v = env(var); v != nullptr && *v != '\0')
                {
                    Apply(cfg, key, v);
                }
            }
        }

        for (int i = 1; i < argc; ++i)
        {
            std::string_view arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                cfg.show_help = true;
                continue;
            }
            if (!arg.starts_with("--"))
            {
                MQZ_THROW(core::error::Code::Config, std::format("unexpected argument '{}'", arg));
            }
            arg.remove_prefix(2);

            // --key=value or --key value
            std::string_view key = arg;
            std::string_view val;
            if (size_t const eq = arg.find('='); eq != std::string_view::npos)
            {
                key = arg.substr(0, eq);
                val = arg.substr(eq + 1);
            }
            else
            {
                if (i + 1 >= argc)
                {
                    MQZ_THROW(core::error::Code::Config, std::format("--{} needs a value", key));
                }
                val = argv[++i];
            }
            Apply(cfg, key, val);
        }

        if (cfg.session.question_interval < std::chrono::seconds(1) ||
            cfg.session.answer_window < std::chrono::seconds(1))
        {
            MQZ_THROW(core::error::Code::Config, "timings must be at least one second");
        }
        return cfg;
    }

    auto Usage(char const* prog) -> std::string
    {
        return std::format(
            "usage: {} [options]\n"
            "  --gateway <uri>            mesh gateway websocket (ws://127.0.0.1:4403/mesh)\n"
            "  --admins <id,id,...>       admin node ids           [HJ_ADMIN_NODE_IDS]\n"
            "  --answer-window <s|Nm>     answer window, 2m        [HJ_ANSWER_WINDOW]\n"
            "  --question-interval <s|Nm> question interval, 3m    [HJ_QUESTION_INTERVAL]\n"
            "  --max-rounds <n>           rounds per game, 10      [HJ_MAX_ROUNDS]\n"
            "  --questions <file>         question file            [HJ_QUESTIONS_FILE]\n"
            "  --channel <0-7>            game channel index       [HJ_GAME_CHANNEL]\n"
            "  --ledger <file>            score journal            [HJ_LEDGER_PATH]\n"
            "  --settle-attempts <n>      ledger write attempts per round, 3\n"
            "  --audit <file>             write a session transcript\n",
            prog);
    }
}
