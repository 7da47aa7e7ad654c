#ifndef MESHQUIZ_AUDITLOGGER_HPP
#define MESHQUIZ_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

#include "../core/Announcements.hpp"
#include "../core/GameSession.hpp"
#include "../core/Personality.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace meshquiz::core::debug
{
    // Plain-text transcript of everything that went in and out of a bot run. Safe to call
    // from the transport thread and from scheduler callbacks at once.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        // Header: timing, round count, admins, question count
        auto start(SessionConfig const& cfg, size_t question_count) -> void;

        auto inbound(InboundMessage const& msg) -> void;
        auto reply(NodeId const& to, std::string_view text) -> void;
        auto announcement(Announcement const& a) -> void;
        auto status(SessionStatus const& st) -> void;

        // Footer with the final leaderboard
        auto end(GameSession const& session) -> void;

        auto flush() -> void;

        auto Lines() const -> uint64_t;

    private:
        auto write(std::string const& line) -> void;

    private:
        mutable std::mutex mtx_;
        std::ofstream out_;
        uint64_t lines_{0};
    };
}

#endif //MESHQUIZ_AUDITLOGGER_HPP
