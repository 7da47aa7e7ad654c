#ifndef MESHQUIZ_STATE_HPP
#define MESHQUIZ_STATE_HPP

#include <cstdint>
#include <optional>
#include <string_view>

#include "Types.hpp"

namespace meshquiz::core
{
    enum class SessionState : uint8_t
    {
        Idle,
        Running,
        Stopped
    };

    enum class RoundStatus : uint8_t
    {
        Open,
        Grading,
        Closed
    };

    inline auto to_string(SessionState s) -> std::string_view
    {
        switch (s)
        {
        case SessionState::Idle: return "Idle";
        case SessionState::Running: return "Running";
        case SessionState::Stopped: return "Stopped";
        }
        return "?";
    }

    inline auto to_string(RoundStatus s) -> std::string_view
    {
        switch (s)
        {
        case RoundStatus::Open: return "Open";
        case RoundStatus::Grading: return "Grading";
        case RoundStatus::Closed: return "Closed";
        }
        return "?";
    }

    // Immutable view of a round handed to the router and to tests (copies, no references into the session)
    struct RoundView
    {
        RoundId id{};
        uint32_t number{};
        uint32_t max_rounds{};
        QuestionCSP question;
        TimePoint opens_at{};
        TimePoint closes_at{};
        RoundStatus status{RoundStatus::Open};
    };

    struct SessionStatus
    {
        SessionState state{SessionState::Idle};
        uint64_t session_no{};
        uint32_t round_number{};
        uint32_t max_rounds{};
        size_t players_joined{};
        std::optional<RoundView> current;
    };
}

#endif //MESHQUIZ_STATE_HPP
