#ifndef MESHQUIZ_ANNOUNCEMENTS_HPP
#define MESHQUIZ_ANNOUNCEMENTS_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "State.hpp"
#include "Types.hpp"

namespace meshquiz::core
{
    enum class AnnouncementKind : uint8_t
    {
        GameStarted,
        RoundOpened,
        RoundSettled,
        GameStopped
    };

    struct Announcement
    {
        AnnouncementKind kind{};
        std::string text;
        // empty = public game channel
        std::optional<NodeId> direct_to{};
    };

    // Outbound side of the session. Called with the session lock held: implementations
    // queue or send, and must never call back into the session.
    class Announcer
    {
    public:
        virtual ~Announcer() = default;
        virtual auto Publish(Announcement const& a) -> void = 0;
    };

    struct NamedStanding
    {
        NodeId player;
        std::string name;
        Points total{};
    };

    struct ScoreLine
    {
        NodeId player;
        std::string name;
        bool correct{false};
        Points delta{};
        Points total{};
    };

    auto to_string(AnnouncementKind k) -> std::string_view;

    auto FormatGameStarted(uint64_t session_no, SessionConfig const& cfg) -> std::string;
    auto FormatRoundOpened(RoundView const& r, std::chrono::seconds answer_window) -> std::string;
    auto FormatRoundSettled(RoundView const& r,
                            std::vector<ScoreLine> const& scorers,
                            std::vector<NamedStanding> const& top) -> std::string;
    auto FormatFinalLeaderboard(std::vector<NamedStanding> const& top) -> std::string;
    auto FormatScores(std::vector<NamedStanding> const& top) -> std::string;
    auto FormatStatus(SessionStatus const& st, TimePoint now) -> std::string;
    auto FormatHelp(bool show_admin) -> std::string;
    auto FormatDuration(std::chrono::seconds d) -> std::string;
}

#endif //MESHQUIZ_ANNOUNCEMENTS_HPP
