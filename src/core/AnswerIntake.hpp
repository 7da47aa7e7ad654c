#ifndef MESHQUIZ_ANSWERINTAKE_HPP
#define MESHQUIZ_ANSWERINTAKE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "Exception.hpp"
#include "Round.hpp"
#include "Types.hpp"

namespace meshquiz::core
{
    struct SubmissionReceipt
    {
        RoundId round{};
        uint32_t round_number{};
        TimePoint closes_at{};
    };

    // Submission book for the one open round plus the ban list. Owned by a GameSession
    // and only touched under its lock; Submit() is the atomic check-and-insert.
    class AnswerIntake
    {
    public:
        AnswerIntake() = default;

        auto OpenRound(RoundId id, uint32_t number, TimePoint closes_at) -> void;

        // Stops intake for `id` and hands back everything accepted, in arrival order.
        auto CloseRound(RoundId id) -> std::vector<Submission>;

        // Banned, then NoOpenRound (no window, wrong id, or arrival past closes_at),
        // then DuplicateSubmission. Player ids are expected normalized.
        auto Submit(NodeId const& player, RoundId round, std::string text, TimePoint arrival)
            -> error::Outcome<SubmissionReceipt>;

        auto Ban(NodeId const& player) -> bool;
        auto Unban(NodeId const& player) -> bool;
        [[nodiscard]]
        auto IsBanned(NodeId const& player) const -> bool { return banned_.contains(player); }

        auto IsOpen() const noexcept -> bool { return window_.has_value(); }
        auto AcceptedCount() const noexcept -> size_t { return accepted_.size(); }
        auto HasSubmitted(NodeId const& player) const -> bool { return by_player_.contains(player); }

        // Clears the book (new session). Bans survive.
        auto Reset() -> void;

    private:
        struct Window
        {
            RoundId id{};
            uint32_t number{};
            TimePoint closes_at{};
        };

        std::optional<Window> window_;
        std::vector<Submission> accepted_;
        std::unordered_map<NodeId, size_t> by_player_;
        std::unordered_set<NodeId> banned_;
    };

    // Exact match after trim + case fold on both sides.
    [[nodiscard]]
    auto IsCorrectAnswer(Question const& q, std::string_view submitted) -> bool;
}

#endif //MESHQUIZ_ANSWERINTAKE_HPP
