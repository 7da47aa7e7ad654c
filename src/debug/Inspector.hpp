#ifndef MESHQUIZ_INSPECTOR_HPP
#define MESHQUIZ_INSPECTOR_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "../core/GameSession.hpp"
#include "../core/Types.hpp"

namespace meshquiz::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            SessionState state{};
            uint64_t session_no{};
            uint32_t round_counter{};
            uint32_t max_rounds{};
            size_t next_question{};
            size_t question_count{};
            RoundId next_round_id{};

            std::optional<RoundId> round_id;
            std::optional<RoundStatus> round_status;
            TimePoint closes_at{};
            std::unordered_set<NodeId> applied;

            bool intake_open{false};
            size_t accepted{};

            TimerHandle close_timer{NoTimer};
            TimerHandle open_timer{NoTimer};

            std::vector<NodeId> roster;
        };

        static inline auto Gather(GameSession const& g) -> SnapshotAll
        {
            std::lock_guard<std::mutex> lock(g.mtx_);

            SnapshotAll ret{};
            ret.state = g.state_;
            ret.session_no = g.session_no_;
            ret.round_counter = g.round_counter_;
            ret.max_rounds = g.cfg_.max_rounds;
            ret.next_question = g.next_question_;
            ret.question_count = g.questions_.size();
            ret.next_round_id = g.next_round_id_;

            if (g.current_)
            {
                ret.round_id = g.current_->id;
                ret.round_status = g.current_->status;
                ret.closes_at = g.current_->closes_at;
                ret.applied = g.current_->applied;
            }

            ret.intake_open = g.intake_.IsOpen();
            ret.accepted = g.intake_.AcceptedCount();
            ret.close_timer = g.close_timer_;
            ret.open_timer = g.open_timer_;
            ret.roster = g.roster_;
            return ret;
        }
    };
}

#endif //MESHQUIZ_INSPECTOR_HPP
