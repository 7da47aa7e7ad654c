#include "AnswerIntake.hpp"

#include <algorithm>
#include <utility>

#include "Util.hpp"

namespace meshquiz::core
{
    auto AnswerIntake::OpenRound(RoundId const id, uint32_t const number, TimePoint const closes_at) -> void
    {
        MQZ_ASSERT(!window_.has_value(), "Opening a round while another one is still accepting answers");
        accepted_.clear();
        by_player_.clear();
        window_ = Window{.id = id, .number = number, .closes_at = closes_at};
    }

    auto AnswerIntake::CloseRound(RoundId const id) -> std::vector<Submission>
    {
        MQZ_ASSERT(window_.has_value() && window_->id == id, "Closing a round the intake does not hold open");
        window_.reset();
        by_player_.clear();
        return std::exchange(accepted_, {});
    }

    auto AnswerIntake::Submit(NodeId const& player, RoundId const round, std::string text, TimePoint const arrival)
        -> error::Outcome<SubmissionReceipt>
    {
        using error::RejectCode;

        if (banned_.contains(player))
        {
            return std::unexpected(error::Reject(RejectCode::Banned));
        }
        if (!window_ || window_->id != round)
        {
            return std::unexpected(error::Reject(RejectCode::NoOpenRound).with_round(round));
        }
        if (arrival > window_->closes_at)
        {
            return std::unexpected(error::Reject(RejectCode::NoOpenRound).with_round(round)
                                   .with_detail("answer window closed"));
        }
        if (by_player_.contains(player))
        {
            return std::unexpected(error::Reject(RejectCode::DuplicateSubmission).with_round(round));
        }

        by_player_.emplace(player, accepted_.size());
        accepted_.push_back(Submission{.player = player, .round = round, .text = std::move(text), .arrival = arrival});
        return SubmissionReceipt{.round = round, .round_number = window_->number, .closes_at = window_->closes_at};
    }

    auto AnswerIntake::Ban(NodeId const& player) -> bool
    {
        return banned_.insert(player).second;
    }

    auto AnswerIntake::Unban(NodeId const& player) -> bool
    {
        return banned_.erase(player) > 0;
    }

    auto AnswerIntake::Reset() -> void
    {
        window_.reset();
        accepted_.clear();
        by_player_.clear();
    }

    auto IsCorrectAnswer(Question const& q, std::string_view const submitted) -> bool
    {
        std::string const norm = util::NormalizeAnswer(submitted);
        return std::ranges::any_of(q.answers, [&norm](std::string const& a)
        {
            return util::NormalizeAnswer(a) == norm;
        });
    }
}
