#ifndef MESHQUIZ_ROUND_HPP
#define MESHQUIZ_ROUND_HPP

#include <string>
#include <unordered_set>

#include "State.hpp"
#include "Types.hpp"

namespace meshquiz::core
{
    struct Submission
    {
        NodeId player;
        RoundId round{};
        std::string text;
        TimePoint arrival{};
    };

    struct Round
    {
        RoundId id{};
        uint32_t number{};
        QuestionCSP question;
        TimePoint opens_at{};
        TimePoint closes_at{};
        RoundStatus status{RoundStatus::Open};

        // Players whose delta already reached the ledger; a retried settlement skips them.
        std::unordered_set<NodeId> applied;

        auto IsOpen() const noexcept -> bool { return status == RoundStatus::Open; }

        auto View(uint32_t const max_rounds) const -> RoundView
        {
            return RoundView{
                .id = id,
                .number = number,
                .max_rounds = max_rounds,
                .question = question,
                .opens_at = opens_at,
                .closes_at = closes_at,
                .status = status
            };
        }
    };
}

#endif //MESHQUIZ_ROUND_HPP
