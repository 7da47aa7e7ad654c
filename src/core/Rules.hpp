#ifndef MESHQUIZ_RULES_HPP
#define MESHQUIZ_RULES_HPP

#include "Round.hpp"
#include "Types.hpp"

namespace meshquiz::core
{
    struct Grade
    {
        NodeId player;
        std::string text;
        bool correct{false};
        Points delta{};
    };

    // Scoring policy used at round close. Submissions arrive already deduplicated, one
    // per player. Throws error::GradingError only for a malformed question.
    class Rules
    {
    public:
        virtual ~Rules() = default;

        virtual auto Score(Question const& q, Submission const& s) const -> Grade = 0;
    };
}

#endif //MESHQUIZ_RULES_HPP
