#ifndef MESHQUIZ_CLASSICRULES_HPP
#define MESHQUIZ_CLASSICRULES_HPP

#include "Rules.hpp"

namespace meshquiz::core
{
    // Jeopardy scoring: exact normalized match earns +value, anything else costs -value.
    // Players who did not answer are never graded, so they stay at 0.
    class ClassicRules final : public Rules
    {
    public:
        auto Score(Question const& q, Submission const& s) const -> Grade override;
    };
}

#endif //MESHQUIZ_CLASSICRULES_HPP
