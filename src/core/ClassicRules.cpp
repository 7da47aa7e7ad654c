#include "ClassicRules.hpp"

#include <format>

#include "AnswerIntake.hpp"
#include "Exception.hpp"

namespace meshquiz::core
{
    auto ClassicRules::Score(Question const& q, Submission const& s) const -> Grade
    {
        if (q.answers.empty())
        {
            MQZ_THROW(error::Code::Grading, std::format("question {} has no accepted answers", q.id));
        }

        bool const correct = IsCorrectAnswer(q, s.text);
        return Grade{
            .player = s.player,
            .text = s.text,
            .correct = correct,
            .delta = correct ? q.value : -q.value
        };
    }
}
