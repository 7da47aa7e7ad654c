#ifndef MESHQUIZ_TYPES_HPP
#define MESHQUIZ_TYPES_HPP

#define MQZ_ALLOW_EXCEPTIONS true
#define MQZ_ENABLE_TEST_HOOKS true

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace meshquiz::core::constants
{
    inline constexpr int32_t MinQuestionValue = 100;
    inline constexpr int32_t MaxQuestionValue = 500;
    inline constexpr size_t  SettlementTopN = 3;
    inline constexpr size_t  FinalTopN = 5;
}

namespace meshquiz::core
{
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = Clock::duration;

    // Mesh node id as the radio reports it, e.g. "!a1b2c3d4".
    using NodeId  = std::string;
    using Points  = int32_t;
    using RoundId = uint64_t;

    struct Question
    {
        uint32_t id{};
        std::string prompt;
        Points value{constants::MinQuestionValue};
        // first entry is the one revealed at settlement; matching is case/space insensitive
        std::vector<std::string> answers;
    };
    using QuestionCSP = std::shared_ptr<Question const>;

    struct Standing
    {
        NodeId player;
        Points total{};
    };

    struct SessionConfig
    {
        std::vector<NodeId> admin_ids;
        std::chrono::seconds question_interval{std::chrono::minutes(3)};
        std::chrono::seconds answer_window{std::chrono::minutes(2)};
        uint32_t max_rounds{10};
        // Ledger write attempts per round before the round is abandoned
        uint32_t settle_attempts{3};
        size_t   settlement_top_n{constants::SettlementTopN};
        size_t   final_top_n{constants::FinalTopN};
    };
}

#endif //MESHQUIZ_TYPES_HPP
