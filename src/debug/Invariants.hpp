#ifndef MESHQUIZ_INVARIANTS_HPP
#define MESHQUIZ_INVARIANTS_HPP

#include "../core/Exception.hpp"
#include "../core/GameSession.hpp"
#include "Inspector.hpp"
#include <unordered_set>

namespace meshquiz::core::debug
{
    // Structural checks on a session between events. Violations raise error::AssertionError
    // so a test sees exactly which rule broke.
    inline auto CheckInvariants(GameSession const& g) -> void
    {
#if MQZ_ENABLE_TEST_HOOKS == false
        (void)g;
#else
        Inspector::SnapshotAll const s = Inspector::Gather(g);
        bool const open = s.round_status == RoundStatus::Open;

        // 1) The intake window is open exactly while the current round is Open
        MQZ_ASSERT(s.intake_open == open, "Intake window and round status disagree");

        // 2) Nothing is ever left half graded between events
        MQZ_ASSERT(s.round_status != RoundStatus::Grading, "Round stuck in Grading");

        // 3) Only a running game has an open round or armed timers
        if (s.state != SessionState::Running)
        {
            MQZ_ASSERT(!open, "Open round outside a running game");
            MQZ_ASSERT(s.close_timer == NoTimer && s.open_timer == NoTimer, "Timer armed outside a running game");
        }

        // 4) An open round always has its close armed
        if (open)
        {
            MQZ_ASSERT(s.close_timer != NoTimer, "Open round without a close timer");
        }

        // 5) Counters stay in range; round ids are never reused
        MQZ_ASSERT(s.round_counter <= s.max_rounds, "Round counter beyond max rounds");
        MQZ_ASSERT(s.next_question <= s.question_count, "Question cursor past the end");
        if (s.round_id)
        {
            MQZ_ASSERT(*s.round_id < s.next_round_id, "Current round id not below next id");
        }

        // 6) A closed-intake round has no pending submissions; the roster has no duplicates
        if (!s.intake_open)
        {
            MQZ_ASSERT(s.accepted == 0, "Submissions left in a closed intake");
        }
        std::unordered_set<NodeId> seen;
        for (NodeId const& p : s.roster)
        {
            MQZ_ASSERT(seen.insert(p).second, "Player joined twice");
        }
#endif // MQZ_ENABLE_TEST_HOOKS == true
    }
}
#endif //MESHQUIZ_INVARIANTS_HPP
