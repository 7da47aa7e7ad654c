#ifndef MESHQUIZ_GAMESESSION_HPP
#define MESHQUIZ_GAMESESSION_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "AdminGate.hpp"
#include "Announcements.hpp"
#include "AnswerIntake.hpp"
#include "Exception.hpp"
#include "Ledger.hpp"
#include "Round.hpp"
#include "Rules.hpp"
#include "Scheduler.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace meshquiz::core::debug {struct Inspector;}
namespace meshquiz::core
{
    struct JoinResult
    {
        bool newly_joined{false};
        size_t players{};
        std::optional<RoundView> open_round;
    };

    // The Hacker Jeopardy state machine: Idle -> Running -> Stopped (-> Running on a new start).
    //
    // Every public operation and every timer callback runs under one mutex, which is the
    // serialization point for the whole game: the order in which callers acquire it is the
    // order submissions are accepted in. No public operation throws; refusals come back as
    // error::Rejection and internal faults are logged.
    //
    // The scheduler, ledger and announcer must outlive the session, and the scheduler must
    // not fire callbacks after the session is destroyed (shut it down first).
    class GameSession
    {
    public:
        GameSession() = delete;
        GameSession(SessionConfig const& config,
                    std::vector<Question> questions,
                    Scheduler& scheduler,
                    Ledger& ledger,
                    Announcer& announcer,
                    std::unique_ptr<Rules> rules = nullptr);
        ~GameSession();

        GameSession(GameSession const&) = delete;
        auto operator=(GameSession const&) -> GameSession& = delete;

        // admin control
        auto Start(std::string_view admin) -> error::Outcome<SessionStatus>;
        auto Stop(std::string_view admin) -> error::Outcome<>;
        // Closes the open round now; the next round keeps its original open time.
        auto Skip(std::string_view admin) -> error::Outcome<RoundView>;
        auto Ban(std::string_view admin, std::string_view target) -> error::Outcome<bool>;
        auto Unban(std::string_view admin, std::string_view target) -> error::Outcome<bool>;
        // Clears cumulative ledger totals and this game's board. Not allowed while a game is running.
        auto ResetScores(std::string_view admin) -> error::Outcome<>;

        // players
        auto Join(std::string_view player, std::string_view display_name) -> error::Outcome<JoinResult>;
        auto Submit(std::string_view player, RoundId round, std::string text, TimePoint arrival)
            -> error::Outcome<SubmissionReceipt>;
        // Submit against whatever round is open, stamped with the scheduler clock.
        auto Answer(std::string_view player, std::string_view display_name, std::string text)
            -> error::Outcome<SubmissionReceipt>;

        // read-only
        auto Status() const -> SessionStatus;
        // Standings of the current (or last) game only; the Ledger keeps the all-time totals.
        auto Leaderboard(size_t n) const -> std::vector<NamedStanding>;
        auto IsAdmin(std::string_view node) const -> bool { return gate_.IsAdmin(node); }
        auto Now() const -> TimePoint { return scheduler_.Now(); }
        auto Settings() const noexcept -> SessionConfig const& { return cfg_; }
        auto QuestionCount() const noexcept -> size_t { return questions_.size(); }

        friend struct debug::Inspector;

    private:
        // callbacks (take the lock)
        auto OnCloseTimer(uint64_t session_no, RoundId id) -> void;
        auto OnOpenTimer(uint64_t session_no) -> void;

        // everything below expects mtx_ held
        auto OpenNextRoundLocked() -> void;
        auto CloseRoundLocked() -> void;
        auto SettleLocked(Round& round, std::vector<Submission> const& subs) -> std::vector<ScoreLine>;
        auto AbandonRoundLocked(std::string_view reason) -> void;
        auto AfterCloseLocked() -> void;
        auto FinishLocked() -> void;
        auto CancelTimersLocked() -> void;
        auto IsLastRoundLocked() const -> bool;
        auto StatusLocked() const -> SessionStatus;
        auto TopLocked(size_t n) const -> std::vector<NamedStanding>;
        auto NameOfLocked(NodeId const& player) const -> std::string;
        auto RememberNameLocked(NodeId const& player, std::string_view name) -> void;
        auto PublishLocked(Announcement a) -> void;
        // Runs fn, abandoning the current round if it throws. Unless rearm is false, an
        // abandoned round also re-arms the next open when nothing else will.
        template <typename Fn>
        auto GuardedLocked(std::string_view what, Fn&& fn, bool rearm = true) -> bool;

    private:
        SessionConfig const cfg_;
        AdminGate gate_;
        std::vector<QuestionCSP> questions_;
        Scheduler& scheduler_;
        Ledger& ledger_;
        Announcer& announcer_;
        std::unique_ptr<Rules> rules_;

        mutable std::mutex mtx_;

        SessionState state_{SessionState::Idle};
        uint64_t session_no_{0};
        uint32_t round_counter_{0};
        size_t next_question_{0};
        RoundId next_round_id_{1};
        std::optional<Round> current_; // latest round of this session, open or closed
        AnswerIntake intake_;
        MemoryLedger board_; // this game's deltas, cleared on start

        TimerHandle close_timer_{NoTimer};
        TimerHandle open_timer_{NoTimer};

        std::unordered_map<NodeId, std::string> names_; // best effort, kept across sessions
        std::vector<NodeId> roster_;                    // joined this session, join order
        std::unordered_set<NodeId> in_roster_;
    };
}

#endif //MESHQUIZ_GAMESESSION_HPP
