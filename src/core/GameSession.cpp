#include "GameSession.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <print>
#include <utility>

#include "ClassicRules.hpp"
#include "Util.hpp"

namespace meshquiz::core
{
    using error::Reject;
    using error::RejectCode;

    GameSession::GameSession(SessionConfig const& config,
                             std::vector<Question> questions,
                             Scheduler& scheduler,
                             Ledger& ledger,
                             Announcer& announcer,
                             std::unique_ptr<Rules> rules) :
        cfg_(config),
        gate_(cfg_.admin_ids),
        scheduler_(scheduler),
        ledger_(ledger),
        announcer_(announcer),
        rules_(rules ? std::move(rules) : std::make_unique<ClassicRules>())
    {
        if (cfg_.max_rounds == 0)
            MQZ_THROW(error::Code::Config, "max rounds must be at least 1");
        if (cfg_.answer_window.count() <= 0 || cfg_.question_interval.count() <= 0)
            MQZ_THROW(error::Code::Config, "answer window and question interval must be positive");

        questions_.reserve(questions.size());
        for (Question& q : questions)
        {
            questions_.push_back(std::make_shared<Question const>(std::move(q)));
        }

        if (gate_.Count() == 0)
        {
            std::print("[{}] [Session] WARNING: no admins configured, nobody can start a game\n", util::Stamp());
        }
    }

    GameSession::~GameSession()
    {
        std::lock_guard<std::mutex> lock(mtx_);
        CancelTimersLocked();
    }

    // ---------------------------------------------------------------- admin

    auto GameSession::Start(std::string_view const admin) -> error::Outcome<SessionStatus>
    {
        std::lock_guard<std::mutex> lock(mtx_);

        if (!gate_.IsAdmin(admin))
            return std::unexpected(Reject(RejectCode::Unauthorized).with_command("start"));
        if (state_ == SessionState::Running)
            return std::unexpected(Reject(RejectCode::InvalidState).with_command("start").with_state(state_));
        if (questions_.empty())
            return std::unexpected(Reject(RejectCode::InvalidState).with_command("start")
                                   .with_detail("no questions loaded"));

        CancelTimersLocked();
        ++session_no_;
        state_ = SessionState::Running;
        round_counter_ = 0;
        next_question_ = 0;
        current_.reset();
        intake_.Reset();
        board_.Reset();
        roster_.clear();
        in_roster_.clear();

        std::print("[{}] [Session] game #{} started by {} ({} rounds, window {}s, interval {}s)\n",
                   util::Stamp(), session_no_, admin, cfg_.max_rounds,
                   cfg_.answer_window.count(), cfg_.question_interval.count());

        PublishLocked(Announcement{
            .kind = AnnouncementKind::GameStarted,
            .text = FormatGameStarted(session_no_, cfg_)
        });

        try
        {
            OpenNextRoundLocked();
        }
        catch (std::exception const& e)
        {
            std::print("[{}] [Session] FATAL: game #{} could not open its first round: {}\n",
                       util::Stamp(), session_no_, e.what());
            CancelTimersLocked();
            state_ = SessionState::Stopped;
            PublishLocked(Announcement{
                .kind = AnnouncementKind::GameStopped,
                .text = std::format("Game #{} could not start. Try again later.", session_no_)
            });
            return std::unexpected(Reject(RejectCode::InternalFault).with_command("start")
                                   .with_detail("round timers could not be armed"));
        }
        return StatusLocked();
    }

    auto GameSession::Stop(std::string_view const admin) -> error::Outcome<>
    {
        std::lock_guard<std::mutex> lock(mtx_);

        if (!gate_.IsAdmin(admin))
            return std::unexpected(Reject(RejectCode::Unauthorized).with_command("stop"));
        if (state_ != SessionState::Running)
            return std::unexpected(Reject(RejectCode::InvalidState).with_command("stop").with_state(state_));

        // timers first, so neither can settle or open behind our back
        CancelTimersLocked();
        if (current_ && current_->IsOpen())
        {
            (void)GuardedLocked("settlement on stop", [this]() { CloseRoundLocked(); });
        }
        std::print("[{}] [Session] game #{} stopped by {}\n", util::Stamp(), session_no_, admin);
        FinishLocked();
        return {};
    }

    auto GameSession::Skip(std::string_view const admin) -> error::Outcome<RoundView>
    {
        std::lock_guard<std::mutex> lock(mtx_);

        if (!gate_.IsAdmin(admin))
            return std::unexpected(Reject(RejectCode::Unauthorized).with_command("next"));
        if (state_ != SessionState::Running || !current_ || !current_->IsOpen())
            return std::unexpected(Reject(RejectCode::InvalidState).with_command("next").with_state(state_)
                                   .with_detail("no open round"));

        scheduler_.Cancel(close_timer_);
        close_timer_ = NoTimer;

        std::print("[{}] [Session] round {} skipped by {}\n", util::Stamp(), current_->number, admin);
        (void)GuardedLocked("skip", [this]() { CloseRoundLocked(); });
        RoundView const closed = current_->View(cfg_.max_rounds);
        AfterCloseLocked();
        return closed;
    }

    auto GameSession::Ban(std::string_view const admin, std::string_view const target) -> error::Outcome<bool>
    {
        std::lock_guard<std::mutex> lock(mtx_);

        if (!gate_.IsAdmin(admin))
            return std::unexpected(Reject(RejectCode::Unauthorized).with_command("ban"));
        NodeId const id = NormalizeNodeId(target);
        if (id.empty())
            return std::unexpected(Reject(RejectCode::InvalidArgument).with_command("ban")
                                   .with_detail("missing node id"));

        bool const changed = intake_.Ban(id);
        std::print("[{}] [Session] {} banned {}{}\n", util::Stamp(), admin, id, changed ? "" : " (already banned)");
        return changed;
    }

    auto GameSession::Unban(std::string_view const admin, std::string_view const target) -> error::Outcome<bool>
    {
        std::lock_guard<std::mutex> lock(mtx_);

        if (!gate_.IsAdmin(admin))
            return std::unexpected(Reject(RejectCode::Unauthorized).with_command("unban"));
        NodeId const id = NormalizeNodeId(target);
        if (id.empty())
            return std::unexpected(Reject(RejectCode::InvalidArgument).with_command("unban")
                                   .with_detail("missing node id"));

        bool const changed = intake_.Unban(id);
        std::print("[{}] [Session] {} unbanned {}{}\n", util::Stamp(), admin, id, changed ? "" : " (was not banned)");
        return changed;
    }

    auto GameSession::ResetScores(std::string_view const admin) -> error::Outcome<>
    {
        std::lock_guard<std::mutex> lock(mtx_);

        if (!gate_.IsAdmin(admin))
            return std::unexpected(Reject(RejectCode::Unauthorized).with_command("reset"));
        if (state_ == SessionState::Running)
            return std::unexpected(Reject(RejectCode::InvalidState).with_command("reset").with_state(state_));

        try
        {
            ledger_.Reset();
            board_.Reset();
        }
        catch (std::exception const& e)
        {
            std::print("[{}] [Session] ledger reset failed: {}\n", util::Stamp(), e.what());
            return std::unexpected(Reject(RejectCode::InternalFault).with_command("reset"));
        }
        std::print("[{}] [Session] cumulative scores reset by {}\n", util::Stamp(), admin);
        return {};
    }

    // ---------------------------------------------------------------- players

    auto GameSession::Join(std::string_view const player, std::string_view const display_name)
        -> error::Outcome<JoinResult>
    {
        std::lock_guard<std::mutex> lock(mtx_);

        NodeId const id = NormalizeNodeId(player);
        if (id.empty())
            return std::unexpected(Reject(RejectCode::InvalidArgument).with_command("join"));
        if (state_ != SessionState::Running)
            return std::unexpected(Reject(RejectCode::InvalidState).with_command("join").with_state(state_));
        if (intake_.IsBanned(id))
            return std::unexpected(Reject(RejectCode::Banned).with_command("join"));

        RememberNameLocked(id, display_name);
        bool const added = in_roster_.insert(id).second;
        if (added)
        {
            roster_.push_back(id);
            std::print("[{}] [Session] {} joined ({} players)\n", util::Stamp(), NameOfLocked(id), roster_.size());
        }

        JoinResult res{.newly_joined = added, .players = roster_.size()};
        if (current_ && current_->IsOpen())
        {
            res.open_round = current_->View(cfg_.max_rounds);
        }
        return res;
    }

    auto GameSession::Submit(std::string_view const player, RoundId const round, std::string text,
                             TimePoint const arrival) -> error::Outcome<SubmissionReceipt>
    {
        std::lock_guard<std::mutex> lock(mtx_);

        NodeId const id = NormalizeNodeId(player);
        auto res = intake_.Submit(id, round, std::move(text), arrival);
        if (res)
        {
            std::print("[{}] [Session] answer from {} locked in for round {}\n",
                       util::Stamp(), NameOfLocked(id), res->round_number);
        }
        return res;
    }

    auto GameSession::Answer(std::string_view const player, std::string_view const display_name, std::string text)
        -> error::Outcome<SubmissionReceipt>
    {
        std::lock_guard<std::mutex> lock(mtx_);

        NodeId const id = NormalizeNodeId(player);
        RememberNameLocked(id, display_name);

        // 0 never names a round, so this falls through to NoOpenRound
        RoundId const round = (current_ && current_->IsOpen()) ? current_->id : 0;
        auto res = intake_.Submit(id, round, std::move(text), scheduler_.Now());
        if (res)
        {
            std::print("[{}] [Session] answer from {} locked in for round {}\n",
                       util::Stamp(), NameOfLocked(id), res->round_number);
        }
        return res;
    }

    // ---------------------------------------------------------------- read-only

    auto GameSession::Status() const -> SessionStatus
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return StatusLocked();
    }

    auto GameSession::Leaderboard(size_t const n) const -> std::vector<NamedStanding>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return TopLocked(n);
    }

    // ---------------------------------------------------------------- timers

    auto GameSession::OnCloseTimer(uint64_t const session_no, RoundId const id) -> void
    {
        std::lock_guard<std::mutex> lock(mtx_);

        // lost a race with skip/stop, or a leftover from an earlier game
        if (session_no != session_no_ || !current_ || current_->id != id || !current_->IsOpen())
        {
            std::print("[{}] [Session] stale close timer for round id {} ignored\n", util::Stamp(), id);
            return;
        }
        close_timer_ = NoTimer;
        (void)GuardedLocked("round close", [this]() { CloseRoundLocked(); });
        AfterCloseLocked();
    }

    auto GameSession::OnOpenTimer(uint64_t const session_no) -> void
    {
        std::lock_guard<std::mutex> lock(mtx_);

        if (session_no != session_no_ || state_ != SessionState::Running)
        {
            std::print("[{}] [Session] stale open timer for game #{} ignored\n", util::Stamp(), session_no);
            return;
        }
        open_timer_ = NoTimer;
        (void)GuardedLocked("round open", [this]() { OpenNextRoundLocked(); });
    }

    // ---------------------------------------------------------------- internals

    auto GameSession::IsLastRoundLocked() const -> bool
    {
        return round_counter_ >= cfg_.max_rounds || next_question_ >= questions_.size();
    }

    auto GameSession::OpenNextRoundLocked() -> void
    {
        MQZ_ASSERT(state_ == SessionState::Running, "Opening a round outside a running game");

        if (current_ && current_->IsOpen())
        {
            // interval shorter than the answer window: settle before moving on
            std::print("[{}] [Session] round {} still open at next interval, closing it first\n",
                       util::Stamp(), current_->number);
            scheduler_.Cancel(close_timer_);
            close_timer_ = NoTimer;
            // the open below arms the next interval itself
            (void)GuardedLocked("round close", [this]() { CloseRoundLocked(); }, false);
        }

        if (IsLastRoundLocked())
        {
            if (next_question_ >= questions_.size() && round_counter_ < cfg_.max_rounds)
            {
                std::print("[{}] [Session] out of questions after {} rounds\n", util::Stamp(), round_counter_);
            }
            FinishLocked();
            return;
        }

        TimePoint const now = scheduler_.Now();
        Round round{
            .id = next_round_id_,
            .number = round_counter_ + 1,
            .question = questions_[next_question_],
            .opens_at = now,
            .closes_at = now + cfg_.answer_window,
            .status = RoundStatus::Open
        };
        bool const last = (round.number >= cfg_.max_rounds) || (next_question_ + 1 >= questions_.size());

        // Both timers are measured from this open; a slow or early close never shifts the
        // next open.
        uint64_t const sn = session_no_;
        RoundId const id = round.id;
        TimerHandle const close_h = scheduler_.After(cfg_.answer_window, [this, sn, id]()
        {
            OnCloseTimer(sn, id);
        });
        TimerHandle open_h = NoTimer;
        if (!last)
        {
            try
            {
                open_h = scheduler_.After(cfg_.question_interval, [this, sn]()
                {
                    OnOpenTimer(sn);
                });
            }
            catch (error::ScheduleError const&)
            {
                scheduler_.Cancel(close_h);
                throw;
            }
        }

        // commit
        ++next_round_id_;
        ++round_counter_;
        ++next_question_;
        close_timer_ = close_h;
        open_timer_ = open_h;
        intake_.OpenRound(round.id, round.number, round.closes_at);
        current_ = std::move(round);

        std::print("[{}] [Session] round {}/{} open ({} pts, id {}): {}\n",
                   util::Stamp(), current_->number, cfg_.max_rounds, current_->question->value,
                   current_->id, current_->question->prompt);

        std::string const text = FormatRoundOpened(current_->View(cfg_.max_rounds), cfg_.answer_window);
        PublishLocked(Announcement{.kind = AnnouncementKind::RoundOpened, .text = text});
        for (NodeId const& p : roster_)
        {
            if (intake_.IsBanned(p)) continue;
            PublishLocked(Announcement{.kind = AnnouncementKind::RoundOpened, .text = text, .direct_to = p});
        }
    }

    auto GameSession::CloseRoundLocked() -> void
    {
        MQZ_ASSERT(current_ && current_->IsOpen(), "Closing a round that is not open");

        Round& round = *current_;
        round.status = RoundStatus::Grading;
        std::vector<Submission> const subs = intake_.CloseRound(round.id);

        std::vector<ScoreLine> const lines = SettleLocked(round, subs);
        round.status = RoundStatus::Closed;

        std::print("[{}] [Session] round {} settled: {} answers\n", util::Stamp(), round.number, lines.size());
        PublishLocked(Announcement{
            .kind = AnnouncementKind::RoundSettled,
            .text = FormatRoundSettled(round.View(cfg_.max_rounds), lines, TopLocked(cfg_.settlement_top_n))
        });
    }

    auto GameSession::SettleLocked(Round& round, std::vector<Submission> const& subs) -> std::vector<ScoreLine>
    {
        std::vector<Grade> grades;
        grades.reserve(subs.size());
        for (Submission const& s : subs)
        {
            grades.push_back(rules_->Score(*round.question, s));
        }

        auto const apply_pending = [&]()
        {
            for (Grade const& g : grades)
            {
                if (round.applied.contains(g.player)) continue;
                (void)ledger_.ApplyDelta(g.player, g.delta);
                (void)board_.ApplyDelta(g.player, g.delta);
                round.applied.insert(g.player);
            }
        };

        uint32_t const attempts = std::max<uint32_t>(cfg_.settle_attempts, 1);
        for (uint32_t attempt{1};; ++attempt)
        {
            try
            {
                apply_pending();
                break;
            }
            catch (error::PersistenceError const& e)
            {
                std::print("[{}] [Session] ledger write failed for round {} (attempt {}/{}): {}\n",
                           util::Stamp(), round.number, attempt, attempts, e.message());
                if (attempt >= attempts) throw;
            }
        }

        std::vector<ScoreLine> lines;
        lines.reserve(grades.size());
        for (Grade const& g : grades)
        {
            lines.push_back(ScoreLine{
                .player = g.player,
                .name = NameOfLocked(g.player),
                .correct = g.correct,
                .delta = g.delta,
                .total = board_.TotalFor(g.player)
            });
        }
        return lines;
    }

    template <typename Fn>
    auto GameSession::GuardedLocked(std::string_view const what, Fn&& fn, bool const rearm) -> bool
    {
        try
        {
            std::forward<Fn>(fn)();
            return true;
        }
        catch (std::exception const& e)
        {
            std::print("[{}] [Session] FATAL for round {}: {} failed: {}\n",
                       util::Stamp(), current_ ? current_->number : 0, what, e.what());
        }

        AbandonRoundLocked(what);

        // keep the game paced: make sure something will open the next round
        if (rearm && state_ == SessionState::Running && !IsLastRoundLocked() && open_timer_ == NoTimer)
        {
            try
            {
                uint64_t const sn = session_no_;
                open_timer_ = scheduler_.After(cfg_.question_interval, [this, sn]()
                {
                    OnOpenTimer(sn);
                });
            }
            catch (std::exception const& e)
            {
                std::print("[{}] [Session] FATAL: cannot re-arm next round: {}\n", util::Stamp(), e.what());
                FinishLocked();
            }
        }
        return false;
    }

    auto GameSession::AbandonRoundLocked(std::string_view const reason) -> void
    {
        if (!current_ || current_->status == RoundStatus::Closed) return;

        if (intake_.IsOpen())
        {
            (void)intake_.CloseRound(current_->id);
        }
        current_->status = RoundStatus::Closed;
        std::print("[{}] [Session] round {} abandoned after {} ({} ledger writes kept)\n",
                   util::Stamp(), current_->number, reason, current_->applied.size());

        QuestionCSP const& q = current_->question;
        PublishLocked(Announcement{
            .kind = AnnouncementKind::RoundSettled,
            .text = std::format("ROUND {} CLOSED. Answer: {}\nScoring failed, this round does not count.",
                                current_->number, q->answers.empty() ? std::string("?") : q->answers.front())
        });
    }

    auto GameSession::AfterCloseLocked() -> void
    {
        if (state_ == SessionState::Running && IsLastRoundLocked())
        {
            std::print("[{}] [Session] final round complete\n", util::Stamp());
            FinishLocked();
        }
    }

    auto GameSession::FinishLocked() -> void
    {
        CancelTimersLocked();
        if (current_ && current_->status != RoundStatus::Closed)
        {
            AbandonRoundLocked("game end");
        }
        state_ = SessionState::Stopped;

        std::vector<NamedStanding> top;
        try
        {
            top = TopLocked(cfg_.final_top_n);
        }
        catch (std::exception const& e)
        {
            std::print("[{}] [Session] final leaderboard unavailable: {}\n", util::Stamp(), e.what());
        }
        std::print("[{}] [Session] game #{} over after {} rounds\n", util::Stamp(), session_no_, round_counter_);
        PublishLocked(Announcement{.kind = AnnouncementKind::GameStopped, .text = FormatFinalLeaderboard(top)});
    }

    auto GameSession::CancelTimersLocked() -> void
    {
        scheduler_.Cancel(close_timer_);
        scheduler_.Cancel(open_timer_);
        close_timer_ = NoTimer;
        open_timer_ = NoTimer;
    }

    auto GameSession::StatusLocked() const -> SessionStatus
    {
        SessionStatus st{
            .state = state_,
            .session_no = session_no_,
            .round_number = round_counter_,
            .max_rounds = cfg_.max_rounds,
            .players_joined = roster_.size()
        };
        if (current_)
        {
            st.current = current_->View(cfg_.max_rounds);
        }
        return st;
    }

    auto GameSession::TopLocked(size_t const n) const -> std::vector<NamedStanding>
    {
        std::vector<NamedStanding> out;
        for (Standing const& s : board_.TopN(n))
        {
            out.push_back(NamedStanding{.player = s.player, .name = NameOfLocked(s.player), .total = s.total});
        }
        return out;
    }

    auto GameSession::NameOfLocked(NodeId const& player) const -> std::string
    {
        auto const it = names_.find(player);
        return (it != names_.end()) ? it->second : std::format("!{}", player);
    }

    auto GameSession::RememberNameLocked(NodeId const& player, std::string_view const name) -> void
    {
        std::string_view const trimmed = util::Trim(name);
        if (player.empty() || trimmed.empty()) return;
        names_[player] = std::string(trimmed);
    }

    auto GameSession::PublishLocked(Announcement a) -> void
    {
        try
        {
            announcer_.Publish(a);
        }
        catch (std::exception const& e)
        {
            std::print("[{}] [Session] could not publish {}: {}\n", util::Stamp(), to_string(a.kind), e.what());
        }
    }
}
