#include "Announcements.hpp"

#include <algorithm>
#include <format>

namespace meshquiz::core
{
    auto to_string(AnnouncementKind const k) -> std::string_view
    {
        switch (k)
        {
        case AnnouncementKind::GameStarted: return "GameStarted";
        case AnnouncementKind::RoundOpened: return "RoundOpened";
        case AnnouncementKind::RoundSettled: return "RoundSettled";
        case AnnouncementKind::GameStopped: return "GameStopped";
        }
        return "?";
    }

    auto FormatDuration(std::chrono::seconds const d) -> std::string
    {
        auto const secs = d.count();
        if (secs >= 60 && secs % 60 == 0) return std::format("{} min", secs / 60);
        if (secs >= 60) return std::format("{} min {} s", secs / 60, secs % 60);
        return std::format("{} s", secs);
    }

    static auto SignedPoints(Points const p) -> std::string
    {
        return p >= 0 ? std::format("+{}", p) : std::format("{}", p);
    }

    static auto AppendStandings(std::string& s, std::vector<NamedStanding> const& top) -> void
    {
        for (size_t i{}; i < top.size(); ++i)
        {
            s += std::format("\n{}. {}: {} pts", i + 1, top[i].name, top[i].total);
        }
    }

    auto FormatGameStarted(uint64_t const session_no, SessionConfig const& cfg) -> std::string
    {
        return std::format("HACKER JEOPARDY #{} - GAME ON!\n"
                           "Send !hj join to play. DM your answers to me.\n"
                           "Correct = +points | Wrong = -points | No answer = 0\n"
                           "{} rounds, a question every {}, {} to answer.",
                           session_no, cfg.max_rounds,
                           FormatDuration(cfg.question_interval), FormatDuration(cfg.answer_window));
    }

    auto FormatRoundOpened(RoundView const& r, std::chrono::seconds const answer_window) -> std::string
    {
        return std::format("ROUND {}/{} - {} POINTS\n{}\nDM your answer within {}!",
                           r.number, r.max_rounds, r.question->value, r.question->prompt,
                           FormatDuration(answer_window));
    }

    auto FormatRoundSettled(RoundView const& r,
                            std::vector<ScoreLine> const& scorers,
                            std::vector<NamedStanding> const& top) -> std::string
    {
        std::string s = std::format("ROUND {} CLOSED. Answer: {}", r.number,
                                    r.question->answers.empty() ? std::string("?") : r.question->answers.front());
        if (scorers.empty())
        {
            s += "\nNo answers this round.";
        }
        for (ScoreLine const& l : scorers)
        {
            s += std::format("\n{} {} ({})", l.name, SignedPoints(l.delta), l.total);
        }
        if (!top.empty())
        {
            s += "\nStandings:";
            AppendStandings(s, top);
        }
        return s;
    }

    auto FormatFinalLeaderboard(std::vector<NamedStanding> const& top) -> std::string
    {
        if (top.empty())
        {
            return "GAME OVER! No scores recorded.";
        }
        std::string s = "GAME OVER - FINAL SCORES:";
        AppendStandings(s, top);
        s += "\nThanks for playing!";
        return s;
    }

    auto FormatScores(std::vector<NamedStanding> const& top) -> std::string
    {
        if (top.empty())
        {
            return "No scores yet!";
        }
        std::string s = "LEADERBOARD:";
        AppendStandings(s, top);
        return s;
    }

    auto FormatStatus(SessionStatus const& st, TimePoint const now) -> std::string
    {
        if (st.state == SessionState::Idle)
        {
            return "No game in progress.";
        }
        std::string s = std::format("Game #{} {}\nRound {}/{} | {} players joined",
                                    st.session_no, to_string(st.state),
                                    st.round_number, st.max_rounds, st.players_joined);
        if (st.current && st.current->status == RoundStatus::Open)
        {
            auto const left = std::chrono::duration_cast<std::chrono::seconds>(st.current->closes_at - now);
            s += std::format("\nQuestion open, {} left", FormatDuration(std::max(left, std::chrono::seconds{0})));
        }
        return s;
    }

    auto FormatHelp(bool const show_admin) -> std::string
    {
        std::string s = "HACKER JEOPARDY\n"
                        "Questions are posted to the channel. DM your answers to me!\n"
                        "Correct = +points, Wrong = -points, No answer = 0\n"
                        "!hj join | !hj status | !hj scores";
        if (show_admin)
        {
            s += "\nAdmin: !hj start | stop | next | ban <id> | unban <id> | reset";
        }
        return s;
    }
}
