#include "AuditLogger.hpp"

#include <format>
#include <vector>

#include "../core/Exception.hpp"
#include "../core/Util.hpp"

using namespace meshquiz::core;

namespace
{

// keep one transcript entry per line
auto one_line(std::string_view const s) -> std::string
{
    std::string out;
    out.reserve(s.size());
    for (char const c : s)
    {
        if (c == '\n') out += " / ";
        else if (c != '\r') out += c;
    }
    return out;
}

auto s_channel(ChannelContext const& ch) -> std::string
{
    return ch.direct ? std::string("DM") : std::format("ch{}", ch.index);
}

} // anonymous namespace

namespace meshquiz::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(path, std::ios::out | std::ios::trunc)
{
    if (!out_.is_open())
    {
        MQZ_THROW(error::Code::Persistence, std::format("cannot open audit transcript {}", path));
    }
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::write(std::string const& line) -> void
{
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << util::Stamp() << ' ' << line << '\n';
    ++lines_;
}

auto AuditLogger::start(SessionConfig const& cfg, size_t const question_count) -> void
{
    std::string admins;
    for (size_t i{}; i < cfg.admin_ids.size(); ++i)
    {
        admins += (i ? "," : "");
        admins += cfg.admin_ids[i];
    }
    write(std::format("Start rounds={} window={}s interval={}s questions={} admins=[{}]",
                      cfg.max_rounds, cfg.answer_window.count(), cfg.question_interval.count(),
                      question_count, admins));
    flush();
}

auto AuditLogger::inbound(InboundMessage const& msg) -> void
{
    write(std::format("In  {} ({}) {}: {}", msg.sender, msg.sender_name, s_channel(msg.channel), one_line(msg.text)));
}

auto AuditLogger::reply(NodeId const& to, std::string_view const text) -> void
{
    write(std::format("Out {} DM: {}", to, one_line(text)));
}

auto AuditLogger::announcement(Announcement const& a) -> void
{
    write(std::format("Ann {} {}: {}", to_string(a.kind),
                      a.direct_to ? *a.direct_to : std::string("public"), one_line(a.text)));
}

auto AuditLogger::status(SessionStatus const& st) -> void
{
    write(std::format("State {} game=#{} round={}/{} players={} current={}",
                      to_string(st.state), st.session_no, st.round_number, st.max_rounds, st.players_joined,
                      st.current ? std::format("{}:{}", st.current->id, to_string(st.current->status))
                                 : std::string("-")));
}

auto AuditLogger::end(GameSession const& session) -> void
{
    status(session.Status());

    std::vector<NamedStanding> const top = session.Leaderboard(session.Settings().final_top_n);
    std::string body;
    for (size_t i{}; i < top.size(); ++i)
    {
        body += std::format("{}{}:{}", (i ? "," : ""), top[i].player, top[i].total);
    }
    write(std::format("End standings=[{}]", body));
    flush();
}

auto AuditLogger::flush() -> void
{
    std::lock_guard<std::mutex> lock(mtx_);
    out_.flush();
}

auto AuditLogger::Lines() const -> uint64_t
{
    std::lock_guard<std::mutex> lock(mtx_);
    return lines_;
}

} // namespace meshquiz::core::debug
