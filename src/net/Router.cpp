#include "Router.hpp"

#include <exception>
#include <format>
#include <optional>
#include <print>

#include "core/Util.hpp"

namespace meshquiz::net
{
    namespace
    {
        auto IsContinuation(char const c) -> bool
        {
            return (static_cast<unsigned char>(c) & 0xC0u) == 0x80u;
        }
    }

    auto SplitForMesh(std::string_view text, size_t const max_bytes) -> std::vector<std::string>
    {
        std::vector<std::string> out;
        if (max_bytes == 0) return out;

        while (text.size() > max_bytes)
        {
            size_t cut = max_bytes;
            // never split inside a multi-byte sequence
            while (cut > 0 && IsContinuation(text[cut])) --cut;
            if (cut == 0) cut = max_bytes;

            size_t const nl = text.substr(0, cut).rfind('\n');
            bool const at_newline = nl != std::string_view::npos && nl > 0 && nl >= cut / 2;
            if (at_newline) cut = nl;

            out.emplace_back(text.substr(0, cut));
            text.remove_prefix(at_newline ? cut + 1 : cut);
        }
        if (!text.empty()) out.emplace_back(text);
        return out;
    }

    Router::Router(Transport& transport, uint32_t const game_channel) :
        transport_(transport),
        game_channel_(game_channel)
    {
    }

    auto Router::OnInbound(core::InboundMessage const& msg) -> void
    {
        if (!msg.channel.direct && msg.channel.index != game_channel_)
        {
            return;
        }
        if (!personality_)
        {
            std::print("[{}] [Router] no personality bound, message from {} dropped\n",
                       core::util::Stamp(), msg.sender);
            return;
        }
        if (audit_) audit_->inbound(msg);

        std::print("[{}] [Router] [{}] [{}]: {}\n", core::util::Stamp(),
                   msg.channel.direct ? std::string("DM") : std::format("Ch {}", msg.channel.index),
                   msg.sender_name, msg.text);

        std::optional<std::string> reply;
        try
        {
            reply = personality_->HandleMessage(msg);
        }
        catch (std::exception const& e)
        {
            std::print("[{}] [Router] {} failed on a message from {}: {}\n",
                       core::util::Stamp(), personality_->Name(), msg.sender, e.what());
            return;
        }

        if (reply && !reply->empty())
        {
            if (audit_) audit_->reply(msg.sender, *reply);
            Deliver(msg.sender, *reply);
        }
    }

    auto Router::Publish(core::Announcement const& a) -> void
    {
        if (audit_) audit_->announcement(a);
        Deliver(a.direct_to.value_or(core::NodeId{}), a.text);
    }

    auto Router::Deliver(core::NodeId const& to, std::string_view const text) -> void
    {
        // node ids travel in the radio's own "!hex" spelling
        core::NodeId const dest = (to.empty() || to.front() == '!') ? to : "!" + to;

        for (std::string& chunk : SplitForMesh(text))
        {
            bool const queued = transport_.SendText(core::net::OutboundText{
                .to = dest,
                .channel = game_channel_,
                .text = std::move(chunk)
            });
            if (!queued)
            {
                std::print("[{}] [Router] dropped outbound packet to {}\n", core::util::Stamp(),
                           dest.empty() ? std::format("ch {}", game_channel_) : dest);
                return;
            }
            ++packets_out_;
        }
    }
}
