#ifndef MESHQUIZ_ROUTER_HPP
#define MESHQUIZ_ROUTER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/Announcements.hpp"
#include "core/Personality.hpp"
#include "debug/AuditLogger.hpp"
#include "net/codec.hpp"

namespace meshquiz::net
{
    // Largest payload we hand the radio in one packet
    inline constexpr size_t MaxMeshText = 200;

    // Splits on UTF-8 character boundaries, preferring a line break in the back half
    // of a chunk. Every chunk is at most `max_bytes` long and nothing is dropped but the
    // line breaks the split consumed.
    auto SplitForMesh(std::string_view text, size_t max_bytes = MaxMeshText) -> std::vector<std::string>;

    // Where outbound text goes: the gateway link, or stdout in the console harness.
    class Transport
    {
    public:
        virtual ~Transport() = default;

        // Queues one packet; false if it was refused (queue full, link shut down).
        virtual auto SendText(core::net::OutboundText out) -> bool = 0;
    };

    // Glue between the radio and the game: hands inbound text to the personality, DMs
    // its reply to the sender, and publishes session announcements to the game channel.
    class Router final : public core::Announcer
    {
    public:
        Router(Transport& transport, uint32_t game_channel);

        Router(Router const&) = delete;
        auto operator=(Router const&) -> Router& = delete;

        // Late-bound: the personality drives a session that publishes through this router.
        auto BindPersonality(core::Personality& personality) noexcept -> void { personality_ = &personality; }

        // Public traffic is only read on the game channel; DMs always.
        auto OnInbound(core::InboundMessage const& msg) -> void;

        auto Publish(core::Announcement const& a) -> void override;

        auto SetAudit(core::debug::AuditLogger* audit) noexcept -> void { audit_ = audit; }

        auto GameChannel() const noexcept -> uint32_t { return game_channel_; }
        auto PacketsOut() const noexcept -> uint64_t { return packets_out_.load(); }

    private:
        auto Deliver(core::NodeId const& to, std::string_view text) -> void;

        core::Personality* personality_{nullptr}; // late-bound
        Transport& transport_;
        uint32_t const game_channel_;
        core::debug::AuditLogger* audit_{nullptr};
        std::atomic<uint64_t> packets_out_{0};
    };
}

#endif //MESHQUIZ_ROUTER_HPP
