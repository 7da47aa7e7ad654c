#ifndef MESHQUIZ_CODEC_HPP
#define MESHQUIZ_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <flatbuffers/flatbuffers.h>

#include "../core/Personality.hpp"
#include "../core/Types.hpp"

#include "generated/flatbuffers/meshquiz_net_generated.h"

namespace meshquiz::core::net
{
    inline constexpr uint16_t SchemaVersion = 1;

    struct ParseError
    {
        std::string message;
    };

    // One text message for the radio. An empty `to` broadcasts on `channel`.
    struct OutboundText
    {
        NodeId to;
        uint32_t channel{0};
        std::string text;
    };

    // --- Outbound builders ---

    // bot -> gateway
    auto BuildSendText(OutboundText const& out, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // gateway -> bot; used by the console harness and tests to stand in for the radio side
    auto BuildTextPacket(InboundMessage const& msg, std::uint64_t rx_time = 0) -> flatbuffers::DetachedBuffer;

    // --- Inbound decode (verified; never trusts the wire) ---

    auto DecodeInbound(std::span<std::byte const> bytes) -> std::expected<InboundMessage, ParseError>;

    auto DecodeSendText(std::span<std::byte const> bytes) -> std::expected<OutboundText, ParseError>;

    inline auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }
} // namespace meshquiz::core::net

#endif //MESHQUIZ_CODEC_HPP
