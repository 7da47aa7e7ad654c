#include "codec.hpp"

#include <format>
#include <utility>

namespace fbn = meshquiz::gen::net;

namespace
{
    auto str_or_empty(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }

    // Verifies the buffer and returns its root, or why it cannot be read
    auto checked_envelope(std::span<std::byte const> bytes)
        -> std::expected<fbn::Envelope const*, meshquiz::core::net::ParseError>
    {
        using meshquiz::core::net::ParseError;

        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fbn::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"envelope failed verification"});

        auto const* env = fbn::GetEnvelope(data);
        if (!env)
            return std::unexpected(ParseError{"bad root"});
        if (env->schema_version() != meshquiz::core::net::SchemaVersion)
            return std::unexpected(ParseError{std::format("unsupported schema version {}", env->schema_version())});
        return env;
    }
} // anonymous

namespace meshquiz::core::net
{
    auto BuildSendText(OutboundText const& out, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const to = fbb.CreateString(out.to);
        auto const txt = fbb.CreateString(out.text);
        auto const st = fbn::CreateSendText(fbb, msg_id, to, out.channel, txt);
        auto const env = fbn::CreateEnvelope(fbb, SchemaVersion, fbn::Message::SendText, st.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    auto BuildTextPacket(InboundMessage const& msg, std::uint64_t const rx_time) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const from = fbb.CreateString(msg.sender);
        auto const name = fbb.CreateString(msg.sender_name);
        auto const txt = fbb.CreateString(msg.text);
        auto const tp = fbn::CreateTextPacket(fbb, from, name, msg.channel.index, msg.channel.direct, txt, rx_time);
        auto const env = fbn::CreateEnvelope(fbb, SchemaVersion, fbn::Message::TextPacket, tp.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    auto DecodeInbound(std::span<std::byte const> bytes) -> std::expected<InboundMessage, ParseError>
    {
        auto const env = checked_envelope(bytes);
        if (!env)
            return std::unexpected(env.error());

        if ((*env)->message_type() != fbn::Message::TextPacket)
            return std::unexpected(ParseError{"not a TextPacket"});

        auto const* tp = (*env)->message_as_TextPacket();
        if (!tp->from_id() || tp->from_id()->size() == 0)
            return std::unexpected(ParseError{"packet without sender"});
        if (!tp->text())
            return std::unexpected(ParseError{"packet without text"});

        InboundMessage out{};
        out.sender = tp->from_id()->str();
        out.sender_name = str_or_empty(tp->from_name());
        if (out.sender_name.empty())
        {
            out.sender_name = out.sender;
        }
        out.channel = ChannelContext{.direct = tp->direct(), .index = tp->channel()};
        out.text = tp->text()->str();
        return out;
    }

    auto DecodeSendText(std::span<std::byte const> bytes) -> std::expected<OutboundText, ParseError>
    {
        auto const env = checked_envelope(bytes);
        if (!env)
            return std::unexpected(env.error());

        if ((*env)->message_type() != fbn::Message::SendText)
            return std::unexpected(ParseError{"not a SendText"});

        auto const* st = (*env)->message_as_SendText();
        return OutboundText{
            .to = str_or_empty(st->to_id()),
            .channel = st->channel(),
            .text = str_or_empty(st->text())
        };
    }
} // namespace meshquiz::core::net
