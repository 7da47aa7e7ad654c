#include <gtest/gtest.h>
#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "../core/Personality.hpp"
#include "../net/Router.hpp"
#include "../net/codec.hpp"

using namespace meshquiz::core;
using meshquiz::core::net::AsBytes;
using meshquiz::core::net::BuildSendText;
using meshquiz::core::net::BuildTextPacket;
using meshquiz::core::net::DecodeInbound;
using meshquiz::core::net::DecodeSendText;
using meshquiz::core::net::OutboundText;
using meshquiz::net::SplitForMesh;

namespace
{
    // Hand-built envelope, for versions and shapes the builders never produce
    auto MakeEnvelope(uint16_t version, bool with_sender) -> flatbuffers::DetachedBuffer
    {
        namespace fbn = meshquiz::gen::net;
        flatbuffers::FlatBufferBuilder fbb;
        auto const from = with_sender ? fbb.CreateString("!a1b2") : flatbuffers::Offset<flatbuffers::String>{};
        auto const txt = fbb.CreateString("22");
        auto const tp = fbn::CreateTextPacket(fbb, from, 0, 0, true, txt, 0);
        fbb.Finish(fbn::CreateEnvelope(fbb, version, fbn::Message::TextPacket, tp.Union()));
        return fbb.Release();
    }
}

TEST(Codec, TextPacketDecodes)
{
    InboundMessage const msg{
        .sender = "!a1b2c3d4",
        .sender_name = "Alice",
        .channel = ChannelContext{.direct = false, .index = 2},
        .text = "!hj join"
    };
    auto const buf = BuildTextPacket(msg, 1700000000);
    auto const out = DecodeInbound(AsBytes(buf));

    ASSERT_TRUE(out.has_value()) << out.error().message;
    EXPECT_EQ(out->sender, "!a1b2c3d4");
    EXPECT_EQ(out->sender_name, "Alice");
    EXPECT_FALSE(out->channel.direct);
    EXPECT_EQ(out->channel.index, 2u);
    EXPECT_EQ(out->text, "!hj join");
}

TEST(Codec, MissingNameFallsBackToId)
{
    InboundMessage const msg{.sender = "!beef", .sender_name = "", .channel = {.direct = true}, .text = "22"};
    auto const out = DecodeInbound(AsBytes(BuildTextPacket(msg)));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->sender_name, "!beef");
    EXPECT_TRUE(out->channel.direct);
}

TEST(Codec, SendTextDecodes)
{
    auto const buf = BuildSendText(OutboundText{.to = "!a1b2", .channel = 0, .text = "You're in!"}, 42);
    auto const out = DecodeSendText(AsBytes(buf));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->to, "!a1b2");
    EXPECT_EQ(out->text, "You're in!");

    // our own outbound frame is not something the bot accepts as input
    auto const wrong = DecodeInbound(AsBytes(buf));
    ASSERT_FALSE(wrong.has_value());
    EXPECT_EQ(wrong.error().message, "not a TextPacket");
}

TEST(Codec, RejectsBadFrames)
{
    std::array<std::byte, 2> const tiny{};
    EXPECT_FALSE(DecodeInbound(tiny).has_value());

    std::vector<std::byte> junk(64, std::byte{0x5a});
    EXPECT_FALSE(DecodeInbound(junk).has_value());

    auto const future = MakeEnvelope(2, true);
    auto const v2 = DecodeInbound(AsBytes(future));
    ASSERT_FALSE(v2.has_value());
    EXPECT_NE(v2.error().message.find("schema version"), std::string::npos);

    auto const anon = MakeEnvelope(1, false);
    EXPECT_FALSE(DecodeInbound(AsBytes(anon)).has_value());

    // truncated frame
    auto const good = BuildTextPacket(InboundMessage{.sender = "!a", .text = "hello there"});
    auto const bytes = AsBytes(good);
    EXPECT_FALSE(DecodeInbound(bytes.first(bytes.size() / 2)).has_value());
}

TEST(SplitForMesh, ShortTextIsOnePacket)
{
    auto const parts = SplitForMesh("ROUND 1/10 - 200 POINTS");
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0], "ROUND 1/10 - 200 POINTS");
    EXPECT_TRUE(SplitForMesh("").empty());
}

TEST(SplitForMesh, HardSplitsAtTheLimit)
{
    auto const parts = SplitForMesh(std::string(450, 'a'));
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0].size(), 200u);
    EXPECT_EQ(parts[1].size(), 200u);
    EXPECT_EQ(parts[2].size(), 50u);
}

TEST(SplitForMesh, PrefersALineBreak)
{
    std::string const text = std::string(150, 'x') + "\n" + std::string(100, 'y');
    auto const parts = SplitForMesh(text);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], std::string(150, 'x'));
    EXPECT_EQ(parts[1], std::string(100, 'y'));

    // a break too early in the chunk is not worth it
    std::string const early = std::string(20, 'x') + "\n" + std::string(300, 'y');
    auto const hard = SplitForMesh(early);
    ASSERT_EQ(hard.size(), 2u);
    EXPECT_EQ(hard[0].size(), 200u);
}

TEST(SplitForMesh, NeverCutsACharacter)
{
    // 199 ASCII bytes then a two byte character straddling the limit
    std::string const text = std::string(199, 'a') + "\xc3\xa9" + "b";
    auto const parts = SplitForMesh(text);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], std::string(199, 'a'));
    EXPECT_EQ(parts[1], "\xc3\xa9" "b");
}
