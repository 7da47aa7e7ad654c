#ifndef MESHQUIZ_PERSONALITY_HPP
#define MESHQUIZ_PERSONALITY_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "Types.hpp"

namespace meshquiz::core
{
    struct ChannelContext
    {
        bool direct{false};
        // mesh channel index; meaningful for public messages only
        uint32_t index{0};
    };

    struct InboundMessage
    {
        NodeId sender;
        std::string sender_name;
        ChannelContext channel{};
        std::string text;
    };

    // A game mode the router hands every inbound text message to. One is chosen at
    // startup and never swapped.
    class Personality
    {
    public:
        virtual ~Personality() = default;

        virtual auto Name() const -> std::string_view = 0;

        // Reply to send back to the sender by DM, or nothing to stay silent.
        virtual auto HandleMessage(InboundMessage const& msg) -> std::optional<std::string> = 0;

        virtual auto Help(bool for_admin) const -> std::string = 0;
    };
}

#endif //MESHQUIZ_PERSONALITY_HPP
