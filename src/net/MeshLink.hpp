#ifndef MESHQUIZ_MESHLINK_HPP
#define MESHQUIZ_MESHLINK_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

#include "core/Personality.hpp"
#include "net/Router.hpp"
#include "net/codec.hpp"

namespace meshquiz::net
{
    using WsClient = websocketpp::client<websocketpp::config::asio_client>;
    using Hdl      = websocketpp::connection_hdl;

    struct LinkConfig
    {
        std::string uri{"ws://127.0.0.1:4403/mesh"};
        // gap between packets handed to the radio; the mesh drops bursts
        std::chrono::milliseconds pace{500};
        std::chrono::milliseconds reconnect_delay{std::chrono::seconds(5)};
        size_t max_queue{256};
    };

    // WebSocket client to the mesh gateway. Inbound TextPacket frames are decoded and
    // handed to the callback on the link thread; outbound packets are queued and paced
    // one at a time. Reconnects until Stop().
    class MeshLink final : public Transport
    {
    public:
        using InboundFn = std::function<void(core::InboundMessage const&)>;

        MeshLink(LinkConfig cfg, InboundFn on_inbound);
        ~MeshLink() override;

        MeshLink(MeshLink const&) = delete;
        auto operator=(MeshLink const&) -> MeshLink& = delete;

        // Spawns the link thread and starts connecting. Throws error::NetworkError.
        auto Start() -> void;
        // Closes the connection and joins the link thread. Idempotent.
        auto Stop() -> void;

        auto SendText(core::net::OutboundText out) -> bool override;

        auto Connected() const noexcept -> bool { return connected_.load(); }
        auto Queued() const -> size_t;

    private:
        auto Connect() -> void;
        auto ScheduleReconnect() -> void;
        auto Pump() -> void;
        auto OnFrame(Hdl hdl, WsClient::message_ptr msg) -> void;

        LinkConfig const cfg_;
        InboundFn on_inbound_;

        WsClient client_;
        std::thread net_thr_;

        // touched on the link thread only
        Hdl hdl_{};

        mutable std::mutex q_mtx_;
        std::deque<std::vector<uint8_t>> outbox_;
        bool pumping_{false};

        std::atomic<bool> connected_{false};
        std::atomic<bool> stopping_{false};
        std::atomic<bool> started_{false};
        std::atomic<std::uint64_t> next_msg_id_{1};
    };
}

#endif //MESHQUIZ_MESHLINK_HPP
