#include "MeshLink.hpp"

#include <exception>
#include <format>
#include <print>
#include <span>
#include <utility>

#include "core/Exception.hpp"
#include "core/Util.hpp"

namespace meshquiz::net
{
    MeshLink::MeshLink(LinkConfig cfg, InboundFn on_inbound) :
        cfg_(std::move(cfg)),
        on_inbound_(std::move(on_inbound))
    {
        client_.clear_access_channels(websocketpp::log::alevel::all);
        client_.clear_error_channels(websocketpp::log::elevel::all);
        client_.init_asio();
        // keep run() alive across disconnects
        client_.start_perpetual();

        client_.set_open_handler([this](Hdl hdl)
        {
            hdl_ = hdl;
            connected_ = true;
            std::print("[{}] [MeshLink] connected to {}\n", core::util::Stamp(), cfg_.uri);

            bool kick = false;
            {
                std::lock_guard<std::mutex> lock(q_mtx_);
                if (!outbox_.empty() && !pumping_)
                {
                    pumping_ = true;
                    kick = true;
                }
            }
            if (kick)
            {
                Pump();
            }
        });

        client_.set_close_handler([this](Hdl)
        {
            connected_ = false;
            std::print("[{}] [MeshLink] gateway closed the connection\n", core::util::Stamp());
            ScheduleReconnect();
        });

        client_.set_fail_handler([this](Hdl hdl)
        {
            connected_ = false;
            WsClient::connection_ptr con = client_.get_con_from_hdl(hdl);
            std::print("[{}] [MeshLink] connect to {} failed: {}\n", core::util::Stamp(), cfg_.uri,
                       con->get_ec().message());
            ScheduleReconnect();
        });

        client_.set_message_handler([this](Hdl hdl, WsClient::message_ptr msg)
        {
            OnFrame(std::move(hdl), std::move(msg));
        });
    }

    MeshLink::~MeshLink()
    {
        Stop();
    }

    auto MeshLink::Start() -> void
    {
        if (started_.exchange(true))
        {
            return;
        }

        websocketpp::lib::error_code ec;
        WsClient::connection_ptr con = client_.get_connection(cfg_.uri, ec);
        if (ec)
        {
            MQZ_THROW(core::error::Code::Network, std::format("bad gateway uri {}: {}", cfg_.uri, ec.message()));
        }
        client_.connect(con);

        net_thr_ = std::thread([this]()
        {
            try
            {
                client_.run();
            }
            catch (std::exception const& e)
            {
                std::print("[{}] [MeshLink] FATAL: link thread died: {}\n", core::util::Stamp(), e.what());
                connected_ = false;
            }
        });
        std::print("[{}] [MeshLink] connecting to {}\n", core::util::Stamp(), cfg_.uri);
    }

    auto MeshLink::Stop() -> void
    {
        if (stopping_.exchange(true))
        {
            return;
        }
        if (!started_)
        {
            return;
        }

        websocketpp::lib::asio::post(client_.get_io_service(), [this]()
        {
            if (connected_)
            {
                websocketpp::lib::error_code ec;
                client_.close(hdl_, websocketpp::close::status::going_away, "bot shutting down", ec);
                if (ec)
                {
                    std::print("[{}] [MeshLink] close failed: {}\n", core::util::Stamp(), ec.message());
                }
            }
            client_.stop_perpetual();
        });

        if (net_thr_.joinable())
        {
            net_thr_.join();
        }
        std::print("[{}] [MeshLink] stopped, {} packet(s) left unsent\n", core::util::Stamp(), Queued());
    }

    auto MeshLink::Connect() -> void
    {
        websocketpp::lib::error_code ec;
        WsClient::connection_ptr con = client_.get_connection(cfg_.uri, ec);
        if (ec)
        {
            std::print("[{}] [MeshLink] reconnect failed: {}\n", core::util::Stamp(), ec.message());
            ScheduleReconnect();
            return;
        }
        client_.connect(con);
    }

    auto MeshLink::ScheduleReconnect() -> void
    {
        if (stopping_)
        {
            return;
        }
        client_.set_timer(cfg_.reconnect_delay.count(), [this](websocketpp::lib::error_code const& ec)
        {
            if (ec || stopping_)
            {
                return;
            }
            Connect();
        });
    }

    auto MeshLink::SendText(core::net::OutboundText out) -> bool
    {
        if (stopping_)
        {
            return false;
        }

        flatbuffers::DetachedBuffer const buf = core::net::BuildSendText(out, next_msg_id_++);
        std::vector<uint8_t> frame(buf.data(), buf.data() + buf.size());

        bool kick = false;
        {
            std::lock_guard<std::mutex> lock(q_mtx_);
            if (outbox_.size() >= cfg_.max_queue)
            {
                outbox_.pop_front();
                std::print("[{}] [MeshLink] outbox full, oldest packet dropped\n", core::util::Stamp());
            }
            outbox_.push_back(std::move(frame));
            if (!pumping_ && connected_)
            {
                pumping_ = true;
                kick = true;
            }
        }

        if (kick)
        {
            websocketpp::lib::asio::post(client_.get_io_service(), [this]()
            {
                Pump();
            });
        }
        return true;
    }

    auto MeshLink::Queued() const -> size_t
    {
        std::lock_guard<std::mutex> lock(q_mtx_);
        return outbox_.size();
    }

    // Link thread only. Sends one packet, then waits `pace` before the next.
    auto MeshLink::Pump() -> void
    {
        std::vector<uint8_t> frame;
        {
            std::lock_guard<std::mutex> lock(q_mtx_);
            if (outbox_.empty() || !connected_)
            {
                pumping_ = false;
                return;
            }
            frame = std::move(outbox_.front());
            outbox_.pop_front();
        }

        websocketpp::lib::error_code ec;
        client_.send(hdl_, frame.data(), frame.size(), websocketpp::frame::opcode::binary, ec);
        if (ec)
        {
            std::print("[{}] [MeshLink] send failed: {}\n", core::util::Stamp(), ec.message());
            std::lock_guard<std::mutex> lock(q_mtx_);
            // retried from the open handler once the link is back
            outbox_.push_front(std::move(frame));
            pumping_ = false;
            return;
        }

        client_.set_timer(cfg_.pace.count(), [this](websocketpp::lib::error_code const& timer_ec)
        {
            if (timer_ec)
            {
                std::lock_guard<std::mutex> lock(q_mtx_);
                pumping_ = false;
                return;
            }
            Pump();
        });
    }

    auto MeshLink::OnFrame(Hdl, WsClient::message_ptr msg) -> void
    {
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[{}] [MeshLink] ignoring non-binary frame\n", core::util::Stamp());
            return;
        }

        std::string const& payload = msg->get_payload();
        std::span<std::byte const> const bytes{
            reinterpret_cast<std::byte const*>(payload.data()), payload.size()
        };

        auto decoded = core::net::DecodeInbound(bytes);
        if (!decoded)
        {
            std::print("[{}] [MeshLink] dropped frame: {}\n", core::util::Stamp(), decoded.error().message);
            return;
        }

        try
        {
            on_inbound_(*decoded);
        }
        catch (std::exception const& e)
        {
            std::print("[{}] [MeshLink] inbound handler failed: {}\n", core::util::Stamp(), e.what());
        }
    }
}
