#include "Scheduler.hpp"

#include <exception>
#include <print>
#include <utility>

#include <boost/asio/post.hpp>

#include "Exception.hpp"

namespace meshquiz::core
{
    AsioScheduler::AsioScheduler() :
        work_(boost::asio::make_work_guard(io_))
    {
        worker_ = std::thread([this]()
        {
            io_.run();
        });
    }

    AsioScheduler::~AsioScheduler()
    {
        Shutdown();
    }

    auto AsioScheduler::Shutdown() -> void
    {
        if (stopped_.exchange(true)) return;

        work_.reset();
        io_.stop();
        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
        {
            worker_.join();
        }
        std::lock_guard<std::mutex> lock(mtx_);
        timers_.clear();
    }

    auto AsioScheduler::After(Duration const delay, Callback cb) -> TimerHandle
    {
        if (stopped_.load())
        {
            MQZ_THROW(error::Code::Schedule, "scheduler already shut down");
        }
        if (!cb)
        {
            MQZ_THROW(error::Code::Schedule, "empty timer callback");
        }

        TimerHandle const handle = next_handle_.fetch_add(1);
        auto timer = std::make_shared<boost::asio::steady_timer>(io_);
        {
            std::lock_guard<std::mutex> lock(mtx_);
            timers_.emplace(handle, timer);
        }

        boost::asio::post(io_, [this, handle, delay, timer, cb = std::move(cb)]() mutable
        {
            timer->expires_after(delay);
            timer->async_wait([this, handle, cb = std::move(cb)](boost::system::error_code const& ec)
            {
                {
                    std::lock_guard<std::mutex> lock(mtx_);
                    // erased means Cancel() won the race
                    if (timers_.erase(handle) == 0) return;
                }
                if (ec == boost::asio::error::operation_aborted) return;

                try
                {
                    cb();
                }
                catch (std::exception const& e)
                {
                    // callbacks own their error handling; this only keeps the io thread alive
                    std::print("[Scheduler] timer {} callback escaped: {}\n", handle, e.what());
                }
            });
        });
        return handle;
    }

    auto AsioScheduler::Cancel(TimerHandle const handle) -> void
    {
        if (handle == NoTimer) return;

        std::shared_ptr<boost::asio::steady_timer> timer;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto const it = timers_.find(handle);
            if (it == timers_.end()) return;
            timer = std::move(it->second);
            timers_.erase(it);
        }
        boost::asio::post(io_, [timer = std::move(timer)]()
        {
            timer->cancel();
        });
    }

    auto AsioScheduler::Pending() const -> size_t
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return timers_.size();
    }
}
