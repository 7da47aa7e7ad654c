#ifndef MESHQUIZ_SCHEDULER_HPP
#define MESHQUIZ_SCHEDULER_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "Types.hpp"

namespace meshquiz::core
{
    using TimerHandle = uint64_t;
    inline constexpr TimerHandle NoTimer = 0;

    // Delayed, cancelable callbacks plus the clock the session measures deadlines with.
    // Callbacks are never invoked from inside After()/Cancel(), so a caller may hold its
    // own lock while arming or cancelling.
    class Scheduler
    {
    public:
        using Callback = std::function<void()>;

        virtual ~Scheduler() = default;

        // Throws error::ScheduleError if the timer cannot be armed.
        virtual auto After(Duration delay, Callback cb) -> TimerHandle = 0;

        // Cancelling an unknown or already fired handle is harmless. A callback that is
        // already on its way may still run; callers detect that from their own state.
        virtual auto Cancel(TimerHandle handle) -> void = 0;

        virtual auto Now() const -> TimePoint = 0;
    };

    // Boost.Asio io_context (the one websocketpp runs on) on one dedicated thread. Timer objects are only ever
    // touched from that thread; After()/Cancel() post to it.
    class AsioScheduler final : public Scheduler
    {
    public:
        AsioScheduler();
        ~AsioScheduler() override;

        AsioScheduler(AsioScheduler const&) = delete;
        auto operator=(AsioScheduler const&) -> AsioScheduler& = delete;

        auto After(Duration delay, Callback cb) -> TimerHandle override;
        auto Cancel(TimerHandle handle) -> void override;
        auto Now() const -> TimePoint override { return Clock::now(); }

        // Drops pending timers and joins the worker. Idempotent.
        auto Shutdown() -> void;

        auto Pending() const -> size_t;

    private:
        boost::asio::io_context io_;
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
        std::thread worker_;

        mutable std::mutex mtx_;
        std::unordered_map<TimerHandle, std::shared_ptr<boost::asio::steady_timer>> timers_;
        std::atomic<TimerHandle> next_handle_{1};
        std::atomic<bool> stopped_{false};
    };
}

#endif //MESHQUIZ_SCHEDULER_HPP
