#ifndef MESHQUIZ_MANUALSCHEDULER_HPP
#define MESHQUIZ_MANUALSCHEDULER_HPP

#include <map>
#include <mutex>
#include <optional>
#include <utility>

#include "../core/Scheduler.hpp"

namespace meshquiz::core::debug
{
    // Virtual clock for tests. Time only moves in Advance(); due callbacks run on the
    // caller's thread in (due time, arming order) order, without the scheduler lock held,
    // so a callback may arm further timers that become due within the same Advance().
    class ManualScheduler final : public Scheduler
    {
    public:
        ManualScheduler() = default;

        auto After(Duration delay, Callback cb) -> TimerHandle override
        {
            std::lock_guard<std::mutex> lock(mtx_);
            TimerHandle const h = next_++;
            queue_.emplace(Key{now_ + delay, h}, std::move(cb));
            return h;
        }

        auto Cancel(TimerHandle handle) -> void override
        {
            std::lock_guard<std::mutex> lock(mtx_);
            for (auto it = queue_.begin(); it != queue_.end(); ++it)
            {
                if (it->first.second == handle)
                {
                    queue_.erase(it);
                    return;
                }
            }
        }

        auto Now() const -> TimePoint override
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return now_;
        }

        auto Advance(Duration by) -> size_t
        {
            TimePoint target{};
            {
                std::lock_guard<std::mutex> lock(mtx_);
                target = now_ + by;
            }
            size_t fired = 0;
            while (auto next = PopDue(target))
            {
                next->second();
                ++fired;
            }
            std::lock_guard<std::mutex> lock(mtx_);
            now_ = target;
            return fired;
        }

        auto Pending() const -> size_t
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return queue_.size();
        }

        // Offset of the next due timer from now, if any
        auto NextDueIn() const -> std::optional<Duration>
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (queue_.empty()) return std::nullopt;
            return queue_.begin()->first.first - now_;
        }

    private:
        using Key = std::pair<TimePoint, TimerHandle>;

        auto PopDue(TimePoint target) -> std::optional<std::pair<Key, Callback>>
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (queue_.empty() || queue_.begin()->first.first > target) return std::nullopt;
            auto node = queue_.extract(queue_.begin());
            now_ = node.key().first;
            return std::make_pair(node.key(), std::move(node.mapped()));
        }

    private:
        mutable std::mutex mtx_;
        TimePoint now_{};
        TimerHandle next_{1};
        std::map<Key, Callback> queue_;
    };
}

#endif //MESHQUIZ_MANUALSCHEDULER_HPP
