#ifndef MESHQUIZ_RECORDINGANNOUNCER_HPP
#define MESHQUIZ_RECORDINGANNOUNCER_HPP

#include <cstddef>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "../core/Announcements.hpp"

namespace meshquiz::core::debug
{
    // Keeps every announcement, optionally forwarding to a real announcer behind it.
    class RecordingAnnouncer final : public Announcer
    {
    public:
        RecordingAnnouncer() = default;

        explicit RecordingAnnouncer(Announcer& inner)
            : inner_{&inner}
        {
        }

        auto Publish(Announcement const& a) -> void override
        {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                seen_.push_back(a);
            }
            if (inner_)
            {
                inner_->Publish(a);
            }
        }

        auto All() const -> std::vector<Announcement>
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return seen_;
        }

        // Public announcements of one kind, in publish order
        auto OfKind(AnnouncementKind const k) const -> std::vector<Announcement>
        {
            std::lock_guard<std::mutex> lock(mtx_);
            std::vector<Announcement> out;
            for (Announcement const& a : seen_)
            {
                if (a.kind == k && !a.direct_to) out.push_back(a);
            }
            return out;
        }

        auto CountOf(AnnouncementKind const k) const -> size_t
        {
            return OfKind(k).size();
        }

        auto Last() const -> std::optional<Announcement>
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (seen_.empty()) return std::nullopt;
            return seen_.back();
        }

        auto Clear() -> void
        {
            std::lock_guard<std::mutex> lock(mtx_);
            seen_.clear();
        }

    private:
        Announcer* inner_{nullptr};
        mutable std::mutex mtx_;
        std::vector<Announcement> seen_;
    };
} // namespace meshquiz::core::debug

#endif //MESHQUIZ_RECORDINGANNOUNCER_HPP
