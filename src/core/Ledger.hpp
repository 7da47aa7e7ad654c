#ifndef MESHQUIZ_LEDGER_HPP
#define MESHQUIZ_LEDGER_HPP

#include <cstddef>
#include <fstream>
#include <string>
#include <unordered_map>
#include <vector>

#include "Types.hpp"

namespace meshquiz::core
{
    // Cumulative per-player totals. Always driven from inside the session's critical
    // section, so implementations do not lock. Idempotency of a settlement is tracked
    // by the caller (per round), not here.
    class Ledger
    {
    public:
        virtual ~Ledger() = default;

        // Returns the player's new total. Throws error::PersistenceError on storage failure.
        virtual auto ApplyDelta(NodeId const& player, Points delta) -> Points = 0;

        // Descending by total; equal totals keep the order players first appeared in.
        virtual auto TopN(size_t n) const -> std::vector<Standing> = 0;

        virtual auto TotalFor(NodeId const& player) const -> Points = 0;

        virtual auto Reset() -> void = 0;
    };

    class MemoryLedger : public Ledger
    {
    public:
        MemoryLedger() = default;

        auto ApplyDelta(NodeId const& player, Points delta) -> Points override;
        auto TopN(size_t n) const -> std::vector<Standing> override;
        auto TotalFor(NodeId const& player) const -> Points override;
        auto Reset() -> void override;

        auto PlayerCount() const noexcept -> size_t { return rows_.size(); }

    private:
        std::vector<Standing> rows_; // first-seen order
        std::unordered_map<NodeId, size_t> index_;
    };

    // MemoryLedger backed by an append-only text journal ("<player> <delta>" per line,
    // "reset" to clear). The journal is replayed on construction.
    class JournalLedger final : public MemoryLedger
    {
    public:
        explicit JournalLedger(std::string path);

        JournalLedger(JournalLedger const&) = delete;
        auto operator=(JournalLedger const&) -> JournalLedger& = delete;

        auto ApplyDelta(NodeId const& player, Points delta) -> Points override;
        auto Reset() -> void override;

        auto ReplayedLines() const noexcept -> size_t { return replayed_; }

    private:
        auto Replay() -> void;
        auto Append(std::string const& line) -> void;

    private:
        std::string path_;
        std::ofstream out_;
        size_t replayed_{0};
    };
}

#endif //MESHQUIZ_LEDGER_HPP
