#include "Ledger.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <print>
#include <ranges>

#include "Exception.hpp"
#include "Util.hpp"

namespace meshquiz::core
{
    auto MemoryLedger::ApplyDelta(NodeId const& player, Points const delta) -> Points
    {
        auto const [it, inserted] = index_.try_emplace(player, rows_.size());
        if (inserted)
        {
            rows_.push_back(Standing{.player = player, .total = 0});
        }
        Standing& row = rows_[it->second];
        row.total += delta;
        return row.total;
    }

    auto MemoryLedger::TopN(size_t const n) const -> std::vector<Standing>
    {
        std::vector<Standing> sorted = rows_;
        // stable: ties keep first-seen order
        std::ranges::stable_sort(sorted, std::ranges::greater{}, &Standing::total);
        if (sorted.size() > n) sorted.resize(n);
        return sorted;
    }

    auto MemoryLedger::TotalFor(NodeId const& player) const -> Points
    {
        auto const it = index_.find(player);
        return (it != index_.end()) ? rows_[it->second].total : 0;
    }

    auto MemoryLedger::Reset() -> void
    {
        rows_.clear();
        index_.clear();
    }

    JournalLedger::JournalLedger(std::string path) :
        path_(std::move(path))
    {
        Replay();
        out_.open(path_, std::ios::out | std::ios::app);
        if (!out_)
        {
            MQZ_THROW(error::Code::Persistence, std::format("cannot open ledger journal '{}'", path_));
        }
    }

    auto JournalLedger::Replay() -> void
    {
        std::ifstream in(path_);
        if (!in) return; // first run

        std::string line;
        size_t line_no = 0;
        while (std::getline(in, line))
        {
            ++line_no;
            std::string_view const body = util::Trim(line);
            if (body.empty()) continue;

            if (body == "reset")
            {
                MemoryLedger::Reset();
                ++replayed_;
                continue;
            }

            auto const [player, delta_txt] = util::SplitFirstWord(body);
            Points delta{};
            auto const res = std::from_chars(delta_txt.data(), delta_txt.data() + delta_txt.size(), delta);
            if (player.empty() || res.ec != std::errc{} || res.ptr != delta_txt.data() + delta_txt.size())
            {
                std::print("[Ledger] {}:{} skipping malformed journal line\n", path_, line_no);
                continue;
            }
            MemoryLedger::ApplyDelta(NodeId{player}, delta);
            ++replayed_;
        }
    }

    auto JournalLedger::Append(std::string const& line) -> void
    {
        out_ << line << '\n';
        out_.flush();
        if (!out_)
        {
            out_.clear();
            MQZ_THROW(error::Code::Persistence, std::format("write to ledger journal '{}' failed", path_));
        }
    }

    auto JournalLedger::ApplyDelta(NodeId const& player, Points const delta) -> Points
    {
        // journal first: a failed write must leave the in-memory total untouched
        Append(std::format("{} {}", player, delta));
        return MemoryLedger::ApplyDelta(player, delta);
    }

    auto JournalLedger::Reset() -> void
    {
        Append("reset");
        MemoryLedger::Reset();
    }
}
