#ifndef MESHQUIZ_ADMINGATE_HPP
#define MESHQUIZ_ADMINGATE_HPP

#include <string_view>
#include <unordered_set>
#include <vector>

#include "Types.hpp"

namespace meshquiz::core
{
    // "!A1B2c3d4 " and "a1b2c3d4" name the same node
    auto NormalizeNodeId(std::string_view id) -> NodeId;

    // Comma separated list as found in HJ_ADMIN_NODE_IDS; empty items are dropped
    auto ParseIdList(std::string_view csv) -> std::vector<NodeId>;

    class AdminGate
    {
    public:
        explicit AdminGate(std::vector<NodeId> const& admin_ids);

        [[nodiscard]]
        auto IsAdmin(std::string_view node_id) const -> bool;

        auto Count() const noexcept -> size_t { return admins_.size(); }

    private:
        std::unordered_set<NodeId> admins_;
    };
}

#endif //MESHQUIZ_ADMINGATE_HPP
