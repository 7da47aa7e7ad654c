#include "AdminGate.hpp"

#include "Util.hpp"

namespace meshquiz::core
{
    auto NormalizeNodeId(std::string_view id) -> NodeId
    {
        id = util::Trim(id);
        if (!id.empty() && id.front() == '!') id.remove_prefix(1);
        return util::ToLower(id);
    }

    auto ParseIdList(std::string_view csv) -> std::vector<NodeId>
    {
        std::vector<NodeId> out;
        while (!csv.empty())
        {
            size_t const comma = csv.find(',');
            std::string_view const item = csv.substr(0, comma);
            if (NodeId id = NormalizeNodeId(item); !id.empty())
            {
                out.push_back(std::move(id));
            }
            if (comma == std::string_view::npos) break;
            csv.remove_prefix(comma + 1);
        }
        return out;
    }

    AdminGate::AdminGate(std::vector<NodeId> const& admin_ids)
    {
        for (NodeId const& id : admin_ids)
        {
            if (NodeId n = NormalizeNodeId(id); !n.empty())
            {
                admins_.insert(std::move(n));
            }
        }
    }

    auto AdminGate::IsAdmin(std::string_view node_id) const -> bool
    {
        return admins_.contains(NormalizeNodeId(node_id));
    }
}
