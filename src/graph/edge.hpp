#pragma once
#include <optional>
#include <string>

namespace Folio {
namespace Graph {

enum class EdgeType { Forward, Back, Cross };

struct EdgeInfo {
    EdgeType type        = EdgeType::Forward;
    int      depth_delta = 0;
    bool     is_ancestor = false;

    bool operator==(const EdgeInfo& other) const = default;
};

const char*             to_string(EdgeType type);
std::optional<EdgeType> edge_type_from_string(const std::string& name);

}  // namespace Graph
}  // namespace Folio
