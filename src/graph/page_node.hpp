#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace Folio {
namespace Graph {

using NodeHandle = std::size_t;

struct PageNode {
    std::string               id;
    std::string               url;
    std::string               title;
    int                       depth = 0;
    std::optional<NodeHandle> parent;
    std::vector<NodeHandle>   children;

    // Sanitized title chain from the root, fixed once by PageGraph::finalize_segments.
    std::vector<std::string> path_segments;
    bool                     segments_final = false;

    bool is_root() const {
        return !parent.has_value();
    }

    // Page id embedded in the URL, or the URL itself without its fragment.
    static std::string derive_id(const std::string& url);
};

}  // namespace Graph
}  // namespace Folio
