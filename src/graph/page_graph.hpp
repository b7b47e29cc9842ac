#pragma once
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "edge.hpp"
#include "page_node.hpp"

namespace Folio {
namespace Graph {

struct GraphStatistics {
    size_t nodes         = 0;
    size_t leaves        = 0;
    int    max_depth     = 0;
    size_t forward_edges = 0;
    size_t back_edges    = 0;
    size_t cross_edges   = 0;
};

using EdgeKey = std::pair<std::string, std::string>;

// Arena of PageNodes addressed by handle, plus the classified edge list keyed by node id.
// Arena order is discovery order, so iterating nodes() visits the tree breadth-first.
class PageGraph {
public:
    NodeHandle add_root(const std::string& url, const std::string& title = "");
    NodeHandle add_child(NodeHandle parent, const std::string& url, const std::string& title);

    // Returns false when the edge is already recorded; the first classification is kept.
    bool add_edge(NodeHandle source, NodeHandle target, const EdgeInfo& info);

    void annotate_title(NodeHandle handle, const std::string& title);
    void finalize_segments(NodeHandle handle);
    void finalize_all();

    void freeze();
    bool frozen() const {
        return frozen_;
    }

    const PageNode&                node(NodeHandle handle) const;
    const std::vector<PageNode>&   nodes() const {
        return nodes_;
    }
    size_t size() const {
        return nodes_.size();
    }
    bool empty() const {
        return nodes_.empty();
    }

    std::optional<NodeHandle> root() const;
    std::optional<NodeHandle> find(const std::string& id) const;
    std::optional<NodeHandle> find_by_url(const std::string& url) const;

    const std::set<std::string>&          edges_from(const std::string& id) const;
    std::optional<EdgeInfo>               edge(const std::string& source,
                                               const std::string& target) const;
    const std::map<EdgeKey, EdgeInfo>&    edge_metadata() const {
        return edge_metadata_;
    }

    GraphStatistics statistics() const;

    nlohmann::json   to_json() const;
    static PageGraph from_json(const nlohmann::json& json);

    void             save(const std::filesystem::path& file) const;
    static PageGraph load(const std::filesystem::path& file);

private:
    NodeHandle  insert(PageNode node);
    void        require_mutable(const char* operation) const;
    std::string unique_segment(const PageNode& parent, NodeHandle self,
                               const std::string& base) const;

    std::vector<PageNode>                        nodes_;
    std::unordered_map<std::string, NodeHandle>  index_;
    std::unordered_map<std::string, NodeHandle>  url_index_;
    std::map<std::string, std::set<std::string>> edges_;
    std::map<EdgeKey, EdgeInfo>                  edge_metadata_;
    bool                                         frozen_ = false;
};

}  // namespace Graph
}  // namespace Folio
