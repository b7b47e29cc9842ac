#include "page_graph.hpp"
#include <fstream>
#include <stdexcept>
#include "../core/types/constants.hpp"
#include "../core/types/errors.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"

namespace Folio {
namespace Graph {

using Folio::Core::Constants;
using Folio::Core::ContractViolation;
using Folio::Utils::Url;
using Folio::Utils::Text::sanitize_segment;
using Folio::Utils::Text::to_lower;

void PageGraph::require_mutable(const char* operation) const {
    if (frozen_)
        throw ContractViolation(std::string(operation) + " after discovery has finished");
}

NodeHandle PageGraph::insert(PageNode node) {
    if (index_.count(node.id))
        throw ContractViolation("page already registered: " + node.id);

    NodeHandle handle = nodes_.size();
    index_.emplace(node.id, handle);
    url_index_.emplace(Url::strip_fragment(node.url), handle);
    nodes_.push_back(std::move(node));
    return handle;
}

NodeHandle PageGraph::add_root(const std::string& url, const std::string& title) {
    require_mutable("add_root");
    if (!nodes_.empty())
        throw ContractViolation("graph already has a root");

    PageNode root;
    root.id    = PageNode::derive_id(url);
    root.url   = Url::strip_fragment(url);
    root.title = title;
    root.depth = 0;
    return insert(std::move(root));
}

NodeHandle PageGraph::add_child(NodeHandle parent, const std::string& url, const std::string& title) {
    require_mutable("add_child");
    const PageNode& owner = node(parent);

    PageNode child;
    child.id     = PageNode::derive_id(url);
    child.url    = Url::strip_fragment(url);
    child.title  = title;
    child.depth  = owner.depth + 1;
    child.parent = parent;

    NodeHandle handle = insert(std::move(child));
    nodes_[parent].children.push_back(handle);
    return handle;
}

bool PageGraph::add_edge(NodeHandle source, NodeHandle target, const EdgeInfo& info) {
    require_mutable("add_edge");
    const std::string& src = node(source).id;
    const std::string& dst = node(target).id;

    EdgeKey key{src, dst};
    if (edge_metadata_.count(key))
        return false;
    edges_[src].insert(dst);
    edge_metadata_.emplace(std::move(key), info);
    return true;
}

void PageGraph::annotate_title(NodeHandle handle, const std::string& title) {
    node(handle);
    if (!title.empty())
        nodes_[handle].title = title;
}

std::string PageGraph::unique_segment(const PageNode&    parent,
                                      NodeHandle         self,
                                      const std::string& base) const {
    std::set<std::string> taken{to_lower(Constants::INDEX_FILENAME)};
    for (NodeHandle sibling : parent.children) {
        const PageNode& other = nodes_[sibling];
        if (sibling != self && other.segments_final && !other.path_segments.empty())
            taken.insert(to_lower(other.path_segments.back()));
    }

    std::string candidate = base;
    for (int suffix = 2; taken.count(to_lower(candidate)); ++suffix)
        candidate = base + "_" + std::to_string(suffix);
    return candidate;
}

void PageGraph::finalize_segments(NodeHandle handle) {
    const PageNode& current = node(handle);
    if (current.segments_final)
        return;

    std::vector<std::string> segments;
    if (current.parent) {
        const PageNode& parent = nodes_[*current.parent];
        if (!parent.segments_final)
            throw ContractViolation("parent path not fixed before child: " + current.id);
        segments = parent.path_segments;
        segments.push_back(unique_segment(parent, handle, sanitize_segment(current.title)));
    }

    nodes_[handle].path_segments  = std::move(segments);
    nodes_[handle].segments_final = true;
}

void PageGraph::finalize_all() {
    for (NodeHandle handle = 0; handle < nodes_.size(); ++handle)
        finalize_segments(handle);
}

void PageGraph::freeze() {
    finalize_all();
    frozen_ = true;
}

const PageNode& PageGraph::node(NodeHandle handle) const {
    if (handle >= nodes_.size())
        throw std::out_of_range("invalid node handle " + std::to_string(handle));
    return nodes_[handle];
}

std::optional<NodeHandle> PageGraph::root() const {
    if (nodes_.empty())
        return std::nullopt;
    return NodeHandle{0};
}

std::optional<NodeHandle> PageGraph::find(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end())
        return std::nullopt;
    return it->second;
}

std::optional<NodeHandle> PageGraph::find_by_url(const std::string& url) const {
    auto it = url_index_.find(Url::strip_fragment(url));
    if (it == url_index_.end())
        return std::nullopt;
    return it->second;
}

const std::set<std::string>& PageGraph::edges_from(const std::string& id) const {
    static const std::set<std::string> none;
    auto                               it = edges_.find(id);
    return it == edges_.end() ? none : it->second;
}

std::optional<EdgeInfo> PageGraph::edge(const std::string& source, const std::string& target) const {
    auto it = edge_metadata_.find({source, target});
    if (it == edge_metadata_.end())
        return std::nullopt;
    return it->second;
}

GraphStatistics PageGraph::statistics() const {
    GraphStatistics stats;
    stats.nodes = nodes_.size();
    for (const auto& n : nodes_) {
        stats.max_depth = std::max(stats.max_depth, n.depth);
        if (n.children.empty())
            stats.leaves++;
    }
    for (const auto& [key, info] : edge_metadata_) {
        switch (info.type) {
            case EdgeType::Forward:
                stats.forward_edges++;
                break;
            case EdgeType::Back:
                stats.back_edges++;
                break;
            case EdgeType::Cross:
                stats.cross_edges++;
                break;
        }
    }
    return stats;
}

nlohmann::json PageGraph::to_json() const {
    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& n : nodes_) {
        nlohmann::json children = nlohmann::json::array();
        for (NodeHandle child : n.children)
            children.push_back(nodes_[child].id);

        nodes.push_back({{"id", n.id},
                         {"url", n.url},
                         {"title", n.title},
                         {"depth", n.depth},
                         {"parent", n.parent ? nlohmann::json(nodes_[*n.parent].id) : nullptr},
                         {"children", children},
                         {"pathSegments", n.path_segments}});
    }

    nlohmann::json edges = nlohmann::json::object();
    for (const auto& [src, targets] : edges_)
        edges[src] = targets;

    nlohmann::json metadata = nlohmann::json::array();
    for (const auto& [key, info] : edge_metadata_) {
        metadata.push_back({{"source", key.first},
                            {"target", key.second},
                            {"type", to_string(info.type)},
                            {"depthDelta", info.depth_delta},
                            {"isAncestor", info.is_ancestor}});
    }

    return {{"version", 1}, {"nodes", nodes}, {"edges", edges}, {"edgeMetadata", metadata}};
}

PageGraph PageGraph::from_json(const nlohmann::json& json) {
    PageGraph graph;
    try {
        for (const auto& item : json.at("nodes")) {
            PageNode n;
            n.id    = item.at("id").get<std::string>();
            n.url   = item.at("url").get<std::string>();
            n.title = item.value("title", "");
            n.depth = item.at("depth").get<int>();
            n.path_segments  = item.at("pathSegments").get<std::vector<std::string>>();
            n.segments_final = true;

            const auto& parent = item.at("parent");
            if (parent.is_null()) {
                if (!graph.nodes_.empty())
                    throw std::runtime_error("second root " + n.id);
                if (n.depth != 0 || !n.path_segments.empty())
                    throw std::runtime_error("root must have depth 0 and no segments");
            }
            else {
                auto owner = graph.find(parent.get<std::string>());
                if (!owner)
                    throw std::runtime_error("parent listed after child " + n.id);
                if (n.depth != graph.nodes_[*owner].depth + 1)
                    throw std::runtime_error("depth mismatch for " + n.id);
                n.parent = *owner;
            }

            NodeHandle handle = graph.insert(std::move(n));
            if (graph.nodes_[handle].parent)
                graph.nodes_[*graph.nodes_[handle].parent].children.push_back(handle);
        }

        for (const auto& item : json.at("edgeMetadata")) {
            auto type = edge_type_from_string(item.at("type").get<std::string>());
            if (!type)
                throw std::runtime_error("unknown edge type");
            auto source = graph.find(item.at("source").get<std::string>());
            auto target = graph.find(item.at("target").get<std::string>());
            if (!source || !target)
                throw std::runtime_error("edge references unknown node");
            graph.add_edge(*source,
                           *target,
                           EdgeInfo{*type,
                                    item.value("depthDelta", 0),
                                    item.value("isAncestor", false)});
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("malformed page graph: " + std::string(e.what()));
    } catch (const ContractViolation& e) {
        throw std::runtime_error("malformed page graph: " + std::string(e.what()));
    }

    graph.frozen_ = true;
    return graph;
}

void PageGraph::save(const std::filesystem::path& file) const {
    if (file.has_parent_path())
        std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file);
    if (!out)
        throw std::runtime_error("cannot write " + file.string());
    out << to_json().dump(2);
}

PageGraph PageGraph::load(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in)
        throw std::runtime_error("cannot read " + file.string());
    try {
        return from_json(nlohmann::json::parse(in));
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("malformed page graph: " + std::string(e.what()));
    }
}

}  // namespace Graph
}  // namespace Folio
