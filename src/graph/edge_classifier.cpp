#include "edge_classifier.hpp"
#include <cstdlib>
#include "page_graph.hpp"

namespace Folio {
namespace Graph {

bool EdgeClassifier::is_ancestor(const PageGraph& graph, NodeHandle candidate, NodeHandle node) {
    std::optional<NodeHandle> current = graph.node(node).parent;
    while (current) {
        if (*current == candidate)
            return true;
        current = graph.node(*current).parent;
    }
    return false;
}

EdgeInfo EdgeClassifier::classify(const PageGraph& graph, NodeHandle source, NodeHandle target) {
    const PageNode& src   = graph.node(source);
    const PageNode& dst   = graph.node(target);
    int             delta = std::abs(src.depth - dst.depth);

    if (source == target)
        return EdgeInfo{EdgeType::Back, 0, false};
    if (is_ancestor(graph, target, source))
        return EdgeInfo{EdgeType::Back, delta, true};
    return EdgeInfo{EdgeType::Cross, delta, false};
}

EdgeInfo EdgeClassifier::forward(const PageGraph& graph, NodeHandle source, NodeHandle target) {
    return EdgeInfo{
        EdgeType::Forward, std::abs(graph.node(target).depth - graph.node(source).depth), false};
}

}  // namespace Graph
}  // namespace Folio
