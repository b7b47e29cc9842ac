#pragma once
#include "edge.hpp"
#include "page_node.hpp"

namespace Folio {
namespace Graph {

class PageGraph;

// Classifies links against the discovery tree. Never re-parents anything.
class EdgeClassifier {
public:
    // Target already registered: self-loop and ancestors are BACK, everything else CROSS.
    static EdgeInfo classify(const PageGraph& graph, NodeHandle source, NodeHandle target);

    // The link that introduced target as a new node.
    static EdgeInfo forward(const PageGraph& graph, NodeHandle source, NodeHandle target);

    static bool is_ancestor(const PageGraph& graph, NodeHandle candidate, NodeHandle node);
};

}  // namespace Graph
}  // namespace Folio
