#include "tree_printer.hpp"

namespace Folio {
namespace Graph {

namespace {

std::string label(const PageNode& node) {
    if (!node.title.empty())
        return node.title;
    return node.is_root() ? "(root)" : node.url;
}

void render_children(const PageGraph&          graph,
                     const PageNode&           node,
                     const std::string&        indent,
                     std::vector<std::string>& lines) {
    for (size_t i = 0; i < node.children.size(); ++i) {
        const PageNode& child = graph.node(node.children[i]);
        bool            last  = i + 1 == node.children.size();
        lines.push_back(indent + (last ? "└─ " : "├─ ") + label(child));
        render_children(graph, child, indent + (last ? "   " : "│  "), lines);
    }
}

}  // namespace

std::vector<std::string> TreePrinter::render(const PageGraph& graph) {
    std::vector<std::string> lines;
    auto                     root = graph.root();
    if (!root)
        return lines;

    const PageNode& node = graph.node(*root);
    lines.push_back("└─ " + label(node));
    render_children(graph, node, "   ", lines);
    return lines;
}

void TreePrinter::print(const PageGraph& graph, Core::Logger& logger) {
    logger.plain(".");
    for (const auto& line : render(graph))
        logger.plain(line);
}

}  // namespace Graph
}  // namespace Folio
