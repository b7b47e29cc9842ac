#pragma once
#include <string>
#include <vector>

#include "../core/logger/logger.hpp"
#include "page_graph.hpp"

namespace Folio {
namespace Graph {

class TreePrinter {
public:
    static std::vector<std::string> render(const PageGraph& graph);
    static void print(const PageGraph& graph, Core::Logger& logger);
};

}  // namespace Graph
}  // namespace Folio
