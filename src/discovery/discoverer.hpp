#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <string>
#include <unordered_set>
#include <vector>

#include "../core/logger/logger.hpp"
#include "../graph/page_graph.hpp"
#include "page_prober.hpp"

class DiscovererTest_LinkScope_Test;

namespace Folio {
namespace Discovery {

struct DiscoveryStats {
    size_t probed          = 0;
    size_t failed          = 0;
    size_t links_seen      = 0;
    size_t skipped_links   = 0;
    int    levels_expanded = 0;
};

struct DiscoveryResult {
    Graph::PageGraph graph;
    DiscoveryStats   stats;
};

// Level-synchronous BFS: every node at depth d is probed before any node at d + 1.
class Discoverer {
#ifndef CPPCHECK
    friend class ::DiscovererTest_LinkScope_Test;
#endif

public:
    Discoverer(PageProber& prober, Core::LoggerPtr logger);

    boost::asio::awaitable<DiscoveryResult> discover(const std::string& root_url, int max_depth);

private:
    void expand(Graph::PageGraph&                graph,
                Graph::NodeHandle                source,
                const ProbeResult&               result,
                std::vector<Graph::NodeHandle>&  next_level,
                DiscoveryStats&                  stats);

    bool in_scope(const std::string& url) const;

    PageProber&                     prober_;
    Core::LoggerPtr                 logger_;
    std::string                     root_url_;
    std::unordered_set<std::string> visited_;
};

}  // namespace Discovery
}  // namespace Folio
