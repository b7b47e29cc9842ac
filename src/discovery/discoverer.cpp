#include "discoverer.hpp"
#include "../graph/edge_classifier.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"

namespace Folio {
namespace Discovery {

using Folio::Graph::EdgeClassifier;
using Folio::Graph::NodeHandle;
using Folio::Graph::PageGraph;
using Folio::Graph::PageNode;
using Folio::Utils::Url;

Discoverer::Discoverer(PageProber& prober, Core::LoggerPtr logger)
    : prober_(prober), logger_(std::move(logger)) {
}

bool Discoverer::in_scope(const std::string& url) const {
    return Url::is_http(url) && Url::is_same_domain(url, root_url_);
}

boost::asio::awaitable<DiscoveryResult> Discoverer::discover(const std::string& root_url,
                                                             int                max_depth) {
    root_url_ = Url::strip_fragment(root_url);
    visited_.clear();

    DiscoveryResult result;
    PageGraph&      graph = result.graph;

    std::vector<NodeHandle> level{graph.add_root(root_url_)};
    for (int depth = 0; !level.empty() && depth < max_depth; ++depth) {
        logger_->info("Discovery: level " + std::to_string(depth) + " ("
                      + std::to_string(level.size()) + " pages)");

        std::vector<NodeHandle> next_level;
        for (NodeHandle handle : level) {
            std::string url = graph.node(handle).url;
            visited_.insert(url);

            ProbeResult probe;
            try {
                probe = co_await prober_.probe(url);
            } catch (const std::exception& e) {
                result.stats.failed++;
                logger_->warn("Discovery: probe failed for " + url + ": " + e.what());
                graph.finalize_segments(handle);
                continue;
            }

            result.stats.probed++;
            graph.annotate_title(handle, Utils::Text::trim(probe.title));
            graph.finalize_segments(handle);
            logger_->debug("Discovery: " + graph.node(handle).title + " -> "
                           + std::to_string(probe.links.size()) + " links");

            expand(graph, handle, probe, next_level, result.stats);
        }

        result.stats.levels_expanded++;
        level = std::move(next_level);
    }

    if (!level.empty()) {
        logger_->info("Discovery: depth limit " + std::to_string(max_depth) + " reached, "
                      + std::to_string(level.size()) + " pages left unexpanded");
    }

    graph.freeze();
    logger_->success("Discovery: " + std::to_string(graph.size()) + " pages found");
    co_return result;
}

void Discoverer::expand(PageGraph&               graph,
                        NodeHandle               source,
                        const ProbeResult&       result,
                        std::vector<NodeHandle>& next_level,
                        DiscoveryStats&          stats) {
    const std::string base = graph.node(source).url;

    for (const auto& link : result.links) {
        stats.links_seen++;
        std::string target_url = Url::strip_fragment(Url::resolve(base, link.url));
        if (target_url.empty() || !in_scope(target_url)) {
            stats.skipped_links++;
            continue;
        }

        // Registered pages only gain an edge, checked before the visited set so
        // breadcrumbs and sibling navigation never spawn new children.
        if (auto target = graph.find(PageNode::derive_id(target_url))) {
            graph.add_edge(source, *target, EdgeClassifier::classify(graph, source, *target));
            continue;
        }
        if (visited_.count(target_url)) {
            stats.skipped_links++;
            continue;
        }

        NodeHandle child = graph.add_child(source, target_url, Utils::Text::trim(link.text));
        graph.add_edge(source, child, EdgeClassifier::forward(graph, source, child));
        visited_.insert(target_url);
        next_level.push_back(child);
    }
}

}  // namespace Discovery
}  // namespace Folio
