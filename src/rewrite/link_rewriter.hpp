#pragma once
#include <set>
#include <string>

#include "../blocks/block_id_mapper.hpp"
#include "../core/logger/logger.hpp"
#include "../graph/page_graph.hpp"
#include "../path/resolver_factory.hpp"
#include "../storage/storage.hpp"

namespace Folio {
namespace Rewrite {

struct RewriteStats {
    size_t documents = 0;
    size_t missing   = 0;
    size_t links     = 0;
    size_t rewritten = 0;
    size_t anchors   = 0;
    size_t external  = 0;
    size_t unchanged = 0;

    RewriteStats& operator+=(const RewriteStats& other);
};

// Points <a href> values of saved documents at their local copies.
class LinkRewriter {
public:
    LinkRewriter(const Graph::PageGraph&      graph,
                 const Path::ResolverFactory& factory,
                 const Blocks::BlockMapCache& block_maps,
                 std::set<std::string>        saved_ids,
                 Core::LoggerPtr              logger);

    // Only the attribute values change; every other byte of html is kept.
    std::string rewrite(const Graph::PageNode& source, const std::string& html, RewriteStats& stats) const;

    // Rewrites every saved document in place.
    RewriteStats rewrite_all(Storage::Storage& storage) const;

    // Context for one href found on source; target is null for anything outside the mirror.
    Path::ResolveContext context_for(const Graph::PageNode& source, const std::string& href) const;

private:
    const Graph::PageNode* internal_target(const std::string& absolute_url) const;

    const Graph::PageGraph&      graph_;
    const Path::ResolverFactory& factory_;
    const Blocks::BlockMapCache& block_maps_;
    std::set<std::string>        saved_ids_;
    Core::LoggerPtr              logger_;
};

}  // namespace Rewrite
}  // namespace Folio
