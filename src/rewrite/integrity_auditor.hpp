#pragma once
#include <set>
#include <string>
#include <vector>

#include "../core/logger/logger.hpp"
#include "../graph/page_graph.hpp"
#include "../storage/storage.hpp"

namespace Folio {
namespace Rewrite {

struct AuditReport {
    size_t                   checked        = 0;
    size_t                   not_mirrored   = 0;  // planned but never saved
    size_t                   residual_links = 0;
    std::vector<std::string> missing;             // saved but unreadable, by page id

    bool clean() const {
        return missing.empty() && residual_links == 0;
    }
};

// Checks the mirror after link rewriting: every saved page has its document and no
// link on it still points at a mirrored page through the live site.
class IntegrityAuditor {
public:
    IntegrityAuditor(const Graph::PageGraph& graph, std::set<std::string> saved_ids, Core::LoggerPtr logger);

    AuditReport audit(const Storage::Storage& storage) const;

private:
    bool links_to_mirrored_page(const std::string& href) const;

    const Graph::PageGraph& graph_;
    std::set<std::string>   saved_ids_;
    std::string             root_host_;
    Core::LoggerPtr         logger_;
};

}  // namespace Rewrite
}  // namespace Folio
