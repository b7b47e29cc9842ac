#include "integrity_auditor.hpp"
#include "../path/filesystem_resolver.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"
#include "html_links.hpp"

namespace Folio {
namespace Rewrite {

using Utils::Url;

IntegrityAuditor::IntegrityAuditor(const Graph::PageGraph& graph,
                                   std::set<std::string>   saved_ids,
                                   Core::LoggerPtr         logger)
    : graph_(graph), saved_ids_(std::move(saved_ids)), logger_(std::move(logger)) {
    if (auto root = graph_.root())
        root_host_ = Utils::Text::to_lower(Url::parse(graph_.node(*root).url).host);
}

bool IntegrityAuditor::links_to_mirrored_page(const std::string& href) const {
    if (!Url::is_http(href) || Utils::Text::to_lower(Url::parse(href).host) != root_host_)
        return false;

    std::optional<Graph::NodeHandle> handle;
    std::string                      page_id = Url::extract_page_id(href);
    if (!page_id.empty())
        handle = graph_.find(page_id);
    if (!handle)
        handle = graph_.find_by_url(Url::strip_fragment(href));
    return handle && saved_ids_.count(graph_.node(*handle).id) > 0;
}

AuditReport IntegrityAuditor::audit(const Storage::Storage& storage) const {
    AuditReport report;

    for (const auto& node : graph_.nodes()) {
        report.checked++;
        if (!saved_ids_.count(node.id)) {
            report.not_mirrored++;
            continue;
        }

        std::filesystem::path      key  = Path::FilesystemResolver::document_path(node);
        std::optional<std::string> html = storage.load(key);
        if (!html) {
            logger_->warn("Audit: missing document for " + node.url + " (" + key.string() + ")");
            report.missing.push_back(node.id);
            continue;
        }

        size_t residual = 0;
        for (const auto& span : find_hrefs(*html)) {
            std::string href = Utils::Text::trim(span.value);
            if (href.empty() || href[0] == '#')
                continue;
            if (links_to_mirrored_page(Url::resolve(node.url, href)))
                residual++;
        }
        if (residual > 0) {
            logger_->warn("Audit: " + std::to_string(residual) + " live-site links left in " + key.string());
            report.residual_links += residual;
        }
    }
    return report;
}

}  // namespace Rewrite
}  // namespace Folio
