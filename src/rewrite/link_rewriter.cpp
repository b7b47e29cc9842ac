#include "link_rewriter.hpp"
#include "../blocks/block_id.hpp"
#include "../path/filesystem_resolver.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"
#include "html_links.hpp"

namespace Folio {
namespace Rewrite {

using Utils::Url;

RewriteStats& RewriteStats::operator+=(const RewriteStats& other) {
    documents += other.documents;
    missing += other.missing;
    links += other.links;
    rewritten += other.rewritten;
    anchors += other.anchors;
    external += other.external;
    unchanged += other.unchanged;
    return *this;
}

LinkRewriter::LinkRewriter(const Graph::PageGraph&      graph,
                           const Path::ResolverFactory& factory,
                           const Blocks::BlockMapCache& block_maps,
                           std::set<std::string>        saved_ids,
                           Core::LoggerPtr              logger)
    : graph_(graph),
      factory_(factory),
      block_maps_(block_maps),
      saved_ids_(std::move(saved_ids)),
      logger_(std::move(logger)) {
}

const Graph::PageNode* LinkRewriter::internal_target(const std::string& absolute_url) const {
    std::optional<Graph::NodeHandle> handle;
    std::string                      page_id = Url::extract_page_id(absolute_url);
    if (!page_id.empty())
        handle = graph_.find(page_id);
    if (!handle)
        handle = graph_.find_by_url(Url::strip_fragment(absolute_url));
    if (!handle)
        return nullptr;

    const Graph::PageNode& node = graph_.node(*handle);
    if (!saved_ids_.count(node.id))
        return nullptr;
    return &node;
}

Path::ResolveContext LinkRewriter::context_for(const Graph::PageNode& source, const std::string& href) const {
    Path::ResolveContext ctx;
    ctx.source     = &source;
    ctx.block_maps = &block_maps_;

    if (Path::is_anchor_only(href)) {
        ctx.href   = href;
        ctx.target = &source;
        return ctx;
    }

    std::string absolute = Url::resolve(source.url, href);
    if (!Url::is_http(absolute)) {
        ctx.href = href;
        return ctx;
    }

    ctx.href   = absolute;
    ctx.target = internal_target(absolute);
    if (ctx.target) {
        std::string raw = Blocks::to_raw_block_id(Url::fragment(absolute));
        if (Blocks::is_raw_block_id(raw))
            ctx.block_id = raw;
    }
    return ctx;
}

std::string LinkRewriter::rewrite(const Graph::PageNode& source, const std::string& html, RewriteStats& stats) const {
    if (html.empty())
        return html;

    std::vector<HrefSpan> spans  = find_hrefs(html);
    std::string           result = html;
    // Back to front, so earlier offsets stay valid.
    for (auto it = spans.rbegin(); it != spans.rend(); ++it) {
        const HrefSpan& span = *it;
        std::string     href = Utils::Text::trim(span.value);
        stats.links++;

        if (href.empty()) {
            stats.unchanged++;
            continue;
        }

        Path::ResolveContext          ctx         = context_for(source, href);
        std::optional<Path::PathType> type        = factory_.select(ctx);
        std::string                   replacement = factory_.resolve(ctx);

        if (type == Path::PathType::External)
            stats.external++;
        else if (type == Path::PathType::Intra)
            stats.anchors++;

        if (replacement == span.value) {
            stats.unchanged++;
            continue;
        }

        result.replace(span.offset, span.length, "\"" + Utils::Text::html_escape_attribute(replacement) + "\"");
        stats.rewritten++;
    }
    return result;
}

RewriteStats LinkRewriter::rewrite_all(Storage::Storage& storage) const {
    RewriteStats total;

    for (const auto& node : graph_.nodes()) {
        if (!saved_ids_.count(node.id))
            continue;

        std::filesystem::path      key  = Path::FilesystemResolver::document_path(node);
        std::optional<std::string> html = storage.load(key);
        if (!html) {
            logger_->warn("Rewrite: saved document missing: " + key.string());
            total.missing++;
            continue;
        }

        RewriteStats stats;
        std::string  rewritten = rewrite(node, *html, stats);
        stats.documents++;
        if (stats.rewritten > 0 && !storage.save(key, rewritten)) {
            logger_->error("Rewrite: cannot update " + key.string());
            stats.rewritten = 0;
        }

        logger_->debug("Rewrite: " + key.string() + ": " + std::to_string(stats.rewritten) + "/"
                       + std::to_string(stats.links) + " links");
        total += stats;
    }
    return total;
}

}  // namespace Rewrite
}  // namespace Folio
