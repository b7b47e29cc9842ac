#include "html_links.hpp"
#include <gumbo.h>
#include <map>

namespace Folio {
namespace Rewrite {

namespace {

void collect_hrefs(const GumboNode* node, const char* base, std::map<size_t, HrefSpan>& spans) {
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE)
        return;

    if (node->v.element.tag == GUMBO_TAG_A) {
        const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, "href");
        // Reconstructed formatting elements share the source text of the original tag.
        if (attr && attr->original_value.data && attr->original_value.length > 0) {
            size_t offset = static_cast<size_t>(attr->original_value.data - base);
            spans.emplace(offset, HrefSpan{offset, attr->original_value.length, attr->value});
        }
    }

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect_hrefs(static_cast<const GumboNode*>(children->data[i]), base, spans);
    }
}

}  // namespace

std::vector<HrefSpan> find_hrefs(const std::string& html) {
    std::vector<HrefSpan> result;
    if (html.empty())
        return result;

    std::map<size_t, HrefSpan> spans;
    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
    collect_hrefs(output->root, html.data(), spans);
    gumbo_destroy_output(&kGumboDefaultOptions, output);

    result.reserve(spans.size());
    for (auto& [offset, span] : spans)
        result.push_back(std::move(span));
    return result;
}

}  // namespace Rewrite
}  // namespace Folio
