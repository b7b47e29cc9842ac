#include "page_node.hpp"
#include "../utils/url/url.hpp"

namespace Folio {
namespace Graph {

using Folio::Utils::Url;

std::string PageNode::derive_id(const std::string& url) {
    std::string id = Url::extract_page_id(url);
    if (!id.empty())
        return id;
    return Url::strip_fragment(url);
}

}  // namespace Graph
}  // namespace Folio
