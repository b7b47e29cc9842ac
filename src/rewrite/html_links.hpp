#pragma once
#include <string>
#include <vector>

namespace Folio {
namespace Rewrite {

// An <a href> value as it appears in the source document.
struct HrefSpan {
    size_t      offset = 0;  // of the original value text, quotes included
    size_t      length = 0;
    std::string value;       // entity-decoded
};

// Ordered by offset; each source attribute is reported once.
std::vector<HrefSpan> find_hrefs(const std::string& html);

}  // namespace Rewrite
}  // namespace Folio
