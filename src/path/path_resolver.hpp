#pragma once
#include <string>

#include "../blocks/block_id_mapper.hpp"
#include "../graph/page_node.hpp"

namespace Folio {
namespace Path {

enum class PathType { Intra, Inter, External, Filesystem };

const char* to_string(PathType type);

struct ResolveContext {
    const Graph::PageNode*       source = nullptr;
    const Graph::PageNode*       target = nullptr;
    std::string                  href;
    std::string                  block_id;  // raw form
    const Blocks::BlockMapCache* block_maps = nullptr;
};

class PathResolver {
public:
    virtual ~PathResolver() = default;

    virtual PathType    type() const                              = 0;
    virtual bool        supports(const ResolveContext& ctx) const = 0;
    virtual std::string resolve(const ResolveContext& ctx) const  = 0;

protected:
    // Anchor for a block on the target page, preferring the id rendered on that page.
    static std::string anchor(const ResolveContext& ctx, const std::string& raw);
};

bool is_anchor_only(const std::string& href);
bool has_valid_id(const Graph::PageNode* node);

}  // namespace Path
}  // namespace Folio
