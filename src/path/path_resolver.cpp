#include "path_resolver.hpp"

namespace Folio {
namespace Path {

const char* to_string(PathType type) {
    switch (type) {
        case PathType::Intra:
            return "intra";
        case PathType::Inter:
            return "inter";
        case PathType::External:
            return "external";
        case PathType::Filesystem:
            return "filesystem";
    }
    return "external";
}

bool is_anchor_only(const std::string& href) {
    return !href.empty() && href[0] == '#';
}

bool has_valid_id(const Graph::PageNode* node) {
    return node != nullptr && !node->id.empty();
}

std::string PathResolver::anchor(const ResolveContext& ctx, const std::string& raw) {
    const Blocks::BlockMap* map = nullptr;
    if (ctx.block_maps && ctx.target) {
        auto it = ctx.block_maps->find(ctx.target->id);
        if (it != ctx.block_maps->end())
            map = &it->second;
    }
    return "#" + Blocks::BlockIdMapper::formatted_id(raw, map);
}

}  // namespace Path
}  // namespace Folio
