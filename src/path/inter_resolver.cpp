#include "inter_resolver.hpp"
#include "../core/types/constants.hpp"

namespace Folio {
namespace Path {

bool InterResolver::supports(const ResolveContext& ctx) const {
    return has_valid_id(ctx.source) && has_valid_id(ctx.target) && ctx.source->id != ctx.target->id;
}

std::string InterResolver::relative_path(const std::vector<std::string>& from,
                                         const std::vector<std::string>& to) {
    size_t common = 0;
    while (common < from.size() && common < to.size() && from[common] == to[common])
        ++common;

    std::string path;
    for (size_t i = common; i < from.size(); ++i)
        path += "../";
    for (size_t i = common; i < to.size(); ++i)
        path += to[i] + "/";
    return path + Core::Constants::INDEX_FILENAME;
}

std::string InterResolver::resolve(const ResolveContext& ctx) const {
    std::string path = relative_path(ctx.source->path_segments, ctx.target->path_segments);
    if (!ctx.block_id.empty())
        path += anchor(ctx, ctx.block_id);
    return path;
}

}  // namespace Path
}  // namespace Folio
