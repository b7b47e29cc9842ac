#include "intra_resolver.hpp"
#include <regex>
#include "../blocks/block_id.hpp"

namespace Folio {
namespace Path {

bool IntraResolver::supports(const ResolveContext& ctx) const {
    if (is_anchor_only(ctx.href))
        return true;
    return has_valid_id(ctx.source) && has_valid_id(ctx.target) && ctx.source->id == ctx.target->id;
}

std::string IntraResolver::resolve(const ResolveContext& ctx) const {
    static const std::regex block_fragment("^[a-fA-F0-9-]{32,36}$");

    if (is_anchor_only(ctx.href)) {
        std::string fragment = ctx.href.substr(1);
        std::string raw      = Blocks::to_raw_block_id(fragment);
        if (std::regex_match(fragment, block_fragment) && Blocks::is_raw_block_id(raw)) {
            ResolveContext local = ctx;
            if (!local.target)
                local.target = ctx.source;
            return anchor(local, raw);
        }
        return ctx.href;
    }

    if (ctx.block_id.empty())
        return "";
    return anchor(ctx, ctx.block_id);
}

}  // namespace Path
}  // namespace Folio
