#pragma once
#include "path_resolver.hpp"

namespace Folio {
namespace Path {

// Anything outside the mirror keeps its original URL.
class ExternalResolver : public PathResolver {
public:
    PathType type() const override {
        return PathType::External;
    }
    bool supports(const ResolveContext& ctx) const override {
        return !has_valid_id(ctx.target);
    }
    std::string resolve(const ResolveContext& ctx) const override {
        return ctx.href;
    }
};

}  // namespace Path
}  // namespace Folio
