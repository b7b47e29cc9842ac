#pragma once
#include "path_resolver.hpp"

namespace Folio {
namespace Path {

// Links that stay on the current page.
class IntraResolver : public PathResolver {
public:
    PathType type() const override {
        return PathType::Intra;
    }
    bool        supports(const ResolveContext& ctx) const override;
    std::string resolve(const ResolveContext& ctx) const override;
};

}  // namespace Path
}  // namespace Folio
