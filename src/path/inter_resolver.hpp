#pragma once
#include <string>
#include <vector>

#include "path_resolver.hpp"

namespace Folio {
namespace Path {

// Relative path between two different pages of the mirror.
class InterResolver : public PathResolver {
public:
    PathType type() const override {
        return PathType::Inter;
    }
    bool        supports(const ResolveContext& ctx) const override;
    std::string resolve(const ResolveContext& ctx) const override;

    static std::string relative_path(const std::vector<std::string>& from,
                                     const std::vector<std::string>& to);
};

}  // namespace Path
}  // namespace Folio
