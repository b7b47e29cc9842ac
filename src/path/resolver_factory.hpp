#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../core/logger/logger.hpp"
#include "filesystem_resolver.hpp"
#include "path_resolver.hpp"

namespace Folio {
namespace Path {

// Tries Intra, Inter, External in order; Filesystem is reachable only through output_path().
class ResolverFactory {
public:
    explicit ResolverFactory(Core::LoggerPtr logger);

    std::optional<PathType> select(const ResolveContext& ctx) const;

    // Unclaimed contexts pass the href through with a warning.
    std::string resolve(const ResolveContext& ctx) const;

    std::string output_path(const Graph::PageNode& node) const;

    void register_resolver(std::unique_ptr<PathResolver> resolver);

private:
    const PathResolver* find(const ResolveContext& ctx) const;

    Core::LoggerPtr                            logger_;
    std::vector<std::unique_ptr<PathResolver>> resolvers_;
    FilesystemResolver                         filesystem_;
};

}  // namespace Path
}  // namespace Folio
