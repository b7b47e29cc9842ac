#pragma once
#include <filesystem>

#include "path_resolver.hpp"

namespace Folio {
namespace Path {

// Output location of a single page, relative to the output root. Only used explicitly.
class FilesystemResolver : public PathResolver {
public:
    PathType type() const override {
        return PathType::Filesystem;
    }
    bool supports(const ResolveContext& ctx) const override {
        return ctx.source != nullptr && ctx.source->segments_final;
    }
    std::string resolve(const ResolveContext& ctx) const override;

    static std::filesystem::path document_path(const Graph::PageNode& node);
};

}  // namespace Path
}  // namespace Folio
