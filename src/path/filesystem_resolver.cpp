#include "filesystem_resolver.hpp"
#include "../core/types/constants.hpp"
#include "../core/types/errors.hpp"

namespace Folio {
namespace Path {

std::filesystem::path FilesystemResolver::document_path(const Graph::PageNode& node) {
    std::filesystem::path path;
    for (const auto& segment : node.path_segments)
        path /= segment;
    return path / Core::Constants::INDEX_FILENAME;
}

std::string FilesystemResolver::resolve(const ResolveContext& ctx) const {
    if (!supports(ctx))
        throw Core::ContractViolation("output path requested for a page without fixed segments");
    return document_path(*ctx.source).generic_string();
}

}  // namespace Path
}  // namespace Folio
