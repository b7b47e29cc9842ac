#include "resolver_factory.hpp"
#include "external_resolver.hpp"
#include "inter_resolver.hpp"
#include "intra_resolver.hpp"

namespace Folio {
namespace Path {

ResolverFactory::ResolverFactory(Core::LoggerPtr logger) : logger_(std::move(logger)) {
    resolvers_.push_back(std::make_unique<IntraResolver>());
    resolvers_.push_back(std::make_unique<InterResolver>());
    resolvers_.push_back(std::make_unique<ExternalResolver>());
}

void ResolverFactory::register_resolver(std::unique_ptr<PathResolver> resolver) {
    resolvers_.push_back(std::move(resolver));
}

const PathResolver* ResolverFactory::find(const ResolveContext& ctx) const {
    for (const auto& resolver : resolvers_) {
        if (resolver->supports(ctx))
            return resolver.get();
    }
    return nullptr;
}

std::optional<PathType> ResolverFactory::select(const ResolveContext& ctx) const {
    const PathResolver* resolver = find(ctx);
    if (!resolver)
        return std::nullopt;
    return resolver->type();
}

std::string ResolverFactory::resolve(const ResolveContext& ctx) const {
    const PathResolver* resolver = find(ctx);
    if (!resolver) {
        logger_->warn("No path resolver for '" + ctx.href + "', leaving it unchanged");
        return ctx.href;
    }
    return resolver->resolve(ctx);
}

std::string ResolverFactory::output_path(const Graph::PageNode& node) const {
    ResolveContext ctx;
    ctx.source = &node;
    return filesystem_.resolve(ctx);
}

}  // namespace Path
}  // namespace Folio
