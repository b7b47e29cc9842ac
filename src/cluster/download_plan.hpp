#pragma once
#include <filesystem>
#include <vector>

#include "../graph/page_graph.hpp"
#include "../path/resolver_factory.hpp"
#include "download_task.hpp"

namespace Folio {
namespace Cluster {

// Every page of a discovery tree with its output path. Must be confirmed before execution.
class DownloadPlan {
public:
    explicit DownloadPlan(std::filesystem::path output_root);

    static DownloadPlan build(const Graph::PageGraph&      graph,
                              const std::filesystem::path& output_root,
                              const Path::ResolverFactory& factory);

    // Throws Core::ContractViolation on a duplicate page or output path.
    void add(DownloadTask task);

    void confirm() {
        confirmed_ = true;
    }
    bool confirmed() const {
        return confirmed_;
    }

    const std::vector<DownloadTask>& tasks() const {
        return tasks_;
    }
    const std::filesystem::path& output_root() const {
        return output_root_;
    }
    const DownloadTask* find(const std::string& page_id) const;

private:
    std::filesystem::path     output_root_;
    std::vector<DownloadTask> tasks_;
    bool                      confirmed_ = false;
};

}  // namespace Cluster
}  // namespace Folio
