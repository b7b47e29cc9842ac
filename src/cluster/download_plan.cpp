#include "download_plan.hpp"
#include "../core/types/errors.hpp"

namespace Folio {
namespace Cluster {

DownloadPlan::DownloadPlan(std::filesystem::path output_root)
    : output_root_(std::filesystem::absolute(output_root).lexically_normal()) {
}

DownloadPlan DownloadPlan::build(const Graph::PageGraph&      graph,
                                 const std::filesystem::path& output_root,
                                 const Path::ResolverFactory& factory) {
    DownloadPlan plan(output_root);
    for (const auto& node : graph.nodes()) {
        DownloadTask task;
        task.page_id   = node.id;
        task.url       = node.url;
        task.title     = node.title;
        task.save_path = (plan.output_root_ / factory.output_path(node)).lexically_normal();
        plan.add(std::move(task));
    }
    return plan;
}

void DownloadPlan::add(DownloadTask task) {
    if (!task.save_path.is_absolute())
        task.save_path = (output_root_ / task.save_path).lexically_normal();

    for (const auto& existing : tasks_) {
        if (existing.page_id == task.page_id)
            throw Core::ContractViolation("page planned twice: " + task.page_id);
        if (existing.save_path == task.save_path)
            throw Core::ContractViolation("two pages share " + task.save_path.string());
    }
    tasks_.push_back(std::move(task));
}

const DownloadTask* DownloadPlan::find(const std::string& page_id) const {
    for (const auto& task : tasks_) {
        if (task.page_id == page_id)
            return &task;
    }
    return nullptr;
}

}  // namespace Cluster
}  // namespace Folio
