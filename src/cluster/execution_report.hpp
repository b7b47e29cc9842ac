#pragma once
#include <string>
#include <vector>

namespace Folio {
namespace Cluster {

struct TaskOutcome {
    std::string page_id;
    std::string url;
    std::string title;
    std::string saved_path;
    bool        success  = false;
    int         attempts = 0;
    std::string error;
    size_t      block_ids = 0;
};

struct ExecutionReport {
    std::vector<TaskOutcome> outcomes;
    size_t                   succeeded = 0;
    size_t                   failed    = 0;
    int                      crashes   = 0;
    int                      respawns  = 0;

    const TaskOutcome* find(const std::string& page_id) const {
        for (const auto& outcome : outcomes) {
            if (outcome.page_id == page_id)
                return &outcome;
        }
        return nullptr;
    }
};

enum class TaskEventKind { Started, Completed, TransientFailure, PermanentFailure };

struct TaskEvent {
    TaskEventKind kind;
    std::string   page_id;
    int           worker_id = -1;
    int           attempt   = 0;
    std::string   detail;
};

// Receives pool events; passed in by whoever runs the pool.
class ExecutionObserver {
public:
    virtual ~ExecutionObserver() = default;

    virtual void on_task_event(const TaskEvent& event) = 0;
};

}  // namespace Cluster
}  // namespace Folio
