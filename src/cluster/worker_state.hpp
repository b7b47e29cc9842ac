#pragma once
#include <chrono>
#include <optional>
#include <string>

#include "download_task.hpp"

namespace Folio {
namespace Cluster {

enum class WorkerState { Initializing, Idle, Busy, Crashed };

const char* to_string(WorkerState state);

struct ActiveTask {
    std::string                           task_id;
    DownloadTask                          task;
    std::chrono::steady_clock::time_point started;
};

// INITIALIZING -> IDLE on READY, IDLE -> BUSY on dispatch, BUSY -> IDLE on RESULT,
// anything -> CRASHED on exit. CRASHED is terminal.
class WorkerStateMachine {
public:
    explicit WorkerStateMachine(int worker_id) : worker_id_(worker_id) {
    }

    WorkerState state() const {
        return state_;
    }
    const std::optional<ActiveTask>& current_task() const {
        return current_;
    }

    // False when READY arrives outside INITIALIZING.
    bool on_ready();

    // Throws Core::ContractViolation unless IDLE.
    const ActiveTask& assign(DownloadTask task, std::chrono::system_clock::time_point now);

    // Empty when no task is in flight.
    std::optional<ActiveTask> complete();

    // Returns the task lost with the process, if any.
    std::optional<ActiveTask> crash();

    static std::string make_task_id(int worker_id, std::chrono::system_clock::time_point now);

private:
    int                       worker_id_;
    WorkerState               state_ = WorkerState::Initializing;
    std::optional<ActiveTask> current_;
};

}  // namespace Cluster
}  // namespace Folio
