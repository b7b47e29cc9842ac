#include "worker_state.hpp"
#include "../core/types/errors.hpp"

namespace Folio {
namespace Cluster {

const char* to_string(WorkerState state) {
    switch (state) {
        case WorkerState::Initializing:
            return "INITIALIZING";
        case WorkerState::Idle:
            return "IDLE";
        case WorkerState::Busy:
            return "BUSY";
        case WorkerState::Crashed:
            return "CRASHED";
    }
    return "CRASHED";
}

bool WorkerStateMachine::on_ready() {
    if (state_ != WorkerState::Initializing)
        return false;
    state_ = WorkerState::Idle;
    return true;
}

const ActiveTask& WorkerStateMachine::assign(DownloadTask task,
                                             std::chrono::system_clock::time_point now) {
    if (state_ != WorkerState::Idle) {
        throw Core::ContractViolation("worker " + std::to_string(worker_id_) + " is "
                                      + to_string(state_) + ", cannot take a task");
    }
    current_ = ActiveTask{make_task_id(worker_id_, now), std::move(task), std::chrono::steady_clock::now()};
    state_   = WorkerState::Busy;
    return *current_;
}

std::optional<ActiveTask> WorkerStateMachine::complete() {
    if (state_ != WorkerState::Busy)
        return std::nullopt;
    std::optional<ActiveTask> finished = std::move(current_);
    current_.reset();
    state_ = WorkerState::Idle;
    return finished;
}

std::optional<ActiveTask> WorkerStateMachine::crash() {
    std::optional<ActiveTask> lost = std::move(current_);
    current_.reset();
    state_ = WorkerState::Crashed;
    return lost;
}

std::string WorkerStateMachine::make_task_id(int worker_id,
                                             std::chrono::system_clock::time_point now) {
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    return "worker-" + std::to_string(worker_id) + "-" + std::to_string(millis);
}

}  // namespace Cluster
}  // namespace Folio
