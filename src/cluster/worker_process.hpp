#pragma once
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace Folio {
namespace Cluster {

// Owns a child pid; a process still running on destruction is killed and reaped.
class WorkerProcess {
public:
    WorkerProcess() = default;
    explicit WorkerProcess(pid_t pid) : pid_(pid) {
    }
    ~WorkerProcess();

    WorkerProcess(WorkerProcess&& other) noexcept;
    WorkerProcess& operator=(WorkerProcess&& other) noexcept;
    WorkerProcess(const WorkerProcess&)            = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;

    pid_t pid() const {
        return pid_;
    }
    bool running() const {
        return pid_ > 0 && !status_;
    }
    std::optional<int> exit_status() const {
        return status_;
    }

    bool               signal(int sig) const;
    std::optional<int> try_reap();
    int                reap();

    static std::string describe_status(int status);

private:
    pid_t              pid_ = -1;
    std::optional<int> status_;
};

struct SpawnedWorker {
    WorkerProcess process;
    int           read_fd  = -1;  // parent end of the child's output pipe
    int           write_fd = -1;  // parent end of the child's input pipe
};

// Starts argv with its IPC pipes on Constants::IPC_CHILD_IN_FD / IPC_CHILD_OUT_FD.
// Throws std::system_error when pipes or fork fail; exec failures surface as exit status 127.
SpawnedWorker spawn_worker_process(const std::vector<std::string>& argv);

}  // namespace Cluster
}  // namespace Folio
