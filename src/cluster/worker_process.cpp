#include "worker_process.hpp"
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include "../core/types/constants.hpp"

namespace Folio {
namespace Cluster {

WorkerProcess::~WorkerProcess() {
    if (running()) {
        ::kill(pid_, SIGKILL);
        reap();
    }
}

WorkerProcess::WorkerProcess(WorkerProcess&& other) noexcept
    : pid_(other.pid_), status_(other.status_) {
    other.pid_ = -1;
    other.status_.reset();
}

WorkerProcess& WorkerProcess::operator=(WorkerProcess&& other) noexcept {
    if (this != &other) {
        if (running()) {
            ::kill(pid_, SIGKILL);
            reap();
        }
        pid_    = other.pid_;
        status_ = other.status_;
        other.pid_ = -1;
        other.status_.reset();
    }
    return *this;
}

bool WorkerProcess::signal(int sig) const {
    return running() && ::kill(pid_, sig) == 0;
}

std::optional<int> WorkerProcess::try_reap() {
    if (!running())
        return status_;
    int   status = 0;
    pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == pid_)
        status_ = status;
    else if (result < 0 && errno == ECHILD)
        status_ = -1;
    return status_;
}

int WorkerProcess::reap() {
    if (!running())
        return status_.value_or(-1);
    int   status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);
    status_ = result == pid_ ? status : -1;
    return *status_;
}

std::string WorkerProcess::describe_status(int status) {
    if (status < 0)
        return "unknown status";
    if (WIFEXITED(status))
        return "exit code " + std::to_string(WEXITSTATUS(status));
    if (WIFSIGNALED(status))
        return "signal " + std::to_string(WTERMSIG(status));
    return "status " + std::to_string(status);
}

namespace {

void close_pair(int fds[2]) {
    ::close(fds[0]);
    ::close(fds[1]);
}

}  // namespace

SpawnedWorker spawn_worker_process(const std::vector<std::string>& argv) {
    if (argv.empty())
        throw std::system_error(std::make_error_code(std::errc::invalid_argument), "empty command");

    int to_child[2];
    int from_child[2];
    if (::pipe2(to_child, O_CLOEXEC) != 0)
        throw std::system_error(errno, std::system_category(), "pipe");
    if (::pipe2(from_child, O_CLOEXEC) != 0) {
        int err = errno;
        close_pair(to_child);
        throw std::system_error(err, std::system_category(), "pipe");
    }

    std::vector<char*> args;
    for (const auto& arg : argv)
        args.push_back(const_cast<char*>(arg.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        close_pair(to_child);
        close_pair(from_child);
        throw std::system_error(err, std::system_category(), "fork");
    }

    if (pid == 0) {
        // Only async-signal-safe calls until exec. Moving both ends above the target
        // numbers first keeps dup2 from clobbering one with the other.
        int in  = ::fcntl(to_child[0], F_DUPFD, 10);
        int out = ::fcntl(from_child[1], F_DUPFD, 10);
        if (in < 0 || out < 0 || ::dup2(in, Core::Constants::IPC_CHILD_IN_FD) < 0
            || ::dup2(out, Core::Constants::IPC_CHILD_OUT_FD) < 0) {
            ::_exit(126);
        }
        ::close(in);
        ::close(out);
        ::execv(args[0], args.data());
        ::_exit(127);
    }

    ::close(to_child[0]);
    ::close(from_child[1]);

    SpawnedWorker spawned;
    spawned.process  = WorkerProcess(pid);
    spawned.read_fd  = from_child[0];
    spawned.write_fd = to_child[1];
    return spawned;
}

}  // namespace Cluster
}  // namespace Folio
