#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../core/logger/logger.hpp"
#include "../ipc/channel.hpp"
#include "../ipc/protocol.hpp"
#include "worker_process.hpp"
#include "worker_state.hpp"

namespace Folio {
namespace Cluster {

// Orchestrator-side handle of one worker process.
class WorkerProxy {
public:
    struct Handlers {
        std::function<void(WorkerProxy&)>                                 on_ready;
        std::function<void(WorkerProxy&, ActiveTask, Ipc::ResultMessage)> on_result;
        std::function<void(WorkerProxy&, std::optional<ActiveTask>)>      on_exit;
    };

    WorkerProxy(boost::asio::io_context& ioc, int id, Core::LoggerPtr logger, Handlers handlers);
    ~WorkerProxy();

    WorkerProxy(const WorkerProxy&)            = delete;
    WorkerProxy& operator=(const WorkerProxy&) = delete;

    // Spawns the process, queues INIT and starts reading. Throws std::system_error.
    void start(const std::vector<std::string>&  command,
               const Ipc::WorkerSettings&       settings,
               const std::vector<Core::Cookie>& cookies,
               std::chrono::milliseconds        init_timeout);

    // IDLE -> BUSY and sends DOWNLOAD. A failed send kills the process; the loss is
    // reported through on_exit like any other crash.
    void dispatch(DownloadTask task, std::chrono::milliseconds timeout);

    void request_shutdown();
    void kill();

    int id() const {
        return id_;
    }
    WorkerState state() const {
        return machine_.state();
    }
    bool stopping() const {
        return stopping_;
    }
    bool exited() const {
        return exited_;
    }
    // The worker reported a dead browser and is about to exit; no new work goes to it.
    bool session_lost() const {
        return session_lost_;
    }
    pid_t pid() const {
        return process_.pid();
    }

private:
    boost::asio::awaitable<void> read_loop();

    // False on a message the orchestrator must never receive in the current state.
    bool handle(const Ipc::Message& message);
    bool send(const Ipc::Message& message);
    void arm_deadline(std::chrono::milliseconds timeout, const std::string& what);
    void finish(const std::string& reason);

    boost::asio::io_context&      ioc_;
    int                           id_;
    Core::LoggerPtr               logger_;
    Handlers                      handlers_;
    WorkerStateMachine            machine_;
    WorkerProcess                 process_;
    std::unique_ptr<Ipc::Channel> channel_;
    boost::asio::steady_timer     deadline_;
    std::vector<Core::Cookie>     cookies_;
    bool                          stopping_     = false;
    bool                          exited_       = false;
    bool                          session_lost_ = false;
};

}  // namespace Cluster
}  // namespace Folio
