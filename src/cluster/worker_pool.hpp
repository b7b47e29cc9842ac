#pragma once
#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "../core/logger/logger.hpp"
#include "../core/types/constants.hpp"
#include "../ipc/protocol.hpp"
#include "download_plan.hpp"
#include "execution_report.hpp"
#include "worker_proxy.hpp"

namespace Folio {
namespace Cluster {

struct PoolSettings {
    int                       workers     = Core::Constants::DEFAULT_WORKERS;
    int                       max_retries = Core::Constants::DEFAULT_MAX_RETRIES;
    std::chrono::milliseconds retry_base_delay{Core::Constants::DEFAULT_RETRY_DELAY_MS};
    std::chrono::milliseconds task_timeout{Core::Constants::DEFAULT_TASK_TIMEOUT_MS};
    std::chrono::milliseconds init_timeout{Core::Constants::DEFAULT_INIT_TIMEOUT_MS};
    std::chrono::milliseconds shutdown_grace{Core::Constants::DEFAULT_SHUTDOWN_GRACE_MS};
    bool                      respawn      = true;
    int                       max_respawns = -1;  // negative: twice the worker count

    // Executable plus leading arguments; the pool appends worker id and pipe numbers.
    std::vector<std::string> worker_command;

    // Template for INIT; worker i gets cdp_port + 1 + i.
    Ipc::WorkerSettings worker_settings;

    std::vector<Core::Cookie> cookies;
};

// Runs a confirmed plan across worker processes on a single-threaded event loop.
class WorkerPool {
public:
    WorkerPool(PoolSettings settings, Core::LoggerPtr logger, ExecutionObserver* observer = nullptr);

    // Throws Core::ContractViolation for an unconfirmed plan.
    ExecutionReport run(const DownloadPlan& plan);

private:
    bool spawn_worker(size_t slot);
    void on_ready(WorkerProxy& worker);
    void on_result(WorkerProxy& worker, ActiveTask active, const Ipc::ResultMessage& result);
    void on_exit(WorkerProxy& worker, std::optional<ActiveTask> lost);

    void schedule();
    void retry_or_fail(DownloadTask task, int worker_id, const std::string& reason, bool retryable);
    void fail(const DownloadTask& task, int worker_id, const std::string& reason);
    void emit(TaskEventKind kind, const DownloadTask& task, int worker_id, const std::string& detail);

    bool work_remaining() const;
    bool any_worker_alive() const;
    bool can_respawn() const;
    void maybe_finish();
    void begin_shutdown(const std::string& reason);

    boost::asio::io_context ioc_;
    PoolSettings            settings_;
    Core::LoggerPtr         logger_;
    ExecutionObserver*      observer_;

    std::deque<DownloadTask>                                 queue_;
    std::vector<std::shared_ptr<boost::asio::steady_timer>> retry_timers_;
    size_t                                                   delayed_ = 0;
    size_t                                                   total_   = 0;

    std::vector<std::unique_ptr<WorkerProxy>> workers_;  // one slot per worker id
    std::vector<std::unique_ptr<WorkerProxy>> retired_;

    boost::asio::steady_timer grace_timer_;
    boost::asio::signal_set   signals_;
    bool                      shutting_down_ = false;
    bool                      finished_      = false;
    ExecutionReport           report_;
};

}  // namespace Cluster
}  // namespace Folio
