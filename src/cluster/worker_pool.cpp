#include "worker_pool.hpp"
#include <algorithm>
#include <csignal>
#include <system_error>
#include "../core/types/errors.hpp"

namespace Folio {
namespace Cluster {

namespace net = boost::asio;
using Core::get_backoff_time;

WorkerPool::WorkerPool(PoolSettings settings, Core::LoggerPtr logger, ExecutionObserver* observer)
    : settings_(std::move(settings)),
      logger_(std::move(logger)),
      observer_(observer),
      grace_timer_(ioc_),
      signals_(ioc_) {
}

ExecutionReport WorkerPool::run(const DownloadPlan& plan) {
    if (!plan.confirmed())
        throw Core::ContractViolation("execution requires a confirmed discovery tree");
    if (settings_.worker_command.empty())
        throw Core::ContractViolation("no worker command configured");

    ::signal(SIGPIPE, SIG_IGN);

    report_ = ExecutionReport{};
    queue_.assign(plan.tasks().begin(), plan.tasks().end());
    total_ = queue_.size();
    if (queue_.empty())
        return report_;

    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
        if (ec)
            return;
        logger_->warn("Signal " + std::to_string(signal_number) + " received, stopping workers");
        begin_shutdown("interrupted");
    });

    size_t count = std::min<size_t>(std::max(settings_.workers, 1), total_);
    workers_.resize(count);
    logger_->info("Pool: starting " + std::to_string(count) + " workers for "
                  + std::to_string(total_) + " pages");
    for (size_t slot = 0; slot < count; ++slot)
        spawn_worker(slot);

    if (!any_worker_alive()) {
        logger_->error("Pool: no worker could be started");
        begin_shutdown("no workers");
    }

    ioc_.run();

    logger_->info("Pool: " + std::to_string(report_.succeeded) + " saved, "
                  + std::to_string(report_.failed) + " failed, " + std::to_string(report_.crashes)
                  + " crashes, " + std::to_string(report_.respawns) + " respawns");
    return report_;
}

bool WorkerPool::spawn_worker(size_t slot) {
    WorkerProxy::Handlers handlers;
    handlers.on_ready  = [this](WorkerProxy& worker) { on_ready(worker); };
    handlers.on_result = [this](WorkerProxy& worker, ActiveTask active, Ipc::ResultMessage result) {
        on_result(worker, std::move(active), result);
    };
    handlers.on_exit = [this](WorkerProxy& worker, std::optional<ActiveTask> lost) {
        on_exit(worker, std::move(lost));
    };

    Ipc::WorkerSettings settings = settings_.worker_settings;
    settings.worker_id           = static_cast<int>(slot);
    settings.cdp_port            = settings_.worker_settings.cdp_port + 1 + static_cast<int>(slot);

    auto proxy = std::make_unique<WorkerProxy>(ioc_, static_cast<int>(slot), logger_, handlers);
    try {
        proxy->start(settings_.worker_command, settings, settings_.cookies, settings_.init_timeout);
    } catch (const std::system_error& e) {
        logger_->error("Pool: cannot start worker " + std::to_string(slot) + ": " + e.what());
        return false;
    }
    workers_[slot] = std::move(proxy);
    return true;
}

void WorkerPool::on_ready(WorkerProxy& worker) {
    logger_->debug("Pool: worker " + std::to_string(worker.id()) + " is idle");
    if (shutting_down_) {
        worker.request_shutdown();
        return;
    }
    schedule();
    maybe_finish();
}

void WorkerPool::on_result(WorkerProxy& worker, ActiveTask active, const Ipc::ResultMessage& result) {
    DownloadTask& task = active.task;

    if (result.ok()) {
        const Ipc::TaskData& data = *result.data;
        if (data.page_id != task.page_id) {
            logger_->warn("Pool: worker " + std::to_string(worker.id()) + " answered for "
                          + data.page_id + " instead of " + task.page_id);
        }

        TaskOutcome outcome;
        outcome.page_id    = task.page_id;
        outcome.url        = task.url;
        outcome.title      = data.title.empty() ? task.title : data.title;
        outcome.saved_path = data.saved_path;
        outcome.success    = true;
        outcome.attempts   = task.attempts;
        outcome.block_ids  = data.block_ids;
        report_.outcomes.push_back(outcome);
        report_.succeeded++;

        emit(TaskEventKind::Completed, task, worker.id(), data.saved_path);
        logger_->success("[" + std::to_string(report_.succeeded + report_.failed) + "/"
                         + std::to_string(total_) + "] Saved: " + outcome.title);
    }
    else {
        const Ipc::TaskError& error = *result.error;
        retry_or_fail(std::move(task),
                      worker.id(),
                      std::string(Ipc::to_string(error.kind)) + ": " + error.message,
                      error.retryable);
    }

    schedule();
    maybe_finish();
}

void WorkerPool::on_exit(WorkerProxy& worker, std::optional<ActiveTask> lost) {
    bool expected = worker.stopping() && !lost;
    if (!expected)
        report_.crashes++;

    size_t slot = static_cast<size_t>(worker.id());
    if (slot < workers_.size() && workers_[slot].get() == &worker)
        retired_.push_back(std::move(workers_[slot]));

    if (lost)
        retry_or_fail(std::move(lost->task), worker.id(), "worker crashed", true);

    if (shutting_down_) {
        if (!any_worker_alive())
            maybe_finish();
        return;
    }

    if (work_remaining() && can_respawn()) {
        logger_->warn("Pool: respawning worker " + std::to_string(slot));
        report_.respawns++;
        spawn_worker(slot);
    }

    if (!any_worker_alive() && work_remaining()) {
        logger_->error("Pool: no workers left, abandoning remaining pages");
        begin_shutdown("no workers left");
        return;
    }

    schedule();
    maybe_finish();
}

void WorkerPool::schedule() {
    if (shutting_down_)
        return;
    for (auto& worker : workers_) {
        if (queue_.empty())
            return;
        if (!worker || worker->state() != WorkerState::Idle || worker->session_lost())
            continue;

        DownloadTask task = std::move(queue_.front());
        queue_.pop_front();
        task.attempts++;
        emit(TaskEventKind::Started, task, worker->id(), "");
        worker->dispatch(std::move(task), settings_.task_timeout);
    }
}

void WorkerPool::retry_or_fail(DownloadTask       task,
                               int                worker_id,
                               const std::string& reason,
                               bool               retryable) {
    int max_attempts = 1 + std::max(settings_.max_retries, 0);
    if (!retryable || shutting_down_ || task.attempts >= max_attempts) {
        fail(task, worker_id, reason);
        return;
    }

    auto delay = get_backoff_time(task.attempts, settings_.retry_base_delay);
    emit(TaskEventKind::TransientFailure, task, worker_id, reason);
    logger_->warn("Retrying " + task.url + " in " + std::to_string(delay.count()) + "ms (attempt "
                  + std::to_string(task.attempts) + "/" + std::to_string(max_attempts)
                  + " failed: " + reason + ")");

    auto timer = std::make_shared<net::steady_timer>(ioc_, delay);
    retry_timers_.push_back(timer);
    delayed_++;
    timer->async_wait([this, timer, task = std::move(task), worker_id](
                          const boost::system::error_code& ec) mutable {
        delayed_--;
        retry_timers_.erase(std::remove(retry_timers_.begin(), retry_timers_.end(), timer),
                            retry_timers_.end());
        if (ec || shutting_down_) {
            fail(task, worker_id, "cancelled before retry");
            maybe_finish();
            return;
        }
        queue_.push_back(std::move(task));
        schedule();
    });
}

void WorkerPool::fail(const DownloadTask& task, int worker_id, const std::string& reason) {
    TaskOutcome outcome;
    outcome.page_id  = task.page_id;
    outcome.url      = task.url;
    outcome.title    = task.title;
    outcome.attempts = task.attempts;
    outcome.error    = reason;
    report_.outcomes.push_back(outcome);
    report_.failed++;

    emit(TaskEventKind::PermanentFailure, task, worker_id, reason);
    logger_->error("[" + std::to_string(report_.succeeded + report_.failed) + "/"
                   + std::to_string(total_) + "] Failed: " + task.url + " (" + reason + ")");
}

void WorkerPool::emit(TaskEventKind      kind,
                      const DownloadTask& task,
                      int                worker_id,
                      const std::string& detail) {
    if (observer_)
        observer_->on_task_event(TaskEvent{kind, task.page_id, worker_id, task.attempts, detail});
}

bool WorkerPool::work_remaining() const {
    return !queue_.empty() || delayed_ > 0;
}

bool WorkerPool::any_worker_alive() const {
    return std::any_of(workers_.begin(), workers_.end(), [](const auto& worker) {
        return worker && !worker->exited();
    });
}

bool WorkerPool::can_respawn() const {
    if (!settings_.respawn)
        return false;
    int budget = settings_.max_respawns < 0 ? settings_.workers * 2 : settings_.max_respawns;
    return report_.respawns < budget;
}

void WorkerPool::maybe_finish() {
    if (finished_)
        return;

    if (shutting_down_) {
        if (any_worker_alive() || delayed_ > 0)
            return;
        finished_ = true;
        grace_timer_.cancel();
        boost::system::error_code ec;
        signals_.cancel(ec);
        signals_.clear(ec);
        return;
    }

    if (work_remaining())
        return;
    for (const auto& worker : workers_) {
        if (worker && worker->state() == WorkerState::Busy)
            return;
    }
    begin_shutdown("all pages processed");
}

void WorkerPool::begin_shutdown(const std::string& reason) {
    if (shutting_down_)
        return;
    shutting_down_ = true;
    logger_->debug("Pool: shutting down (" + reason + ")");

    while (!queue_.empty()) {
        fail(queue_.front(), -1, reason);
        queue_.pop_front();
    }
    for (auto& timer : retry_timers_)
        timer->cancel();

    for (auto& worker : workers_) {
        if (worker && !worker->exited())
            worker->request_shutdown();
    }

    grace_timer_.expires_after(settings_.shutdown_grace);
    grace_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec)
            return;
        for (auto& worker : workers_) {
            if (worker && !worker->exited()) {
                logger_->warn("Pool: worker " + std::to_string(worker->id())
                              + " ignored shutdown, terminating");
                worker->kill();
            }
        }
    });

    maybe_finish();
}

}  // namespace Cluster
}  // namespace Folio
