#include "worker_proxy.hpp"
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <csignal>
#include "../core/types/constants.hpp"
#include "../core/types/errors.hpp"

namespace Folio {
namespace Cluster {

namespace net = boost::asio;

WorkerProxy::WorkerProxy(net::io_context& ioc, int id, Core::LoggerPtr logger, Handlers handlers)
    : ioc_(ioc),
      id_(id),
      logger_(std::move(logger)),
      handlers_(std::move(handlers)),
      machine_(id),
      deadline_(ioc) {
}

WorkerProxy::~WorkerProxy() {
    if (channel_)
        channel_->close();
}

void WorkerProxy::start(const std::vector<std::string>&  command,
                        const Ipc::WorkerSettings&       settings,
                        const std::vector<Core::Cookie>& cookies,
                        std::chrono::milliseconds        init_timeout) {
    std::vector<std::string> argv = command;
    argv.insert(argv.end(),
                {"--worker-id",
                 std::to_string(id_),
                 "--ipc-in",
                 std::to_string(Core::Constants::IPC_CHILD_IN_FD),
                 "--ipc-out",
                 std::to_string(Core::Constants::IPC_CHILD_OUT_FD)});

    SpawnedWorker spawned = spawn_worker_process(argv);
    process_              = std::move(spawned.process);
    channel_  = std::make_unique<Ipc::Channel>(ioc_, spawned.read_fd, spawned.write_fd);
    cookies_  = cookies;
    logger_->debug("Worker " + std::to_string(id_) + ": started (pid "
                   + std::to_string(process_.pid()) + ")");

    arm_deadline(init_timeout, "initialization");
    send(Ipc::InitMessage{settings});

    net::co_spawn(ioc_, read_loop(), [](std::exception_ptr e) {
        if (e)
            std::rethrow_exception(e);
    });
}

void WorkerProxy::dispatch(DownloadTask task, std::chrono::milliseconds timeout) {
    const ActiveTask& active = machine_.assign(std::move(task), std::chrono::system_clock::now());

    Ipc::DownloadMessage message;
    message.task_id   = active.task_id;
    message.url       = active.task.url;
    message.page_id   = active.task.page_id;
    message.save_path = active.task.save_path.string();
    message.cookies   = cookies_;

    logger_->debug("Worker " + std::to_string(id_) + ": " + active.task_id + " -> "
                   + active.task.url);
    arm_deadline(timeout, "task " + active.task_id);
    send(message);
}

void WorkerProxy::request_shutdown() {
    if (stopping_ || exited_)
        return;
    stopping_ = true;
    send(Ipc::ShutdownMessage{});
}

void WorkerProxy::kill() {
    if (process_.signal(SIGKILL))
        logger_->debug("Worker " + std::to_string(id_) + ": killed");
}

bool WorkerProxy::send(const Ipc::Message& message) {
    boost::system::error_code ec;
    if (channel_ && channel_->send(message, ec))
        return true;

    logger_->warn("Worker " + std::to_string(id_) + ": cannot send "
                  + Ipc::to_string(Ipc::type_of(message)) + ": " + ec.message());
    kill();
    return false;
}

void WorkerProxy::arm_deadline(std::chrono::milliseconds timeout, const std::string& what) {
    deadline_.expires_after(timeout);
    deadline_.async_wait([this, what](const boost::system::error_code& ec) {
        if (ec || exited_)
            return;
        logger_->warn("Worker " + std::to_string(id_) + ": " + what + " timed out");
        kill();
    });
}

bool WorkerProxy::handle(const Ipc::Message& message) {
    if (const auto* ready = std::get_if<Ipc::ReadyMessage>(&message)) {
        if (!machine_.on_ready())
            return false;
        deadline_.cancel();
        logger_->debug("Worker " + std::to_string(id_) + ": ready (pid "
                       + std::to_string(ready->pid) + ")");
        if (!cookies_.empty())
            send(Ipc::SetCookiesMessage{cookies_});
        if (stopping_)
            return true;
        handlers_.on_ready(*this);
        return true;
    }

    if (const auto* result = std::get_if<Ipc::ResultMessage>(&message)) {
        std::optional<ActiveTask> finished = machine_.complete();
        if (!finished)
            return false;
        deadline_.cancel();
        if (!result->task_id.empty() && result->task_id != finished->task_id) {
            logger_->warn("Worker " + std::to_string(id_) + ": result for " + result->task_id
                          + " while running " + finished->task_id);
        }
        if (result->error && result->error->kind == Ipc::ErrorKind::Session)
            session_lost_ = true;
        handlers_.on_result(*this, std::move(*finished), *result);
        return true;
    }

    return false;
}

net::awaitable<void> WorkerProxy::read_loop() {
    std::string reason;
    try {
        for (;;) {
            Ipc::Message message = co_await channel_->receive();
            if (!handle(message)) {
                reason = std::string("unexpected ") + Ipc::to_string(Ipc::type_of(message))
                         + " while " + to_string(machine_.state());
                break;
            }
        }
    } catch (const boost::system::system_error& e) {
        reason = e.code() == net::error::eof ? "process exited" : e.code().message();
    } catch (const Core::ProtocolError& e) {
        reason = std::string("protocol error: ") + e.what();
    }
    finish(reason);
}

void WorkerProxy::finish(const std::string& reason) {
    deadline_.cancel();
    channel_->close();

    if (!process_.try_reap()) {
        process_.signal(SIGKILL);
        process_.reap();
    }
    std::string status = WorkerProcess::describe_status(process_.exit_status().value_or(-1));

    std::optional<ActiveTask> lost = machine_.crash();
    exited_                        = true;

    if (stopping_ && !lost) {
        logger_->debug("Worker " + std::to_string(id_) + ": stopped (" + status + ")");
    }
    else {
        logger_->error("Worker " + std::to_string(id_) + " crashed: " + reason + " (" + status
                       + ")" + (lost ? ", lost " + lost->task.url : ""));
    }
    handlers_.on_exit(*this, std::move(lost));
}

}  // namespace Cluster
}  // namespace Folio
