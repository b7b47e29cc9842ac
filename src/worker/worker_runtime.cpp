#include "worker_runtime.hpp"
#include <utility>
#include <boost/asio/error.hpp>
#include <unistd.h>
#include "../core/types/errors.hpp"

namespace Folio {
namespace Worker {

namespace net = boost::asio;

WorkerRuntime::WorkerRuntime(net::io_context&              ioc,
                             int                           in_fd,
                             int                           out_fd,
                             std::unique_ptr<PageRenderer> renderer,
                             Core::LoggerPtr               logger)
    : channel_(ioc, in_fd, out_fd),
      renderer_(std::move(renderer)),
      logger_(logger),
      mapper_(logger) {
}

bool WorkerRuntime::reply(const Ipc::Message& message) {
    boost::system::error_code ec;
    if (channel_.send(message, ec))
        return true;
    logger_->error("Cannot reach orchestrator: " + ec.message());
    return false;
}

net::awaitable<int> WorkerRuntime::run() {
    int exit_code = EXIT_OK;

    for (;;) {
        std::optional<Ipc::Message> message;
        try {
            message = co_await channel_.receive();
        } catch (const boost::system::system_error& e) {
            if (e.code() != net::error::eof) {
                logger_->error("Channel failure: " + e.code().message());
                exit_code = EXIT_TRANSPORT;
            }
        } catch (const Core::ProtocolError& e) {
            logger_->error(std::string("Protocol error: ") + e.what());
            exit_code = EXIT_PROTOCOL;
        }
        if (!message)
            break;

        if (!Ipc::is_command(*message)) {
            logger_->error(std::string("Unexpected ") + Ipc::to_string(Ipc::type_of(*message)));
            exit_code = EXIT_PROTOCOL;
            break;
        }

        if (const auto* init = std::get_if<Ipc::InitMessage>(&*message)) {
            if (settings_) {
                logger_->error("INIT received twice");
                exit_code = EXIT_PROTOCOL;
                break;
            }
            if (!co_await initialize(*init)) {
                exit_code = EXIT_SESSION_FAILED;
                break;
            }
            if (!reply(Ipc::ReadyMessage{static_cast<int>(::getpid())})) {
                exit_code = EXIT_TRANSPORT;
                break;
            }
        }
        else if (const auto* cookies = std::get_if<Ipc::SetCookiesMessage>(&*message)) {
            co_await apply_cookies(cookies->cookies);
        }
        else if (const auto* task = std::get_if<Ipc::DownloadMessage>(&*message)) {
            if (!settings_) {
                logger_->error("DOWNLOAD before INIT");
                exit_code = EXIT_PROTOCOL;
                break;
            }
            Ipc::ResultMessage result = co_await download(*task);
            if (!reply(result)) {
                exit_code = EXIT_TRANSPORT;
                break;
            }
            if (result.error && result.error->kind == Ipc::ErrorKind::Session) {
                logger_->error("Browser session lost, exiting");
                exit_code = EXIT_SESSION_FAILED;
                break;
            }
        }
        else {
            logger_->debug("Shutdown requested");
            break;
        }
    }

    co_await stop_session();
    channel_.close();
    co_return exit_code;
}

net::awaitable<bool> WorkerRuntime::initialize(const Ipc::InitMessage& init) {
    settings_ = init.settings;
    storage_  = std::make_unique<Storage::DiskStorage>(settings_->output_root, logger_);

    bool        started = false;
    std::string error;
    try {
        co_await renderer_->start(*settings_);
        started = true;
    } catch (const std::exception& e) {
        error = e.what();
    }

    if (!started) {
        logger_->error("Cannot open browser session: " + error);
        co_return false;
    }
    session_open_ = true;
    logger_->debug("Browser session ready");
    co_return true;
}

net::awaitable<void> WorkerRuntime::apply_cookies(const std::vector<Core::Cookie>& cookies) {
    if (cookies.empty() || cookies == cookies_)
        co_return;
    cookies_ = cookies;

    std::string error;
    try {
        co_await renderer_->set_cookies(cookies_);
    } catch (const std::exception& e) {
        error = e.what();
    }
    if (!error.empty())
        logger_->warn("Cannot apply session cookies: " + error);
}

net::awaitable<Ipc::ResultMessage> WorkerRuntime::download(const Ipc::DownloadMessage& task) {
    Ipc::ResultMessage result;
    result.task_id = task.task_id;

    auto failure = [&](Ipc::ErrorKind kind, const std::string& message, bool retryable) {
        logger_->warn("Task " + task.task_id + " failed: " + message);
        result.error = Ipc::TaskError{task.page_id, message, kind, retryable};
        return result;
    };

    co_await apply_cookies(task.cookies);

    RenderedPage page;
    std::string  render_error;
    bool         rendered = false;
    try {
        page     = co_await renderer_->render(RenderRequest{task.url, task.page_id, task.save_path});
        rendered = true;
    } catch (const Core::RenderError& e) {
        render_error = e.what();
    } catch (const std::exception& e) {
        render_error = std::string("unexpected: ") + e.what();
    }
    if (!rendered) {
        if (!renderer_->alive())
            co_return failure(Ipc::ErrorKind::Session, render_error, true);
        co_return failure(Ipc::ErrorKind::Render, render_error, true);
    }

    std::filesystem::path save_path(task.save_path);
    if (!storage_->save(save_path, page.html))
        co_return failure(Ipc::ErrorKind::Filesystem, "cannot write " + task.save_path, false);

    Blocks::BlockMap blocks = Blocks::BlockIdMapper::extract(page.html);
    if (!mapper_.save(save_path.parent_path(), blocks))
        logger_->warn("Block map not saved for " + task.url);

    result.data = Ipc::TaskData{task.page_id, task.save_path, page.title, page.html.size(), blocks.size()};
    co_return result;
}

net::awaitable<void> WorkerRuntime::stop_session() {
    if (!session_open_)
        co_return;
    session_open_ = false;

    std::string error;
    try {
        co_await renderer_->stop();
    } catch (const std::exception& e) {
        error = e.what();
    }
    if (!error.empty())
        logger_->warn("Browser session did not close cleanly: " + error);
}

}  // namespace Worker
}  // namespace Folio
