#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <csignal>
#include <curl/curl.h>
#include <memory>
#include <unistd.h>

#include "browser/cdp_renderer.hpp"
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "engine/mirror.hpp"
#include "worker/worker_runtime.hpp"

namespace {

using namespace Folio;

int run_worker(const Core::Config& config, Core::LoggerPtr logger) {
    // The orchestrator owns Ctrl-C handling and tells workers to stop over the channel.
    std::signal(SIGINT, SIG_IGN);
    std::signal(SIGPIPE, SIG_IGN);
    logger->set_prefix("[worker-" + std::to_string(config.worker_id) + "] ");

    if (config.ipc_in < 0 || config.ipc_out < 0) {
        logger->error("Worker mode needs --ipc-in and --ipc-out");
        return Worker::EXIT_TRANSPORT;
    }

    boost::asio::io_context ioc;
    Worker::WorkerRuntime   runtime(ioc,
                                  config.ipc_in,
                                  config.ipc_out,
                                  std::make_unique<Browser::CdpRenderer>(ioc, logger),
                                  logger);

    int                exit_code = Worker::EXIT_TRANSPORT;
    std::exception_ptr failure;
    boost::asio::co_spawn(ioc, runtime.run(), [&](std::exception_ptr e, int code) {
        failure   = e;
        exit_code = code;
    });
    ioc.run();

    if (failure)
        std::rethrow_exception(failure);
    return exit_code;
}

int run_mirror(const Core::Config& config, Core::LoggerPtr logger) {
    curl_global_init(CURL_GLOBAL_ALL);
    int exit_code = Engine::MIRROR_ERROR;
    {
        Engine::Mirror mirror(config, logger);
        exit_code = mirror.run();
    }
    curl_global_cleanup();
    return exit_code;
}

}  // namespace

int main(int argc, char* argv[]) {
    Core::Config config;
    try {
        config = Core::Config::parse(argc, argv);
    } catch (const std::exception& e) {
        Core::Logger(Core::LOG_ERROR).error(e.what());
        return 1;
    }

    auto logger = std::make_shared<Core::Logger>(config.log_level());

    try {
        if (config.worker) {
            curl_global_init(CURL_GLOBAL_ALL);
            int code = run_worker(config, logger);
            curl_global_cleanup();
            return code;
        }
        return run_mirror(config, logger);
    } catch (const std::exception& e) {
        logger->error(e.what());
        return 1;
    }
}
