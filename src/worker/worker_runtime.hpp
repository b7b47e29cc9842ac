#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <memory>
#include <optional>
#include <vector>

#include "../blocks/block_id_mapper.hpp"
#include "../core/logger/logger.hpp"
#include "../ipc/channel.hpp"
#include "../storage/disk_storage.hpp"
#include "page_renderer.hpp"

namespace Folio {
namespace Worker {

enum ExitCode {
    EXIT_OK             = 0,
    EXIT_TRANSPORT      = 1,
    EXIT_PROTOCOL       = 2,
    EXIT_SESSION_FAILED = 3
};

// Worker side of the channel: answers INIT with READY and each DOWNLOAD with one RESULT.
class WorkerRuntime {
public:
    WorkerRuntime(boost::asio::io_context&      ioc,
                  int                           in_fd,
                  int                           out_fd,
                  std::unique_ptr<PageRenderer> renderer,
                  Core::LoggerPtr               logger);

    boost::asio::awaitable<int> run();

private:
    boost::asio::awaitable<bool>               initialize(const Ipc::InitMessage& init);
    boost::asio::awaitable<Ipc::ResultMessage> download(const Ipc::DownloadMessage& task);
    boost::asio::awaitable<void>               apply_cookies(const std::vector<Core::Cookie>& cookies);
    boost::asio::awaitable<void>               stop_session();
    bool                                       reply(const Ipc::Message& message);

    Ipc::Channel                          channel_;
    std::unique_ptr<PageRenderer>         renderer_;
    Core::LoggerPtr                       logger_;
    Blocks::BlockIdMapper                 mapper_;
    std::unique_ptr<Storage::DiskStorage> storage_;
    std::optional<Ipc::WorkerSettings>    settings_;
    std::vector<Core::Cookie>             cookies_;
    bool                                  session_open_ = false;
};

}  // namespace Worker
}  // namespace Folio
