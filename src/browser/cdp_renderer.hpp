#pragma once
#include <memory>

#include "../worker/page_renderer.hpp"
#include "browser.hpp"

namespace Folio {
namespace Browser {

class CdpRenderer : public Worker::PageRenderer {
public:
    CdpRenderer(boost::asio::io_context& ioc, Core::LoggerPtr logger);

    boost::asio::awaitable<void> start(const Ipc::WorkerSettings& settings) override;
    boost::asio::awaitable<void> set_cookies(const std::vector<Core::Cookie>& cookies) override;
    boost::asio::awaitable<Worker::RenderedPage> render(const Worker::RenderRequest& request) override;
    boost::asio::awaitable<void>                 stop() override;
    bool                                         alive() override;

private:
    BrowserSession  session_;
    Core::LoggerPtr logger_;
};

}  // namespace Browser
}  // namespace Folio
