#include "browser.hpp"
#include <utility>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace Folio {
namespace Browser {

namespace net = boost::asio;

BrowserSession::BrowserSession(net::io_context& ioc, Core::LoggerPtr logger)
    : ioc_(ioc), logger_(logger), launcher_(logger) {
}

net::awaitable<void> BrowserSession::open(const SessionOptions& options) {
    options_ = options;
    if (options_.browser_path.empty())
        options_.browser_path = Launcher::BrowserLauncher::find_browser();
    if (options_.browser_path.empty())
        throw CDP::CdpError("no Chromium-based browser found; pass --browser");

    if (!launcher_.launch(options_.browser_path, options_.port, options_.headless))
        throw CDP::CdpError("cannot launch browser " + options_.browser_path);

    cdp_ = std::make_unique<CDP::CDPClient>(ioc_, logger_, "127.0.0.1", options_.port);
    co_await cdp_->connect();
}

net::awaitable<void> BrowserSession::load(const std::string& url) {
    if (!cdp_)
        throw CDP::CdpError("browser session is not open");
    if (!cdp_->connected()) {
        logger_->debug("Reattaching to browser");
        co_await cdp_->connect();
    }

    co_await cdp_->navigate(url, options_.page_timeout);

    if (options_.settle.count() > 0) {
        net::steady_timer settle(ioc_, options_.settle);
        co_await settle.async_wait(net::use_awaitable);
    }
}

net::awaitable<void> BrowserSession::close() {
    if (cdp_) {
        co_await cdp_->close();
        cdp_.reset();
    }
    launcher_.stop();
}

}  // namespace Browser
}  // namespace Folio
