#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <memory>
#include <string>

#include "../core/logger/logger.hpp"
#include "cdp/cdp_client.hpp"
#include "launcher/browser_launcher.hpp"

namespace Folio {
namespace Browser {

struct SessionOptions {
    std::string               browser_path;
    int                       port     = 9222;
    bool                      headless = true;
    std::chrono::milliseconds page_timeout{60000};
    std::chrono::milliseconds settle{1500};
};

// A launched browser plus one attached tab. Reattaches after a transport failure.
class BrowserSession {
public:
    BrowserSession(boost::asio::io_context& ioc, Core::LoggerPtr logger);

    boost::asio::awaitable<void> open(const SessionOptions& options);

    // Navigates and waits for the load event plus the settle delay.
    boost::asio::awaitable<void> load(const std::string& url);

    boost::asio::awaitable<void> close();

    CDP::CDPClient& client() {
        return *cdp_;
    }
    bool is_open() const {
        return cdp_ != nullptr;
    }
    bool alive() {
        return cdp_ != nullptr && launcher_.alive();
    }

private:
    boost::asio::io_context&        ioc_;
    Core::LoggerPtr                 logger_;
    SessionOptions                  options_;
    Launcher::BrowserLauncher       launcher_;
    std::unique_ptr<CDP::CDPClient> cdp_;
};

}  // namespace Browser
}  // namespace Folio
