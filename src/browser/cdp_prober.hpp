#pragma once
#include "../discovery/page_prober.hpp"
#include "browser.hpp"

namespace Folio {
namespace Browser {

// Discovery prober sharing one browser session across every probe.
class CdpProber : public Discovery::PageProber {
public:
    CdpProber(boost::asio::io_context& ioc, SessionOptions options, Core::LoggerPtr logger);

    // Launches the shared browser; probe() does so lazily when not called first.
    boost::asio::awaitable<void>                      open();
    boost::asio::awaitable<Discovery::ProbeResult>    probe(const std::string& url) override;
    boost::asio::awaitable<std::vector<Core::Cookie>> session_cookies() override;
    boost::asio::awaitable<void>                      close();

private:
    BrowserSession  session_;
    SessionOptions  options_;
    Core::LoggerPtr logger_;
};

}  // namespace Browser
}  // namespace Folio
