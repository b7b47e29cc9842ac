#include "cdp_prober.hpp"
#include "../core/types/errors.hpp"

namespace Folio {
namespace Browser {

namespace net = boost::asio;

namespace {

constexpr const char* kProbeScript = R"JS((() => ({
    title: document.title || '',
    links: Array.from(document.querySelectorAll('a[href]')).map(a => ({
        url: a.href,
        text: (a.innerText || a.textContent || '').trim()
    }))
}))())JS";

}  // namespace

CdpProber::CdpProber(net::io_context& ioc, SessionOptions options, Core::LoggerPtr logger)
    : session_(ioc, logger), options_(std::move(options)), logger_(logger) {
}

net::awaitable<void> CdpProber::open() {
    if (!session_.is_open())
        co_await session_.open(options_);
}

net::awaitable<Discovery::ProbeResult> CdpProber::probe(const std::string& url) {
    co_await open();

    nlohmann::json value;
    std::string    error;
    try {
        co_await session_.load(url);
        value = co_await session_.client().evaluate(kProbeScript);
    } catch (const CDP::CdpError& e) {
        error = e.what();
    } catch (const boost::system::system_error& e) {
        error = e.code().message();
    }
    if (!error.empty())
        throw Core::ProbeError(url + ": " + error);
    if (!value.is_object())
        throw Core::ProbeError(url + ": probe script returned no data");

    Discovery::ProbeResult result;
    result.title = value.value("title", "");
    for (const auto& link : value.value("links", nlohmann::json::array())) {
        if (!link.is_object())
            continue;
        result.links.push_back({link.value("url", ""), link.value("text", "")});
    }
    logger_->debug("Probed " + url + ": " + std::to_string(result.links.size()) + " links");
    co_return result;
}

net::awaitable<std::vector<Core::Cookie>> CdpProber::session_cookies() {
    if (!session_.is_open())
        co_return std::vector<Core::Cookie>{};
    co_return co_await session_.client().get_cookies();
}

net::awaitable<void> CdpProber::close() {
    co_await session_.close();
}

}  // namespace Browser
}  // namespace Folio
