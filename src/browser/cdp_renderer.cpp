#include "cdp_renderer.hpp"
#include "../core/types/errors.hpp"

namespace Folio {
namespace Browser {

namespace net = boost::asio;

namespace {

constexpr const char* kSnapshotScript = R"JS((() => {
    const d = document.doctype;
    const doctype = d ? '<!DOCTYPE ' + d.name + '>\n' : '';
    return { title: document.title || '', html: doctype + document.documentElement.outerHTML };
})())JS";

}  // namespace

CdpRenderer::CdpRenderer(net::io_context& ioc, Core::LoggerPtr logger)
    : session_(ioc, logger), logger_(logger) {
}

net::awaitable<void> CdpRenderer::start(const Ipc::WorkerSettings& settings) {
    SessionOptions options;
    options.browser_path = settings.browser_path;
    options.port         = settings.cdp_port;
    options.headless     = settings.headless;
    options.page_timeout = std::chrono::milliseconds(settings.page_timeout_ms);
    options.settle       = std::chrono::milliseconds(settings.settle_ms);
    co_await session_.open(options);
}

net::awaitable<void> CdpRenderer::set_cookies(const std::vector<Core::Cookie>& cookies) {
    co_await session_.client().set_cookies(cookies);
}

net::awaitable<Worker::RenderedPage> CdpRenderer::render(const Worker::RenderRequest& request) {
    nlohmann::json snapshot;
    std::string    error;
    try {
        co_await session_.load(request.url);
        snapshot = co_await session_.client().evaluate(kSnapshotScript);
    } catch (const CDP::CdpError& e) {
        error = e.what();
    } catch (const boost::system::system_error& e) {
        error = e.code().message();
    }
    if (!error.empty())
        throw Core::RenderError(request.url + ": " + error);

    if (!snapshot.is_object() || !snapshot.contains("html"))
        throw Core::RenderError(request.url + ": empty document");

    Worker::RenderedPage page;
    page.html  = snapshot.value("html", "");
    page.title = snapshot.value("title", "");
    if (page.html.empty())
        throw Core::RenderError(request.url + ": empty document");
    co_return page;
}

bool CdpRenderer::alive() {
    return session_.alive();
}

net::awaitable<void> CdpRenderer::stop() {
    co_await session_.close();
}

}  // namespace Browser
}  // namespace Folio
