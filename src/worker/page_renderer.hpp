#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <string>
#include <vector>

#include "../core/types/cookie.hpp"
#include "../ipc/protocol.hpp"

namespace Folio {
namespace Worker {

struct RenderRequest {
    std::string url;
    std::string page_id;
    std::string save_path;
};

struct RenderedPage {
    std::string html;
    std::string title;
};

// One browser session per worker process.
class PageRenderer {
public:
    virtual ~PageRenderer() = default;

    // Throws when the session cannot be opened; the worker then exits before READY.
    virtual boost::asio::awaitable<void> start(const Ipc::WorkerSettings& settings) = 0;
    virtual boost::asio::awaitable<void> set_cookies(const std::vector<Core::Cookie>& cookies) = 0;

    // Throws Core::RenderError when the page cannot be rendered.
    virtual boost::asio::awaitable<RenderedPage> render(const RenderRequest& request) = 0;

    // False once the browser behind the session has exited.
    virtual bool alive() = 0;

    virtual boost::asio::awaitable<void> stop() = 0;
};

}  // namespace Worker
}  // namespace Folio
