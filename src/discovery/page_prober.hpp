#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <string>
#include <vector>

#include "../core/types/cookie.hpp"

namespace Folio {
namespace Discovery {

struct DiscoveredLink {
    std::string url;
    std::string text;
};

struct ProbeResult {
    std::string                 title;
    std::vector<DiscoveredLink> links;
};

// Renders a page and reports its title and outbound links. Failures throw.
class PageProber {
public:
    virtual ~PageProber() = default;

    virtual boost::asio::awaitable<ProbeResult> probe(const std::string& url) = 0;

    // Cookies of the shared session, captured once discovery is done.
    virtual boost::asio::awaitable<std::vector<Core::Cookie>> session_cookies() {
        co_return std::vector<Core::Cookie>{};
    }
};

}  // namespace Discovery
}  // namespace Folio
