#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../core/logger/logger.hpp"
#include "../../core/types/cookie.hpp"

namespace Folio {
namespace Browser {
namespace CDP {

class CdpError : public std::runtime_error {
public:
    explicit CdpError(const std::string& what) : std::runtime_error(what) {
    }
};

// One DevTools tab driven over a websocket. Every operation throws CdpError or
// boost::system::system_error; after a transport failure the client must reconnect.
class CDPClient {
public:
    using Clock = std::chrono::steady_clock;

    CDPClient(boost::asio::io_context& ioc,
              Core::LoggerPtr          logger,
              const std::string&       host = "127.0.0.1",
              int                      port = 9222);
    ~CDPClient();

    CDPClient(const CDPClient&)            = delete;
    CDPClient& operator=(const CDPClient&) = delete;

    boost::asio::awaitable<void> connect();
    bool                         connected() const {
        return connected_;
    }

    boost::asio::awaitable<nlohmann::json> call(const std::string&    method,
                                                const nlohmann::json& params = nlohmann::json::object());

    // Resolves once the load event fired or throws when the timeout passes first.
    boost::asio::awaitable<void>           navigate(const std::string& url, std::chrono::milliseconds timeout);
    boost::asio::awaitable<nlohmann::json> evaluate(const std::string& expression);

    boost::asio::awaitable<std::vector<Core::Cookie>> get_cookies();
    boost::asio::awaitable<void>                      set_cookies(const std::vector<Core::Cookie>& cookies);

    boost::asio::awaitable<void> close();

private:
    using WebSocket = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    static constexpr std::chrono::seconds kCallTimeout{30};
    static constexpr std::chrono::seconds kConnectTimeout{5};
    static constexpr size_t               kMaxBufferedEvents = 512;

    boost::asio::io_context&   ioc_;
    Core::LoggerPtr            logger_;
    std::string                host_;
    int                        port_;
    std::unique_ptr<WebSocket> ws_;
    bool                       connected_ = false;
    Clock::time_point          deadline_;

    int         current_id_ = 1;
    std::string tab_id_;

    std::map<int, nlohmann::json> responses_;
    std::deque<nlohmann::json>    events_;

    std::string open_tab();
    void        close_tab();

    void                                   arm(std::chrono::milliseconds timeout);
    boost::asio::awaitable<nlohmann::json> request(const std::string& method, const nlohmann::json& params);
    boost::asio::awaitable<void>           send_message(const nlohmann::json& msg);
    boost::asio::awaitable<nlohmann::json> read_message();
    boost::asio::awaitable<nlohmann::json> wait_for_id(int id);
    boost::asio::awaitable<nlohmann::json> wait_for_event(const std::string& method);
};

}  // namespace CDP
}  // namespace Browser
}  // namespace Folio
