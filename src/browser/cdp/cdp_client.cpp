#include "cdp_client.hpp"
#include <algorithm>
#include <utility>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <curl/curl.h>

namespace Folio {
namespace Browser {
namespace CDP {

namespace net       = boost::asio;
namespace beast     = boost::beast;
namespace websocket = boost::beast::websocket;
using json          = nlohmann::json;

static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

CDPClient::CDPClient(net::io_context& ioc, Core::LoggerPtr logger, const std::string& host, int port)
    : ioc_(ioc), logger_(logger), host_(host), port_(port) {
}

CDPClient::~CDPClient() {
    close_tab();
}

std::string CDPClient::open_tab() {
    CURL* curl = curl_easy_init();
    if (!curl)
        throw CdpError("curl initialisation failed");

    std::string body;
    std::string url = "http://" + host_ + ":" + std::to_string(port_) + "/json/new";
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(kConnectTimeout.count()));
    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK)
        throw CdpError(std::string("cannot open tab: ") + curl_easy_strerror(res));

    json tab = json::parse(body, nullptr, false);
    if (tab.is_discarded() || !tab.contains("webSocketDebuggerUrl") || !tab.contains("id"))
        throw CdpError("unexpected /json/new response");

    tab_id_ = tab["id"].get<std::string>();
    return tab["webSocketDebuggerUrl"].get<std::string>();
}

void CDPClient::close_tab() {
    if (tab_id_.empty())
        return;

    CURL* curl = curl_easy_init();
    if (curl) {
        std::string url = "http://" + host_ + ":" + std::to_string(port_) + "/json/close/" + tab_id_;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        std::string ignored;
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ignored);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, 2L);
        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK)
            logger_->debug(std::string("CDP: closing tab failed: ") + curl_easy_strerror(res));
        curl_easy_cleanup(curl);
    }
    tab_id_.clear();
}

net::awaitable<void> CDPClient::connect() {
    if (connected_)
        co_return;

    close_tab();
    std::string ws_url = open_tab();

    size_t scheme_end = ws_url.find("://");
    size_t path_start = scheme_end == std::string::npos ? std::string::npos : ws_url.find('/', scheme_end + 3);
    if (path_start == std::string::npos)
        throw CdpError("malformed debugger URL: " + ws_url);
    std::string path = ws_url.substr(path_start);

    responses_.clear();
    events_.clear();
    ws_ = std::make_unique<WebSocket>(ioc_);

    net::ip::tcp::resolver resolver(ioc_);
    auto endpoints = co_await resolver.async_resolve(host_, std::to_string(port_), net::use_awaitable);

    beast::get_lowest_layer(*ws_).expires_after(kConnectTimeout);
    co_await beast::get_lowest_layer(*ws_).async_connect(endpoints, net::use_awaitable);

    ws_->read_message_max(64 * 1024 * 1024);
    co_await ws_->async_handshake(host_ + ":" + std::to_string(port_), path, net::use_awaitable);
    beast::get_lowest_layer(*ws_).expires_never();

    connected_ = true;
    logger_->debug("CDP: attached to tab " + tab_id_);
}

void CDPClient::arm(std::chrono::milliseconds timeout) {
    deadline_ = Clock::now() + timeout;
}

net::awaitable<void> CDPClient::send_message(const json& msg) {
    if (!connected_)
        throw CdpError("not connected");

    std::string text = msg.dump();
    beast::get_lowest_layer(*ws_).expires_at(deadline_);
    try {
        co_await ws_->async_write(net::buffer(text), net::use_awaitable);
    } catch (const boost::system::system_error&) {
        connected_ = false;
        throw;
    }
}

net::awaitable<json> CDPClient::read_message() {
    if (!connected_)
        throw CdpError("not connected");

    beast::flat_buffer buffer;
    beast::get_lowest_layer(*ws_).expires_at(deadline_);
    try {
        co_await ws_->async_read(buffer, net::use_awaitable);
    } catch (const boost::system::system_error&) {
        connected_ = false;
        throw;
    }

    json msg = json::parse(beast::buffers_to_string(buffer.data()), nullptr, false);
    if (msg.is_discarded())
        throw CdpError("malformed DevTools message");
    co_return msg;
}

net::awaitable<json> CDPClient::wait_for_id(int id) {
    for (;;) {
        auto it = responses_.find(id);
        if (it != responses_.end()) {
            json response = std::move(it->second);
            responses_.erase(it);
            co_return response;
        }

        json msg = co_await read_message();
        if (msg.contains("id")) {
            int response_id         = msg["id"].get<int>();
            responses_[response_id] = std::move(msg);
        } else {
            events_.push_back(std::move(msg));
            if (events_.size() > kMaxBufferedEvents)
                events_.pop_front();
        }
    }
}

net::awaitable<json> CDPClient::wait_for_event(const std::string& method) {
    for (;;) {
        for (auto it = events_.begin(); it != events_.end(); ++it) {
            if (it->value("method", "") == method) {
                json event = std::move(*it);
                events_.erase(it);
                co_return event;
            }
        }

        json msg = co_await read_message();
        if (msg.contains("id")) {
            int response_id         = msg["id"].get<int>();
            responses_[response_id] = std::move(msg);
        } else {
            events_.push_back(std::move(msg));
        }
    }
}

net::awaitable<json> CDPClient::request(const std::string& method, const json& params) {
    int id = current_id_++;
    const json message = {{"id", id}, {"method", method}, {"params", params}};
    co_await send_message(message);

    json response = co_await wait_for_id(id);
    if (response.contains("error"))
        throw CdpError(method + ": " + response["error"].value("message", response["error"].dump()));
    co_return response.value("result", json::object());
}

net::awaitable<json> CDPClient::call(const std::string& method, const json& params) {
    arm(kCallTimeout);
    co_return co_await request(method, params);
}

net::awaitable<void> CDPClient::navigate(const std::string& url, std::chrono::milliseconds timeout) {
    arm(timeout);
    co_await request("Page.enable", json::object());

    events_.erase(std::remove_if(events_.begin(),
                                 events_.end(),
                                 [](const json& e) { return e.value("method", "") == "Page.loadEventFired"; }),
                  events_.end());

    const json navigate_params = {{"url", url}};
    json result = co_await request("Page.navigate", navigate_params);
    if (result.contains("errorText") && !result["errorText"].get<std::string>().empty())
        throw CdpError("navigation to " + url + " failed: " + result["errorText"].get<std::string>());

    co_await wait_for_event("Page.loadEventFired");
}

net::awaitable<json> CDPClient::evaluate(const std::string& expression) {
    const json evaluate_params = {{"expression", expression}, {"returnByValue", true}, {"awaitPromise", true}};
    json result = co_await call("Runtime.evaluate", evaluate_params);
    if (result.contains("exceptionDetails")) {
        const json& details = result["exceptionDetails"];
        std::string text    = details.value("text", "script error");
        if (details.contains("exception"))
            text += ": " + details["exception"].value("description", "");
        throw CdpError(text);
    }
    if (!result.contains("result"))
        co_return json();
    co_return result["result"].value("value", json());
}

net::awaitable<std::vector<Core::Cookie>> CDPClient::get_cookies() {
    json result = co_await call("Network.getAllCookies");
    std::vector<Core::Cookie> cookies;
    for (const auto& c : result.value("cookies", json::array()))
        cookies.push_back(c.get<Core::Cookie>());
    co_return cookies;
}

net::awaitable<void> CDPClient::set_cookies(const std::vector<Core::Cookie>& cookies) {
    json params = json::array();
    for (const auto& cookie : cookies) {
        json c = cookie;
        if (cookie.expires <= 0)
            c.erase("expires");
        params.push_back(std::move(c));
    }
    const json set_cookies_params = {{"cookies", params}};
    co_await call("Network.setCookies", set_cookies_params);
}

net::awaitable<void> CDPClient::close() {
    if (connected_) {
        connected_ = false;
        boost::system::error_code ec;
        beast::get_lowest_layer(*ws_).expires_after(std::chrono::seconds(2));
        co_await ws_->async_close(websocket::close_code::normal, net::redirect_error(net::use_awaitable, ec));
        if (ec)
            logger_->debug("CDP: websocket close: " + ec.message());
    }
    ws_.reset();
    close_tab();
}

}  // namespace CDP
}  // namespace Browser
}  // namespace Folio
