#include "notify/events_ws_sender.hpp"

#include <stdexcept>
#include <sys/socket.h>
#include <sys/time.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include "utils/logging.hpp"

namespace remex::notify {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

class WsConnection {
public:
    virtual ~WsConnection() = default;
    virtual void Write(const std::string& text) = 0;
    virtual void Close() = 0;
};

namespace {

void ApplySocketTimeout(tcp::socket& socket, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    ::setsockopt(socket.native_handle(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(socket.native_handle(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

void DecorateHandshake(websocket::request_type& req, const std::string& host) {
    req.set(beast::http::field::host, host);
    req.set(beast::http::field::user_agent, "remex-worker");
}

class PlainWsConnection : public WsConnection {
public:
    PlainWsConnection(const EventsEndpoint& endpoint, std::chrono::milliseconds timeout)
        : ws_(ioc_) {
        tcp::resolver resolver(ioc_);
        const auto results = resolver.resolve(endpoint.host, endpoint.port);
        beast::get_lowest_layer(ws_).connect(results);
        ApplySocketTimeout(beast::get_lowest_layer(ws_).socket(), timeout);
        const auto host = endpoint.host;
        ws_.set_option(websocket::stream_base::decorator(
            [host](websocket::request_type& req) { DecorateHandshake(req, host); }));
        ws_.handshake(endpoint.host, endpoint.target);
        ws_.text(true);
    }

    void Write(const std::string& text) override {
        ws_.write(boost::asio::buffer(text));
    }

    void Close() override {
        boost::system::error_code ec;
        ws_.close(websocket::close_code::normal, ec);
    }

private:
    boost::asio::io_context ioc_;
    websocket::stream<beast::tcp_stream> ws_;
};

class SecureWsConnection : public WsConnection {
public:
    SecureWsConnection(const EventsEndpoint& endpoint, std::chrono::milliseconds timeout)
        : ctx_(boost::asio::ssl::context::tls_client)
        , ws_(ioc_, PrepareContext(ctx_)) {
        tcp::resolver resolver(ioc_);
        const auto results = resolver.resolve(endpoint.host, endpoint.port);
        beast::get_lowest_layer(ws_).connect(results);
        ApplySocketTimeout(beast::get_lowest_layer(ws_).socket(), timeout);
        if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), endpoint.host.c_str())) {
            const auto err = static_cast<int>(::ERR_get_error());
            boost::system::error_code ec(err, boost::asio::error::get_ssl_category());
            throw boost::system::system_error(ec);
        }
        ws_.next_layer().handshake(boost::asio::ssl::stream_base::client);
        const auto host = endpoint.host;
        ws_.set_option(websocket::stream_base::decorator(
            [host](websocket::request_type& req) { DecorateHandshake(req, host); }));
        ws_.handshake(endpoint.host, endpoint.target);
        ws_.text(true);
    }

    void Write(const std::string& text) override {
        ws_.write(boost::asio::buffer(text));
    }

    void Close() override {
        boost::system::error_code ec;
        ws_.close(websocket::close_code::normal, ec);
    }

private:
    static boost::asio::ssl::context& PrepareContext(boost::asio::ssl::context& ctx) {
        ctx.set_default_verify_paths();
        ctx.set_options(boost::asio::ssl::context::default_workarounds);
        ctx.set_verify_mode(boost::asio::ssl::verify_peer);
        return ctx;
    }

    boost::asio::io_context ioc_;
    boost::asio::ssl::context ctx_;
    websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws_;
};

}  // namespace

EventsEndpoint ParseEventsUrl(const std::string& url) {
    EventsEndpoint endpoint{};
    std::string rest;
    if (url.rfind("wss://", 0) == 0) {
        endpoint.secure = true;
        rest = url.substr(6);
    } else if (url.rfind("ws://", 0) == 0) {
        rest = url.substr(5);
    } else {
        throw std::invalid_argument("events url must start with ws:// or wss://: " + url);
    }
    const auto slash = rest.find('/');
    const auto authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        endpoint.target = rest.substr(slash);
    }
    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        endpoint.host = authority.substr(0, colon);
        endpoint.port = authority.substr(colon + 1);
    } else {
        endpoint.host = authority;
    }
    if (endpoint.port.empty()) {
        endpoint.port = endpoint.secure ? "443" : "80";
    }
    if (endpoint.host.empty()) {
        throw std::invalid_argument("events url has no host: " + url);
    }
    return endpoint;
}

EventsWsSender::EventsWsSender(std::string url, std::chrono::milliseconds timeout)
    : url_(std::move(url))
    , timeout_(timeout) {}

EventsWsSender::~EventsWsSender() {
    Close();
}

void EventsWsSender::Send(const std::string& guid, const nlohmann::json& result) {
    nlohmann::json payload = result.is_object() ? result : nlohmann::json::object();
    payload["guid"] = guid;

    std::string stage = "init";
    try {
        if (!connection_) {
            const auto endpoint = ParseEventsUrl(url_);
            stage = "connect";
            if (endpoint.secure) {
                connection_ = std::make_unique<SecureWsConnection>(endpoint, timeout_);
            } else {
                connection_ = std::make_unique<PlainWsConnection>(endpoint, timeout_);
            }
        }
        stage = "write";
        connection_->Write(payload.dump());
        utils::LogDebug("events", "result sent", {{"guid", guid}});
    } catch (const std::exception& ex) {
        utils::LogError("events", "failed to deliver result", {
            {"guid", guid},
            {"stage", stage},
            {"error", ex.what()}});
        connection_.reset();
    }
}

void EventsWsSender::Close() {
    if (!connection_) {
        return;
    }
    try {
        connection_->Close();
    } catch (const std::exception& ex) {
        utils::LogWarn("events", "close failed", {{"error", ex.what()}});
    }
    connection_.reset();
}

}  // namespace remex::notify
