#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "notify/result_notifier.hpp"

namespace remex::notify {

class WsConnection;

struct EventsEndpoint {
    bool secure = false;
    std::string host;
    std::string port;
    std::string target = "/";
};

// ws://host[:port]/path or wss://...; throws std::invalid_argument.
EventsEndpoint ParseEventsUrl(const std::string& url);

// Sends each result as one JSON text frame over a websocket opened on the
// first Send.
class EventsWsSender : public ResultNotifier {
public:
    EventsWsSender(std::string url, std::chrono::milliseconds timeout = std::chrono::seconds(5));
    ~EventsWsSender() override;

    void Send(const std::string& guid, const nlohmann::json& result) override;
    void Close() override;

private:
    std::string url_;
    std::chrono::milliseconds timeout_;
    std::unique_ptr<WsConnection> connection_;
};

}  // namespace remex::notify
