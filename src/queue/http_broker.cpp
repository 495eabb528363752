#include "queue/http_broker.hpp"

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace remex::queue {
namespace {

struct ParsedUrl {
    bool https = false;
    std::string host;
    int port = 80;
    std::string path;
};

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        parsed.port = 443;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        working = working.substr(7);
    } else {
        throw BrokerError("unsupported broker url: " + url);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        try {
            parsed.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            throw BrokerError("invalid port in broker url: " + url);
        }
    } else {
        parsed.host = host_port;
    }

    if (!parsed.path.empty() && parsed.path.back() == '/') {
        parsed.path.pop_back();
    }
    if (parsed.host.empty() || parsed.path.empty()) {
        throw BrokerError("broker url needs a host and a queue path: " + url);
    }
    return parsed;
}

std::unique_ptr<httplib::Client> MakeClient(const ParsedUrl& parsed, std::chrono::seconds timeout) {
    std::string scheme_host_port = parsed.https ? "https://" : "http://";
    scheme_host_port += parsed.host + ":" + std::to_string(parsed.port);
    auto client = std::make_unique<httplib::Client>(scheme_host_port);
    client->set_connection_timeout(static_cast<time_t>(timeout.count()));
    client->set_read_timeout(static_cast<time_t>(timeout.count()));
    return client;
}

nlohmann::json ParseResponse(const httplib::Result& response, const std::string& what) {
    if (!response) {
        throw BrokerError(what + " failed: " + httplib::to_string(response.error()));
    }
    if (response->status >= 400) {
        throw BrokerError(what + " failed: HTTP " + std::to_string(response->status));
    }
    auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw BrokerError(what + " failed: invalid response");
    }
    return json;
}

void ReplyJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

}  // namespace

HttpBrokerClient::HttpBrokerClient(std::chrono::seconds timeout)
    : timeout_(timeout) {}

SendReceipt HttpBrokerClient::Send(const std::string& queue,
                                   const std::string& body,
                                   const std::string& group_id,
                                   const std::string& dedup_id) {
    const auto parsed = ParseUrl(queue);
    auto client = MakeClient(parsed, timeout_);
    const nlohmann::json payload = {
        {"body", body},
        {"groupId", group_id},
        {"dedupId", dedup_id}
    };
    const auto endpoint = parsed.path + "/messages";
    const auto json = ParseResponse(
        client->Post(endpoint.c_str(), payload.dump(), "application/json"), "send");
    return SendReceipt{json.value("messageId", ""), json.value("duplicate", false)};
}

std::vector<ReceivedMessage> HttpBrokerClient::Receive(const std::string& queue,
                                                       std::size_t max_messages,
                                                       std::chrono::milliseconds visibility) {
    const auto parsed = ParseUrl(queue);
    auto client = MakeClient(parsed, timeout_);
    const nlohmann::json payload = {
        {"max", max_messages},
        {"visibilityMs", visibility.count()}
    };
    const auto endpoint = parsed.path + "/receive";
    const auto json = ParseResponse(
        client->Post(endpoint.c_str(), payload.dump(), "application/json"), "receive");

    std::vector<ReceivedMessage> messages;
    if (json.contains("messages") && json["messages"].is_array()) {
        for (const auto& item : json["messages"]) {
            ReceivedMessage message{};
            message.message_id = item.value("messageId", "");
            message.body = item.value("body", "");
            message.receipt_handle = item.value("receiptHandle", "");
            messages.push_back(std::move(message));
        }
    }
    return messages;
}

bool HttpBrokerClient::Delete(const std::string& queue, const std::string& receipt_handle) {
    const auto parsed = ParseUrl(queue);
    auto client = MakeClient(parsed, timeout_);
    const auto endpoint = parsed.path + "/messages/" + receipt_handle;
    auto response = client->Delete(endpoint.c_str());
    if (!response) {
        throw BrokerError("delete failed: " + httplib::to_string(response.error()));
    }
    return response->status == 204 || response->status == 200;
}

HttpBrokerServer::HttpBrokerServer(std::chrono::milliseconds dedup_window)
    : broker_(dedup_window)
    , server_(std::make_unique<httplib::Server>()) {
    RegisterRoutes();
}

HttpBrokerServer::~HttpBrokerServer() {
    Stop();
}

void HttpBrokerServer::RegisterRoutes() {
    server_->Post(R"(/queues/([^/]+)/messages)", [this](const httplib::Request& req, httplib::Response& res) {
        const auto queue = req.matches[1].str();
        auto json = nlohmann::json::parse(req.body, nullptr, false);
        if (json.is_discarded() || !json.is_object() || !json.contains("body") || !json["body"].is_string()) {
            ReplyJson(res, 400, {{"error", "body is required"}});
            return;
        }
        const auto receipt = broker_.Send(
            queue,
            json["body"].get<std::string>(),
            json.value("groupId", ""),
            json.value("dedupId", ""));
        ReplyJson(res, 200, {{"messageId", receipt.message_id}, {"duplicate", receipt.duplicate}});
    });

    server_->Post(R"(/queues/([^/]+)/receive)", [this](const httplib::Request& req, httplib::Response& res) {
        const auto queue = req.matches[1].str();
        auto json = nlohmann::json::parse(req.body, nullptr, false);
        if (json.is_discarded() || !json.is_object()) {
            json = nlohmann::json::object();
        }
        const auto max_messages = json.value("max", static_cast<std::size_t>(1));
        const auto visibility = std::chrono::milliseconds(json.value("visibilityMs", 30000LL));
        nlohmann::json messages = nlohmann::json::array();
        for (const auto& message : broker_.Receive(queue, max_messages, visibility)) {
            messages.push_back({
                {"messageId", message.message_id},
                {"body", message.body},
                {"receiptHandle", message.receipt_handle}
            });
        }
        ReplyJson(res, 200, {{"messages", messages}});
    });

    server_->Delete(R"(/queues/([^/]+)/messages/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        const auto queue = req.matches[1].str();
        const auto receipt = req.matches[2].str();
        if (broker_.Delete(queue, receipt)) {
            res.status = 204;
        } else {
            ReplyJson(res, 404, {{"error", "unknown receipt handle"}});
        }
    });
}

bool HttpBrokerServer::Listen(const std::string& host, int port) {
    utils::LogInfo("broker", "listening", {{"host", host}, {"port", std::to_string(port)}});
    return server_->listen(host, port);
}

int HttpBrokerServer::BindToAnyPort(const std::string& host) {
    const int port = server_->bind_to_any_port(host);
    utils::LogInfo("broker", "bound", {{"host", host}, {"port", std::to_string(port)}});
    return port;
}

bool HttpBrokerServer::ListenAfterBind() {
    return server_->listen_after_bind();
}

bool HttpBrokerServer::IsRunning() const {
    return server_->is_running();
}

void HttpBrokerServer::Stop() {
    if (server_) {
        server_->stop();
    }
}

std::unique_ptr<QueueBroker> CreateBroker(const config::Config& config) {
    const auto& url = config.execqueue.queue_url;
    if (url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0) {
        return std::make_unique<HttpBrokerClient>();
    }
    throw config::ConfigError("unsupported execqueue.queueUrl scheme: " + url);
}

}  // namespace remex::queue
