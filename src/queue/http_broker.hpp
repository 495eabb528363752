#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "config/config_schema.hpp"
#include "queue/memory_broker.hpp"
#include "queue/queue_broker.hpp"

namespace httplib {
class Server;
}  // namespace httplib

namespace remex::queue {

// Talks to an HttpBrokerServer. Queue names are urls of the form
// http(s)://host:port/queues/<name>.
class HttpBrokerClient : public QueueBroker {
public:
    explicit HttpBrokerClient(std::chrono::seconds timeout = std::chrono::seconds(10));

    SendReceipt Send(const std::string& queue,
                     const std::string& body,
                     const std::string& group_id,
                     const std::string& dedup_id) override;
    std::vector<ReceivedMessage> Receive(const std::string& queue,
                                         std::size_t max_messages,
                                         std::chrono::milliseconds visibility) override;
    bool Delete(const std::string& queue, const std::string& receipt_handle) override;

private:
    std::chrono::seconds timeout_;
};

// Serves an InMemoryBroker over http:
//   POST   /queues/<name>/messages            {body, groupId, dedupId}
//   POST   /queues/<name>/receive             {max, visibilityMs}
//   DELETE /queues/<name>/messages/<receipt>
class HttpBrokerServer {
public:
    explicit HttpBrokerServer(std::chrono::milliseconds dedup_window);
    ~HttpBrokerServer();

    // Blocks until Stop(); false when the socket could not be bound.
    bool Listen(const std::string& host, int port);
    // Ephemeral port variant: bind first, then serve. BindToAnyPort returns
    // the chosen port or -1.
    int BindToAnyPort(const std::string& host);
    bool ListenAfterBind();
    bool IsRunning() const;
    void Stop();

    InMemoryBroker& Broker() { return broker_; }

private:
    void RegisterRoutes();

    InMemoryBroker broker_;
    std::unique_ptr<httplib::Server> server_;
};

// Broker client for the scheme of `config.execqueue.queueUrl`.
std::unique_ptr<QueueBroker> CreateBroker(const config::Config& config);

}  // namespace remex::queue
