#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <signal.h>
#include <string>
#include <thread>
#include <vector>

#include "cache/cache_client.hpp"
#include "cache/packager.hpp"
#include "config/config_loader.hpp"
#include "notify/events_ws_sender.hpp"
#include "notify/sent_guid_ledger.hpp"
#include "queue/execution_queue.hpp"
#include "queue/http_broker.hpp"
#include "routing/execution_triple.hpp"
#include "sandbox/execution_environment.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "worker/execution_worker.hpp"

namespace {

std::atomic<bool> g_running{true};
volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

void WaitForSignal() {
    while (g_running.load()) {
        if (g_signal != 0) {
            g_running.store(false);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

remex::config::Config LoadAndApplyConfig() {
    auto config = remex::config::LoadConfig();
    remex::utils::SetLogConfig(remex::utils::LogConfig{
        remex::utils::ParseLogLevel(config.logging.level)});
    return config;
}

remex::routing::ExecutionTriple WorkerTriple(const remex::config::Config& config) {
    const auto host = remex::routing::ExecutionTriple::ForCurrentHost();
    return remex::routing::ExecutionTriple(
        config.worker.instruction_set.empty() ? host.InstructionSet() : config.worker.instruction_set,
        config.worker.os.empty() ? host.OperatingSystem() : config.worker.os,
        config.worker.specialty.empty() ? host.Specialty() : config.worker.specialty);
}

int RunWorker() {
    const auto config = LoadAndApplyConfig();
    remex::config::ValidateWorkerConfig(config);

    auto broker = remex::queue::CreateBroker(config);
    const auto triple = WorkerTriple(config);
    remex::queue::WorkerQueue queue(
        *broker,
        config.execqueue.queue_url,
        triple,
        std::chrono::seconds(config.execqueue.visibility_timeout_s),
        config.execqueue.dead_letter_url);

    remex::cache::DiskCache cache(remex::utils::ExpandHome(config.cache.dir));
    const auto settings = remex::sandbox::EnvironmentSettings::FromConfig(config);

    std::unique_ptr<remex::notify::SentGuidLedger> ledger;
    if (config.events.dedup_guids) {
        ledger = std::make_unique<remex::notify::SentGuidLedger>(
            static_cast<std::size_t>(config.events.dedup_capacity));
    }

    remex::worker::WorkerOptions options{};
    options.startup_delay = std::chrono::milliseconds(config.execqueue.startup_delay_ms);
    options.poll_interval = std::chrono::milliseconds(config.execqueue.poll_interval_ms);
    options.ledger = ledger.get();

    const auto events_url = config.events.url;
    const auto events_timeout = std::chrono::milliseconds(config.events.timeout_ms);
    remex::worker::ExecutionWorker worker(
        queue,
        [&cache, settings]() {
            return std::make_unique<remex::sandbox::LocalExecutionEnvironment>(cache, settings);
        },
        [events_url, events_timeout]() -> std::unique_ptr<remex::notify::ResultNotifier> {
            if (events_url.empty()) {
                return nullptr;
            }
            return std::make_unique<remex::notify::EventsWsSender>(events_url, events_timeout);
        },
        options);

    InstallSignalHandlers();
    worker.Start();
    std::cout << "remex worker started for " << queue.GetQueueUrl(triple)
              << ". Press Ctrl+C to stop." << std::endl;
    WaitForSignal();
    worker.Stop();
    return 0;
}

int RunBroker() {
    const auto config = LoadAndApplyConfig();
    remex::queue::HttpBrokerServer server(std::chrono::seconds(config.broker.dedup_window_s));

    InstallSignalHandlers();
    const std::string host = config.broker.host;
    const int port = config.broker.port;
    std::thread http_thread([&server, host, port]() {
        if (!server.Listen(host, port)) {
            std::cerr << "[broker] http server failed to listen on " << host << ":" << port << std::endl;
            g_running.store(false);
        }
    });
    std::cout << "remex broker listening on " << host << ":" << port << std::endl;
    WaitForSignal();
    server.Stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    return 0;
}

int Push(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        std::cout << "Usage: remex push <isa-os-specialty> <guid> <hash> [args...]" << std::endl;
        return 1;
    }
    const auto triple = remex::routing::ExecutionTriple::Parse(args[0]);
    if (!triple) {
        std::cout << "Invalid triple: " << args[0] << std::endl;
        return 1;
    }
    const auto config = LoadAndApplyConfig();
    remex::config::ValidateWorkerConfig(config);
    auto broker = remex::queue::CreateBroker(config);
    remex::queue::ExecuteRequester requester(*broker, config.execqueue.queue_url);

    remex::queue::RemoteExecutionMessage message{};
    message.guid = args[1];
    message.hash = args[2];
    message.params.args = std::vector<std::string>(args.begin() + 3, args.end());

    const auto receipt = requester.Push(*triple, message);
    std::cout << receipt.message_id << (receipt.duplicate ? " (duplicate)" : "") << std::endl;
    return 0;
}

int CachePut(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cout << "Usage: remex cache-put <hash> <file>" << std::endl;
        return 1;
    }
    const auto data = remex::utils::ReadFile(args[1]);
    if (!data) {
        std::cout << "Cannot read " << args[1] << std::endl;
        return 1;
    }
    const auto config = LoadAndApplyConfig();
    remex::cache::DiskCache cache(remex::utils::ExpandHome(config.cache.dir));
    if (!cache.Put(args[0], *data)) {
        std::cout << "Failed to store " << args[0] << std::endl;
        return 1;
    }
    return 0;
}

int Pack(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cout << "Usage: remex pack <dir> <archive>" << std::endl;
        return 1;
    }
    remex::cache::Packager packager;
    packager.Pack(args[0], args[1]);
    return 0;
}

void PrintUsage() {
    std::cout << "Usage: remex worker | remex broker | remex push <triple> <guid> <hash> [args...]"
              << " | remex cache-put <hash> <file> | remex pack <dir> <archive> | remex triple"
              << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    try {
        if (command == "worker") {
            return RunWorker();
        }
        if (command == "broker") {
            return RunBroker();
        }
        if (command == "push") {
            return Push(args);
        }
        if (command == "cache-put") {
            return CachePut(args);
        }
        if (command == "pack") {
            return Pack(args);
        }
        if (command == "triple") {
            std::cout << remex::routing::ExecutionTriple::ForCurrentHost().ToString() << std::endl;
            return 0;
        }
    } catch (const remex::config::ConfigError& ex) {
        std::cerr << "[config] " << ex.what() << std::endl;
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "[remex] " << ex.what() << std::endl;
        return 1;
    }

    PrintUsage();
    return 1;
}
