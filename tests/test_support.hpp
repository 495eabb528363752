#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "cache/cache_client.hpp"
#include "notify/result_notifier.hpp"
#include "utils/common.hpp"

namespace remex::testing {

// Writes an executable /bin/sh script.
void WriteScript(const std::filesystem::path& path, const std::string& body);

// Packs a bundle holding `program` (a shell script with `script_body`) and a
// compilation-result.json recorded under the /app build root, then stores it
// in `cache` under `hash`.
void PutScriptBundle(cache::CacheClient& cache,
                     const std::string& hash,
                     const std::string& script_body,
                     const std::string& path_hint = "/usr/bin:/bin");

// Packs an arbitrary directory tree into `cache` under `hash`.
void PutDirectoryBundle(cache::CacheClient& cache,
                        const std::string& hash,
                        const std::filesystem::path& source_dir);

struct SentResult {
    std::string guid;
    nlohmann::json result;
};

// Shared log of everything RecordingNotifier instances delivered.
class NotificationLog {
public:
    void Add(SentResult sent);
    void Closed();
    std::vector<SentResult> Sent() const;
    int CloseCount() const;

private:
    mutable std::mutex mutex_;
    std::vector<SentResult> sent_;
    int closed_ = 0;
};

class RecordingNotifier : public notify::ResultNotifier {
public:
    explicit RecordingNotifier(std::shared_ptr<NotificationLog> log);

    void Send(const std::string& guid, const nlohmann::json& result) override;
    void Close() override;

private:
    std::shared_ptr<NotificationLog> log_;
};

notify::NotifierFactory RecordingNotifierFactory(std::shared_ptr<NotificationLog> log);

// Joined text of a result's stdout/stderr line array.
std::string JoinLines(const nlohmann::json& lines);

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
    ScopedEnv(std::string name, const std::string& value);
    ~ScopedEnv();

private:
    std::string name_;
};

}  // namespace remex::testing
