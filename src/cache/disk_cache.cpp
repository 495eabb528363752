#include "cache/cache_client.hpp"

#include <system_error>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace remex::cache {

DiskCache::DiskCache(std::filesystem::path root)
    : root_(std::move(root)) {}

bool DiskCache::IsValidHash(const std::string& hash) {
    if (hash.empty() || hash == "." || hash == "..") {
        return false;
    }
    return hash.find('/') == std::string::npos && hash.find('\\') == std::string::npos &&
        hash.find("..") == std::string::npos;
}

std::filesystem::path DiskCache::PathFor(const std::string& hash) const {
    const auto shard = hash.size() >= 2 ? hash.substr(0, 2) : hash;
    return root_ / shard / hash;
}

CacheResult DiskCache::Get(const std::string& hash) {
    if (!IsValidHash(hash)) {
        utils::LogWarn("cache", "rejecting invalid hash", {{"hash", hash}});
        return {};
    }
    auto data = utils::ReadFile(PathFor(hash));
    if (!data) {
        return {};
    }
    return CacheResult{true, std::move(*data)};
}

bool DiskCache::Put(const std::string& hash, const std::string& data) {
    if (!IsValidHash(hash)) {
        return false;
    }
    const auto target = PathFor(hash);
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        utils::LogError("cache", "failed to create cache directory",
                        {{"path", target.parent_path().string()}, {"error", ec.message()}});
        return false;
    }
    const auto staging = target.parent_path() / (hash + ".tmp." + utils::RandomHex(4));
    if (!utils::WriteFile(staging, data)) {
        std::filesystem::remove(staging, ec);
        return false;
    }
    std::filesystem::rename(staging, target, ec);
    if (ec) {
        utils::LogError("cache", "failed to publish cache entry",
                        {{"hash", hash}, {"error", ec.message()}});
        std::filesystem::remove(staging, ec);
        return false;
    }
    return true;
}

}  // namespace remex::cache
