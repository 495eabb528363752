#pragma once

#include <filesystem>
#include <string>

namespace remex::cache {

struct CacheResult {
    bool hit = false;
    std::string data;
};

// Content addressed artifact store keyed by hash. Reads have no side effects.
class CacheClient {
public:
    virtual ~CacheClient() = default;
    virtual CacheResult Get(const std::string& hash) = 0;
    virtual bool Put(const std::string& hash, const std::string& data) = 0;
};

// One file per hash below `root`, fanned out by the first two characters.
class DiskCache : public CacheClient {
public:
    explicit DiskCache(std::filesystem::path root);

    CacheResult Get(const std::string& hash) override;
    bool Put(const std::string& hash, const std::string& data) override;

    const std::filesystem::path& Root() const { return root_; }

private:
    std::filesystem::path PathFor(const std::string& hash) const;
    static bool IsValidHash(const std::string& hash);

    std::filesystem::path root_;
};

}  // namespace remex::cache
