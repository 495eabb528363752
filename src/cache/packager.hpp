#pragma once

#include <filesystem>

namespace remex::cache {

// gzip'ed tar bundles. Both operations throw UnpackError on failure.
class Packager {
public:
    void Unpack(const std::filesystem::path& archive, const std::filesystem::path& destination) const;
    void Pack(const std::filesystem::path& source_dir, const std::filesystem::path& archive) const;
};

}  // namespace remex::cache
