#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "cache/cache_client.hpp"
#include "cache/packager.hpp"

namespace remex::cache {

constexpr const char* kCompilationResultFilename = "compilation-result.json";
// Where the fetched archive is staged inside the work dir.
constexpr const char* kArchiveFilename = "package.tgz";

// Maps paths recorded at build time onto the directory a bundle was unpacked
// into. Roots are matched longest first.
class RelocationTable {
public:
    explicit RelocationTable(std::filesystem::path work_dir);

    void AddRoot(const std::string& build_root);

    // Relative paths land under the work dir; absolute paths only when they
    // sit below a known root or a temporary compiler build dir. Throws
    // CachePackageError for a path escaping the work dir.
    std::optional<std::filesystem::path> Relocate(const std::string& path) const;

    const std::filesystem::path& WorkDir() const { return work_dir_; }

private:
    std::filesystem::path Within(const std::filesystem::path& relative, const std::string& original) const;

    std::filesystem::path work_dir_;
    std::vector<std::string> roots_;
};

struct BundleMetadata {
    std::filesystem::path dir_path;
    std::filesystem::path executable_filename;
    std::filesystem::path input_filename;
    std::string path_hint;
    std::vector<std::string> prepared_ld_paths;
    long long package_download_and_unzip_ms = 0;
};

// Throws CacheMissError, UnpackError or CachePackageError.
BundleMetadata FetchAndUnpack(CacheClient& cache,
                              const Packager& packager,
                              const std::string& hash,
                              const std::filesystem::path& work_dir);

}  // namespace remex::cache
