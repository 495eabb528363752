#include "cache/package_loader.hpp"

#include <algorithm>
#include <chrono>
#include <regex>

#include "cache/package_errors.hpp"
#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace remex::cache {
namespace {

// build dirs left by the compile step, e.g. /tmp/remex-compilerAbC123/
const std::regex kTempBuildRoot(R"(^/tmp/[\w.-]*compiler[\w.-]*/)");

std::string StripTrailingSlash(std::string value) {
    while (value.size() > 1 && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

}  // namespace

RelocationTable::RelocationTable(std::filesystem::path work_dir)
    : work_dir_(std::move(work_dir)) {
    AddRoot("/app");
}

void RelocationTable::AddRoot(const std::string& build_root) {
    auto root = StripTrailingSlash(build_root);
    if (root.empty() || root == "/" || root.front() != '/') {
        return;
    }
    if (std::find(roots_.begin(), roots_.end(), root) != roots_.end()) {
        return;
    }
    roots_.push_back(std::move(root));
    std::sort(roots_.begin(), roots_.end(), [](const std::string& a, const std::string& b) {
        return a.size() > b.size();
    });
}

std::filesystem::path RelocationTable::Within(const std::filesystem::path& relative,
                                              const std::string& original) const {
    const auto normal = relative.lexically_normal();
    if (normal.empty() || *normal.begin() == "..") {
        throw CachePackageError("path escapes the package directory: " + original);
    }
    return work_dir_ / normal;
}

std::optional<std::filesystem::path> RelocationTable::Relocate(const std::string& path) const {
    if (path.empty()) {
        return std::nullopt;
    }
    if (path.front() != '/') {
        return Within(path, path);
    }
    for (const auto& root : roots_) {
        if (path.size() > root.size() + 1 && path.compare(0, root.size(), root) == 0 &&
            path[root.size()] == '/') {
            return Within(path.substr(root.size() + 1), path);
        }
    }
    std::smatch match;
    if (std::regex_search(path, match, kTempBuildRoot)) {
        return Within(path.substr(match.length(0)), path);
    }
    return std::nullopt;
}

BundleMetadata FetchAndUnpack(CacheClient& cache,
                              const Packager& packager,
                              const std::string& hash,
                              const std::filesystem::path& work_dir) {
    const auto start = std::chrono::steady_clock::now();

    auto result = cache.Get(hash);
    if (!result.hit) {
        throw CacheMissError(hash);
    }
    const auto archive = work_dir / kArchiveFilename;
    if (!utils::WriteFile(archive, result.data)) {
        throw UnpackError("cannot write " + archive.string());
    }
    utils::LogDebug("cache", "using cached package", {{"path", archive.string()}});
    packager.Unpack(archive, work_dir);

    const auto raw = utils::ReadFile(work_dir / kCompilationResultFilename);
    if (!raw) {
        throw CachePackageError(std::string(kCompilationResultFilename) + " is missing");
    }
    auto json = nlohmann::json::parse(*raw, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw CachePackageError(std::string(kCompilationResultFilename) + " is not a json object");
    }

    RelocationTable relocation(work_dir);
    BundleMetadata metadata{};
    metadata.dir_path = work_dir;
    try {
        const auto build_root = json.value("dirPath", "");
        relocation.AddRoot(build_root);

        const auto input_filename = json.value("inputFilename", "");
        if (!input_filename.empty()) {
            metadata.input_filename = work_dir / std::filesystem::path(input_filename).filename();
        }

        const auto executable_filename = json.value("executableFilename", "");
        if (executable_filename.empty()) {
            throw CachePackageError("no executableFilename recorded");
        }
        auto relocated = relocation.Relocate(executable_filename);
        metadata.executable_filename = relocated
            ? *relocated
            : work_dir / std::filesystem::path(executable_filename).filename();

        if (json.contains("defaultExecOptions") && json["defaultExecOptions"].is_object()) {
            const auto& defaults = json["defaultExecOptions"];
            if (defaults.contains("env") && defaults["env"].is_object()) {
                metadata.path_hint = defaults["env"].value("PATH", "");
            }
        }

        if (json.contains("preparedLdPaths") && json["preparedLdPaths"].is_array()) {
            for (const auto& item : json["preparedLdPaths"]) {
                if (!item.is_string()) {
                    continue;
                }
                const auto ld_path = item.get<std::string>();
                auto moved = relocation.Relocate(ld_path);
                metadata.prepared_ld_paths.push_back(moved ? moved->string() : ld_path);
            }
        }
    } catch (const nlohmann::json::exception& ex) {
        throw CachePackageError(ex.what());
    }

    if (!std::filesystem::is_regular_file(metadata.executable_filename)) {
        throw CachePackageError("executable missing from package: " + metadata.executable_filename.string());
    }

    const auto end = std::chrono::steady_clock::now();
    metadata.package_download_and_unzip_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    return metadata;
}

}  // namespace remex::cache
