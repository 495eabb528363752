#include "cache/packager.hpp"

#include <boost/process.hpp>
#include <sstream>
#include <string>
#include <vector>

#include "cache/package_errors.hpp"
#include "utils/logging.hpp"

namespace remex::cache {
namespace bp = boost::process;
namespace {

void RunTar(const std::vector<std::string>& args, const std::string& what) {
    const auto tar = bp::search_path("tar");
    if (tar.empty()) {
        throw UnpackError("tar not found on PATH");
    }
    try {
        bp::ipstream error_stream;
        bp::child child_process(
            tar,
            bp::args(args),
            bp::std_in.close(),
            bp::std_out > bp::null,
            bp::std_err > error_stream);

        std::ostringstream error_text;
        std::string line;
        while (std::getline(error_stream, line)) {
            error_text << line << "\n";
        }
        child_process.wait();
        if (child_process.exit_code() != 0) {
            throw UnpackError(what + " exited with code " + std::to_string(child_process.exit_code()) +
                              ": " + error_text.str());
        }
    } catch (const bp::process_error& ex) {
        throw UnpackError(what + ": " + ex.what());
    }
}

}  // namespace

void Packager::Unpack(const std::filesystem::path& archive, const std::filesystem::path& destination) const {
    if (!std::filesystem::exists(archive)) {
        throw UnpackError("archive does not exist: " + archive.string());
    }
    utils::LogDebug("packager", "unpacking", {{"archive", archive.string()}, {"dest", destination.string()}});
    RunTar({"-xzf", archive.string(), "-C", destination.string()}, "tar -x");
}

void Packager::Pack(const std::filesystem::path& source_dir, const std::filesystem::path& archive) const {
    if (!std::filesystem::is_directory(source_dir)) {
        throw UnpackError("not a directory: " + source_dir.string());
    }
    RunTar({"-czf", archive.string(), "-C", source_dir.string(), "."}, "tar -c");
}

}  // namespace remex::cache
