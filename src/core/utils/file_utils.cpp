#include "file_utils.h"

#include <fstream>
#include <iterator>
#include <system_error>

#include "log.h"

namespace mc {

namespace {

constexpr const char* kLogModule = "FileIO";

// Runs a filesystem call taking std::error_code& and logs on failure
template <typename F> bool fsOp(const char* opName, const Path& path, F&& fn) {
    std::error_code ec;
    fn(ec);
    if (ec) {
        log::errorf(kLogModule, "Failed to %s: %s (%s)", opName, path.string().c_str(),
                    ec.message().c_str());
        return false;
    }
    return true;
}

} // anonymous namespace

namespace file {

Result<std::string> readText(const Path& path) {
    std::ifstream file(path, std::ios::in);
    if (!file.is_open()) {
        log::errorf(kLogModule, "Failed to open for reading: %s", path.string().c_str());
        return std::nullopt;
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        log::errorf(kLogModule, "Read error: %s", path.string().c_str());
        return std::nullopt;
    }
    return content;
}

bool writeText(const Path& path, std::string_view content) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        log::errorf(kLogModule, "Failed to open for writing: %s", path.string().c_str());
        return false;
    }

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    return file.good();
}

bool writeTextAtomic(const Path& path, std::string_view content) {
    const Path tempPath = path.string() + ".tmp";
    if (!writeText(tempPath, content)) {
        std::error_code ec;
        fs::remove(tempPath, ec);
        return false;
    }

    if (!fsOp("replace", path, [&](std::error_code& ec) { fs::rename(tempPath, path, ec); })) {
        std::error_code ec;
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

bool exists(const Path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool createDirectories(const Path& path) {
    if (path.empty()) {
        return true;
    }
    bool created = false;
    fsOp("create directories", path,
         [&](std::error_code& ec) { created = fs::create_directories(path, ec); });
    return created || file::exists(path);
}

} // namespace file
} // namespace mc
