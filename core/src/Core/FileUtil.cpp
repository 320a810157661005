#include "FileUtil.h"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace CosmicConnect {
namespace FileUtil {

std::optional<std::string> readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        spdlog::warn("FileUtil: Failed to read {}", path);
        return std::nullopt;
    }
    return oss.str();
}

bool writeFileAtomic(const std::string& path, const std::string& data,
                     bool privateMode, std::string* error) {
    const std::string tmpPath = path + ".tmp";
    {
        std::ofstream file(tmpPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            if (error) *error = "Cannot open " + tmpPath + " for writing";
            return false;
        }
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file) {
            if (error) *error = "Failed to write " + tmpPath;
            return false;
        }
    }

    std::error_code ec;
    fs::permissions(tmpPath,
                    privateMode ? (fs::perms::owner_read | fs::perms::owner_write)
                                : (fs::perms::owner_read | fs::perms::owner_write |
                                   fs::perms::group_read | fs::perms::others_read),
                    fs::perm_options::replace, ec);
    if (ec) {
        spdlog::warn("FileUtil: Cannot set permissions on {}: {}", tmpPath, ec.message());
    }

    fs::rename(tmpPath, path, ec);
    if (ec) {
        if (error) *error = "Failed to rename " + tmpPath + ": " + ec.message();
        fs::remove(tmpPath, ec);
        return false;
    }
    return true;
}

bool ensureDirectory(const std::string& path, std::string* error) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        if (error) *error = "Cannot create directory " + path + ": " + ec.message();
        return false;
    }
    return true;
}

std::string joinPath(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    return (fs::path(dir) / name).string();
}

} // namespace FileUtil
} // namespace CosmicConnect
