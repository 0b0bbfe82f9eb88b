#include "helpmirror/filesystem.hpp"
#include "helpmirror/logger.hpp"
#include "helpmirror/raii.hpp"
#include "helpmirror/util.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>

namespace helpmirror {

bool ensureDirectory(const std::string& path) {
    std::filesystem::path p(path);
    std::error_code ec;
    bool ok = std::filesystem::create_directories(p, ec) || std::filesystem::is_directory(p, ec);
    if (!ok) logError("Failed to ensure directory: " + path, "FS");
    return ok;
}

uint64_t getFreeSpace(const std::string& path) {
    struct statvfs s{};
    if (statvfs(path.c_str(), &s) != 0) return 0;
    return static_cast<uint64_t>(s.f_bavail) * static_cast<uint64_t>(s.f_frsize);
}

bool statFile(const std::string& path, FileStat& out, std::string& err) {
    out = FileStat{};
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) return true;
        err = "stat failed for " + path + ": " + std::strerror(errno);
        return false;
    }
    if (!S_ISREG(st.st_mode)) return true;
    out.exists = true;
    out.size = static_cast<uint64_t>(st.st_size);
    out.modified = Timestamp(std::chrono::seconds(st.st_mtim.tv_sec) +
                             std::chrono::nanoseconds(st.st_mtim.tv_nsec));
    return true;
}

bool listFilesWithExtension(const std::string& dir,
                            const std::string& ext,
                            std::vector<std::string>& outPaths,
                            std::string& err) {
    outPaths.clear();
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        err = "Cannot list " + dir + ": " + ec.message();
        return false;
    }
    for (const auto& entry : it) {
        std::error_code typeEc;
        if (!entry.is_regular_file(typeEc)) continue;
        if (!util::equalsIgnoreCase(entry.path().extension().string(), ext)) continue;
        outPaths.push_back(entry.path().string());
    }
    std::sort(outPaths.begin(), outPaths.end());
    return true;
}

bool writeTextFile(const std::string& path, const std::string& content, std::string& err) {
    UniqueFile f(std::fopen(path.c_str(), "wb"));
    if (!f) {
        err = "Open failed for " + path + ": " + std::strerror(errno);
        return false;
    }
    if (!content.empty() && std::fwrite(content.data(), 1, content.size(), f.f) != content.size()) {
        err = "Write failed for " + path + ": " + std::strerror(errno);
        return false;
    }
    if (!f.close()) {
        err = "Write failed for " + path + " (close): " + std::strerror(errno);
        return false;
    }
    return true;
}

bool removeFile(const std::string& path, std::string& err) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        err = "Delete failed for " + path + ": " + ec.message();
        return false;
    }
    return true;
}

bool setFileTimes(const std::string& path, Timestamp when, std::string& err) {
    auto since = when.time_since_epoch();
    auto secs = std::chrono::floor<std::chrono::seconds>(since);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since - secs);
    struct timespec times[2];
    times[0].tv_sec = static_cast<time_t>(secs.count());
    times[0].tv_nsec = static_cast<long>(nanos.count());
    times[1] = times[0];
    if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
        err = "Setting timestamps failed for " + path + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

} // namespace helpmirror
