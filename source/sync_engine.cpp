#include "helpmirror/sync_engine.hpp"
#include "helpmirror/filesystem.hpp"
#include "helpmirror/http_common.hpp"
#include "helpmirror/index_manager.hpp"
#include "helpmirror/logger.hpp"
#include "helpmirror/util.hpp"

#include <chrono>
#include <cmath>
#include <filesystem>
#include <map>
#include <unordered_map>

namespace helpmirror {

namespace {

namespace fs = std::filesystem;

constexpr auto kTickInterval = std::chrono::milliseconds(500);

// Distinct packages of the wanted books, keyed by upper-cased name and kept in
// insertion order. The first occurrence of a name supplies link and metadata;
// later occurrences only share its resulting state.
struct PackageEntry {
    std::string key;
    std::vector<Package*> owners; // owners[0] is the authoritative copy
};

class PackageSet {
public:
    void add(Package& pkg) {
        std::string key = util::toUpperAscii(pkg.name);
        auto it = index_.find(key);
        if (it != index_.end()) {
            logDebug("Duplicate package " + pkg.name + " ignored", "SYNC");
            entries_[it->second].owners.push_back(&pkg);
            return;
        }
        index_.emplace(key, entries_.size());
        entries_.push_back(PackageEntry{std::move(key), {&pkg}});
    }

    bool contains(const std::string& key) const { return index_.count(key) != 0; }
    std::vector<PackageEntry>& entries() { return entries_; }
    size_t size() const { return entries_.size(); }

private:
    std::vector<PackageEntry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

void emitFileStatus(const SyncCallbacks& cb, const std::string& name, int percent, int64_t received, int64_t total) {
    if (!cb.fileStatus) return;
    FileStatus fs;
    fs.filename = name;
    fs.percent = percent;
    fs.bytesDownloaded = received;
    fs.bytesToDownload = total;
    cb.fileStatus(fs);
}

bool writeIndex(const fs::path& path, const std::string& content, ErrorInfo& err) {
    std::string e;
    if (!writeTextFile(path.string(), content, e)) {
        err = makeError(ErrorCategory::Filesystem, ErrorCode::IoFailure, e);
        return false;
    }
    logDebug("Wrote " + path.string(), "IDX");
    return true;
}

bool removeStaleIndexes(const fs::path& cacheDir, ErrorInfo& err) {
    for (const char* ext : {kSetupIndexExtension, kIndexExtension}) {
        std::vector<std::string> files;
        std::string e;
        if (!listFilesWithExtension(cacheDir.string(), ext, files, e)) {
            err = makeError(ErrorCategory::Filesystem, ErrorCode::IoFailure, e);
            return false;
        }
        for (const auto& f : files) {
            if (!removeFile(f, e)) {
                err = makeError(ErrorCategory::Filesystem, ErrorCode::IoFailure, e);
                return false;
            }
        }
    }
    return true;
}

// Advisory: a failed delete is logged and the sync carries on.
void removeOrphanPackages(const fs::path& packagesDir, const PackageSet& keep) {
    std::vector<std::string> files;
    std::string e;
    if (!listFilesWithExtension(packagesDir.string(), kPackageExtension, files, e)) {
        logWarn("Orphan scan failed: " + e, "SYNC");
        return;
    }
    for (const auto& f : files) {
        const std::string key = util::toUpperAscii(fs::path(f).stem().string());
        if (keep.contains(key)) continue;
        if (removeFile(f, e)) {
            logInfo("Removed orphan " + f, "SYNC");
        } else {
            logWarn("Orphan delete failed: " + e, "SYNC");
        }
    }
}

bool fetchPackage(const Package& pkg,
                  const fs::path& target,
                  const SyncEnvironment& env,
                  const SyncCallbacks& cb,
                  ErrorInfo& err) {
    const std::string name = packageFileName(pkg);
    const std::string url = resolveUrl(env.packageBaseUrl, pkg.link);
    logInfo("Downloading " + name + " (" + packageStateLabel(pkg.state) + ") from " + url, "SYNC");

    emitFileStatus(cb, name, 0, -1, -1);

    // Ticks arrive per socket read; forward one when the percent moves or
    // the interval has passed.
    int lastPercent = -1;
    auto lastEmit = std::chrono::steady_clock::now();
    TransferTick onTick = [&](uint64_t received, int64_t total) {
        int percent = 0;
        if (total > 0) percent = static_cast<int>((received * 100) / static_cast<uint64_t>(total));
        if (percent > 100) percent = 100;
        const auto now = std::chrono::steady_clock::now();
        if (percent == lastPercent && now - lastEmit < kTickInterval) return;
        lastPercent = percent;
        lastEmit = now;
        emitFileStatus(cb, name, percent, static_cast<int64_t>(received), total);
    };

    if (!env.transport->download(url, target.string(), onTick, err)) {
        logError("Download failed for " + name + ": " + describeError(err), "SYNC");
        return false;
    }

    emitFileStatus(cb, name, 100, -1, -1);

    if (!env.verifier->isTrusted(target.string())) {
        std::string e;
        if (!removeFile(target.string(), e)) logWarn("Could not remove rejected package: " + e, "SYNC");
        err = makeError(ErrorCategory::Integrity, ErrorCode::SignatureInvalid,
                        "Signature verification failed for " + name);
        logError(err.detail, "SYNC");
        return false;
    }

    std::string e;
    if (!setFileTimes(target.string(), pkg.lastModified, e)) {
        err = makeError(ErrorCategory::Filesystem, ErrorCode::IoFailure, e);
        return false;
    }
    return true;
}

} // namespace

bool syncBooks(std::vector<BookGroup>& groups,
               const std::string& cacheDirectory,
               const SyncEnvironment& env,
               const SyncCallbacks& callbacks,
               ErrorInfo& err) {
    if (cacheDirectory.empty()) {
        err = makeError(ErrorCategory::InvalidArgument, ErrorCode::MissingArgument, "Cache directory is empty");
        return false;
    }
    if (!env.transport || !env.verifier) {
        err = makeError(ErrorCategory::InvalidArgument, ErrorCode::MissingArgument,
                        "Sync requires a transport and a trust verifier");
        return false;
    }

    for (const auto& group : groups) {
        for (const auto& book : group.books) {
            if (!book.wanted) continue;
            for (const auto& pkg : book.packages) {
                if (isSafePackageName(pkg.name)) continue;
                err = makeError(ErrorCategory::Parse, ErrorCode::ParseFailure,
                                "Package name is not a plain file name: '" + pkg.name + "'");
                logError(err.detail, "SYNC");
                return false;
            }
        }
    }

    const fs::path cacheDir(cacheDirectory);
    const fs::path packagesDir = cacheDir / kPackagesDirName;
    if (!ensureDirectory(packagesDir.string())) {
        err = makeError(ErrorCategory::Filesystem, ErrorCode::IoFailure,
                        "Cannot create directory " + packagesDir.string());
        return false;
    }

    if (!removeStaleIndexes(cacheDir, err)) return false;
    if (!writeIndex(cacheDir / kSetupIndexFileName, renderSetupIndex(groups), err)) return false;

    PackageSet packages;
    uint64_t bytesNeeded = 0;
    for (auto& group : groups) {
        if (!writeIndex(cacheDir / groupFileName(group), renderGroupIndex(group), err)) return false;
        for (auto& book : group.books) {
            if (!book.wanted) continue;
            if (!writeIndex(cacheDir / bookFileName(book), renderBookIndex(group, book), err)) return false;
            for (auto& pkg : book.packages) {
                packages.add(pkg);
            }
        }
    }
    for (auto& entry : packages.entries()) {
        if (entry.owners[0]->state != PackageState::Ready) bytesNeeded += entry.owners[0]->size;
    }
    logInfo(std::to_string(packages.size()) + " distinct packages, " +
            util::formatMegabytes(bytesNeeded) + " MB to download", "SYNC");

    const uint64_t freeBytes = getFreeSpace(cacheDir.string());
    if (freeBytes > 0 && bytesNeeded > freeBytes) {
        logWarn("Only " + util::formatMegabytes(freeBytes) + " MB free in " + cacheDir.string(), "SYNC");
    }

    removeOrphanPackages(packagesDir, packages);

    // A cached file whose name differs only in case is downloaded over in place.
    std::map<std::string, std::string> cached;
    std::string listErr;
    if (!findPackageFiles(packagesDir.string(), cached, listErr)) {
        err = makeError(ErrorCategory::Filesystem, ErrorCode::IoFailure, listErr);
        return false;
    }

    const size_t total = packages.size();
    size_t processed = 0;
    for (auto& entry : packages.entries()) {
        Package& pkg = *entry.owners[0];
        if (pkg.state != PackageState::Ready) {
            auto found = cached.find(entry.key);
            const fs::path target = found != cached.end() ? fs::path(found->second) : packagesDir / packageFileName(pkg);
            if (!fetchPackage(pkg, target, env, callbacks, err)) return false;
            for (Package* owner : entry.owners) owner->state = PackageState::Ready;
        }
        ++processed;
        if (callbacks.progress) {
            callbacks.progress(static_cast<int>(std::lround(100.0 * static_cast<double>(processed) /
                                                            static_cast<double>(total))));
        }
    }

    logInfo("Sync complete: " + std::to_string(processed) + " packages", "SYNC");
    return true;
}

} // namespace helpmirror
