#include "helpmirror/reconciler.hpp"
#include "helpmirror/filesystem.hpp"
#include "helpmirror/index_manager.hpp"
#include "helpmirror/logger.hpp"
#include "helpmirror/util.hpp"
#include <filesystem>
#include <map>

namespace helpmirror {

bool reconcile(std::vector<BookGroup>& groups, const std::string& cacheDirectory, ErrorInfo& err) {
    if (cacheDirectory.empty()) {
        err = makeError(ErrorCategory::InvalidArgument, ErrorCode::MissingArgument, "cacheDirectory is empty");
        return false;
    }

    const std::filesystem::path packagesDir = std::filesystem::path(cacheDirectory) / kPackagesDirName;
    std::map<std::string, std::string> cached;
    std::string listErr;
    if (!findPackageFiles(packagesDir.string(), cached, listErr)) {
        err = makeError(ErrorCategory::Filesystem, ErrorCode::IoFailure, listErr);
        return false;
    }

    size_t missing = 0, outOfDate = 0, ready = 0;
    for (auto& group : groups) {
        for (auto& book : group.books) {
            for (auto& package : book.packages) {
                FileStat st;
                std::string statErr;
                auto found = cached.find(util::toUpperAscii(package.name));
                if (found != cached.end() && !statFile(found->second, st, statErr)) {
                    err = makeError(ErrorCategory::Filesystem, ErrorCode::IoFailure, statErr);
                    return false;
                }
                if (!st.exists) {
                    package.state = PackageState::NotDownloaded;
                    ++missing;
                } else if (st.modified == package.lastModified && st.size == package.size) {
                    package.state = PackageState::OutOfDate;
                    ++outOfDate;
                } else {
                    package.state = PackageState::Ready;
                    ++ready;
                }
            }
        }
    }
    logDebug("Reconciled against " + cacheDirectory + ": " + std::to_string(missing) + " missing, " +
             std::to_string(outOfDate) + " out of date, " + std::to_string(ready) + " ready", "REC");
    return true;
}

BookSummary summarizeBook(const Book& book) {
    BookSummary s;
    s.packageCount = book.packages.size();
    for (const auto& p : book.packages) {
        s.totalSize += p.size;
        if (p.state != PackageState::Ready) {
            s.downloadSize += p.size;
            ++s.packagesOutOfDate;
        }
        if (p.state != PackageState::NotDownloaded) {
            ++s.packagesCached;
        }
    }
    return s;
}

void applyDefaultSelection(std::vector<BookGroup>& groups) {
    for (auto& group : groups) {
        for (auto& book : group.books) {
            book.wanted = summarizeBook(book).packagesCached > 1;
        }
    }
}

} // namespace helpmirror
