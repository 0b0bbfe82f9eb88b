#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "helpmirror/errors.hpp"
#include "helpmirror/models.hpp"

namespace helpmirror {

// Annotates every package with its cache state by comparing
// <cacheDirectory>/Packages/<packageFileName> against the recorded size and
// last-modified time. A file matching both is marked OutOfDate and a file
// differing in either is marked Ready. Missing files are NotDownloaded.
bool reconcile(std::vector<BookGroup>& groups, const std::string& cacheDirectory, ErrorInfo& err);

struct BookSummary {
    uint64_t totalSize{0};
    uint64_t downloadSize{0};    // packages not Ready
    size_t packageCount{0};
    size_t packagesOutOfDate{0}; // packages not Ready
    size_t packagesCached{0};    // packages not NotDownloaded
};

BookSummary summarizeBook(const Book& book);

// Pre-selects books with more than one cached package.
void applyDefaultSelection(std::vector<BookGroup>& groups);

} // namespace helpmirror
