#pragma once

#include <map>
#include <string>
#include <vector>
#include "helpmirror/errors.hpp"
#include "helpmirror/models.hpp"

namespace helpmirror {

// Index file naming shared by the renderer and the sync engine.
constexpr const char* kSetupIndexFileName = "HelpContentSetup.msha";
constexpr const char* kSetupIndexExtension = ".msha";
constexpr const char* kIndexExtension = ".xml";
constexpr const char* kPackageExtension = ".cab";
constexpr const char* kPackagesDirName = "Packages";

// Catalog payload parsing. Both fail with a Parse error when the document is
// not well-formed or lacks the expected root/container shape; outputs are
// only assigned on success.
bool parseLocales(const std::string& bytes, std::vector<Locale>& outLocales, ErrorInfo& err);
bool parseCatalog(const std::string& bytes, std::vector<BookGroup>& outGroups, ErrorInfo& err);

// Index rendering. Output depends only on the model, never on wanted flags
// (except that renderBookIndex is only called for wanted books).
std::string renderSetupIndex(const std::vector<BookGroup>& groups);
std::string renderGroupIndex(const BookGroup& group);
std::string renderBookIndex(const BookGroup& group, const Book& book);

std::string packageFileName(const Package& package);
std::string bookFileName(const Book& book);
std::string groupFileName(const BookGroup& group);

// A package name must map to a single file inside Packages/: not empty, not
// "." or "..", and free of path separators and NUL.
bool isSafePackageName(const std::string& name);

// Existing *.cab files in packagesDir keyed by upper-cased stem. When two files
// share a key the first in sorted order wins. A missing directory is empty.
bool findPackageFiles(const std::string& packagesDir,
                      std::map<std::string, std::string>& outByKey,
                      std::string& err);

// ISO-8601 in UTC: YYYY-MM-DDTHH:MM:SS[.fraction][Z|+hh:mm|-hh:mm].
bool parseTimestamp(const std::string& text, Timestamp& out);
std::string formatTimestamp(Timestamp ts);

} // namespace helpmirror
