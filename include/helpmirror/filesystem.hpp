#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "helpmirror/models.hpp"

namespace helpmirror {

struct FileStat {
    bool exists{false};
    uint64_t size{0};
    Timestamp modified{};
};

// Ensure a directory exists, creating it if necessary.
bool ensureDirectory(const std::string& path);
// Best-effort free-space query for a path (bytes).
uint64_t getFreeSpace(const std::string& path);

// stat() wrapper; a missing file is not an error (exists=false).
bool statFile(const std::string& path, FileStat& out, std::string& err);

// Regular files directly inside dir whose extension matches ext (".xml"),
// compared case-insensitively. Sorted by name.
bool listFilesWithExtension(const std::string& dir,
                            const std::string& ext,
                            std::vector<std::string>& outPaths,
                            std::string& err);

// Replaces the file with the given content (UTF-8, written verbatim).
bool writeTextFile(const std::string& path, const std::string& content, std::string& err);

bool removeFile(const std::string& path, std::string& err);

// Sets access and modification time. Birth time cannot be set on Linux.
bool setFileTimes(const std::string& path, Timestamp when, std::string& err);

} // namespace helpmirror
