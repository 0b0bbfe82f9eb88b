#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace helpmirror {

// UTC instant; keeps whatever sub-second precision the catalog carried.
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

enum class PackageState { NotDownloaded, OutOfDate, Ready };

inline const char* packageStateLabel(PackageState s) {
    switch (s) {
        case PackageState::NotDownloaded: return "not downloaded";
        case PackageState::OutOfDate: return "out of date";
        case PackageState::Ready: return "ready";
        default: return "unknown";
    }
}

struct Locale {
    std::string code;        // e.g. "en-us"
    std::string name;        // display name; falls back to code
    std::string catalogLink; // relative link to the locale's book catalog
};

struct Package {
    std::string name; // identity, compared case-insensitively
    std::string link;
    uint64_t size{0};
    Timestamp lastModified{};
    std::string etag;
    uint64_t uncompressedSize{0};
    std::string constituentLink;
    bool deployed{true};
    PackageState state{PackageState::NotDownloaded};
};

struct Book {
    std::string code;
    std::string name;
    std::string locale;
    std::string category; // display grouping label
    std::string description;
    std::string vendor;
    bool wanted{false};
    std::vector<Package> packages;
};

struct BookGroup {
    std::string code;
    std::string name;
    std::string locale;
    std::string description;
    std::string vendor;
    std::vector<Book> books;
};

} // namespace helpmirror
