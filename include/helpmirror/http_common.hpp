#pragma once

#include <string>

namespace helpmirror {

// True for http:// and https:// URLs (scheme case-insensitive) with a host.
bool isHttpUrl(const std::string& url);

// Resolve link against base the way the catalog service expects: absolute
// URLs pass through, "/x" replaces the base path, anything else is appended
// to the base directory.
std::string resolveUrl(const std::string& base, const std::string& link);

} // namespace helpmirror
