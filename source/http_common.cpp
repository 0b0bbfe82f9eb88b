#include "helpmirror/http_common.hpp"
#include "helpmirror/util.hpp"

namespace helpmirror {

namespace {

// Length of the "http://" or "https://" prefix, 0 for anything else.
size_t schemeLength(const std::string& url) {
    if (url.size() >= 7 && util::equalsIgnoreCase(url.substr(0, 7), "http://")) return 7;
    if (url.size() >= 8 && util::equalsIgnoreCase(url.substr(0, 8), "https://")) return 8;
    return 0;
}

} // namespace

bool isHttpUrl(const std::string& url) {
    const size_t start = schemeLength(url);
    if (start == 0) return false;
    const size_t hostEnd = url.find_first_of(":/?#", start);
    return hostEnd == std::string::npos ? url.size() > start : hostEnd > start;
}

std::string resolveUrl(const std::string& base, const std::string& link) {
    if (schemeLength(link) != 0) return link;
    if (!link.empty() && link.front() == '/') {
        auto schemeEnd = base.find("://");
        auto hostEnd = schemeEnd == std::string::npos ? std::string::npos : base.find('/', schemeEnd + 3);
        std::string origin = hostEnd == std::string::npos ? base : base.substr(0, hostEnd);
        return origin + link;
    }
    if (!base.empty() && base.back() == '/') return base + link;
    return base + "/" + link;
}

} // namespace helpmirror
