#include "helpmirror/catalog_client.hpp"
#include "helpmirror/http_common.hpp"
#include "helpmirror/index_manager.hpp"
#include "helpmirror/logger.hpp"
#include "helpmirror/util.hpp"

namespace helpmirror {

const std::vector<std::string>& supportedVersionTokens() {
    static const std::vector<std::string> tokens = {
        "visualstudio11", "visualstudio12", "dev14", "dev15"};
    return tokens;
}

bool loadAvailableLocales(Transport& transport,
                          const std::string& catalogBaseUrl,
                          const std::string& versionToken,
                          std::vector<Locale>& outLocales,
                          ErrorInfo& err) {
    if (versionToken.empty()) {
        err = makeError(ErrorCategory::InvalidArgument, ErrorCode::MissingArgument, "Version token is empty");
        return false;
    }
    if (catalogBaseUrl.empty()) {
        err = makeError(ErrorCategory::InvalidArgument, ErrorCode::MissingArgument, "Catalog base URL is empty");
        return false;
    }

    const std::string url = resolveUrl(catalogBaseUrl, "catalogs/" + versionToken);
    logInfo("Loading locales from " + url, "APP");
    std::string body;
    if (!transport.get(url, body, err)) {
        logError("Locale fetch failed: " + describeError(err), "APP");
        return false;
    }
    if (!parseLocales(body, outLocales, err)) {
        logError("Locale parse failed: " + err.detail, "APP");
        return false;
    }
    logInfo("Found " + std::to_string(outLocales.size()) + " locales", "APP");
    return true;
}

bool loadBooksInformation(Transport& transport,
                          const std::string& catalogBaseUrl,
                          const std::string& catalogLink,
                          std::vector<BookGroup>& outGroups,
                          ErrorInfo& err) {
    if (catalogLink.empty()) {
        err = makeError(ErrorCategory::InvalidArgument, ErrorCode::MissingArgument, "Catalog link is empty");
        return false;
    }

    const std::string url = resolveUrl(catalogBaseUrl, catalogLink);
    logInfo("Loading book catalog from " + url, "APP");
    std::string body;
    if (!transport.get(url, body, err)) {
        logError("Catalog fetch failed: " + describeError(err), "APP");
        return false;
    }
    if (!parseCatalog(body, outGroups, err)) {
        logError("Catalog parse failed: " + err.detail, "APP");
        return false;
    }
    size_t books = 0;
    for (const auto& g : outGroups) books += g.books.size();
    logInfo("Catalog has " + std::to_string(outGroups.size()) + " groups, " +
            std::to_string(books) + " books", "APP");
    return true;
}

const Locale* findLocale(const std::vector<Locale>& locales, const std::string& code) {
    for (const auto& l : locales) {
        if (util::equalsIgnoreCase(l.code, code)) return &l;
    }
    return nullptr;
}

} // namespace helpmirror
