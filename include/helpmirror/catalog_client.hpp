#pragma once

#include <string>
#include <vector>
#include "helpmirror/errors.hpp"
#include "helpmirror/models.hpp"
#include "helpmirror/transport.hpp"

namespace helpmirror {

// Catalog versions known to the service, oldest first.
const std::vector<std::string>& supportedVersionTokens();

// Fetches <catalogBaseUrl>catalogs/<versionToken> and parses the locale list.
bool loadAvailableLocales(Transport& transport,
                          const std::string& catalogBaseUrl,
                          const std::string& versionToken,
                          std::vector<Locale>& outLocales,
                          ErrorInfo& err);

// Fetches a locale's book catalog (catalogLink resolved against the base).
bool loadBooksInformation(Transport& transport,
                          const std::string& catalogBaseUrl,
                          const std::string& catalogLink,
                          std::vector<BookGroup>& outGroups,
                          ErrorInfo& err);

// Case-insensitive lookup by locale code; nullptr when absent.
const Locale* findLocale(const std::vector<Locale>& locales, const std::string& code);

} // namespace helpmirror
