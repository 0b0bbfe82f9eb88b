#include "helpmirror/index_manager.hpp"
#include "helpmirror/filesystem.hpp"
#include "helpmirror/logger.hpp"
#include "helpmirror/util.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <memory>
#include <sstream>

namespace helpmirror {

namespace {

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

std::string takeXmlString(xmlChar* s) {
    if (!s) return {};
    std::string out(reinterpret_cast<const char*>(s));
    xmlFree(s);
    return out;
}

std::string attribute(xmlNode* node, const char* name) {
    return takeXmlString(xmlGetProp(node, reinterpret_cast<const xmlChar*>(name)));
}

bool isElement(const xmlNode* node, const char* localName = nullptr) {
    if (!node || node->type != XML_ELEMENT_NODE) return false;
    if (!localName) return true;
    return xmlStrcmp(node->name, reinterpret_cast<const xmlChar*>(localName)) == 0;
}

// The class attribute may carry several whitespace-separated tokens.
bool hasClass(xmlNode* node, const std::string& cls) {
    if (!isElement(node)) return false;
    std::istringstream tokens(attribute(node, "class"));
    std::string tok;
    while (tokens >> tok) {
        if (tok == cls) return true;
    }
    return false;
}

xmlNode* childByClass(xmlNode* parent, const std::string& cls) {
    for (xmlNode* c = parent ? parent->children : nullptr; c; c = c->next) {
        if (hasClass(c, cls)) return c;
    }
    return nullptr;
}

std::vector<xmlNode*> childrenByClass(xmlNode* parent, const std::string& cls) {
    std::vector<xmlNode*> out;
    for (xmlNode* c = parent ? parent->children : nullptr; c; c = c->next) {
        if (hasClass(c, cls)) out.push_back(c);
    }
    return out;
}

xmlNode* descendantByClass(xmlNode* node, const std::string& cls) {
    for (xmlNode* c = node ? node->children : nullptr; c; c = c->next) {
        if (!isElement(c)) continue;
        if (hasClass(c, cls)) return c;
        if (xmlNode* found = descendantByClass(c, cls)) return found;
    }
    return nullptr;
}

std::string childText(xmlNode* parent, const std::string& cls) {
    xmlNode* c = childByClass(parent, cls);
    if (!c) return {};
    return util::trimCopy(takeXmlString(xmlNodeGetContent(c)));
}

std::string childHref(xmlNode* parent, const std::string& cls) {
    xmlNode* c = childByClass(parent, cls);
    if (!c) return {};
    return util::trimCopy(attribute(c, "href"));
}

bool parseUnsigned(const std::string& text, uint64_t& out) {
    if (text.empty() || text[0] == '-' || text[0] == '+') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(text.c_str(), &end, 10);
    if (errno == ERANGE || !end || *end != '\0') return false;
    out = static_cast<uint64_t>(v);
    return true;
}

int daysInMonth(int year, int month) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && ((year % 4 == 0 && year % 100 != 0) || year % 400 == 0)) return 29;
    return kDays[month - 1];
}

bool loadXhtml(const std::string& bytes, const char* what, XmlDocPtr& outDoc, xmlNode*& outRoot, ErrorInfo& err) {
    if (bytes.size() > static_cast<size_t>(INT_MAX)) {
        err = makeError(ErrorCategory::Parse, ErrorCode::ParseFailure, std::string(what) + " payload too large");
        return false;
    }
    xmlInitParser();
    xmlResetLastError();
    XmlDocPtr doc(xmlReadMemory(bytes.data(), static_cast<int>(bytes.size()), what, nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc) {
        std::string detail = std::string("Malformed ") + what + " payload";
        const xmlError* xe = xmlGetLastError();
        if (xe && xe->message) {
            detail += " (line " + std::to_string(xe->line) + "): " + util::trimCopy(xe->message);
        }
        err = makeError(ErrorCategory::Parse, ErrorCode::ParseFailure, detail);
        return false;
    }
    xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!isElement(root, "html")) {
        err = makeError(ErrorCategory::Parse, ErrorCode::ParseFailure,
                        std::string(what) + " payload is missing the html root element");
        return false;
    }
    outDoc = std::move(doc);
    outRoot = root;
    return true;
}

bool parsePackage(xmlNode* node, Package& p, ErrorInfo& err) {
    p.name = childText(node, "name");
    p.link = childHref(node, "current-link");
    if (p.name.empty() || p.link.empty()) {
        err = makeError(ErrorCategory::Parse, ErrorCode::ParseFailure,
                        "Package entry missing name or current-link" + (p.name.empty() ? std::string() : ": " + p.name));
        return false;
    }
    if (!isSafePackageName(p.name)) {
        err = makeError(ErrorCategory::Parse, ErrorCode::ParseFailure,
                        "Package name is not a plain file name: '" + p.name + "'");
        return false;
    }
    const std::string size = childText(node, "package-size-bytes");
    if (!parseUnsigned(size, p.size)) {
        err = makeError(ErrorCategory::Parse, ErrorCode::ParseFailure,
                        "Package " + p.name + " has malformed package-size-bytes '" + size + "'");
        return false;
    }
    const std::string uncompressed = childText(node, "package-size-bytes-uncompressed");
    if (!uncompressed.empty() && !parseUnsigned(uncompressed, p.uncompressedSize)) {
        err = makeError(ErrorCategory::Parse, ErrorCode::ParseFailure,
                        "Package " + p.name + " has malformed package-size-bytes-uncompressed '" + uncompressed + "'");
        return false;
    }
    const std::string modified = childText(node, "last-modified");
    if (!parseTimestamp(modified, p.lastModified)) {
        err = makeError(ErrorCategory::Parse, ErrorCode::ParseFailure,
                        "Package " + p.name + " has malformed last-modified '" + modified + "'");
        return false;
    }
    p.etag = childText(node, "package-etag");
    p.constituentLink = childHref(node, "package-constituent-link");
    const std::string deployed = toLowerCopy(childText(node, "deployed"));
    p.deployed = deployed.empty() || deployed == "true";
    p.state = PackageState::NotDownloaded;
    return true;
}

bool parseBook(xmlNode* node, const BookGroup& group, Book& b, ErrorInfo& err) {
    b.name = childText(node, "name");
    b.code = childText(node, "id");
    if (b.code.empty()) b.code = b.name;
    if (b.code.empty()) {
        err = makeError(ErrorCategory::Parse, ErrorCode::ParseFailure,
                        "Book entry in group " + group.name + " has neither id nor name");
        return false;
    }
    b.locale = childText(node, "locale");
    if (b.locale.empty()) b.locale = group.locale;
    b.description = childText(node, "description");
    b.category = childText(node, "category");
    if (b.category.empty()) b.category = group.name;
    b.vendor = childText(node, "vendor");
    if (b.vendor.empty()) b.vendor = group.vendor;

    xmlNode* packages = childByClass(node, "packages");
    for (xmlNode* pn : childrenByClass(packages, "package")) {
        Package p;
        if (!parsePackage(pn, p, err)) return false;
        b.packages.push_back(std::move(p));
    }
    return true;
}

std::string escapeXml(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

void span(std::ostringstream& oss, const char* cls, const std::string& text) {
    oss << "      <span class=\"" << cls << "\">" << escapeXml(text) << "</span>\n";
}

void link(std::ostringstream& oss, const char* cls, const std::string& href, const std::string& text) {
    oss << "      <a class=\"" << cls << "\" href=\"" << escapeXml(href) << "\">" << escapeXml(text) << "</a>\n";
}

void openDocument(std::ostringstream& oss, const char* bodyClass) {
    oss << "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
        << "<html xmlns=\"http://www.w3.org/1999/xhtml\">\n"
        << "  <head />\n"
        << "  <body class=\"" << bodyClass << "\">\n";
}

void closeDocument(std::ostringstream& oss) {
    oss << "  </body>\n"
        << "</html>\n";
}

bool readDigits(const std::string& s, size_t& pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = s[pos + i];
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    pos += count;
    out = v;
    return true;
}

bool expectChar(const std::string& s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) return false;
    ++pos;
    return true;
}

} // namespace

bool parseLocales(const std::string& bytes, std::vector<Locale>& outLocales, ErrorInfo& err) {
    XmlDocPtr doc;
    xmlNode* root = nullptr;
    if (!loadXhtml(bytes, "locales", doc, root, err)) return false;

    xmlNode* container = descendantByClass(root, "catalog-locales");
    if (!container) {
        err = makeError(ErrorCategory::Parse, ErrorCode::ParseFailure,
                        "locales payload has no catalog-locales element");
        return false;
    }

    std::vector<Locale> locales;
    for (xmlNode* node : childrenByClass(container, "catalog-locale-link")) {
        Locale l;
        l.code = toLowerCopy(childText(node, "locale"));
        l.catalogLink = childHref(node, "catalog-link");
        l.name = childText(node, "name");
        if (l.code.empty() || l.catalogLink.empty()) {
            logWarn("Skipping locale entry without code or catalog link", "IDX");
            continue;
        }
        if (l.name.empty()) l.name = l.code;
        locales.push_back(std::move(l));
    }
    logDebug("Parsed " + std::to_string(locales.size()) + " locales", "IDX");
    outLocales = std::move(locales);
    return true;
}

bool parseCatalog(const std::string& bytes, std::vector<BookGroup>& outGroups, ErrorInfo& err) {
    XmlDocPtr doc;
    xmlNode* root = nullptr;
    if (!loadXhtml(bytes, "book catalog", doc, root, err)) return false;

    xmlNode* container = descendantByClass(root, "book-groups");
    if (!container) {
        err = makeError(ErrorCategory::Parse, ErrorCode::ParseFailure,
                        "book catalog payload has no book-groups element");
        return false;
    }

    std::vector<BookGroup> groups;
    size_t bookCount = 0;
    size_t packageCount = 0;
    for (xmlNode* gn : childrenByClass(container, "book-group")) {
        BookGroup g;
        g.name = childText(gn, "name");
        g.code = childText(gn, "id");
        if (g.code.empty()) g.code = g.name;
        if (g.code.empty()) {
            err = makeError(ErrorCategory::Parse, ErrorCode::ParseFailure,
                            "book-group entry has neither id nor name");
            return false;
        }
        g.locale = toLowerCopy(childText(gn, "locale"));
        g.description = childText(gn, "description");
        g.vendor = childText(gn, "vendor");

        xmlNode* books = childByClass(gn, "book-group-books");
        for (xmlNode* bn : childrenByClass(books, "book")) {
            Book b;
            if (!parseBook(bn, g, b, err)) return false;
            packageCount += b.packages.size();
            g.books.push_back(std::move(b));
        }
        bookCount += g.books.size();
        groups.push_back(std::move(g));
    }
    logDebug("Parsed " + std::to_string(groups.size()) + " book groups, " + std::to_string(bookCount) +
             " books, " + std::to_string(packageCount) + " package references", "IDX");
    outGroups = std::move(groups);
    return true;
}

std::string renderSetupIndex(const std::vector<BookGroup>& groups) {
    std::ostringstream oss;
    openDocument(oss, "product-list");
    for (const auto& g : groups) {
        oss << "    <div class=\"book-list\">\n";
        span(oss, "id", g.code);
        span(oss, "name", g.name);
        span(oss, "locale", g.locale);
        span(oss, "description", g.description);
        span(oss, "vendor", g.vendor);
        link(oss, "book-list-link", groupFileName(g), g.name);
        oss << "    </div>\n";
    }
    closeDocument(oss);
    return oss.str();
}

std::string renderGroupIndex(const BookGroup& group) {
    std::ostringstream oss;
    openDocument(oss, "book-list");
    oss << "    <div class=\"details\">\n";
    span(oss, "id", group.code);
    span(oss, "name", group.name);
    span(oss, "locale", group.locale);
    span(oss, "description", group.description);
    oss << "    </div>\n";
    for (const auto& b : group.books) {
        oss << "    <div class=\"book\">\n";
        span(oss, "id", b.code);
        span(oss, "name", b.name);
        span(oss, "locale", b.locale);
        span(oss, "category", b.category);
        span(oss, "description", b.description);
        span(oss, "vendor", b.vendor);
        link(oss, "book-link", bookFileName(b), b.name);
        oss << "    </div>\n";
    }
    closeDocument(oss);
    return oss.str();
}

std::string renderBookIndex(const BookGroup& group, const Book& book) {
    std::ostringstream oss;
    openDocument(oss, "package-list");
    oss << "    <div class=\"details\">\n";
    span(oss, "product-group", group.name);
    span(oss, "id", book.code);
    span(oss, "name", book.name);
    span(oss, "locale", book.locale);
    oss << "    </div>\n";
    for (const auto& p : book.packages) {
        const std::string file = packageFileName(p);
        oss << "    <div class=\"package\">\n";
        span(oss, "name", p.name);
        span(oss, "deployed", p.deployed ? "true" : "false");
        span(oss, "last-modified", formatTimestamp(p.lastModified));
        span(oss, "package-etag", p.etag);
        link(oss, "current-link", std::string(kPackagesDirName) + "\\" + file, file);
        span(oss, "package-size-bytes", std::to_string(p.size));
        span(oss, "package-size-bytes-uncompressed", std::to_string(p.uncompressedSize));
        if (!p.constituentLink.empty()) {
            link(oss, "package-constituent-link", p.constituentLink, p.name);
        }
        oss << "    </div>\n";
    }
    closeDocument(oss);
    return oss.str();
}

std::string packageFileName(const Package& package) {
    return package.name + kPackageExtension;
}

bool isSafePackageName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

bool findPackageFiles(const std::string& packagesDir,
                      std::map<std::string, std::string>& outByKey,
                      std::string& err) {
    outByKey.clear();
    std::error_code ec;
    if (!std::filesystem::is_directory(packagesDir, ec)) return true;
    std::vector<std::string> files;
    if (!listFilesWithExtension(packagesDir, kPackageExtension, files, err)) return false;
    for (const auto& f : files) {
        outByKey.emplace(util::toUpperAscii(std::filesystem::path(f).stem().string()), f);
    }
    return true;
}

std::string bookFileName(const Book& book) {
    return "book-" + util::urlEncode(book.code) + kIndexExtension;
}

std::string groupFileName(const BookGroup& group) {
    return "product-" + util::urlEncode(group.code) + kIndexExtension;
}

bool parseTimestamp(const std::string& text, Timestamp& out) {
    const std::string s = util::trimCopy(text);
    size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!readDigits(s, pos, 4, year) || !expectChar(s, pos, '-') ||
        !readDigits(s, pos, 2, month) || !expectChar(s, pos, '-') ||
        !readDigits(s, pos, 2, day)) {
        return false;
    }
    if (pos >= s.size() || (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ')) return false;
    ++pos;
    if (!readDigits(s, pos, 2, hour) || !expectChar(s, pos, ':') ||
        !readDigits(s, pos, 2, minute) || !expectChar(s, pos, ':') ||
        !readDigits(s, pos, 2, second)) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month) ||
        hour > 23 || minute > 59 || second > 60) {
        return false;
    }

    int64_t nanos = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            if (digits < 9) {
                nanos = nanos * 10 + (s[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) return false;
        for (int i = digits; i < 9; ++i) nanos *= 10;
    }

    int offsetSeconds = 0;
    if (pos < s.size()) {
        if (s[pos] == 'Z' || s[pos] == 'z') {
            ++pos;
        } else if (s[pos] == '+' || s[pos] == '-') {
            int sign = s[pos] == '-' ? -1 : 1;
            ++pos;
            int oh = 0, om = 0;
            if (!readDigits(s, pos, 2, oh)) return false;
            if (pos < s.size() && s[pos] == ':') ++pos;
            if (!readDigits(s, pos, 2, om)) return false;
            offsetSeconds = sign * (oh * 3600 + om * 60);
        } else {
            return false;
        }
    }
    if (pos != s.size()) return false;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    const time_t secs = timegm(&tm);
    out = Timestamp(std::chrono::seconds(static_cast<int64_t>(secs) - offsetSeconds) +
                    std::chrono::nanoseconds(nanos));
    return true;
}

std::string formatTimestamp(Timestamp ts) {
    auto since = ts.time_since_epoch();
    auto secs = std::chrono::floor<std::chrono::seconds>(since);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since - secs).count();
    time_t t = static_cast<time_t>(secs.count());
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::string out(buf);
    if (nanos > 0) {
        std::string frac = std::to_string(nanos);
        frac.insert(0, 9 - frac.size(), '0');
        while (!frac.empty() && frac.back() == '0') frac.pop_back();
        out += "." + frac;
    }
    out += "Z";
    return out;
}

} // namespace helpmirror
