#include <catch2/catch.hpp>
#include "helpmirror/index_manager.hpp"
#include "test_support.hpp"

using namespace helpmirror;

namespace {

const char* kLocalesPayload =
    "<html xmlns=\"http://www.w3.org/1999/xhtml\"><head /><body class=\"catalogs\">"
    "<div class=\"catalog-locales\">"
    "  <div class=\"catalog-locale-link\">"
    "    <span class=\"locale\">EN-US</span><span class=\"name\">English (United States)</span>"
    "    <a class=\"catalog-link\" href=\"catalogs/visualstudio11/en-us\">en-us</a>"
    "  </div>"
    "  <div class=\"catalog-locale-link\">"
    "    <span class=\"locale\">de-de</span>"
    "    <a class=\"catalog-link\" href=\"catalogs/visualstudio11/de-de\">de-de</a>"
    "  </div>"
    "  <div class=\"catalog-locale-link\">"
    "    <span class=\"name\">No code</span>"
    "    <a class=\"catalog-link\" href=\"catalogs/visualstudio11/xx\">xx</a>"
    "  </div>"
    "</div></body></html>";

const char* kCatalogPayload =
    "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
    "<html xmlns=\"http://www.w3.org/1999/xhtml\"><head /><body class=\"product-groups\">"
    "<div class=\"book-groups\">"
    " <div class=\"book-group\">"
    "  <span class=\"id\">vs-csharp</span><span class=\"name\">C# Docs</span>"
    "  <span class=\"locale\">EN-US</span><span class=\"description\">Language</span>"
    "  <span class=\"vendor\">Microsoft</span>"
    "  <div class=\"book-group-books\">"
    "   <div class=\"book\">"
    "    <span class=\"id\">intro</span><span class=\"name\">Intro &amp; Basics</span>"
    "    <span class=\"description\">Start here</span>"
    "    <div class=\"packages\">"
    "     <div class=\"package\">"
    "      <span class=\"name\">A</span><span class=\"deployed\">True</span>"
    "      <span class=\"last-modified\">2013-01-15T10:20:30.1234567Z</span>"
    "      <span class=\"package-etag\">etag-a</span>"
    "      <a class=\"current-link\" href=\"public/a.cab\">A.cab</a>"
    "      <span class=\"package-size-bytes\">500000</span>"
    "      <span class=\"package-size-bytes-uncompressed\">900000</span>"
    "      <a class=\"package-constituent-link\" href=\"content/a\">A</a>"
    "     </div>"
    "     <div class=\"package\">"
    "      <span class=\"name\">B</span><span class=\"deployed\">false</span>"
    "      <span class=\"last-modified\">2013-01-16T00:00:00-02:00</span>"
    "      <a class=\"current-link\" href=\"public/b.cab\">B.cab</a>"
    "      <span class=\"package-size-bytes\">1200</span>"
    "     </div>"
    "    </div>"
    "   </div>"
    "   <div class=\"book\">"
    "    <span class=\"name\">Reference</span><span class=\"category\">Reference</span>"
    "    <span class=\"locale\">en-us</span><span class=\"vendor\">Contoso</span>"
    "    <div class=\"packages\"></div>"
    "   </div>"
    "  </div>"
    " </div>"
    "</div></body></html>";

std::string catalogWithPackage(const std::string& packageBody) {
    return "<html><body><div class=\"book-groups\"><div class=\"book-group\">"
           "<span class=\"id\">g</span><span class=\"name\">G</span>"
           "<div class=\"book-group-books\"><div class=\"book\"><span class=\"id\">b</span>"
           "<div class=\"packages\"><div class=\"package\">" + packageBody +
           "</div></div></div></div></div></div></body></html>";
}

} // namespace

TEST_CASE("parseLocales reads codes, names and links") {
    std::vector<Locale> locales;
    ErrorInfo err;
    REQUIRE(parseLocales(kLocalesPayload, locales, err));
    REQUIRE(locales.size() == 2);
    REQUIRE(locales[0].code == "en-us");
    REQUIRE(locales[0].name == "English (United States)");
    REQUIRE(locales[0].catalogLink == "catalogs/visualstudio11/en-us");
    REQUIRE(locales[1].code == "de-de");
    REQUIRE(locales[1].name == "de-de");
}

TEST_CASE("parseLocales rejects malformed payloads") {
    std::vector<Locale> locales{Locale{"keep", "keep", "keep"}};
    ErrorInfo err;

    SECTION("not XML") {
        REQUIRE_FALSE(parseLocales("<html><body", locales, err));
    }
    SECTION("wrong root") {
        REQUIRE_FALSE(parseLocales("<catalogs><div class=\"catalog-locales\"/></catalogs>", locales, err));
    }
    SECTION("no container") {
        REQUIRE_FALSE(parseLocales("<html><body class=\"catalogs\"></body></html>", locales, err));
    }
    REQUIRE(err.category == ErrorCategory::Parse);
    REQUIRE(locales.size() == 1);
}

TEST_CASE("parseCatalog builds the group, book and package tree") {
    std::vector<BookGroup> groups;
    ErrorInfo err;
    REQUIRE(parseCatalog(kCatalogPayload, groups, err));
    REQUIRE(groups.size() == 1);

    const BookGroup& g = groups[0];
    REQUIRE(g.code == "vs-csharp");
    REQUIRE(g.name == "C# Docs");
    REQUIRE(g.locale == "en-us");
    REQUIRE(g.vendor == "Microsoft");
    REQUIRE(g.books.size() == 2);

    const Book& intro = g.books[0];
    REQUIRE(intro.code == "intro");
    REQUIRE(intro.name == "Intro & Basics");
    REQUIRE(intro.category == "C# Docs");
    REQUIRE(intro.locale == "en-us");
    REQUIRE(intro.vendor == "Microsoft");
    REQUIRE_FALSE(intro.wanted);
    REQUIRE(intro.packages.size() == 2);

    const Package& a = intro.packages[0];
    REQUIRE(a.name == "A");
    REQUIRE(a.link == "public/a.cab");
    REQUIRE(a.size == 500000);
    REQUIRE(a.uncompressedSize == 900000);
    REQUIRE(a.etag == "etag-a");
    REQUIRE(a.constituentLink == "content/a");
    REQUIRE(a.deployed);
    REQUIRE(a.state == PackageState::NotDownloaded);
    REQUIRE(formatTimestamp(a.lastModified) == "2013-01-15T10:20:30.1234567Z");

    const Package& b = intro.packages[1];
    REQUIRE_FALSE(b.deployed);
    REQUIRE(b.uncompressedSize == 0);
    REQUIRE(formatTimestamp(b.lastModified) == "2013-01-16T02:00:00Z");

    const Book& ref = g.books[1];
    REQUIRE(ref.code == "Reference");
    REQUIRE(ref.category == "Reference");
    REQUIRE(ref.vendor == "Contoso");
    REQUIRE(ref.packages.empty());
}

TEST_CASE("parseCatalog rejects packages with missing or malformed fields") {
    std::vector<BookGroup> groups;
    ErrorInfo err;
    const std::string link = "<a class=\"current-link\" href=\"x.cab\">x</a>";
    const std::string name = "<span class=\"name\">X</span>";
    const std::string when = "<span class=\"last-modified\">2013-01-15T10:20:30Z</span>";
    const std::string size = "<span class=\"package-size-bytes\">12</span>";

    REQUIRE(parseCatalog(catalogWithPackage(name + link + when + size), groups, err));
    REQUIRE(groups.size() == 1);

    SECTION("missing name") {
        REQUIRE_FALSE(parseCatalog(catalogWithPackage(link + when + size), groups, err));
    }
    SECTION("missing link") {
        REQUIRE_FALSE(parseCatalog(catalogWithPackage(name + when + size), groups, err));
    }
    SECTION("bad size") {
        REQUIRE_FALSE(parseCatalog(
            catalogWithPackage(name + link + when + "<span class=\"package-size-bytes\">12kb</span>"), groups, err));
    }
    SECTION("name with a path separator") {
        REQUIRE_FALSE(parseCatalog(
            catalogWithPackage("<span class=\"name\">../../escaped</span>" + link + when + size), groups, err));
    }
    SECTION("dot-dot name") {
        REQUIRE_FALSE(parseCatalog(catalogWithPackage("<span class=\"name\">..</span>" + link + when + size), groups, err));
    }
    SECTION("backslash name") {
        REQUIRE_FALSE(parseCatalog(
            catalogWithPackage("<span class=\"name\">Packages\\x</span>" + link + when + size), groups, err));
    }
    SECTION("bad timestamp") {
        REQUIRE_FALSE(parseCatalog(
            catalogWithPackage(name + link + "<span class=\"last-modified\">yesterday</span>" + size), groups, err));
    }
    REQUIRE(err.category == ErrorCategory::Parse);
}

TEST_CASE("file names follow the cache layout") {
    Package p;
    p.name = "VS_Intro_B123";
    REQUIRE(packageFileName(p) == "VS_Intro_B123.cab");
    REQUIRE(isSafePackageName("VS_Intro_B123"));
    REQUIRE(isSafePackageName("v1.2"));
    REQUIRE_FALSE(isSafePackageName(""));
    REQUIRE_FALSE(isSafePackageName("."));
    REQUIRE_FALSE(isSafePackageName(".."));
    REQUIRE_FALSE(isSafePackageName("a/b"));
    REQUIRE_FALSE(isSafePackageName("a\\b"));
    REQUIRE_FALSE(isSafePackageName(std::string("a\0b", 3)));
    Book b;
    b.code = "intro";
    REQUIRE(bookFileName(b) == "book-intro.xml");
    BookGroup g;
    g.code = "vs-csharp";
    REQUIRE(groupFileName(g) == "product-vs-csharp.xml");
}

TEST_CASE("rendered indexes are deterministic and ignore selection") {
    std::vector<BookGroup> groups;
    ErrorInfo err;
    REQUIRE(parseCatalog(kCatalogPayload, groups, err));

    const std::string setup = renderSetupIndex(groups);
    const std::string group = renderGroupIndex(groups[0]);
    const std::string book = renderBookIndex(groups[0], groups[0].books[0]);

    groups[0].books[0].wanted = true;
    groups[0].books[0].packages[0].state = PackageState::Ready;
    REQUIRE(renderSetupIndex(groups) == setup);
    REQUIRE(renderGroupIndex(groups[0]) == group);
    REQUIRE(renderBookIndex(groups[0], groups[0].books[0]) == book);

    REQUIRE(setup.rfind("<?xml version=\"1.0\" encoding=\"utf-8\"?>\n", 0) == 0);
    REQUIRE(setup.find("<body class=\"product-list\">") != std::string::npos);
    REQUIRE(setup.find("href=\"product-vs-csharp.xml\"") != std::string::npos);
    REQUIRE(group.find("<body class=\"book-list\">") != std::string::npos);
    REQUIRE(group.find("href=\"book-intro.xml\"") != std::string::npos);
    REQUIRE(group.find("Intro &amp; Basics") != std::string::npos);
    REQUIRE(book.find("<body class=\"package-list\">") != std::string::npos);
    REQUIRE(book.find("href=\"Packages\\A.cab\"") != std::string::npos);
    REQUIRE(book.find("<span class=\"last-modified\">2013-01-15T10:20:30.1234567Z</span>") != std::string::npos);
    REQUIRE(book.find("<span class=\"deployed\">false</span>") != std::string::npos);
    REQUIRE(book.find("href=\"content/a\"") != std::string::npos);
}

TEST_CASE("a rendered book index parses back as an XHTML document") {
    std::vector<BookGroup> groups;
    ErrorInfo err;
    REQUIRE(parseCatalog(kCatalogPayload, groups, err));
    // The locale parser only needs a well-formed html root; a missing
    // container proves the document itself was accepted.
    std::vector<Locale> locales;
    REQUIRE_FALSE(parseLocales(renderBookIndex(groups[0], groups[0].books[0]), locales, err));
    REQUIRE(err.detail.find("catalog-locales") != std::string::npos);
}

TEST_CASE("parseTimestamp accepts ISO-8601 variants") {
    Timestamp ts;
    REQUIRE(parseTimestamp("2013-01-15T10:20:30Z", ts));
    REQUIRE(formatTimestamp(ts) == "2013-01-15T10:20:30Z");

    REQUIRE(parseTimestamp("2013-01-15 10:20:30", ts));
    REQUIRE(formatTimestamp(ts) == "2013-01-15T10:20:30Z");

    REQUIRE(parseTimestamp("2013-01-15T10:20:30.5+01:30", ts));
    REQUIRE(formatTimestamp(ts) == "2013-01-15T08:50:30.5Z");

    REQUIRE(parseTimestamp("  1999-12-31T23:59:59.000000001Z ", ts));
    REQUIRE(formatTimestamp(ts) == "1999-12-31T23:59:59.000000001Z");

    REQUIRE(parseTimestamp("2012-02-29T00:00:00Z", ts));
    REQUIRE(formatTimestamp(ts) == "2012-02-29T00:00:00Z");
    REQUIRE(parseTimestamp("2000-02-29T12:00:00Z", ts));

    REQUIRE_FALSE(parseTimestamp("", ts));
    REQUIRE_FALSE(parseTimestamp("2013-13-01T00:00:00Z", ts));
    REQUIRE_FALSE(parseTimestamp("2013-02-31T00:00:00Z", ts));
    REQUIRE_FALSE(parseTimestamp("2013-02-29T00:00:00Z", ts));
    REQUIRE_FALSE(parseTimestamp("2013-04-31T00:00:00Z", ts));
    REQUIRE_FALSE(parseTimestamp("1900-02-29T00:00:00Z", ts));
    REQUIRE_FALSE(parseTimestamp("2013-01-15T10:20", ts));
    REQUIRE_FALSE(parseTimestamp("2013-01-15T10:20:30.Z", ts));
    REQUIRE_FALSE(parseTimestamp("2013-01-15T10:20:30Q", ts));
}
