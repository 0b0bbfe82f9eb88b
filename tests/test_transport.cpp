#include <catch2/catch.hpp>
#include "helpmirror/transport.hpp"
#include "test_support.hpp"

using namespace helpmirror;
using testsupport::LoopbackHttpServer;
using testsupport::TempDir;
namespace fs = std::filesystem;

namespace {

HttpTransportOptions loopbackOptions() {
    HttpTransportOptions o;
    o.timeoutSeconds = 5;
    o.maxRedirects = 3;
    return o;
}

std::string okResponse(const std::string& body) {
    return "HTTP/1.1 200 OK\r\n"
           "Content-Type: application/octet-stream\r\n"
           "Content-Length: " + std::to_string(body.size()) + "\r\n"
           "Connection: close\r\n"
           "\r\n" + body;
}

struct TickLog {
    std::vector<std::pair<uint64_t, int64_t>> ticks;
    TransferTick callback() {
        return [this](uint64_t received, int64_t total) { ticks.emplace_back(received, total); };
    }
};

} // namespace

TEST_CASE("get returns the body and identifies the client") {
    LoopbackHttpServer server({okResponse("<html/>")});
    REQUIRE(server.listening());
    HttpTransport transport(loopbackOptions());

    std::string body;
    ErrorInfo err;
    REQUIRE(transport.get(server.url("/serviceapi/catalogs/dev14"), body, err));
    REQUIRE(body == "<html/>");

    const auto lines = server.requestLines();
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0] == "GET /serviceapi/catalogs/dev14 HTTP/1.1");
    REQUIRE(server.requestHeads()[0].find("User-Agent: helpmirror/") != std::string::npos);
}

TEST_CASE("get decodes a chunked body") {
    LoopbackHttpServer server({"HTTP/1.1 200 OK\r\n"
                               "Transfer-Encoding: chunked\r\n"
                               "Connection: close\r\n"
                               "\r\n"
                               "4\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\n"});
    HttpTransport transport(loopbackOptions());

    std::string body;
    ErrorInfo err;
    REQUIRE(transport.get(server.url("/chunked"), body, err));
    REQUIRE(body == "Wikipedia");
}

TEST_CASE("get follows redirects to the final resource") {
    LoopbackHttpServer server({"HTTP/1.1 302 Found\r\n"
                               "Location: /moved/catalog\r\n"
                               "Content-Length: 0\r\n"
                               "Connection: close\r\n"
                               "\r\n",
                               okResponse("moved body")});
    HttpTransport transport(loopbackOptions());

    std::string body;
    ErrorInfo err;
    REQUIRE(transport.get(server.url("/catalog"), body, err));
    REQUIRE(body == "moved body");
    REQUIRE(server.requestLines() ==
            std::vector<std::string>{"GET /catalog HTTP/1.1", "GET /moved/catalog HTTP/1.1"});
}

TEST_CASE("redirect loops stop with a redirect error") {
    const std::string loop = "HTTP/1.1 301 Moved Permanently\r\n"
                             "Location: /again\r\n"
                             "Content-Length: 0\r\n"
                             "Connection: close\r\n"
                             "\r\n";
    LoopbackHttpServer server({loop, loop});
    HttpTransportOptions opts = loopbackOptions();
    opts.maxRedirects = 1;
    HttpTransport transport(opts);

    std::string body;
    ErrorInfo err;
    REQUIRE_FALSE(transport.get(server.url("/start"), body, err));
    REQUIRE(err.category == ErrorCategory::Http);
    REQUIRE(err.code == ErrorCode::TooManyRedirects);
}

TEST_CASE("non-2xx responses are classified as HTTP errors") {
    SECTION("404") {
        LoopbackHttpServer server({"HTTP/1.1 404 Not Found\r\nContent-Length: 9\r\nConnection: close\r\n\r\nnot found"});
        HttpTransport transport(loopbackOptions());
        std::string body;
        ErrorInfo err;
        REQUIRE_FALSE(transport.get(server.url("/catalogs/unknown"), body, err));
        REQUIRE(err.category == ErrorCategory::Http);
        REQUIRE(err.code == ErrorCode::HttpNotFound);
        REQUIRE(err.httpStatus == 404);
        REQUIRE(body.empty());
    }
    SECTION("503 on a download removes the target") {
        LoopbackHttpServer server({"HTTP/1.1 503 Service Unavailable\r\nContent-Length: 4\r\nConnection: close\r\n\r\nbusy"});
        HttpTransport transport(loopbackOptions());
        TempDir dir;
        const auto dest = dir.path() / "A.cab";
        ErrorInfo err;
        REQUIRE_FALSE(transport.download(server.url("/a.cab"), dest.string(), TransferTick{}, err));
        REQUIRE(err.category == ErrorCategory::Http);
        REQUIRE(err.code == ErrorCode::HttpStatus);
        REQUIRE(err.httpStatus == 503);
        REQUIRE(err.retryable);
        REQUIRE_FALSE(fs::exists(dest));
    }
}

TEST_CASE("download streams the body to disk and reports progress") {
    const std::string payload(200000, 'p');
    LoopbackHttpServer server({okResponse(payload)});
    HttpTransport transport(loopbackOptions());
    TempDir dir;
    const auto dest = dir.path() / "A.cab";
    TickLog log;

    ErrorInfo err;
    REQUIRE(transport.download(server.url("/public/a.cab"), dest.string(), log.callback(), err));
    REQUIRE(testsupport::readFile(dest) == payload);
    REQUIRE_FALSE(log.ticks.empty());
    REQUIRE(log.ticks.back().first == payload.size());
    REQUIRE(log.ticks.back().second == static_cast<int64_t>(payload.size()));
    for (size_t i = 1; i < log.ticks.size(); ++i) {
        REQUIRE(log.ticks[i].first >= log.ticks[i - 1].first);
    }
}

TEST_CASE("download replaces an existing file") {
    LoopbackHttpServer server({okResponse("fresh")});
    HttpTransport transport(loopbackOptions());
    TempDir dir;
    const auto dest = dir.path() / "a.cab";
    testsupport::writeFile(dest, "an older and longer cached copy");

    ErrorInfo err;
    REQUIRE(transport.download(server.url("/a.cab"), dest.string(), TransferTick{}, err));
    REQUIRE(testsupport::readFile(dest) == "fresh");
}

TEST_CASE("download stops at Content-Length") {
    LoopbackHttpServer server({"HTTP/1.1 200 OK\r\nContent-Length: 5\r\nConnection: close\r\n\r\nhelloTRAILING"});
    HttpTransport transport(loopbackOptions());
    TempDir dir;
    const auto dest = dir.path() / "B.cab";

    ErrorInfo err;
    REQUIRE(transport.download(server.url("/b.cab"), dest.string(), TransferTick{}, err));
    REQUIRE(testsupport::readFile(dest) == "hello");
}

TEST_CASE("download of a chunked body has no known total") {
    LoopbackHttpServer server({"HTTP/1.1 200 OK\r\n"
                               "Transfer-Encoding: chunked\r\n"
                               "Connection: close\r\n"
                               "\r\n"
                               "3\r\nabc\r\n2\r\nde\r\n0\r\n\r\n"});
    HttpTransport transport(loopbackOptions());
    TempDir dir;
    const auto dest = dir.path() / "C.cab";
    TickLog log;

    ErrorInfo err;
    REQUIRE(transport.download(server.url("/c.cab"), dest.string(), log.callback(), err));
    REQUIRE(testsupport::readFile(dest) == "abcde");
    REQUIRE_FALSE(log.ticks.empty());
    REQUIRE(log.ticks.back().first == 5);
    REQUIRE(log.ticks.back().second == -1);
}

TEST_CASE("a short read removes the partial file") {
    LoopbackHttpServer server({"HTTP/1.1 200 OK\r\nContent-Length: 100\r\nConnection: close\r\n\r\n0123456789"});
    HttpTransport transport(loopbackOptions());
    TempDir dir;
    const auto dest = dir.path() / "D.cab";

    ErrorInfo err;
    REQUIRE_FALSE(transport.download(server.url("/d.cab"), dest.string(), TransferTick{}, err));
    REQUIRE(err.category == ErrorCategory::Network);
    REQUIRE(err.code == ErrorCode::TransportFailure);
    REQUIRE(err.retryable);
    REQUIRE_FALSE(fs::exists(dest));
}

TEST_CASE("a short read on get is a network error") {
    LoopbackHttpServer server({"HTTP/1.1 200 OK\r\nContent-Length: 50\r\nConnection: close\r\n\r\n<html>"});
    HttpTransport transport(loopbackOptions());

    std::string body;
    ErrorInfo err;
    REQUIRE_FALSE(transport.get(server.url("/catalog"), body, err));
    REQUIRE(err.category == ErrorCategory::Network);
    REQUIRE(body.empty());
}

TEST_CASE("non-http schemes are rejected before any request") {
    HttpTransport transport(loopbackOptions());
    std::string body;
    ErrorInfo err;
    REQUIRE_FALSE(transport.get("ftp://packages.example/a.cab", body, err));
    REQUIRE(err.category == ErrorCategory::Unsupported);

    TempDir dir;
    REQUIRE_FALSE(transport.download("file:///etc/passwd", (dir.path() / "x.cab").string(), TransferTick{}, err));
    REQUIRE(err.category == ErrorCategory::Unsupported);
    REQUIRE_FALSE(fs::exists(dir.path() / "x.cab"));
}
