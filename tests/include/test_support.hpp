#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "helpmirror/filesystem.hpp"
#include "helpmirror/index_manager.hpp"
#include "helpmirror/raii.hpp"
#include "helpmirror/transport.hpp"
#include "helpmirror/trust.hpp"

namespace testsupport {

namespace fs = std::filesystem;

// Fresh directory under the system temp dir, removed on scope exit.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() /
                ("helpmirror-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    fs::path path_;
};

inline void writeFile(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// In-memory Transport: GET bodies and download payloads are looked up by URL.
class FakeTransport : public helpmirror::Transport {
public:
    std::map<std::string, std::string> bodies;
    std::map<std::string, std::string> files;
    std::set<std::string> failing; // URLs that fail with a network error
    std::vector<std::string> requested;

    bool get(const std::string& url, std::string& outBody, helpmirror::ErrorInfo& err) override {
        requested.push_back(url);
        auto it = bodies.find(url);
        if (it == bodies.end() || failing.count(url)) {
            err = helpmirror::classifyError("HTTP 404 Not Found for " + url, helpmirror::ErrorCategory::Network);
            return false;
        }
        outBody = it->second;
        return true;
    }

    bool download(const std::string& url,
                  const std::string& destPath,
                  const helpmirror::TransferTick& onTick,
                  helpmirror::ErrorInfo& err) override {
        requested.push_back(url);
        if (failing.count(url)) {
            err = helpmirror::classifyError("Connect failed: packages.example:80: Connection refused",
                                            helpmirror::ErrorCategory::Network);
            return false;
        }
        auto it = files.find(url);
        if (it == files.end()) {
            err = helpmirror::classifyError("HTTP 404 Not Found for " + url, helpmirror::ErrorCategory::Network);
            return false;
        }
        const int64_t total = static_cast<int64_t>(it->second.size());
        if (onTick) onTick(0, total);
        writeFile(destPath, it->second);
        if (onTick) onTick(static_cast<uint64_t>(total), total);
        return true;
    }

    size_t downloadCount() const {
        size_t n = 0;
        for (const auto& u : requested) {
            if (files.count(u) || failing.count(u)) ++n;
        }
        return n;
    }
};

// Trusts everything except the listed file names; remembers what it saw.
class ScriptedVerifier : public helpmirror::TrustVerifier {
public:
    std::set<std::string> rejected;
    mutable std::vector<std::string> seen;

    bool isTrusted(const std::string& path) const override {
        const std::string name = fs::path(path).filename().string();
        seen.push_back(name);
        return rejected.count(name) == 0;
    }
};

// Loopback HTTP server on 127.0.0.1: the n-th accepted connection gets the
// n-th canned raw response, then the connection is closed.
class LoopbackHttpServer {
public:
    explicit LoopbackHttpServer(std::vector<std::string> responses) : responses_(std::move(responses)) {
        listener_.reset(::socket(AF_INET, SOCK_STREAM, 0));
        int one = 1;
        ::setsockopt(listener_.fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listener_.fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listener_.fd, 8) != 0) {
            listener_.reset();
            return;
        }
        socklen_t len = sizeof(addr);
        ::getsockname(listener_.fd, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this]() { serve(); });
    }

    ~LoopbackHttpServer() {
        // Unblocks a pending accept() when fewer requests arrived than expected.
        if (listener_) ::shutdown(listener_.fd, SHUT_RDWR);
        if (thread_.joinable()) thread_.join();
    }

    LoopbackHttpServer(const LoopbackHttpServer&) = delete;
    LoopbackHttpServer& operator=(const LoopbackHttpServer&) = delete;

    bool listening() const { return port_ != 0; }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    // Request lines received so far, e.g. "GET /a.cab HTTP/1.1".
    std::vector<std::string> requestLines() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requestLines_;
    }

    std::vector<std::string> requestHeads() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requestHeads_;
    }

private:
    void serve() {
        for (const auto& response : responses_) {
            helpmirror::UniqueFd client(::accept(listener_.fd, nullptr, nullptr));
            if (!client) return;

            std::string head;
            char buf[1024];
            while (head.find("\r\n\r\n") == std::string::npos) {
                ssize_t n = ::recv(client.fd, buf, sizeof(buf), 0);
                if (n <= 0) break;
                head.append(buf, static_cast<size_t>(n));
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requestLines_.push_back(head.substr(0, head.find("\r\n")));
                requestHeads_.push_back(head);
            }

            size_t sent = 0;
            while (sent < response.size()) {
                ssize_t n = ::send(client.fd, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
                if (n <= 0) break;
                sent += static_cast<size_t>(n);
            }
            ::shutdown(client.fd, SHUT_WR);
        }
    }

    std::vector<std::string> responses_;
    helpmirror::UniqueFd listener_;
    uint16_t port_{0};
    std::thread thread_;
    mutable std::mutex mutex_;
    std::vector<std::string> requestLines_;
    std::vector<std::string> requestHeads_;
};

inline helpmirror::Package makePackage(const std::string& name, const std::string& link, uint64_t size,
                                       const std::string& modified = "2013-01-15T10:20:30Z") {
    helpmirror::Package p;
    p.name = name;
    p.link = link;
    p.size = size;
    helpmirror::parseTimestamp(modified, p.lastModified);
    return p;
}

} // namespace testsupport
