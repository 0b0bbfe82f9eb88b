#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include "helpmirror/errors.hpp"

namespace helpmirror {

// Transfer tick: bytes received so far and the expected total (-1 if unknown).
using TransferTick = std::function<void(uint64_t received, int64_t total)>;

// Network seam used by the catalog client and the sync engine.
class Transport {
public:
    virtual ~Transport() = default;

    // GET url and return the whole (de-chunked) body. Non-2xx is an error.
    virtual bool get(const std::string& url, std::string& outBody, ErrorInfo& err) = 0;

    // GET url and stream the body into destPath (replaced if present).
    // A failed transfer removes the partial file.
    virtual bool download(const std::string& url,
                          const std::string& destPath,
                          const TransferTick& onTick,
                          ErrorInfo& err) = 0;
};

struct HttpTransportOptions {
    // Connect timeout, and how long a transfer may stall before it fails
    int timeoutSeconds{30};
    int maxRedirects{5};
    // Optional forward proxy, http://host:port
    std::string proxyUrl;
    std::string proxyUsername;
    std::string proxyPassword;
    std::string userAgent;
};

// HTTP and HTTPS through libcurl, one easy handle per request. Peer
// certificates are verified against the system CA store.
class HttpTransport : public Transport {
public:
    explicit HttpTransport(HttpTransportOptions opts);

    bool get(const std::string& url, std::string& outBody, ErrorInfo& err) override;
    bool download(const std::string& url,
                  const std::string& destPath,
                  const TransferTick& onTick,
                  ErrorInfo& err) override;

private:
    HttpTransportOptions opts_;
};

} // namespace helpmirror
