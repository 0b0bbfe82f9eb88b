#include "helpmirror/transport.hpp"
#include "helpmirror/http_common.hpp"
#include "helpmirror/logger.hpp"
#include "helpmirror/raii.hpp"
#include "helpmirror/version.hpp"

#include <curl/curl.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <mutex>

namespace helpmirror {

namespace {

constexpr long kLowSpeedLimitBytesPerSec = 1;

struct CurlEasyDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

bool ensureCurlGlobalInit() {
    static std::once_flag initFlag;
    static bool initOk = false;
    std::call_once(initFlag, []() { initOk = curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK; });
    return initOk;
}

size_t appendToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t count = size * nmemb;
    static_cast<std::string*>(userdata)->append(ptr, count);
    return count;
}

size_t writeToFile(char* ptr, size_t size, size_t nmemb, void* userdata) {
    return std::fwrite(ptr, 1, size * nmemb, static_cast<FILE*>(userdata));
}

struct TickContext {
    const TransferTick* onTick{nullptr};
    curl_off_t lastNow{-1};
    curl_off_t lastTotal{-1};
};

int forwardTick(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TickContext*>(clientp);
    if (!ctx || !ctx->onTick || !*ctx->onTick) return 0;
    if (dlnow == ctx->lastNow && dltotal == ctx->lastTotal) return 0;
    ctx->lastNow = dlnow;
    ctx->lastTotal = dltotal;
    (*ctx->onTick)(dlnow > 0 ? static_cast<uint64_t>(dlnow) : 0,
                   dltotal > 0 ? static_cast<int64_t>(dltotal) : -1);
    return 0;
}

// One configured easy handle. perform() turns curl and HTTP failures into
// the messages classifyError maps onto the taxonomy.
class CurlRequest {
public:
    CurlRequest(const HttpTransportOptions& opts, const std::string& url) : url_(url) {
        errbuf_[0] = '\0';
        if (!isHttpUrl(url)) {
            initError_ = "URL scheme not supported: " + url;
            return;
        }
        if (!ensureCurlGlobalInit()) {
            initError_ = "Transport failure: curl_global_init failed";
            return;
        }
        handle_.reset(curl_easy_init());
        if (!handle_) {
            initError_ = "Transport failure: curl_easy_init failed";
            return;
        }

        CURL* c = handle_.get();
        curl_easy_setopt(c, CURLOPT_URL, url.c_str());
        curl_easy_setopt(c, CURLOPT_ERRORBUFFER, errbuf_);
        curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(c, CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(c, CURLOPT_MAXREDIRS, static_cast<long>(opts.maxRedirects));
#if LIBCURL_VERSION_NUM >= 0x075500
        curl_easy_setopt(c, CURLOPT_PROTOCOLS_STR, "http,https");
        curl_easy_setopt(c, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
#else
        curl_easy_setopt(c, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
        curl_easy_setopt(c, CURLOPT_REDIR_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
#endif
        curl_easy_setopt(c, CURLOPT_USERAGENT, opts.userAgent.c_str());
        curl_easy_setopt(c, CURLOPT_NOPROGRESS, 1L);
        if (opts.timeoutSeconds > 0) {
            curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, static_cast<long>(opts.timeoutSeconds));
            curl_easy_setopt(c, CURLOPT_LOW_SPEED_LIMIT, kLowSpeedLimitBytesPerSec);
            curl_easy_setopt(c, CURLOPT_LOW_SPEED_TIME, static_cast<long>(opts.timeoutSeconds));
        }
        // An empty proxy also stops curl from picking one up from the environment.
        curl_easy_setopt(c, CURLOPT_PROXY, opts.proxyUrl.c_str());
        if (!opts.proxyUrl.empty() && !opts.proxyUsername.empty()) {
            curl_easy_setopt(c, CURLOPT_PROXYUSERNAME, opts.proxyUsername.c_str());
            curl_easy_setopt(c, CURLOPT_PROXYPASSWORD, opts.proxyPassword.c_str());
        }
    }

    CURL* handle() const { return handle_.get(); }

    bool ready(std::string& err) const {
        if (initError_.empty()) return true;
        err = initError_;
        return false;
    }

    bool perform(std::string& err) {
        logDebug("GET " + url_, "HTTP");
        const CURLcode rc = curl_easy_perform(handle_.get());
        long status = 0;
        curl_easy_getinfo(handle_.get(), CURLINFO_RESPONSE_CODE, &status);
        if (rc == CURLE_OK && status >= 200 && status < 300) return true;

        std::string where = url_;
        char* effective = nullptr;
        if (curl_easy_getinfo(handle_.get(), CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
            where = effective;
        }
        if (rc == CURLE_OK) {
            err = "HTTP " + std::to_string(status) + " for " + where;
        } else {
            err = describeFailure(rc, status, where);
        }
        logDebug("curl rc=" + std::to_string(static_cast<int>(rc)) + " http=" + std::to_string(status) +
                 " for " + where, "HTTP");
        return false;
    }

    // Bytes of body received and the announced length (-1 if none).
    uint64_t received() const {
        curl_off_t n = 0;
        curl_easy_getinfo(handle_.get(), CURLINFO_SIZE_DOWNLOAD_T, &n);
        return n > 0 ? static_cast<uint64_t>(n) : 0;
    }
    int64_t expected() const {
        curl_off_t n = -1;
        curl_easy_getinfo(handle_.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &n);
        return n >= 0 ? static_cast<int64_t>(n) : -1;
    }

private:
    std::string describeFailure(CURLcode rc, long status, const std::string& where) const {
        const std::string why = errbuf_[0] ? std::string(errbuf_) : std::string(curl_easy_strerror(rc));
        switch (rc) {
            case CURLE_HTTP_RETURNED_ERROR:
                return "HTTP " + std::to_string(status) + " for " + where;
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
                return "DNS lookup failed for " + where + ": " + why;
            case CURLE_COULDNT_CONNECT:
                return "Connect failed: " + where + ": " + why;
            case CURLE_OPERATION_TIMEDOUT:
                return "Request timed out for " + where + ": " + why;
            case CURLE_TOO_MANY_REDIRECTS:
                return "Too many redirects for " + url_;
            case CURLE_PARTIAL_FILE:
                return "Short read from " + where + ": " + why;
            case CURLE_UNSUPPORTED_PROTOCOL:
                return "URL scheme not supported: " + where;
            case CURLE_WRITE_ERROR:
                return "Write failed while receiving " + where;
            default:
                return "Transport failure for " + where + ": " + why;
        }
    }

    std::string url_;
    std::string initError_;
    CurlEasyPtr handle_;
    char errbuf_[CURL_ERROR_SIZE];
};

} // namespace

HttpTransport::HttpTransport(HttpTransportOptions opts) : opts_(std::move(opts)) {
    if (opts_.userAgent.empty()) opts_.userAgent = std::string("helpmirror/") + appVersion();
}

bool HttpTransport::get(const std::string& url, std::string& outBody, ErrorInfo& err) {
    CurlRequest req(opts_, url);
    std::string e;
    if (!req.ready(e)) {
        err = classifyError(e, ErrorCategory::Network);
        return false;
    }

    std::string body;
    curl_easy_setopt(req.handle(), CURLOPT_WRITEFUNCTION, appendToString);
    curl_easy_setopt(req.handle(), CURLOPT_WRITEDATA, &body);
    if (!req.perform(e)) {
        err = classifyError(e, ErrorCategory::Network);
        return false;
    }
    outBody.swap(body);
    return true;
}

bool HttpTransport::download(const std::string& url,
                             const std::string& destPath,
                             const TransferTick& onTick,
                             ErrorInfo& err) {
    CurlRequest req(opts_, url);
    std::string e;
    if (!req.ready(e)) {
        err = classifyError(e, ErrorCategory::Network);
        return false;
    }

    UniqueFile out(std::fopen(destPath.c_str(), "wb"));
    if (!out) {
        err = makeError(ErrorCategory::Filesystem, ErrorCode::IoFailure,
                        "Open failed for " + destPath + ": " + std::strerror(errno));
        return false;
    }
    // Remove the partial file on every failure path below.
    auto cleanup = make_scope_guard([&]() {
        out.reset();
        std::error_code ec;
        std::filesystem::remove(destPath, ec);
        logDebug("Removed partial download " + destPath, "HTTP");
    });

    TickContext ticks;
    ticks.onTick = &onTick;
    CURL* c = req.handle();
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, writeToFile);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, out.f);
    curl_easy_setopt(c, CURLOPT_XFERINFOFUNCTION, forwardTick);
    curl_easy_setopt(c, CURLOPT_XFERINFODATA, &ticks);
    curl_easy_setopt(c, CURLOPT_NOPROGRESS, 0L);

    if (!req.perform(e)) {
        err = classifyError(e, ErrorCategory::Network);
        return false;
    }
    if (!out.close()) {
        err = makeError(ErrorCategory::Filesystem, ErrorCode::IoFailure,
                        "Write failed for " + destPath + " (close): " + std::strerror(errno));
        return false;
    }
    if (onTick) onTick(req.received(), req.expected());
    cleanup.dismiss();
    return true;
}

} // namespace helpmirror
