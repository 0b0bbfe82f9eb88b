#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace helpmirror {

enum class ErrorCategory {
    None,
    InvalidArgument,
    Config,
    Parse,
    Network,
    Http,
    Filesystem,
    Integrity,
    Unsupported,
    Internal
};

enum class ErrorCode {
    None,
    Unknown,
    MissingArgument,
    ConfigInvalid,
    MissingRequiredField,
    TransportFailure,
    Timeout,
    DnsFailure,
    ConnectFailure,
    HttpStatus,
    HttpNotFound,
    TooManyRedirects,
    ParseFailure,
    IoFailure,
    SignatureInvalid,
    UnsupportedFeature
};

struct ErrorInfo {
    ErrorCategory category{ErrorCategory::None};
    ErrorCode code{ErrorCode::None};
    int httpStatus{0};
    bool retryable{false};
    std::string userMessage;
    std::string detail;

    explicit operator bool() const { return category != ErrorCategory::None; }
};

inline const char* errorCategoryLabel(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::InvalidArgument: return "InvalidArgument";
        case ErrorCategory::Config: return "Config";
        case ErrorCategory::Parse: return "Parse";
        case ErrorCategory::Network: return "Network";
        case ErrorCategory::Http: return "HTTP";
        case ErrorCategory::Filesystem: return "Filesystem";
        case ErrorCategory::Integrity: return "Integrity";
        case ErrorCategory::Unsupported: return "Unsupported";
        case ErrorCategory::Internal: return "Internal";
        default: return "Unknown";
    }
}

inline const char* errorCodeLabel(ErrorCode c) {
    switch (c) {
        case ErrorCode::None: return "None";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::MissingArgument: return "MissingArgument";
        case ErrorCode::ConfigInvalid: return "ConfigInvalid";
        case ErrorCode::MissingRequiredField: return "MissingRequiredField";
        case ErrorCode::TransportFailure: return "TransportFailure";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::DnsFailure: return "DnsFailure";
        case ErrorCode::ConnectFailure: return "ConnectFailure";
        case ErrorCode::HttpStatus: return "HttpStatus";
        case ErrorCode::HttpNotFound: return "HttpNotFound";
        case ErrorCode::TooManyRedirects: return "TooManyRedirects";
        case ErrorCode::ParseFailure: return "ParseFailure";
        case ErrorCode::IoFailure: return "IoFailure";
        case ErrorCode::SignatureInvalid: return "SignatureInvalid";
        case ErrorCode::UnsupportedFeature: return "UnsupportedFeature";
        default: return "Unknown";
    }
}

inline std::string toLowerCopy(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

inline int parseHttpStatusFromMessage(const std::string& msg) {
    // Accept simple forms like "HTTP 404 ..." or "(HTTP 503)".
    auto pos = msg.find("HTTP ");
    if (pos == std::string::npos) pos = msg.find("HTTP");
    if (pos == std::string::npos) return 0;
    pos = msg.find_first_of("0123456789", pos);
    if (pos == std::string::npos) return 0;
    int code = 0;
    int digits = 0;
    while (pos < msg.size() && std::isdigit(static_cast<unsigned char>(msg[pos])) && digits < 3) {
        code = code * 10 + (msg[pos] - '0');
        ++pos;
        ++digits;
    }
    return digits == 3 ? code : 0;
}

inline const char* defaultUserMessage(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::InvalidArgument: return "A required parameter is missing.";
        case ErrorCategory::Config: return "Configuration error.";
        case ErrorCategory::Parse: return "Catalog data could not be parsed.";
        case ErrorCategory::Network: return "Network error.";
        case ErrorCategory::Http: return "Server returned an error.";
        case ErrorCategory::Filesystem: return "Cache directory could not be updated.";
        case ErrorCategory::Integrity: return "Downloaded package failed signature verification.";
        case ErrorCategory::Unsupported: return "Unsupported feature.";
        case ErrorCategory::Internal: return "Internal application error.";
        default: return "Unknown error.";
    }
}

inline ErrorInfo makeError(ErrorCategory category, ErrorCode code, const std::string& detail) {
    ErrorInfo out;
    out.category = category;
    out.code = code;
    out.detail = detail;
    out.userMessage = defaultUserMessage(category);
    out.retryable = category == ErrorCategory::Network;
    return out;
}

// Maps a free-form transport or config message onto the taxonomy.
inline ErrorInfo classifyError(const std::string& detail, ErrorCategory hint = ErrorCategory::None) {
    ErrorInfo out;
    out.detail = detail;
    out.category = hint;
    out.code = ErrorCode::Unknown;

    const std::string l = toLowerCopy(detail);
    const int http = parseHttpStatusFromMessage(detail);
    if (http > 0) out.httpStatus = http;

    auto set = [&](ErrorCategory cat, ErrorCode code, const char* user, bool retryable) {
        out.category = cat;
        out.code = code;
        out.userMessage = user;
        out.retryable = retryable;
    };

    if (l.find("missing required") != std::string::npos || l.find("config missing") != std::string::npos) {
        set(ErrorCategory::Config, ErrorCode::MissingRequiredField, "Required setting is missing.", false);
    } else if (l.find("invalid config") != std::string::npos) {
        set(ErrorCategory::Config, ErrorCode::ConfigInvalid, "Configuration format is invalid.", false);
    } else if (l.find("not supported") != std::string::npos) {
        set(ErrorCategory::Unsupported, ErrorCode::UnsupportedFeature, "This feature is not supported yet.", false);
    } else if (l.find("too many redirects") != std::string::npos) {
        set(ErrorCategory::Http, ErrorCode::TooManyRedirects, "Server redirected too many times.", false);
    } else if (http == 404) {
        set(ErrorCategory::Http, ErrorCode::HttpNotFound, "Requested resource was not found (404).", false);
    } else if (http >= 400 && http < 600) {
        set(ErrorCategory::Http, ErrorCode::HttpStatus, "Server returned an HTTP error.", http >= 500);
    } else if (l.find("dns") != std::string::npos || l.find("resolve") != std::string::npos) {
        set(ErrorCategory::Network, ErrorCode::DnsFailure, "DNS lookup failed.", true);
    } else if (l.find("connect failed") != std::string::npos || l.find("socket") != std::string::npos) {
        set(ErrorCategory::Network, ErrorCode::ConnectFailure, "Failed to connect to server.", true);
    } else if (l.find("timeout") != std::string::npos || l.find("timed out") != std::string::npos) {
        set(ErrorCategory::Network, ErrorCode::Timeout, "Network operation timed out.", true);
    } else if (l.find("recv failed") != std::string::npos || l.find("send failed") != std::string::npos ||
               l.find("short read") != std::string::npos || l.find("transport") != std::string::npos) {
        set(ErrorCategory::Network, ErrorCode::TransportFailure, "Network transport failed.", true);
    } else if (l.find("write failed") != std::string::npos || l.find("open failed") != std::string::npos) {
        set(ErrorCategory::Filesystem, ErrorCode::IoFailure, "Failed to write to the cache directory.", true);
    } else if (l.find("malformed") != std::string::npos || l.find("parse") != std::string::npos) {
        set(ErrorCategory::Parse, ErrorCode::ParseFailure, "Received malformed data.", false);
    }

    if (out.category == ErrorCategory::None) out.category = ErrorCategory::Internal;
    if (out.userMessage.empty()) {
        out.userMessage = defaultUserMessage(out.category);
        out.retryable = out.category == ErrorCategory::Network || out.category == ErrorCategory::Filesystem;
    }

    return out;
}

inline std::string describeError(const ErrorInfo& info) {
    if (info.detail.empty()) return info.userMessage;
    return info.userMessage + " (" + info.detail + ")";
}

} // namespace helpmirror
