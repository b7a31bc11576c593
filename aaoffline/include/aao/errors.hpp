#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace aao {

enum class ErrorCategory {
    None,
    Config,
    Resolution,
    Network,
    Asset,
    Sequence,
    Bundle,
    Parse,
    Internal
};

enum class ErrorCode {
    None,
    Unknown,
    ConfigMissing,
    ConfigInvalid,
    MalformedCaseId,
    CaseNotFound,
    TransportFailure,
    Timeout,
    DnsFailure,
    ConnectFailure,
    HttpStatus,
    HttpForbidden,
    HttpNotFound,
    EmptyPayload,
    ParseFailure,
    SelfLink,
    WriteFailure,
    OutputExists,
    MissingAssets,
    Insecure,
    Cancelled
};

struct ErrorInfo {
    ErrorCategory category{ErrorCategory::None};
    ErrorCode code{ErrorCode::None};
    int httpStatus{0};
    bool retryable{false};
    std::string userMessage;
    std::string detail;
};

inline const char* errorCategoryLabel(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::Config: return "Config";
        case ErrorCategory::Resolution: return "ResolutionError";
        case ErrorCategory::Network: return "NetworkError";
        case ErrorCategory::Asset: return "AssetError";
        case ErrorCategory::Sequence: return "SequenceError";
        case ErrorCategory::Bundle: return "BundleError";
        case ErrorCategory::Parse: return "ParseError";
        case ErrorCategory::Internal: return "Internal";
        default: return "Unknown";
    }
}

inline const char* errorCodeLabel(ErrorCode c) {
    switch (c) {
        case ErrorCode::None: return "None";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::ConfigMissing: return "ConfigMissing";
        case ErrorCode::ConfigInvalid: return "ConfigInvalid";
        case ErrorCode::MalformedCaseId: return "MalformedCaseId";
        case ErrorCode::CaseNotFound: return "NotFound";
        case ErrorCode::TransportFailure: return "TransportFailure";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::DnsFailure: return "DnsFailure";
        case ErrorCode::ConnectFailure: return "ConnectFailure";
        case ErrorCode::HttpStatus: return "HttpStatus";
        case ErrorCode::HttpForbidden: return "HttpForbidden";
        case ErrorCode::HttpNotFound: return "HttpNotFound";
        case ErrorCode::EmptyPayload: return "EmptyPayload";
        case ErrorCode::ParseFailure: return "ParseFailure";
        case ErrorCode::SelfLink: return "SelfLink";
        case ErrorCode::WriteFailure: return "WriteFailure";
        case ErrorCode::OutputExists: return "OutputExists";
        case ErrorCode::MissingAssets: return "MissingAssets";
        case ErrorCode::Insecure: return "Insecure";
        case ErrorCode::Cancelled: return "Cancelled";
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
    // Accept simple forms like "HTTP 503 ..." or "(HTTP 404)".
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

inline ErrorInfo classifyError(const std::string& detail, ErrorCategory hint = ErrorCategory::None) {
    ErrorInfo out;
    out.detail = detail;
    out.category = hint;
    out.code = ErrorCode::Unknown;

    const std::string l = toLowerCopy(detail);
    const int http = parseHttpStatusFromMessage(detail);
    if (http > 0) out.httpStatus = http;

    // Asset-level failures keep their category; only code/retryable are refined.
    // Malformed case payloads stay resolution errors.
    auto set = [&](ErrorCategory cat, ErrorCode code, const char* user, bool retryable) {
        bool keep = hint == ErrorCategory::Asset || hint == ErrorCategory::Bundle ||
                    (hint == ErrorCategory::Resolution && cat == ErrorCategory::Parse);
        out.category = keep ? hint : cat;
        out.code = code;
        out.userMessage = user;
        out.retryable = retryable;
    };

    if (l.find("cancelled") != std::string::npos) {
        set(hint == ErrorCategory::None ? ErrorCategory::Internal : hint, ErrorCode::Cancelled, "Operation was cancelled.", false);
    } else if (l.find("insecure") != std::string::npos) {
        set(ErrorCategory::Asset, ErrorCode::Insecure, "Insecure http:// download was refused.", false);
    } else if (l.find("missing config") != std::string::npos) {
        set(ErrorCategory::Config, ErrorCode::ConfigMissing, "Configuration file is missing.", false);
    } else if (l.find("invalid config") != std::string::npos || l.find("failed to parse env") != std::string::npos) {
        set(ErrorCategory::Config, ErrorCode::ConfigInvalid, "Configuration format is invalid.", false);
    } else if (l.find("malformed case id") != std::string::npos) {
        set(ErrorCategory::Resolution, ErrorCode::MalformedCaseId, "Not a case id or case URL.", false);
    } else if (l.find("case not found") != std::string::npos) {
        set(ErrorCategory::Resolution, ErrorCode::CaseNotFound, "Case does not exist or is private.", false);
    } else if (http == 404 || http == 410) {
        set(ErrorCategory::Network, ErrorCode::HttpNotFound, "Requested resource was not found (404).", false);
    } else if (http == 401 || http == 403) {
        set(ErrorCategory::Network, ErrorCode::HttpForbidden, "Access denied by the server.", false);
    } else if (http == 408 || http == 429) {
        // Throttling is worth a retry for assets; a case lookup fails at once like any 4xx.
        set(ErrorCategory::Network, ErrorCode::HttpStatus, "Server asked to retry later.",
            hint != ErrorCategory::Resolution);
    } else if (http >= 400 && http < 600) {
        set(ErrorCategory::Network, ErrorCode::HttpStatus, "Server returned an HTTP error.", http >= 500);
    } else if (l.find("empty payload") != std::string::npos || l.find("empty body") != std::string::npos) {
        set(ErrorCategory::Network, ErrorCode::EmptyPayload, "Server returned no data.", false);
    } else if (l.find("dns") != std::string::npos || l.find("resolve host") != std::string::npos) {
        set(ErrorCategory::Network, ErrorCode::DnsFailure, "DNS lookup failed.", true);
    } else if (l.find("connect") != std::string::npos || l.find("connection reset") != std::string::npos) {
        set(ErrorCategory::Network, ErrorCode::ConnectFailure, "Failed to connect to server.", true);
    } else if (l.find("timeout") != std::string::npos || l.find("timed out") != std::string::npos) {
        set(ErrorCategory::Network, ErrorCode::Timeout, "Network operation timed out.", true);
    } else if (l.find("recv failure") != std::string::npos || l.find("send failure") != std::string::npos ||
               l.find("transport") != std::string::npos || l.find("http request failed") != std::string::npos) {
        set(ErrorCategory::Network, ErrorCode::TransportFailure, "Network transport failed.", true);
    } else if (l.find("self-link") != std::string::npos || l.find("sequence") != std::string::npos) {
        set(ErrorCategory::Sequence, ErrorCode::SelfLink, "Sequence links are inconsistent.", false);
    } else if (l.find("already exists") != std::string::npos) {
        set(ErrorCategory::Bundle, ErrorCode::OutputExists, "Output already exists.", false);
    } else if (l.find("missing assets") != std::string::npos) {
        set(ErrorCategory::Bundle, ErrorCode::MissingAssets, "Some assets could not be downloaded.", false);
    } else if (l.find("write failed") != std::string::npos || l.find("open failed") != std::string::npos ||
               l.find("rename failed") != std::string::npos) {
        set(ErrorCategory::Bundle, ErrorCode::WriteFailure, "Failed to write output.", false);
    } else if (l.find("parse") != std::string::npos || l.find("malformed") != std::string::npos || l.find("json") != std::string::npos) {
        set(ErrorCategory::Parse, ErrorCode::ParseFailure, "Received malformed data.", false);
    }

    // Fill any missing defaults.
    if (out.category == ErrorCategory::None) out.category = hint == ErrorCategory::None ? ErrorCategory::Internal : hint;
    if (out.userMessage.empty()) {
        switch (out.category) {
            case ErrorCategory::Config: out.userMessage = "Configuration error."; break;
            case ErrorCategory::Resolution: out.userMessage = "Case could not be resolved."; break;
            case ErrorCategory::Network: out.userMessage = "Network error."; out.retryable = true; break;
            case ErrorCategory::Asset: out.userMessage = "Asset could not be downloaded."; break;
            case ErrorCategory::Sequence: out.userMessage = "Sequence link problem."; break;
            case ErrorCategory::Bundle: out.userMessage = "Output could not be written."; break;
            case ErrorCategory::Parse: out.userMessage = "Data parsing error."; break;
            case ErrorCategory::Internal: out.userMessage = "Internal application error."; break;
            default: out.userMessage = "Unknown error."; break;
        }
    }

    return out;
}

} // namespace aao
