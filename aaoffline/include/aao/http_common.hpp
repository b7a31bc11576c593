#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace aao {

struct ParsedHttpResponse {
    int statusCode{0};
    std::string statusText;
    uint64_t contentLength{0};
    std::string contentType;
    std::string contentDisposition;
    std::string location;
    std::string headersRaw;
};

// Parse HTTP status line + headers (headerBlock excludes the trailing CRLFCRLF).
// Returns false and sets err on malformed input.
bool parseHttpResponseHeaders(const std::string& headerBlock, ParsedHttpResponse& out, std::string& err);

// Media type without parameters, lowercased ("Image/PNG; q=1" -> "image/png").
std::string mediaTypeOf(const std::string& contentType);

// filename / filename* parameter of a Content-Disposition value, or "".
std::string dispositionFilename(const std::string& contentDisposition);

inline bool isSuccessStatus(int status) { return status >= 200 && status < 300; }

} // namespace aao
