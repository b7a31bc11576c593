#include "aao/http_common.hpp"
#include "aao/util.hpp"
#include <sstream>
#include <cctype>
#include <algorithm>
#include <cstdlib>

namespace aao {

bool parseHttpResponseHeaders(const std::string& headerBlock, ParsedHttpResponse& out, std::string& err) {
    out = ParsedHttpResponse{};
    auto firstCrLf = headerBlock.find("\r\n");
    if (firstCrLf == std::string::npos) {
        err = "Malformed HTTP response (no status line CRLF)";
        return false;
    }
    std::string statusLine = headerBlock.substr(0, firstCrLf);
    if (!statusLine.empty() && statusLine.back() == '\r') statusLine.pop_back();
    std::istringstream sl(statusLine);
    std::string httpVer;
    sl >> httpVer >> out.statusCode;
    if (httpVer.rfind("HTTP/", 0) != 0 || out.statusCode < 100) {
        err = "Malformed HTTP status line: " + util::ellipsize(statusLine, 64);
        return false;
    }
    std::getline(sl, out.statusText);
    if (!out.statusText.empty() && out.statusText.front() == ' ') out.statusText.erase(out.statusText.begin());

    std::istringstream hs(headerBlock);
    std::string line;
    std::getline(hs, line); // discard status line
    std::ostringstream raw;
    bool firstHeader = true;
    while (std::getline(hs, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        if (!firstHeader) raw << "\r\n";
        raw << line;
        firstHeader = false;
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = line.substr(0, colon);
        std::string val = line.substr(colon + 1);
        while (!val.empty() && (val.front() == ' ' || val.front() == '\t')) val.erase(val.begin());
        std::string keyLower = util::toLower(key);
        if (keyLower == "content-length") {
            out.contentLength = static_cast<uint64_t>(std::strtoull(val.c_str(), nullptr, 10));
        } else if (keyLower == "content-type") {
            out.contentType = val;
        } else if (keyLower == "content-disposition") {
            out.contentDisposition = val;
        } else if (keyLower == "location") {
            out.location = val;
        }
    }
    out.headersRaw = raw.str();
    return true;
}

std::string mediaTypeOf(const std::string& contentType) {
    std::string t = contentType.substr(0, contentType.find(';'));
    util::trim(t);
    return util::toLower(t);
}

std::string dispositionFilename(const std::string& contentDisposition) {
    std::string lower = util::toLower(contentDisposition);
    // RFC 5987 form wins: filename*=UTF-8''name%20here
    auto star = lower.find("filename*=");
    if (star != std::string::npos) {
        std::string v = contentDisposition.substr(star + 10);
        v = v.substr(0, v.find(';'));
        auto quotes = v.find("''");
        if (quotes != std::string::npos) v = v.substr(quotes + 2);
        util::trim(v);
        return util::urlDecode(v);
    }
    auto pos = lower.find("filename=");
    if (pos == std::string::npos) return "";
    std::string v = contentDisposition.substr(pos + 9);
    util::trim(v);
    if (!v.empty() && v.front() == '"') {
        auto end = v.find('"', 1);
        return v.substr(1, end == std::string::npos ? std::string::npos : end - 1);
    }
    v = v.substr(0, v.find(';'));
    util::trim(v);
    return v;
}

} // namespace aao
