#pragma once

#include <string>
#include "aao/config.hpp"

namespace aao {

struct ParsedUrl {
    std::string scheme; // lowercase, "http" or "https"
    std::string host;   // lowercase
    std::string port;   // empty when default
    std::string path;   // starts with '/'
    std::string query;  // without '?'
};

bool parseUrl(const std::string& url, ParsedUrl& out, std::string& err);
std::string formatUrl(const ParsedUrl& url);

// Collapse runs of '/' in the path ("a//b" -> "a/b"), leaving "scheme://" alone.
std::string collapseSlashes(const std::string& url);

// Normalize a reference into the dedup key used everywhere else: absolute,
// lowercase scheme/host, no fragment, no default port, collapsed and
// percent-encoded path. Relative references resolve against `base`.
bool canonicalizeUrl(const std::string& raw,
                     const std::string& base,
                     HttpHandling handling,
                     std::string& out,
                     std::string& err);

std::string urlHost(const std::string& url);
// Last path segment, percent-decoded, without query.
std::string urlFileName(const std::string& url);
// Lowercase extension of the last path segment without the dot, or "".
std::string urlExtension(const std::string& url);
// True when host is `domain` or a subdomain of it.
bool hostMatches(const std::string& host, const std::string& domain);

} // namespace aao
