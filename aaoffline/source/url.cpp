#include "aao/url.hpp"
#include "aao/util.hpp"
#include <vector>

namespace aao {

bool parseUrl(const std::string& url, ParsedUrl& out, std::string& err) {
    out = ParsedUrl{};
    auto sep = url.find("://");
    if (sep == std::string::npos) {
        err = "Bad URL: missing scheme in " + util::ellipsize(url, 80);
        return false;
    }
    out.scheme = util::toLower(url.substr(0, sep));
    if (out.scheme != "http" && out.scheme != "https") {
        err = "Unsupported URL scheme: " + out.scheme;
        return false;
    }

    std::string rest = url.substr(sep + 3);
    auto hash = rest.find('#');
    if (hash != std::string::npos) rest = rest.substr(0, hash);
    std::string hostport;
    auto slash = rest.find_first_of("/?");
    if (slash == std::string::npos) {
        hostport = rest;
        out.path = "/";
    } else {
        hostport = rest.substr(0, slash);
        out.path = rest.substr(slash);
    }
    auto q = out.path.find('?');
    if (q != std::string::npos) {
        out.query = out.path.substr(q + 1);
        out.path = out.path.substr(0, q);
    }
    if (out.path.empty() || out.path[0] != '/') out.path.insert(out.path.begin(), '/');

    auto at = hostport.rfind('@');
    if (at != std::string::npos) hostport = hostport.substr(at + 1);
    out.host = util::toLower(hostport);
    auto colon = out.host.find(':');
    if (colon != std::string::npos) {
        out.port = out.host.substr(colon + 1);
        out.host = out.host.substr(0, colon);
        if ((out.scheme == "http" && out.port == "80") || (out.scheme == "https" && out.port == "443")) {
            out.port.clear();
        }
    }

    if (out.host.empty()) {
        err = "Bad URL: missing host";
        return false;
    }
    return true;
}

std::string formatUrl(const ParsedUrl& url) {
    std::string out = url.scheme + "://" + url.host;
    if (!url.port.empty()) out += ":" + url.port;
    out += url.path.empty() ? "/" : url.path;
    if (!url.query.empty()) out += "?" + url.query;
    return out;
}

std::string collapseSlashes(const std::string& url) {
    auto sep = url.find("://");
    size_t prefixLen = sep == std::string::npos ? 0 : sep + 3;
    std::string out = url.substr(0, prefixLen);
    out.reserve(url.size());
    auto q = url.find('?', prefixLen);
    size_t end = q == std::string::npos ? url.size() : q;
    for (size_t i = prefixLen; i < end; ++i) {
        if (url[i] == '/' && out.size() > prefixLen && out.back() == '/') continue;
        out.push_back(url[i]);
    }
    if (q != std::string::npos) out += url.substr(q);
    return out;
}

bool canonicalizeUrl(const std::string& raw,
                     const std::string& base,
                     HttpHandling handling,
                     std::string& out,
                     std::string& err) {
    std::string ref = raw;
    util::trim(ref);
    if (ref.empty()) {
        err = "Empty URL";
        return false;
    }
    if (util::startsWith(util::toLower(ref), "data:")) {
        err = "Data URI is not a remote reference";
        return false;
    }
    for (auto& c : ref) {
        if (c == '\\') c = '/';
    }

    std::string absolute;
    std::string lower = util::toLower(ref);
    if (util::startsWith(lower, "http://") || util::startsWith(lower, "https://")) {
        absolute = ref;
    } else if (util::startsWith(ref, "//")) {
        absolute = "https:" + ref;
    } else if (ref.find("://") != std::string::npos) {
        err = "Unsupported URL scheme in " + util::ellipsize(ref, 80);
        return false;
    } else {
        ParsedUrl b;
        if (!parseUrl(base, b, err)) return false;
        b.query.clear();
        if (ref[0] == '/') {
            b.path = ref;
        } else {
            auto lastSlash = b.path.rfind('/');
            b.path = b.path.substr(0, lastSlash + 1) + ref;
        }
        absolute = formatUrl(b);
    }

    ParsedUrl u;
    if (!parseUrl(collapseSlashes(absolute), u, err)) return false;

    if (u.scheme == "http") {
        switch (handling) {
            case HttpHandling::RedirectToHttps: u.scheme = "https"; break;
            case HttpHandling::Disallow:
                err = "Insecure http:// URL disallowed: " + util::ellipsize(ref, 80);
                return false;
            case HttpHandling::AllowInsecure: break;
        }
    }

    // Resolve "." and ".." segments.
    std::string resolved;
    {
        std::vector<std::string> stack;
        bool trailing = u.path.size() > 1 && u.path.back() == '/';
        for (const auto& seg : util::split(u.path, '/')) {
            if (seg.empty() || seg == ".") continue;
            if (seg == "..") {
                if (!stack.empty()) stack.pop_back();
                continue;
            }
            stack.push_back(seg);
        }
        for (const auto& seg : stack) resolved += "/" + seg;
        if (resolved.empty() || trailing) resolved += "/";
    }
    u.path = util::encodePath(resolved);
    util::replaceAll(u.query, " ", "%20");
    out = formatUrl(u);
    return true;
}

std::string urlHost(const std::string& url) {
    ParsedUrl u;
    std::string err;
    if (!parseUrl(url, u, err)) return "";
    return u.host;
}

std::string urlFileName(const std::string& url) {
    std::string path = url;
    auto sep = path.find("://");
    if (sep != std::string::npos) {
        auto slash = path.find('/', sep + 3);
        path = slash == std::string::npos ? std::string() : path.substr(slash);
    }
    path = path.substr(0, path.find_first_of("?#"));
    auto slash = path.rfind('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    return util::urlDecode(name);
}

std::string urlExtension(const std::string& url) {
    std::string name = urlFileName(url);
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot + 1 >= name.size()) return "";
    return util::toLower(name.substr(dot + 1));
}

bool hostMatches(const std::string& host, const std::string& domain) {
    if (host == domain) return true;
    return host.size() > domain.size() &&
           util::endsWith(host, domain) &&
           host[host.size() - domain.size() - 1] == '.';
}

} // namespace aao
