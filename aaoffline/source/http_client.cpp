#include "aao/http_client.hpp"
#include "aao/http_common.hpp"
#include "aao/logger.hpp"
#include "aao/raii.hpp"
#include "aao/url.hpp"
#include "aao/util.hpp"
#include "aao/version.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>
#include <curl/curl.h>

namespace aao {

namespace {

size_t curlWriteBody(void* ptr, size_t sz, size_t nm, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(static_cast<const char*>(ptr), sz * nm);
    return sz * nm;
}

// Redirects deliver one header block per hop; keep only the last one.
size_t curlWriteHeader(char* ptr, size_t sz, size_t nm, void* userdata) {
    auto* block = static_cast<std::string*>(userdata);
    std::string line(ptr, sz * nm);
    if (line.rfind("HTTP/", 0) == 0) block->clear();
    block->append(line);
    return sz * nm;
}

bool curlPerform(const HttpRequest& req, HttpResponse& resp, std::string& err) {
    UniqueCurl curl(curl_easy_init());
    if (!curl) {
        err = "transport: curl_easy_init failed";
        return false;
    }
    UniqueCurlList headers;
    for (const auto& h : req.headers) {
        std::string line = h.first + ": " + h.second;
        if (!headers.append(line.c_str())) {
            err = "transport: header allocation failed";
            return false;
        }
    }

    std::string headerBlock;
    char errbuf[CURL_ERROR_SIZE] = {0};
    resp = HttpResponse{};
    curl_easy_setopt(curl.h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl.h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.h, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl.h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.h, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl.h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(req.connectTimeoutSeconds));
    curl_easy_setopt(curl.h, CURLOPT_TIMEOUT, static_cast<long>(req.timeoutSeconds));
    curl_easy_setopt(curl.h, CURLOPT_ERRORBUFFER, errbuf);
    if (headers.list) curl_easy_setopt(curl.h, CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(curl.h, CURLOPT_WRITEFUNCTION, &curlWriteBody);
    curl_easy_setopt(curl.h, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl.h, CURLOPT_HEADERFUNCTION, &curlWriteHeader);
    curl_easy_setopt(curl.h, CURLOPT_HEADERDATA, &headerBlock);

    CURLcode rc = curl_easy_perform(curl.h);
    if (rc != CURLE_OK) {
        err = std::string("transport: ") + (errbuf[0] ? errbuf : curl_easy_strerror(rc));
        if (rc == CURLE_OPERATION_TIMEDOUT) err += " (timeout)";
        return false;
    }

    long status = 0;
    curl_easy_getinfo(curl.h, CURLINFO_RESPONSE_CODE, &status);
    resp.statusCode = static_cast<int>(status);
    char* effective = nullptr;
    if (curl_easy_getinfo(curl.h, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
        resp.effectiveUrl = effective;
    }

    ParsedHttpResponse parsed;
    std::string parseErr;
    if (!headerBlock.empty() && parseHttpResponseHeaders(headerBlock, parsed, parseErr)) {
        resp.statusText = parsed.statusText;
        resp.contentType = parsed.contentType;
        resp.contentDisposition = parsed.contentDisposition;
    } else if (!parseErr.empty()) {
        logDebug("Header parse: " + parseErr, "HTTP");
    }
    if (resp.contentType.empty()) {
        char* ct = nullptr;
        if (curl_easy_getinfo(curl.h, CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct) resp.contentType = ct;
    }
    return true;
}

std::string statusError(const HttpResponse& resp) {
    std::string e = "HTTP " + std::to_string(resp.statusCode);
    if (!resp.statusText.empty()) e += " " + resp.statusText;
    return e;
}

} // namespace

Transport makeCurlTransport() {
    return [](const HttpRequest& req, HttpResponse& resp, std::string& err) {
        return curlPerform(req, resp, err);
    };
}

CurlGlobal::CurlGlobal() {
    ok_ = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
    if (!ok_) logError("curl_global_init failed", "HTTP");
}

CurlGlobal::~CurlGlobal() {
    if (ok_) curl_global_cleanup();
}

int RetryPolicy::delayMs(int attempt, std::mt19937& rng) const {
    if (attempt < 1) attempt = 1;
    double d = static_cast<double>(baseDelayMs) * std::pow(2.0, attempt - 1);
    d = std::min(d, static_cast<double>(maxDelayMs));
    if (jitter > 0.0) {
        std::uniform_real_distribution<double> dist(1.0 - jitter, 1.0 + jitter);
        d *= dist(rng);
    }
    return std::max(0, static_cast<int>(d));
}

RequestLimiter::RequestLimiter(int limit) : limit_(std::max(1, limit)) {}

bool RequestLimiter::acquire(const CancelToken* cancel) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (inFlight_ >= limit_) {
        if (cancel && cancel->cancelled()) return false;
        cv_.wait_for(lock, std::chrono::milliseconds(50));
    }
    if (cancel && cancel->cancelled()) return false;
    ++inFlight_;
    peak_ = std::max(peak_, inFlight_);
    return true;
}

void RequestLimiter::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inFlight_ > 0) --inFlight_;
    }
    cv_.notify_one();
}

void RequestLimiter::interrupt() { cv_.notify_all(); }

int RequestLimiter::inFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inFlight_;
}

int RequestLimiter::peak() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

ClientOptions clientOptionsFromConfig(const Config& cfg) {
    ClientOptions o;
    o.connectTimeoutSeconds = cfg.connectTimeoutSeconds;
    o.readTimeoutSeconds = cfg.readTimeoutSeconds;
    o.proxy = cfg.proxy;
    o.photobucketFix = !cfg.disablePhotobucketFix;
    o.userAgent = std::string("aaoffline/") + appVersion();
    return o;
}

RetryPolicy retryPolicyFromConfig(const Config& cfg) {
    RetryPolicy p;
    p.maxAttempts = std::max(1, cfg.retries);
    return p;
}

HttpClient::HttpClient(Transport transport,
                       RetryPolicy policy,
                       RequestLimiter& limiter,
                       ClientOptions options,
                       const CancelToken* cancel)
    : transport_(std::move(transport)),
      policy_(policy),
      limiter_(limiter),
      options_(std::move(options)),
      cancel_(cancel),
      rng_(std::random_device{}()) {}

HttpRequest HttpClient::buildRequest(const std::string& url) const {
    HttpRequest req;
    req.url = options_.proxy.empty() ? url : options_.proxy + url;
    req.connectTimeoutSeconds = options_.connectTimeoutSeconds;
    req.timeoutSeconds = options_.readTimeoutSeconds;
    if (!options_.userAgent.empty()) req.headers.emplace_back("User-Agent", options_.userAgent);
    // Photobucket serves a placeholder unless the request looks like it came from its own pages.
    if (options_.photobucketFix && hostMatches(urlHost(url), "photobucket.com")) {
        req.headers.emplace_back("Referer", "https://photobucket.com/");
    }
    return req;
}

bool HttpClient::sleepUnlessCancelled(int ms) const {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (cancelled()) return false;
        std::this_thread::sleep_for(std::min(std::chrono::milliseconds(25),
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now())));
    }
    return !cancelled();
}

bool HttpClient::get(const std::string& url, HttpResponse& resp, ErrorInfo& info, ErrorCategory hint) {
    const HttpRequest req = buildRequest(url);
    std::string lastErr;
    for (int attempt = 1; attempt <= policy_.maxAttempts; ++attempt) {
        if (!limiter_.acquire(cancel_)) {
            info = classifyError("cancelled before request", hint);
            return false;
        }
        HttpResponse r;
        std::string e;
        bool transported = false;
        {
            auto slot = make_scope_guard([this] { limiter_.release(); });
            requests_.fetch_add(1);
            transported = transport_(req, r, e);
        }

        if (transported) {
            if (isSuccessStatus(r.statusCode)) {
                resp = std::move(r);
                return true;
            }
            lastErr = statusError(r);
            info = classifyError(lastErr, hint);
            info.httpStatus = r.statusCode;
            resp = std::move(r);
        } else {
            lastErr = e.empty() ? "transport failure" : e;
            info = classifyError(lastErr, hint);
            // Anything the transport could not classify is still a network fault.
            if (info.code == ErrorCode::Unknown) info.retryable = true;
        }

        if (!info.retryable) {
            logDebug("GET " + url + " failed permanently: " + lastErr, "HTTP");
            return false;
        }
        if (attempt < policy_.maxAttempts) {
            int delay = 0;
            {
                std::lock_guard<std::mutex> lock(rngMutex_);
                delay = policy_.delayMs(attempt, rng_);
            }
            logDebug("GET " + url + " attempt " + std::to_string(attempt) + " failed (" + lastErr +
                     "), retrying in " + std::to_string(delay) + "ms", "HTTP");
            if (!sleepUnlessCancelled(delay)) {
                info = classifyError("cancelled during backoff", hint);
                return false;
            }
        }
    }
    logWarn("GET " + url + " failed after " + std::to_string(policy_.maxAttempts) + " attempts: " + lastErr, "HTTP");
    return false;
}

bool HttpClient::getText(const std::string& url, std::string& body, std::string& err) {
    HttpResponse resp;
    ErrorInfo info;
    if (!get(url, resp, info)) {
        err = info.detail.empty() ? info.userMessage : info.detail;
        err += " (" + url + ")";
        return false;
    }
    body = std::move(resp.body);
    return true;
}

} // namespace aao
