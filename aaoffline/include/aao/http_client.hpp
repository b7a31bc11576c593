#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <utility>
#include <vector>
#include "aao/config.hpp"
#include "aao/errors.hpp"

namespace aao {

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    int connectTimeoutSeconds{10};
    int timeoutSeconds{30};
};

struct HttpResponse {
    int statusCode{0};
    std::string statusText;
    std::string contentType;
    std::string contentDisposition;
    std::string effectiveUrl;
    std::string body;
};

// One network round trip. Returns false only on transport failure (no HTTP
// status); non-2xx responses return true with statusCode set.
using Transport = std::function<bool(const HttpRequest& req, HttpResponse& resp, std::string& err)>;

Transport makeCurlTransport();

// curl_global_init/cleanup for the lifetime of the run.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
    bool ok() const { return ok_; }

private:
    bool ok_{false};
};

// Exponential backoff with jitter; only transient failures are retried.
struct RetryPolicy {
    int maxAttempts{3};
    int baseDelayMs{250};
    int maxDelayMs{4000};
    double jitter{0.2};

    // Delay before attempt `attempt + 1` (attempt counts from 1).
    int delayMs(int attempt, std::mt19937& rng) const;
};

class CancelToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// Run-wide in-flight budget shared by every case and every worker.
class RequestLimiter {
public:
    explicit RequestLimiter(int limit);

    // Blocks until a slot is free; false if cancelled while waiting.
    bool acquire(const CancelToken* cancel = nullptr);
    void release();
    // Wake waiters so they can observe cancellation.
    void interrupt();

    int limit() const { return limit_; }
    int inFlight() const;
    int peak() const;

private:
    const int limit_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int inFlight_{0};
    int peak_{0};
};

struct ClientOptions {
    int connectTimeoutSeconds{10};
    int readTimeoutSeconds{30};
    std::string proxy;
    bool photobucketFix{true};
    std::string userAgent;
};

ClientOptions clientOptionsFromConfig(const Config& cfg);
RetryPolicy retryPolicyFromConfig(const Config& cfg);

// Per-run HTTP client: transport + retry policy + shared limiter.
class HttpClient {
public:
    HttpClient(Transport transport,
               RetryPolicy policy,
               RequestLimiter& limiter,
               ClientOptions options,
               const CancelToken* cancel = nullptr);

    // GET with retries on transient failures. True only for 2xx; on failure
    // `info` carries the classified error (hint decides the category).
    bool get(const std::string& url, HttpResponse& resp, ErrorInfo& info,
             ErrorCategory hint = ErrorCategory::Network);
    // GET returning the body as text; err holds a one-line reason.
    bool getText(const std::string& url, std::string& body, std::string& err);

    const RetryPolicy& policy() const { return policy_; }
    const ClientOptions& options() const { return options_; }
    bool cancelled() const { return cancel_ && cancel_->cancelled(); }
    uint64_t requestsIssued() const { return requests_.load(); }

private:
    HttpRequest buildRequest(const std::string& url) const;
    bool sleepUnlessCancelled(int ms) const;

    Transport transport_;
    RetryPolicy policy_;
    RequestLimiter& limiter_;
    ClientOptions options_;
    const CancelToken* cancel_{nullptr};
    std::atomic<uint64_t> requests_{0};
    std::mutex rngMutex_;
    std::mt19937 rng_;
};

} // namespace aao
