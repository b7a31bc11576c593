#include "catch.hpp"
#include "aao/http_client.hpp"
#include "fake_site.hpp"
#include <thread>
#include <vector>

using aao::testing::FakeSite;

namespace {

aao::RetryPolicy fastPolicy(int attempts) {
    aao::RetryPolicy p;
    p.maxAttempts = attempts;
    p.baseDelayMs = 1;
    p.maxDelayMs = 2;
    p.jitter = 0.0;
    return p;
}

} // namespace

TEST_CASE("HttpClient does not retry client errors") {
    FakeSite site;
    site.fail("https://aaonline.fr/gone.png", 404);
    aao::RequestLimiter limiter(2);
    aao::HttpClient client(site.transport(), fastPolicy(3), limiter, aao::ClientOptions{});

    aao::HttpResponse resp;
    aao::ErrorInfo info;
    REQUIRE_FALSE(client.get("https://aaonline.fr/gone.png", resp, info, aao::ErrorCategory::Asset));
    REQUIRE(info.category == aao::ErrorCategory::Asset);
    REQUIRE(info.code == aao::ErrorCode::HttpNotFound);
    REQUIRE(info.httpStatus == 404);
    REQUIRE(site.hits("https://aaonline.fr/gone.png") == 1);
    REQUIRE(client.requestsIssued() == 1);
}

TEST_CASE("HttpClient gives up on a throttled case lookup at once") {
    FakeSite site;
    site.fail("https://aaonline.fr/trial.js.php?trial_id=7", 429);
    site.fail("https://aaonline.fr/busy.png", 429);
    aao::RequestLimiter limiter(2);
    aao::HttpClient client(site.transport(), fastPolicy(3), limiter, aao::ClientOptions{});

    aao::HttpResponse resp;
    aao::ErrorInfo info;
    REQUIRE_FALSE(client.get("https://aaonline.fr/trial.js.php?trial_id=7", resp, info,
                             aao::ErrorCategory::Resolution));
    REQUIRE(info.httpStatus == 429);
    REQUIRE(site.hits("https://aaonline.fr/trial.js.php?trial_id=7") == 1);

    REQUIRE_FALSE(client.get("https://aaonline.fr/busy.png", resp, info, aao::ErrorCategory::Asset));
    REQUIRE(site.hits("https://aaonline.fr/busy.png") == 3);
}

TEST_CASE("HttpClient retries server errors up to the attempt bound") {
    FakeSite site;
    site.fail("https://aaonline.fr/busy.png", 503);
    aao::RequestLimiter limiter(2);
    aao::HttpClient client(site.transport(), fastPolicy(3), limiter, aao::ClientOptions{});

    aao::HttpResponse resp;
    aao::ErrorInfo info;
    REQUIRE_FALSE(client.get("https://aaonline.fr/busy.png", resp, info));
    REQUIRE(info.httpStatus == 503);
    REQUIRE(info.retryable);
    REQUIRE(site.hits("https://aaonline.fr/busy.png") == 3);
}

TEST_CASE("HttpClient retries transport failures") {
    FakeSite site;
    site.dropConnection("https://aaonline.fr/flaky.png");
    aao::RequestLimiter limiter(1);
    aao::HttpClient client(site.transport(), fastPolicy(2), limiter, aao::ClientOptions{});

    aao::HttpResponse resp;
    aao::ErrorInfo info;
    REQUIRE_FALSE(client.get("https://aaonline.fr/flaky.png", resp, info));
    REQUIRE(info.category == aao::ErrorCategory::Network);
    REQUIRE(info.code == aao::ErrorCode::ConnectFailure);
    REQUIRE(site.hits("https://aaonline.fr/flaky.png") == 2);
    REQUIRE(limiter.inFlight() == 0);
}

TEST_CASE("HttpClient returns the body on success") {
    FakeSite site;
    site.route("https://aaonline.fr/a.txt", "hello", "text/plain");
    aao::RequestLimiter limiter(1);
    aao::HttpClient client(site.transport(), fastPolicy(1), limiter, aao::ClientOptions{});

    std::string body;
    std::string err;
    REQUIRE(client.getText("https://aaonline.fr/a.txt", body, err));
    REQUIRE(body == "hello");

    REQUIRE_FALSE(client.getText("https://aaonline.fr/missing.txt", body, err));
    REQUIRE(err.find("missing.txt") != std::string::npos);
}

TEST_CASE("HttpClient applies the proxy prefix and the photobucket referer") {
    std::vector<aao::HttpRequest> seen;
    aao::Transport transport = [&](const aao::HttpRequest& req, aao::HttpResponse& resp, std::string&) {
        seen.push_back(req);
        resp.statusCode = 200;
        resp.body = "x";
        return true;
    };
    aao::ClientOptions options;
    options.proxy = "https://proxy.example/?u=";
    aao::RequestLimiter limiter(1);
    aao::HttpClient client(transport, fastPolicy(1), limiter, options);

    aao::HttpResponse resp;
    aao::ErrorInfo info;
    REQUIRE(client.get("https://i1.photobucket.com/a.jpg", resp, info));
    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0].url == "https://proxy.example/?u=https://i1.photobucket.com/a.jpg");
    bool referer = false;
    for (const auto& h : seen[0].headers) {
        if (h.first == "Referer") referer = true;
    }
    REQUIRE(referer);
}

TEST_CASE("RequestLimiter bounds in-flight requests across threads") {
    FakeSite site;
    site.setLatencyMs(5);
    aao::RequestLimiter limiter(3);
    aao::HttpClient client(site.transport(), fastPolicy(1), limiter, aao::ClientOptions{});

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&client, t] {
            for (int i = 0; i < 5; ++i) {
                aao::HttpResponse resp;
                aao::ErrorInfo info;
                client.get("https://aaonline.fr/img/" + std::to_string(t) + "_" + std::to_string(i) + ".png",
                           resp, info);
            }
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE(site.totalHits() == 40);
    REQUIRE(limiter.peak() <= 3);
    REQUIRE(site.peakConcurrent() <= 3);
    REQUIRE(limiter.inFlight() == 0);
}

TEST_CASE("HttpClient stops before the request once cancelled") {
    FakeSite site;
    aao::CancelToken cancel;
    cancel.cancel();
    aao::RequestLimiter limiter(1);
    aao::HttpClient client(site.transport(), fastPolicy(3), limiter, aao::ClientOptions{}, &cancel);

    aao::HttpResponse resp;
    aao::ErrorInfo info;
    REQUIRE(client.cancelled());
    REQUIRE_FALSE(client.get("https://aaonline.fr/a.png", resp, info, aao::ErrorCategory::Asset));
    REQUIRE(info.code == aao::ErrorCode::Cancelled);
    REQUIRE(site.totalHits() == 0);
}

TEST_CASE("RetryPolicy backoff grows and stays capped") {
    aao::RetryPolicy p;
    p.baseDelayMs = 100;
    p.maxDelayMs = 300;
    p.jitter = 0.0;
    std::mt19937 rng(1);
    REQUIRE(p.delayMs(1, rng) == 100);
    REQUIRE(p.delayMs(2, rng) == 200);
    REQUIRE(p.delayMs(5, rng) == 300);
}
