#include "catch.hpp"
#include "aao/fetcher.hpp"
#include "fake_site.hpp"
#include <set>

using aao::testing::FakeSite;

namespace {

aao::AssetReference ref(const std::string& url) {
    aao::AssetReference r;
    r.url = url;
    r.extensionHint = aao::urlExtension(url);
    return r;
}

aao::AssetRecord fetched(const std::string& url, const std::string& ext) {
    aao::AssetRecord rec;
    rec.url = url;
    rec.status = aao::AssetStatus::Fetched;
    rec.extension = ext;
    rec.mime = aao::mimeForExtension(ext);
    rec.bytes = "x";
    return rec;
}

aao::RetryPolicy onePolicy() {
    aao::RetryPolicy p;
    p.maxAttempts = 1;
    return p;
}

} // namespace

TEST_CASE("Fetcher records one failure per unreachable asset and keeps going") {
    FakeSite site;
    site.fail("https://i.imgur.com/gone.png", 404);
    aao::RequestLimiter limiter(3);
    aao::HttpClient client(site.transport(), onePolicy(), limiter, aao::ClientOptions{});
    aao::Fetcher fetcher(client, 3);

    size_t notified = 0;
    fetcher.setOnRecord([&](const aao::AssetRecord&, size_t done, size_t total) {
        ++notified;
        REQUIRE(done <= total);
    });
    const std::vector<aao::AssetReference> refs{ref("https://i.imgur.com/a.png"), ref("https://i.imgur.com/gone.png"),
                                                ref("https://aaonline.fr/Ressources/Sons/b.mp3")};
    const auto records = fetcher.fetchAll(refs);

    REQUIRE(records.size() == 3);
    REQUIRE(notified == 3);
    REQUIRE(records[0].status == aao::AssetStatus::Fetched);
    REQUIRE(records[0].mime == "image/png");
    REQUIRE(records[1].status == aao::AssetStatus::Failed);
    REQUIRE(records[1].error.category == aao::ErrorCategory::Asset);
    REQUIRE(records[1].error.code == aao::ErrorCode::HttpNotFound);
    REQUIRE(records[1].localName.empty());
    REQUIRE(records[2].status == aao::AssetStatus::Fetched);
    REQUIRE(records[2].extension == "mp3");
    REQUIRE(site.hits("https://i.imgur.com/gone.png") == 1);
}

TEST_CASE("Fetcher treats an empty body as a failure") {
    FakeSite site;
    site.route("https://i.imgur.com/empty.gif", "", "image/gif");
    aao::RequestLimiter limiter(1);
    aao::HttpClient client(site.transport(), onePolicy(), limiter, aao::ClientOptions{});
    aao::Fetcher fetcher(client, 1);

    aao::AssetRecord rec = fetcher.fetchOne(ref("https://i.imgur.com/empty.gif"));
    REQUIRE(rec.status == aao::AssetStatus::Failed);
    REQUIRE(rec.error.code == aao::ErrorCode::EmptyPayload);
    REQUIRE(rec.error.category == aao::ErrorCategory::Asset);
}

TEST_CASE("Fetcher records insecure references as failures without a request") {
    FakeSite site;
    aao::RequestLimiter limiter(1);
    aao::HttpClient client(site.transport(), onePolicy(), limiter, aao::ClientOptions{});
    aao::Fetcher fetcher(client, 1);

    aao::AssetReference plain = ref("http://i.imgur.com/theme.mp3");
    plain.insecure = true;
    const auto records = fetcher.fetchAll({plain});
    REQUIRE(records[0].status == aao::AssetStatus::Failed);
    REQUIRE(records[0].error.category == aao::ErrorCategory::Asset);
    REQUIRE(records[0].error.code == aao::ErrorCode::Insecure);
    REQUIRE(records[0].localName.empty());
    REQUIRE(site.totalHits() == 0);
    REQUIRE(client.requestsIssued() == 0);
}

TEST_CASE("Fetcher runs the post-process hook on downloaded bytes") {
    FakeSite site;
    aao::RequestLimiter limiter(2);
    aao::HttpClient client(site.transport(), onePolicy(), limiter, aao::ClientOptions{});
    aao::Fetcher fetcher(client, 2);
    fetcher.setPostProcess([](aao::AssetRecord& rec) { rec.bytes = "processed"; });

    const auto records = fetcher.fetchAll({ref("https://i.imgur.com/a.png"), ref("https://i.imgur.com/b.png")});
    for (const auto& rec : records) REQUIRE(rec.bytes == "processed");
}

TEST_CASE("Fetcher stops downloading after cancellation") {
    FakeSite site;
    aao::CancelToken cancel;
    cancel.cancel();
    aao::RequestLimiter limiter(2);
    aao::HttpClient client(site.transport(), onePolicy(), limiter, aao::ClientOptions{}, &cancel);
    aao::Fetcher fetcher(client, 2);

    const auto records = fetcher.fetchAll({ref("https://i.imgur.com/a.png")});
    REQUIRE(records[0].status == aao::AssetStatus::Failed);
    REQUIRE(records[0].error.code == aao::ErrorCode::Cancelled);
    REQUIRE(site.totalHits() == 0);
}

TEST_CASE("localStem sanitizes the file name") {
    aao::AssetRecord rec;
    rec.url = "https://i.imgur.com/My%20Picture%20(1).PNG";
    REQUIRE(aao::localStem(rec) == "my_picture__1");
    rec.dispositionStem = "Court Room";
    REQUIRE(aao::localStem(rec) == "court_room");
    rec.dispositionStem.clear();
    rec.url = "https://example.com/";
    REQUIRE(aao::localStem(rec) == "asset");
}

TEST_CASE("assignLocalNames is deterministic and unique") {
    std::vector<aao::AssetRecord> a{fetched("https://a.example/x/photo.jpeg", "jpg"),
                                    fetched("https://b.example/x/photo.jpeg", "jpg"),
                                    fetched("https://c.example/sound", "mp3")};
    aao::AssetRecord failed;
    failed.url = "https://d.example/missing.png";
    failed.status = aao::AssetStatus::Failed;
    a.push_back(failed);

    std::vector<aao::AssetRecord> b{a[3], a[2], a[1], a[0]};
    aao::assignLocalNames(a);
    aao::assignLocalNames(b);

    REQUIRE(a[0].localName == b[3].localName);
    REQUIRE(a[2].localName == b[1].localName);
    REQUIRE(a[0].localName != a[1].localName);
    REQUIRE(a[0].localName.rfind("photo-", 0) == 0);
    REQUIRE(a[0].localName.size() > 5);
    REQUIRE(a[0].localName.substr(a[0].localName.size() - 5) == ".jpeg");
    REQUIRE(a[2].localName.substr(a[2].localName.size() - 4) == ".mp3");
    REQUIRE(a[3].localName.empty());

    std::set<std::string> names;
    for (const auto& rec : a) {
        if (!rec.localName.empty()) names.insert(rec.localName);
    }
    REQUIRE(names.size() == 3);
}

TEST_CASE("assignLocalNames uses the resolved type when the URL extension lies") {
    std::vector<aao::AssetRecord> recs{fetched("https://i.imgur.com/fake.png", "gif")};
    aao::assignLocalNames(recs);
    REQUIRE(recs[0].localName.substr(recs[0].localName.size() - 4) == ".gif");
}
