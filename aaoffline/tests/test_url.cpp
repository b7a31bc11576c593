#include "catch.hpp"
#include "aao/url.hpp"

namespace {

std::string canon(const std::string& raw, aao::HttpHandling handling = aao::HttpHandling::RedirectToHttps) {
    std::string out;
    std::string err;
    if (!aao::canonicalizeUrl(raw, "https://aaonline.fr/", handling, out, err)) return "ERR:" + err;
    return out;
}

} // namespace

TEST_CASE("canonicalizeUrl normalizes scheme, host and path") {
    REQUIRE(canon("HTTPS://AAOnline.FR/Ressources//Images/./a.png") == "https://aaonline.fr/Ressources/Images/a.png");
    REQUIRE(canon("https://i.imgur.com/x.png#frag") == "https://i.imgur.com/x.png");
    REQUIRE(canon("https://i.imgur.com:443/x.png") == "https://i.imgur.com/x.png");
    REQUIRE(canon("https://example.com/a/b/../c.gif") == "https://example.com/a/c.gif");
}

TEST_CASE("canonicalizeUrl resolves relative and protocol-relative references") {
    REQUIRE(canon("Ressources/Sons/bang.mp3") == "https://aaonline.fr/Ressources/Sons/bang.mp3");
    REQUIRE(canon("/CSS/player.css") == "https://aaonline.fr/CSS/player.css");
    REQUIRE(canon("//i.imgur.com/abc.gif") == "https://i.imgur.com/abc.gif");

    std::string out;
    std::string err;
    REQUIRE(aao::canonicalizeUrl("../img/bg.png", "https://aaonline.fr/CSS/player.css",
                                 aao::HttpHandling::RedirectToHttps, out, err));
    REQUIRE(out == "https://aaonline.fr/img/bg.png");
}

TEST_CASE("canonicalizeUrl applies the http handling policy") {
    REQUIRE(canon("http://i.imgur.com/a.png") == "https://i.imgur.com/a.png");
    REQUIRE(canon("http://i.imgur.com/a.png", aao::HttpHandling::AllowInsecure) == "http://i.imgur.com/a.png");
    REQUIRE(canon("http://i.imgur.com/a.png", aao::HttpHandling::Disallow).rfind("ERR:", 0) == 0);
}

TEST_CASE("canonicalizeUrl rejects data URIs and foreign schemes") {
    REQUIRE(canon("data:image/png;base64,AAAA").rfind("ERR:", 0) == 0);
    REQUIRE(canon("ftp://example.com/a.png").rfind("ERR:", 0) == 0);
    REQUIRE(canon("   ").rfind("ERR:", 0) == 0);
}

TEST_CASE("canonicalizeUrl percent-encodes path characters") {
    REQUIRE(canon("https://example.com/my file.png") == "https://example.com/my%20file.png");
}

TEST_CASE("url helpers split file names and hosts") {
    REQUIRE(aao::urlHost("https://i.imgur.com/abc.gif?x=1") == "i.imgur.com");
    REQUIRE(aao::urlFileName("https://example.com/dir/My%20Song.MP3?dl=1") == "My Song.MP3");
    REQUIRE(aao::urlExtension("https://example.com/dir/My%20Song.MP3?dl=1") == "mp3");
    REQUIRE(aao::urlExtension("https://example.com/dir/") == "");
    REQUIRE(aao::hostMatches("s12.photobucket.com", "photobucket.com"));
    REQUIRE_FALSE(aao::hostMatches("notphotobucket.com", "photobucket.com"));
}
