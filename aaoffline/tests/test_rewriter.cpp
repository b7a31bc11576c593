#include "catch.hpp"
#include "aao/asset_graph.hpp"
#include "aao/fetcher.hpp"
#include "aao/rewriter.hpp"
#include "aao/util.hpp"
#include "fake_site.hpp"

using aao::testing::FakeSite;

namespace {

struct RewriteFixture {
    FakeSite site;
    aao::PlayerTemplate tpl;
    aao::CaseManifest manifest;
    std::vector<aao::AssetReference> refs;
    std::vector<aao::AssetRecord> records;

    RewriteFixture() {
        aao::testing::installTemplate(site);
        REQUIRE(aao::testing::loadTemplate(site, tpl));
        REQUIRE(aao::testing::loadManifest("1001", "Turnabout Test", aao::testing::sampleCaseData(), manifest));
        aao::AssetGraph graph(aao::HttpHandling::RedirectToHttps);
        refs = graph.enumerate(manifest, tpl);
        for (const auto& ref : refs) {
            aao::AssetRecord rec;
            rec.url = ref.url;
            rec.role = ref.role;
            rec.extension = aao::urlExtension(ref.url);
            rec.mime = aao::mimeForExtension(rec.extension);
            rec.bytes = "bytes of " + ref.url;
            rec.status = aao::AssetStatus::Fetched;
            records.push_back(rec);
        }
        aao::assignLocalNames(records);
    }

    const aao::AssetRecord& record(const std::string& url) const {
        for (const auto& rec : records) {
            if (rec.url == url) return rec;
        }
        FAIL("no record for " << url);
        return records.front();
    }
};

std::string stringAt(const mini::Value& root, const std::string& ptr) {
    const mini::Value* v = mini::pointer(const_cast<mini::Value&>(root), ptr);
    return v && v->isString() ? v->str : std::string();
}

bool flagAt(const mini::Value& root, const std::string& ptr) {
    const mini::Value* v = mini::pointer(const_cast<mini::Value&>(root), ptr);
    return v && v->type == mini::Value::Type::Bool && v->boolean;
}

} // namespace

TEST_CASE("replaceLiteral only replaces whole tokens") {
    std::string text = "a='x.png' b=\"x.png\" c=url(x.png) d=y/x.png e=x.png.bak x.png";
    REQUIRE(aao::replaceLiteral(text, "x.png", "L") == 4);
    REQUIRE(text == "a='L' b=\"L\" c=url(L) d=y/x.png e=x.png.bak L");
    REQUIRE(aao::replaceLiteral(text, "", "L") == 0);
}

TEST_CASE("replaceFunctionBody swaps the body after the signature") {
    std::string scripts = "function f(a)\n{\n\treturn a;\n}\nnext();";
    REQUIRE(aao::replaceFunctionBody(scripts, "function f(a)", "return 1;"));
    REQUIRE(scripts == "function f(a)\n{return 1;}\nnext();");
    REQUIRE_FALSE(aao::replaceFunctionBody(scripts, "function g()", "x"));
}

TEST_CASE("localForm is a relative path or a data URI") {
    aao::AssetRecord rec;
    rec.localName = "badge-0123456789ab.png";
    rec.mime = "image/png";
    rec.bytes = "abc";
    REQUIRE(aao::localForm(rec, aao::OutputMode::Directory) == "assets/badge-0123456789ab.png");
    REQUIRE(aao::localForm(rec, aao::OutputMode::SingleFile) == "data:image/png;base64,YWJj");
}

TEST_CASE("Rewriter points every occurrence at local files in directory mode") {
    RewriteFixture f;
    aao::CaseDocuments docs = aao::makeDocuments(f.manifest, f.tpl);
    aao::Rewriter rewriter(aao::OutputMode::Directory, true);
    const aao::RewriteResult result = rewriter.rewrite(docs, f.refs, f.records);

    REQUIRE(result.missing.empty());
    REQUIRE(result.sitesRewritten > 0);

    const std::string data = mini::dump(docs.data);
    REQUIRE(data.find("https://i.imgur.com") == std::string::npos);
    REQUIRE(stringAt(docs.data, "/profiles/1/icon") ==
            "assets/" + f.record("https://aaonline.fr/Ressources/Images/persos/Phoenix.png").localName);
    REQUIRE(stringAt(docs.data, "/sounds/1/path") ==
            "assets/" + f.record("https://aaonline.fr/Ressources/Sons/bang.mp3").localName);
    REQUIRE(flagAt(docs.data, "/sounds/1/external"));
    REQUIRE(flagAt(docs.data, "/evidence/1/icon_external"));
    REQUIRE(stringAt(docs.data, "/evidence/1/check_button_data/1/content") == "Just text");

    REQUIRE(stringAt(docs.defaultPlaces, "/-1/background/image").rfind("assets/pw_court-", 0) == 0);
    REQUIRE(flagAt(docs.defaultPlaces, "/-1/background/external"));
    REQUIRE(stringAt(docs.defaultPlaces, "/-2/background/image") == "pw_lobby.jpg");
    REQUIRE(docs.scripts.find("\"image\":\"assets/pw_court-") != std::string::npos);

    REQUIRE(docs.player.find("Ressources/Images/logo.png") == std::string::npos);
    REQUIRE(docs.player.find("https://aaonline.fr/Ressources/Images/paper.png") == std::string::npos);
    REQUIRE(docs.player.find("src=\"assets/logo-") != std::string::npos);

    REQUIRE(docs.scripts.find("'voice_singleblip_'") == std::string::npos);
    REQUIRE(docs.scripts.find("if (-voice_id === 3 && ext === 'opus') return 'assets/voice_singleblip_3-") !=
            std::string::npos);
    REQUIRE(docs.scripts.find("base === 'Phoenix' && sprite_id === 2 && status === 'startup') return 'assets/") !=
            std::string::npos);
    REQUIRE(docs.scripts.find("html5: true") != std::string::npos);
}

TEST_CASE("Rewriter inlines data URIs in single-file mode") {
    RewriteFixture f;
    aao::CaseDocuments docs = aao::makeDocuments(f.manifest, f.tpl);
    aao::Rewriter rewriter(aao::OutputMode::SingleFile, true);
    rewriter.rewrite(docs, f.refs, f.records);

    REQUIRE(stringAt(docs.data, "/profiles/1/custom_sprites/0/talking").rfind("data:image/gif;base64,", 0) == 0);
    REQUIRE(stringAt(docs.data, "/music/1/path").rfind("data:audio/mpeg;base64,", 0) == 0);
    REQUIRE(docs.player.find("src=\"data:image/png;base64,") != std::string::npos);
    REQUIRE(docs.scripts.find("assets/") == std::string::npos);
    REQUIRE(docs.scripts.find("html5: true") == std::string::npos);
}

TEST_CASE("Rewriter leaves failed assets alone and reports them") {
    RewriteFixture f;
    for (auto& rec : f.records) {
        if (rec.url == "https://i.imgur.com/check.png") {
            rec.status = aao::AssetStatus::Failed;
            rec.localName.clear();
        }
    }
    aao::CaseDocuments docs = aao::makeDocuments(f.manifest, f.tpl);
    aao::Rewriter rewriter(aao::OutputMode::Directory, false);
    const aao::RewriteResult result = rewriter.rewrite(docs, f.refs, f.records);

    REQUIRE(result.missing == std::vector<std::string>{"https://i.imgur.com/check.png"});
    REQUIRE(stringAt(docs.data, "/evidence/1/check_button_data/0/content") == "https://i.imgur.com/check.png");
    REQUIRE(stringAt(docs.data, "/evidence/1/icon").rfind("assets/", 0) == 0);
}

TEST_CASE("Rewriter is idempotent") {
    RewriteFixture f;
    aao::CaseDocuments docs = aao::makeDocuments(f.manifest, f.tpl);
    aao::Rewriter rewriter(aao::OutputMode::Directory, true);
    rewriter.rewrite(docs, f.refs, f.records);

    const aao::CaseDocuments once = docs;
    rewriter.rewrite(docs, f.refs, f.records);
    REQUIRE(docs.player == once.player);
    REQUIRE(docs.scripts == once.scripts);
    REQUIRE(mini::dump(docs.data) == mini::dump(once.data));
    REQUIRE(mini::dump(docs.defaultPlaces) == mini::dump(once.defaultPlaces));
}

TEST_CASE("rewriteLockPaths gives every lock id its own file") {
    const std::string original =
        "a.src = cfg.picture_dir + cfg.locks_subdir + 'jfa_lock_appears.gif?id=' + lock.id;\n"
        "b.src = cfg.picture_dir + cfg.locks_subdir + 'fg_chains_appear.gif?id=' + n;\n";

    std::string scripts = original;
    const std::map<std::string, std::string> files{{"jfa_lock_appears", "assets/jfa_lock_appears-0123456789ab.gif"}};
    REQUIRE(aao::rewriteLockPaths(scripts, files, aao::OutputMode::Directory) == 1);
    REQUIRE(scripts.find("a.src = 'assets/jfa_lock_appears_' + lock.id + '.gif';") != std::string::npos);
    // No local copy: the live path stays.
    REQUIRE(scripts.find("cfg.locks_subdir + 'fg_chains_appear.gif?id=' + n;") != std::string::npos);
    REQUIRE(aao::rewriteLockPaths(scripts, files, aao::OutputMode::Directory) == 0);

    scripts = original;
    const std::map<std::string, std::string> uris{{"jfa_lock_appears", "data:image/gif;base64,R0lG"}};
    REQUIRE(aao::rewriteLockPaths(scripts, uris, aao::OutputMode::SingleFile) == 1);
    REQUIRE(scripts.find("a.src = 'data:image/gif' + lock.id + ';base64,R0lG';") != std::string::npos);
}

TEST_CASE("Rewriter points psyche locks at per-lock copies") {
    FakeSite site;
    aao::testing::installTemplate(site);
    aao::PlayerTemplate tpl;
    REQUIRE(aao::testing::loadTemplate(site, tpl));
    aao::CaseManifest manifest;
    REQUIRE(aao::testing::loadManifest(
        "1002", "Locked", R"({"scenes":[0,{"dialogues":[0,{"locks":{"locks_to_display":[{"id":1},{"id":2}]}}]}]})",
        manifest));

    aao::AssetGraph graph(aao::HttpHandling::RedirectToHttps);
    const auto refs = graph.enumerate(manifest, tpl);
    std::vector<aao::AssetRecord> records;
    for (const auto& ref : refs) {
        aao::AssetRecord rec;
        rec.url = ref.url;
        rec.extension = aao::urlExtension(ref.url);
        rec.mime = aao::mimeForExtension(rec.extension);
        rec.bytes = "GIF89a";
        rec.status = aao::AssetStatus::Fetched;
        records.push_back(rec);
    }
    aao::assignLocalNames(records);

    aao::CaseDocuments docs = aao::makeDocuments(manifest, tpl);
    aao::Rewriter(aao::OutputMode::Directory, true).rewrite(docs, refs, records);
    REQUIRE(docs.scripts.find("cfg.locks_subdir") == std::string::npos);
    REQUIRE(docs.scripts.find("'assets/jfa_lock_explodes_' + lock_id + '.gif'") != std::string::npos);
    REQUIRE(docs.assetAliases.size() == 8);
    const std::string appears = docs.assetAliases.at("jfa_lock_appears_2.gif");
    REQUIRE(aao::util::startsWith(appears, "jfa_lock_appears-"));
    REQUIRE(docs.assetAliases.count("fg_chains_disappear_1.gif") == 1);
    REQUIRE(docs.assetAliases.count("fg_chains_disappear_3.gif") == 0);

    aao::CaseDocuments single = aao::makeDocuments(manifest, tpl);
    aao::Rewriter(aao::OutputMode::SingleFile, true).rewrite(single, refs, records);
    REQUIRE(single.scripts.find("'data:image/gif' + lock_id + ';base64,") != std::string::npos);
    REQUIRE(single.assetAliases.empty());
}
