#include "catch.hpp"
#include "aao/bundler.hpp"
#include "aao/filesystem.hpp"
#include "aao/rewriter.hpp"
#include "fake_site.hpp"
#include <filesystem>

using aao::testing::FakeSite;

namespace {

struct BundleFixture {
    FakeSite site;
    aao::PlayerTemplate tpl;
    aao::CaseManifest manifest;
    aao::CaseDocuments docs;
    std::vector<aao::AssetRecord> records;
    std::string root;

    explicit BundleFixture(const std::string& name) {
        aao::testing::installTemplate(site);
        REQUIRE(aao::testing::loadTemplate(site, tpl));
        REQUIRE(aao::testing::loadManifest("1001", "Turnabout Test", R"({"frames":[0]})", manifest));
        docs = aao::makeDocuments(manifest, tpl);

        aao::AssetRecord rec;
        rec.url = "https://i.imgur.com/badge.png";
        rec.status = aao::AssetStatus::Fetched;
        rec.mime = "image/png";
        rec.extension = "png";
        rec.bytes = "PNGDATA";
        rec.localName = "badge-0123456789ab.png";
        records.push_back(rec);
        root = aao::testing::makeTempDir(name);
    }

    ~BundleFixture() {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    aao::BundleOptions options(aao::OutputMode mode = aao::OutputMode::Directory) const {
        aao::BundleOptions o;
        o.mode = mode;
        o.outputRoot = root;
        return o;
    }

    aao::OutputPlan plan(aao::OutputMode mode = aao::OutputMode::Directory) const {
        return aao::planOutputs({{"1001", "Turnabout Test"}}, mode).at("1001");
    }
};

bool hasPartialLeftovers(const std::string& root) {
    for (const auto& entry : std::filesystem::directory_iterator(root)) {
        const std::string name = entry.path().filename().string();
        if (name.find(".partial") != std::string::npos) return true;
    }
    return false;
}

} // namespace

TEST_CASE("planOutputs gives every case a unique, safe name") {
    const auto plans = aao::planOutputs(
        {{"1", "Turnabout Test"}, {"2", "turnabout test"}, {"3", "a/b:c?"}, {"4", "  "}}, aao::OutputMode::Directory);
    REQUIRE(plans.at("1").name == "Turnabout_Test");
    REQUIRE(plans.at("1").documentPath == "Turnabout_Test/index.html");
    REQUIRE(plans.at("2").name == "turnabout_test_2");
    REQUIRE(plans.at("3").name == "abc");
    REQUIRE(plans.at("4").name == "case_4");

    const auto single = aao::planOutputs({{"1", "Turnabout Test"}}, aao::OutputMode::SingleFile);
    REQUIRE(single.at("1").name == "Turnabout_Test.html");
    REQUIRE(single.at("1").documentPath == "Turnabout_Test.html");
}

TEST_CASE("findPhpBlocks locates every block") {
    const auto blocks = aao::findPhpBlocks("a<?php echo 1; ?>b<?php x(); ?>c<?php unterminated");
    REQUIRE(blocks.size() == 2);
    REQUIRE(blocks[0].code == " echo 1; ");
    REQUIRE(blocks[1].start == 18);
}

TEST_CASE("Bundler composes a page without server-side code") {
    BundleFixture f("compose");
    aao::BundleOptions opts = f.options();
    opts.userscripts = {"console.log('a');", "console.log('b');"};
    aao::Bundler bundler(opts);

    std::string html;
    aao::ErrorInfo info;
    REQUIRE(bundler.compose(f.docs, html, info));
    REQUIRE(html.find("<?php") == std::string::npos);
    REQUIRE(html.find("var trial_information = {") != std::string::npos);
    REQUIRE(html.find("var initial_trial_data = {\"frames\":[0]};") != std::string::npos);
    REQUIRE(html.find("<title>Turnabout Test</title>") != std::string::npos);
    REQUIRE(html.find("<html lang=\"en\">") != std::string::npos);
    REQUIRE(html.find("var cfg = {") != std::string::npos);
    REQUIRE(html.find("<script type=\"text/javascript\">console.log('a');\n\nconsole.log('b');</script>\n</html>") !=
            std::string::npos);
}

TEST_CASE("composeScripts fails without the trial data slot") {
    aao::CaseDocuments docs;
    std::string scripts = "var x = 1;";
    std::string err;
    REQUIRE_FALSE(aao::composeScripts(scripts, docs, err));
    REQUIRE_FALSE(err.empty());
}

TEST_CASE("Bundler writes a directory output with its assets") {
    BundleFixture f("dir");
    aao::Bundler bundler(f.options());
    std::string outPath;
    aao::ErrorInfo info;
    REQUIRE(bundler.write(f.docs, f.records, {}, f.plan(), nullptr, outPath, info));
    REQUIRE(outPath == aao::joinPath(f.root, "Turnabout_Test"));

    std::string body;
    std::string err;
    REQUIRE(aao::readFile(aao::joinPath(outPath, "assets/badge-0123456789ab.png"), body, err));
    REQUIRE(body == "PNGDATA");
    REQUIRE(aao::readFile(aao::joinPath(outPath, "index.html"), body, err));
    REQUIRE(body.find("initial_trial_data") != std::string::npos);
    REQUIRE_FALSE(hasPartialLeftovers(f.root));
}

TEST_CASE("Bundler refuses to overwrite unless asked") {
    BundleFixture f("exists");
    std::string outPath;
    aao::ErrorInfo info;
    REQUIRE(aao::Bundler(f.options()).write(f.docs, f.records, {}, f.plan(), nullptr, outPath, info));

    REQUIRE_FALSE(aao::Bundler(f.options()).write(f.docs, f.records, {}, f.plan(), nullptr, outPath, info));
    REQUIRE(info.category == aao::ErrorCategory::Bundle);
    REQUIRE(info.code == aao::ErrorCode::OutputExists);

    aao::BundleOptions replace = f.options();
    replace.replaceExisting = true;
    f.docs.title = "Replaced";
    REQUIRE(aao::Bundler(replace).write(f.docs, f.records, {}, f.plan(), nullptr, outPath, info));
    std::string body;
    std::string err;
    REQUIRE(aao::readFile(aao::joinPath(outPath, "index.html"), body, err));
    REQUIRE(body.find("<title>Replaced</title>") != std::string::npos);
    REQUIRE_FALSE(hasPartialLeftovers(f.root));
}

TEST_CASE("Bundler stops on missing assets unless told to continue") {
    BundleFixture f("missing");
    const std::vector<std::string> missing{"https://i.imgur.com/gone.png"};
    std::string outPath;
    aao::ErrorInfo info;
    REQUIRE_FALSE(aao::Bundler(f.options()).write(f.docs, f.records, missing, f.plan(), nullptr, outPath, info));
    REQUIRE(info.code == aao::ErrorCode::MissingAssets);
    REQUIRE(info.detail.find("gone.png") != std::string::npos);
    REQUIRE_FALSE(aao::fileExists(aao::joinPath(f.root, "Turnabout_Test")));

    aao::BundleOptions lenient = f.options();
    lenient.continueOnAssetError = true;
    REQUIRE(aao::Bundler(lenient).write(f.docs, f.records, missing, f.plan(), nullptr, outPath, info));
    REQUIRE(aao::fileExists(aao::joinPath(outPath, "index.html")));
}

TEST_CASE("Bundler writes one HTML file in single-file mode") {
    BundleFixture f("single");
    std::string outPath;
    aao::ErrorInfo info;
    const auto mode = aao::OutputMode::SingleFile;
    REQUIRE(aao::Bundler(f.options(mode)).write(f.docs, f.records, {}, f.plan(mode), nullptr, outPath, info));
    REQUIRE(outPath == aao::joinPath(f.root, "Turnabout_Test.html"));
    REQUIRE(std::filesystem::is_regular_file(outPath));
    REQUIRE_FALSE(aao::fileExists(aao::joinPath(f.root, "assets")));
    REQUIRE_FALSE(hasPartialLeftovers(f.root));
}

TEST_CASE("Bundler leaves nothing behind when cancelled") {
    BundleFixture f("cancel");
    aao::CancelToken cancel;
    cancel.cancel();
    std::string outPath;
    aao::ErrorInfo info;
    REQUIRE_FALSE(aao::Bundler(f.options()).write(f.docs, f.records, {}, f.plan(), &cancel, outPath, info));
    REQUIRE(info.code == aao::ErrorCode::Cancelled);
    REQUIRE_FALSE(aao::fileExists(aao::joinPath(f.root, "Turnabout_Test")));
    REQUIRE_FALSE(hasPartialLeftovers(f.root));
}

TEST_CASE("Bundler writes asset copies next to the originals") {
    BundleFixture f("aliases");
    f.docs.assetAliases["badge_1.png"] = "badge-0123456789ab.png";
    f.docs.assetAliases["badge_2.png"] = "badge-0123456789ab.png";
    f.docs.assetAliases["ghost_1.gif"] = "ghost-000000000000.gif";
    std::string outPath;
    aao::ErrorInfo info;
    REQUIRE(aao::Bundler(f.options()).write(f.docs, f.records, {}, f.plan(), nullptr, outPath, info));

    std::string body;
    std::string err;
    REQUIRE(aao::readFile(aao::joinPath(outPath, "assets/badge_2.png"), body, err));
    REQUIRE(body == "PNGDATA");
    REQUIRE(aao::fileExists(aao::joinPath(outPath, "assets/badge_1.png")));
    REQUIRE_FALSE(aao::fileExists(aao::joinPath(outPath, "assets/ghost_1.gif")));
}
