#pragma once

#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include "aao/case_resolver.hpp"
#include "aao/config.hpp"
#include "aao/content_sniff.hpp"
#include "aao/http_client.hpp"
#include "aao/player_template.hpp"
#include "aao/url.hpp"

namespace aao {
namespace testing {

// In-memory stand-in for the origin host and the template repository.
// Unknown URLs with a media extension answer with a small body of the
// matching type; everything else is a 404.
class FakeSite {
public:
    struct Route {
        int status{200};
        std::string contentType;
        std::string body;
        bool dropConnection{false};
    };

    void route(const std::string& url, const std::string& body,
               const std::string& contentType = "text/plain", int status = 200) {
        std::lock_guard<std::mutex> lock(mutex_);
        routes_[url] = Route{status, contentType, body, false};
    }

    void fail(const std::string& url, int status) {
        std::lock_guard<std::mutex> lock(mutex_);
        routes_[url] = Route{status, "text/html", "<h1>error</h1>", false};
    }

    void dropConnection(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        Route r;
        r.dropConnection = true;
        routes_[url] = r;
    }

    void setServeMedia(bool on) { serveMedia_ = on; }
    void setLatencyMs(int ms) { latencyMs_ = ms; }

    Transport transport() {
        return [this](const HttpRequest& req, HttpResponse& resp, std::string& err) {
            return handle(req, resp, err);
        };
    }

    int hits(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = hits_.find(url);
        return it == hits_.end() ? 0 : it->second;
    }

    int totalHits() const {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (const auto& kv : hits_) n += kv.second;
        return n;
    }

    int peakConcurrent() const { return peak_.load(); }

private:
    bool handle(const HttpRequest& req, HttpResponse& resp, std::string& err) {
        const int now = ++inFlight_;
        int seen = peak_.load();
        while (now > seen && !peak_.compare_exchange_weak(seen, now)) {
        }
        if (latencyMs_ > 0) std::this_thread::sleep_for(std::chrono::milliseconds(latencyMs_));

        Route r;
        bool known = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++hits_[req.url];
            auto it = routes_.find(req.url);
            if (it != routes_.end()) {
                r = it->second;
                known = true;
            }
        }
        --inFlight_;

        if (!known) {
            const std::string mime = mimeForExtension(urlExtension(req.url));
            if (serveMedia_ && !mime.empty() && mime.compare(0, 5, "text/") != 0) {
                r = Route{200, mime, "media:" + req.url, false};
            } else {
                r = Route{404, "text/html", "not found", false};
            }
        }
        if (r.dropConnection) {
            err = "Connection reset by peer";
            return false;
        }
        resp.statusCode = r.status;
        resp.statusText = r.status == 200 ? "OK" : "Error";
        resp.contentType = r.contentType;
        resp.effectiveUrl = req.url;
        resp.body = r.body;
        return true;
    }

    mutable std::mutex mutex_;
    std::map<std::string, Route> routes_;
    std::map<std::string, int> hits_;
    std::atomic<int> inFlight_{0};
    std::atomic<int> peak_{0};
    std::atomic<bool> serveMedia_{true};
    std::atomic<int> latencyMs_{0};
};

inline std::string jsStringEscape(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '\\' || c == '"') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

// trial.js.php body for an existing case.
inline std::string trialScript(const std::string& infoJson, const std::string& dataJson) {
    return "var trial_information = JSON.parse(\"" + jsStringEscape(infoJson) + "\");\n"
           "var initial_trial_data = JSON.parse(\"" + jsStringEscape(dataJson) + "\");\n";
}

inline std::string trialUrl(const std::string& id) {
    return "https://aaonline.fr/trial.js.php?trial_id=" + id;
}

inline std::string templateFileUrl(const std::string& path, const std::string& version = "master") {
    return "https://bitbucket.org/AceAttorneyOnline/aao-game-creation-engine/raw/" + version + "/" + path;
}

const char* const kBridge =
    "<?php header('Content-Type: text/javascript'); ?>\n"
    "var cfg = {\"picture_dir\":\"Ressources/Images/\",\"icon_subdir\":\"persos/\","
    "\"talking_subdir\":\"persos/\",\"still_subdir\":\"persosStill/\",\"startup_subdir\":\"persosStartup/\","
    "\"evidence_subdir\":\"dossier/\",\"bg_subdir\":\"cinematiques/\",\"popups_subdir\":\"popups/\","
    "\"music_dir\":\"Ressources/Musiques/\",\"sounds_dir\":\"Ressources/Sons/\","
    "\"voices_dir\":\"Ressources/Voix/\",\"lang_dir\":\"Languages/\",\"locks_subdir\":\"psyche_locks/\"};\n";

const char* const kDefaultData =
    "Modules.load(new Object({\n"
    "\tname : 'default_data',\n"
    "\tdependencies : [],\n"
    "\tinit : function() {}\n"
    "}));\n"
    "var default_profiles_nb = JSON.parse(\"{\\\"Phoenix\\\":2}\");\n"
    "var default_profiles_startup = JSON.parse(\"[\\\"Phoenix/2\\\"]\");\n"
    "var default_places = {\"-1\":{\"id\":-1,\"name\":\"Courtroom\",\"background\":{\"image\":\"pw_court.jpg\",\"external\":false}},"
    "\"-2\":{\"id\":-2,\"name\":\"Lobby\",\"background\":{\"image\":\"pw_lobby.jpg\",\"external\":false}}};\n";

const char* const kPlayer =
    "<?php include('common_render.php'); ?><!DOCTYPE html>\n"
    "<html lang=\"<?php echo language_backend('en'); ?>\">\n"
    "<head>\n"
    "<title><?php echo 'Ace Attorney Online - Trial Player (Loading)'; ?></title>\n"
    "<link rel=\"stylesheet\" type=\"text/css\" href=\"CSS/player.css\" />\n"
    "<script type=\"text/javascript\">window.ga_id = 'UA-000000-1';</script>\n"
    "<script type=\"text/javascript\">\n"
    "<?php include('bridge.js.php'); ?>\n"
    "</script>\n"
    "</head>\n"
    "<body>\n"
    "<h1><?php echo 'Loading trial ...'; ?></h1>\n"
    "<img src=\"Ressources/Images/logo.png\" alt=\"\" />\n"
    "</body>\n"
    "</html>\n";

const char* const kPlayerCss =
    "body { background: url(../Ressources/Images/paper.png) repeat; }\n";

const char* const kCommonJs =
    "function includeScript(name, async, path, cb) { cb(); }\n"
    "var Languages = { requestFiles: function(files, cb) { cb(); } };\n";

const char* const kPlayerModule =
    "Modules.load(new Object({\n"
    "\tname : 'player',\n"
    "\tdependencies : ['trial', 'default_data', 'language', 'page_loaded'],\n"
    "\tinit : function() {\n"
    "\t\tLanguages.requestFiles(['common', 'player'], function(){\n"
    "\t\t\tstartPlayer();\n"
    "\t\t});\n"
    "\t}\n"
    "}));\n"
    "function getVoiceUrl(voice_id, ext)\n"
    "{\n"
    "\treturn cfg.voices_dir + 'voice_singleblip_' + (-voice_id) + '.' + ext;\n"
    "}\n"
    "function getDefaultSpriteUrl(base, sprite_id, status)\n"
    "{\n"
    "\treturn cfg.picture_dir + status + '/' + base + '/' + sprite_id + '.gif';\n"
    "}\n"
    "function showPsycheLock(lock_id, exploding)\n"
    "{\n"
    "\tvar lock_img = new Image();\n"
    "\tlock_img.src = exploding ? cfg.picture_dir + cfg.locks_subdir + 'jfa_lock_explodes.gif?id=' + lock_id\n"
    "\t\t: cfg.picture_dir + cfg.locks_subdir + 'jfa_lock_appears.gif?id=' + lock_id;\n"
    "\treturn lock_img;\n"
    "}\n"
    "function loadGraphic(url, cb)\n"
    "{\n"
    "\tvar img = new Image();\n"
    "\timg.onload = function() { cb(img.width, img.height); };\n"
    "\timg.src = url;\n"
    "}\n"
    "function endCase(target, save)\n"
    "{\n"
    "\twindow.location.href = 'player.php?trial_id=' + target + '&save_data=' + save;\n"
    "}\n"
    "function preload(img_container)\n"
    "{\n"
    "\tfor (var i in default_places) { preloadPlaceImages(default_places[i], img_container); }\n"
    "}\n"
    "includeScript('howler.js/howler.min', false, '', function(){ initSound(); });\n"
    "function initSound() { window.snd = new Howl({ src: [], preload: true }); }\n";

const char* const kLanguageModule =
    "Modules.load(new Object({\n"
    "\tname : 'language',\n"
    "\tdependencies : [],\n"
    "\tinit : function() {}\n"
    "}));\n"
    "var lang = new Object();\n";

const char* const kTrialModule =
    "<?php include('common_render.php'); ?>\n"
    "Modules.load(new Object({\n"
    "\tname : 'trial',\n"
    "\tdependencies : ['language'],\n"
    "\tinit : function() {}\n"
    "}));\n"
    "<?php\n"
    "var trial_information;\n"
    "?>\n";

// Serves a complete player template for `version`.
inline void installTemplate(FakeSite& site, const std::string& version = "master") {
    site.route("https://aaonline.fr/bridge.js.php", kBridge, "text/javascript");
    site.route("https://aaonline.fr/default_data.js.php", kDefaultData, "text/javascript");
    site.route(templateFileUrl("player.php", version), kPlayer);
    site.route(templateFileUrl("Javascript/common.js", version), kCommonJs);
    site.route(templateFileUrl("Javascript/player.js", version), kPlayerModule);
    site.route(templateFileUrl("Javascript/language.js", version), kLanguageModule);
    site.route(templateFileUrl("trial.js.php", version), kTrialModule);
    site.route(templateFileUrl("Javascript/howler.js/howler.min.js", version), "var Howl = function(o) {};");
    site.route("https://aaonline.fr/CSS/player.css", kPlayerCss, "text/css");
    site.route("https://aaonline.fr/Languages/en/common.js", "{\"ok\":\"OK\",\"menu\":{\"save\":\"Save\"}}");
    site.route("https://aaonline.fr/Languages/en/player.js", "{\"menu\":{\"load\":\"Load\"}}");
}

// Case data touching every asset kind once.
inline std::string sampleCaseData() {
    return R"({
"profiles":[0,{"id":1,"base":"Phoenix","icon":"","custom_sprites":[{"talking":"https://i.imgur.com/talk.gif","still":"https://i.imgur.com/still.gif","startup":""}]}],
"frames":[0,{"id":1,"place":-1,"characters":[{"profile_id":1,"sprite_id":-2}]},{"id":2,"place":1,"characters":[{"profile_id":1,"sprite_id":1}]}],
"evidence":[0,{"id":1,"icon":"https://i.imgur.com/badge.png","icon_external":true,"check_button_data":[{"type":"image","content":"https://i.imgur.com/check.png"},{"type":"text","content":"Just text"}]}],
"places":[0,{"id":1,"background":{"image":"https://i.imgur.com/bg.jpg","external":true},"background_objects":[],"foreground_objects":[]}],
"popups":[0,{"id":1,"path":"https://i.imgur.com/objection.gif","external":true}],
"music":[0,{"id":1,"path":"https://i.imgur.com/theme.mp3","external":true}],
"sounds":[0,{"id":1,"path":"bang","external":false}]
})";
}

inline std::string caseInfo(const std::string& id, const std::string& title,
                            const std::string& sequenceJson = "null") {
    return "{\"author\":\"Tester\",\"author_id\":7,\"can_read\":true,\"can_write\":false,"
           "\"format\":\"Def6\",\"id\":" + id + ",\"language\":\"en\",\"last_edit_date\":1700000000,"
           "\"sequence\":" + sequenceJson + ",\"title\":\"" + title + "\"}";
}

inline void installCase(FakeSite& site, const std::string& id, const std::string& title,
                        const std::string& dataJson, const std::string& sequenceJson = "null") {
    site.route(trialUrl(id), trialScript(caseInfo(id, title, sequenceJson), dataJson), "text/javascript");
}

// Template assembled from a site prepared with installTemplate.
inline bool loadTemplate(FakeSite& site, PlayerTemplate& out) {
    RetryPolicy policy;
    policy.maxAttempts = 1;
    RequestLimiter limiter(4);
    HttpClient client(site.transport(), policy, limiter, ClientOptions{});
    TemplateFetcher fetcher(client, HttpHandling::RedirectToHttps);
    ErrorInfo info;
    return fetcher.fetch("master", "en", out, info);
}

inline bool loadManifest(const std::string& id, const std::string& title, const std::string& dataJson,
                         CaseManifest& out, const std::string& sequenceJson = "null") {
    ErrorInfo info;
    return parseTrialScript(id, trialScript(caseInfo(id, title, sequenceJson), dataJson), out, info);
}

// Fresh empty directory under the system temp dir.
inline std::string makeTempDir(const std::string& name) {
    std::random_device rd;
    const auto dir = std::filesystem::temp_directory_path() /
                     ("aao_test_" + name + "_" + std::to_string(rd()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir.string();
}

inline Config testConfig(const std::string& output) {
    Config cfg;
    cfg.output = output;
    cfg.concurrency = 4;
    cfg.retries = 1;
    return cfg;
}

} // namespace testing
} // namespace aao
