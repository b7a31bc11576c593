#pragma once

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "aao/config.hpp"
#include "aao/errors.hpp"
#include "aao/http_client.hpp"
#include "mini/json.hpp"

namespace aao {

// Directory layout of the origin host, from bridge.js.php's `var cfg`.
struct SitePaths {
    std::string pictureDir;
    std::string iconSubdir;
    std::string talkingSubdir;
    std::string stillSubdir;
    std::string startupSubdir;
    std::string evidenceSubdir;
    std::string bgSubdir;
    std::string defaultplacesSubdir;
    std::string popupsSubdir;
    std::string locksSubdir;
    std::string musicDir;
    std::string soundsDir;
    std::string voicesDir;
    std::string langDir;
    std::string cssDir;
    std::string jsDir;
    std::string cacheDir;

    // Subdirectory of pictureDir for a sprite kind ("talking", "still", "startup").
    std::string spriteSubdir(const std::string& kind) const;
};

bool parseSitePaths(const mini::Value& cfg, SitePaths& out, std::string& err);
// Extract `var cfg = {...};` from bridge.js.php.
bool parseSiteConfig(const std::string& bridge, mini::Value& cfg, std::string& err);

// Default assets shipped by the origin host (default_data.js.php).
struct DefaultData {
    std::map<std::string, int> profilesNb;
    std::set<std::string> profilesStartup; // "<base>/<sprite id>"
    mini::Value places;                    // place id -> place
};

bool parseDefaultData(const std::string& module, DefaultData& out, std::string& err);
// Byte range of the object literal after `var default_places = `.
bool findDefaultPlacesSpan(const std::string& text, size_t& start, size_t& end);

struct JsModule {
    std::string name;
    std::vector<std::string> deps;
    std::string init;
    std::string content;
    size_t declStart{0};
    size_t declEnd{0};
};

// Parse the `Modules.load(new Object({name, dependencies, init}))` declaration.
bool parseJsModule(const std::string& text, JsModule& out, std::string& err);
// Order modules so each follows its dependencies and emit one script.
bool combineJsModules(std::vector<JsModule> modules, std::string& out, std::string& err);

struct LanguageBlock {
    std::vector<std::string> files;
    std::string callback;
    size_t start{0};
    size_t end{0};
};

bool findLanguageBlock(const std::string& scripts, LanguageBlock& out, std::string& err);
// Recursive object merge; `from` wins on scalar conflicts.
void mergeJson(mini::Value& into, const mini::Value& from);
// Replace the dynamic language loading with `lang` and run the callback inline.
bool inlineLanguage(std::string& scripts, const LanguageBlock& block, const mini::Value& lang, std::string& err);

// Drop `<script>` blocks that carry a Google Analytics id. Returns the count.
size_t removeAnalytics(std::string& player);
// Rewrite url(...) references in a stylesheet to absolute URLs.
std::string absolutizeCssUrls(const std::string& css, const std::string& cssUrl, HttpHandling handling);
// Give zero-sized images the default sprite size (256x192) at the top of every
// `img.onload` handler. Local files load fast enough for the player to read the
// size too early. Returns the number of handlers patched; already patched ones are skipped.
size_t patchImageSizes(std::string& scripts);
// Insert `, html5: <flag>` after howler's `preload: true`; no-op when already set.
bool setHtml5Audio(std::string& scripts, bool html5);

struct PlayerTemplate {
    std::string version;
    std::string language;
    std::string player;  // player.php markup, PHP blocks intact
    std::string scripts; // combined scripts, PHP blocks of trial.js.php intact
    mini::Value siteConfig;
    SitePaths paths;
    DefaultData defaults;
};

std::string templateUrl(const std::string& version, const std::string& path);
std::string moduleUrl(const std::string& version, const std::string& name);

// Downloads and assembles one player template.
class TemplateFetcher {
public:
    TemplateFetcher(HttpClient& client, HttpHandling handling);

    bool fetch(const std::string& version, const std::string& language, PlayerTemplate& out, ErrorInfo& info);

private:
    bool fetchText(const std::string& url, std::string& body, ErrorInfo& info);
    bool fetchModules(PlayerTemplate& tpl, const std::string& defaultDataText, std::string& combined, ErrorInfo& info);
    bool inlineStylesheets(PlayerTemplate& tpl, ErrorInfo& info);
    bool inlineLanguageFiles(PlayerTemplate& tpl, ErrorInfo& info);
    void inlineHowler(PlayerTemplate& tpl);

    HttpClient& client_;
    HttpHandling handling_;
};

// One fetch per (version, language) per run; concurrent callers share it.
class TemplateCache {
public:
    explicit TemplateCache(TemplateFetcher& fetcher);

    bool get(const std::string& version, const std::string& language,
             std::shared_ptr<const PlayerTemplate>& out, ErrorInfo& info);
    size_t fetchCount() const;

private:
    struct Entry {
        bool done{false};
        bool ok{false};
        std::shared_ptr<const PlayerTemplate> tpl;
        ErrorInfo error;
    };

    TemplateFetcher& fetcher_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
    size_t fetches_{0};
};

} // namespace aao
