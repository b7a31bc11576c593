#include "aao/player_template.hpp"
#include "aao/case_resolver.hpp"
#include "aao/constants.hpp"
#include "aao/logger.hpp"
#include "aao/url.hpp"
#include "aao/util.hpp"
#include <algorithm>
#include <cctype>
#include <deque>
#include <regex>
#include <unordered_set>

namespace aao {

namespace {

ErrorInfo parseFailure(const std::string& what) {
    return classifyError("Parse failure: " + what, ErrorCategory::Resolution);
}

size_t skipSpaces(const std::string& s, size_t i) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    return i;
}

// Parse a JSON value starting at `at` and report where it ends.
bool parseValueAt(const std::string& text, size_t at, mini::Value& out, size_t& end) {
    size_t i = at;
    if (!mini::parse_value(text, i, out)) return false;
    end = i;
    return true;
}

std::string originUrl(const std::string& path) {
    return std::string(kOriginBase) + "/" + path;
}

const char* const kHowlerHead = "includeScript('howler.js/howler.min', false, '', function(){";
const char* const kPreloadPlaces = "preloadPlaceImages(default_places[i], img_container)";
const char* const kPreloadOption = "preload: true";
const char* const kImageLoadHead = "img.onload = function()";
const char* const kImageSizeFix = "\nif (img.height == 0) img.height = 192; if (img.width == 0) img.width = 256;\n";

} // namespace

std::string SitePaths::spriteSubdir(const std::string& kind) const {
    if (kind == "talking") return talkingSubdir;
    if (kind == "still") return stillSubdir;
    if (kind == "startup") return startupSubdir;
    return {};
}

bool parseSiteConfig(const std::string& bridge, mini::Value& cfg, std::string& err) {
    const std::string head = "var cfg = ";
    auto pos = bridge.find(head);
    if (pos == std::string::npos) {
        err = "site configuration (var cfg) not found";
        return false;
    }
    size_t end = 0;
    mini::Value v;
    if (!parseValueAt(bridge, pos + head.size(), v, end) || !v.isObject()) {
        err = "site configuration is not a JSON object";
        return false;
    }
    cfg = std::move(v);
    return true;
}

bool parseSitePaths(const mini::Value& cfg, SitePaths& out, std::string& err) {
    struct Field {
        const char* key;
        std::string SitePaths::*member;
        bool required;
    };
    static const Field fields[] = {
        {"picture_dir", &SitePaths::pictureDir, true},
        {"icon_subdir", &SitePaths::iconSubdir, true},
        {"talking_subdir", &SitePaths::talkingSubdir, true},
        {"still_subdir", &SitePaths::stillSubdir, true},
        {"startup_subdir", &SitePaths::startupSubdir, true},
        {"evidence_subdir", &SitePaths::evidenceSubdir, true},
        {"bg_subdir", &SitePaths::bgSubdir, true},
        {"defaultplaces_subdir", &SitePaths::defaultplacesSubdir, false},
        {"popups_subdir", &SitePaths::popupsSubdir, true},
        {"locks_subdir", &SitePaths::locksSubdir, false},
        {"music_dir", &SitePaths::musicDir, true},
        {"sounds_dir", &SitePaths::soundsDir, true},
        {"voices_dir", &SitePaths::voicesDir, true},
        {"lang_dir", &SitePaths::langDir, true},
        {"css_dir", &SitePaths::cssDir, false},
        {"js_dir", &SitePaths::jsDir, false},
        {"cache_dir", &SitePaths::cacheDir, false},
    };
    SitePaths paths;
    for (const auto& f : fields) {
        std::string value = mini::getString(cfg, f.key);
        // Paths are joined with '/' later; keep them without trailing separators.
        while (!value.empty() && value.back() == '/') value.pop_back();
        if (value.empty() && f.required) {
            err = std::string("site configuration lacks ") + f.key;
            return false;
        }
        paths.*(f.member) = value;
    }
    out = std::move(paths);
    return true;
}

bool findDefaultPlacesSpan(const std::string& text, size_t& start, size_t& end) {
    const std::string head = "var default_places = ";
    auto pos = text.find(head);
    if (pos == std::string::npos) return false;
    mini::Value v;
    size_t valueEnd = 0;
    if (!parseValueAt(text, pos + head.size(), v, valueEnd) || !v.isObject()) return false;
    start = pos + head.size();
    end = valueEnd;
    return true;
}

bool parseDefaultData(const std::string& module, DefaultData& out, std::string& err) {
    DefaultData d;
    std::string json;
    bool found = false;
    if (!extractJsonLiteral(module, "default_profiles_nb", json, found, err)) return false;
    if (found) {
        mini::Value nb;
        if (!mini::parse(json, nb) || !nb.isObject()) {
            err = "default_profiles_nb is not a JSON object";
            return false;
        }
        for (const auto& kv : nb.object) {
            if (kv.second.isNumber()) d.profilesNb[kv.first] = static_cast<int>(kv.second.number);
        }
    }
    if (!extractJsonLiteral(module, "default_profiles_startup", json, found, err)) return false;
    if (found) {
        mini::Value startup;
        if (!mini::parse(json, startup)) {
            err = "default_profiles_startup is not valid JSON";
            return false;
        }
        if (startup.isObject()) {
            for (const auto& kv : startup.object) d.profilesStartup.insert(kv.first);
        } else if (startup.isArray()) {
            for (const auto& item : startup.array) {
                if (item.isString()) d.profilesStartup.insert(item.str);
            }
        }
    } else {
        logWarn("default_profiles_startup missing; no startup animations will be fetched", "TPL");
    }
    size_t start = 0;
    size_t end = 0;
    if (!findDefaultPlacesSpan(module, start, end)) {
        err = "default_places not found in default data";
        return false;
    }
    if (!mini::parse(module.substr(start, end - start), d.places)) {
        err = "default_places is not valid JSON";
        return false;
    }
    out = std::move(d);
    return true;
}

bool parseJsModule(const std::string& text, JsModule& out, std::string& err) {
    static const std::regex declRe(
        R"(^Modules\.load\(new Object\(\{\s*name\s*:\s*['"]([^'"]*)['"]\s*,\s*dependencies\s*:\s*(\[[^\]]*\])\s*,\s*init\s*:\s*function\(\)\s*\{)");
    auto pos = text.find("Modules.load(new Object(");
    if (pos == std::string::npos) {
        err = "module declaration not found";
        return false;
    }
    // The declaration header is short; keep the regex off the module body.
    const std::string window = text.substr(pos, 4096);
    std::smatch m;
    if (!std::regex_search(window, m, declRe)) {
        err = "module declaration has an unexpected shape";
        return false;
    }
    JsModule mod;
    mod.name = m[1].str();
    std::string depText = m[2].str();
    std::replace(depText.begin(), depText.end(), '\'', '"');
    mini::Array deps;
    if (!mini::parse(depText, deps)) {
        err = "dependency list of module " + mod.name + " is not an array";
        return false;
    }
    for (const auto& d : deps) {
        if (!d.isString()) {
            err = "dependency list of module " + mod.name + " contains a non-string";
            return false;
        }
        mod.deps.push_back(d.str);
    }

    const size_t initStart = pos + static_cast<size_t>(m.length(0));
    // The declaration closes with "}));" at the start of a line.
    size_t close = text.find("\n}));", initStart);
    if (close == std::string::npos) {
        err = "module " + mod.name + " has no closing \"}));\"";
        return false;
    }
    size_t brace = close;
    while (brace > initStart && std::isspace(static_cast<unsigned char>(text[brace]))) --brace;
    if (text[brace] != '}') {
        err = "init function of module " + mod.name + " is not closed";
        return false;
    }
    mod.init = text.substr(initStart, brace - initStart);
    mod.content = text;
    mod.declStart = pos;
    mod.declEnd = close + 5;
    out = std::move(mod);
    return true;
}

bool combineJsModules(std::vector<JsModule> modules, std::string& out, std::string& err) {
    std::unordered_set<std::string> satisfied{"page_loaded", "dom_loaded"};
    std::string text;
    while (!modules.empty()) {
        const size_t before = modules.size();
        for (auto it = modules.begin(); it != modules.end();) {
            bool ready = std::all_of(it->deps.begin(), it->deps.end(),
                                     [&](const std::string& d) { return satisfied.count(d) > 0; });
            if (!ready) {
                ++it;
                continue;
            }
            satisfied.insert(it->name);
            std::string chunk = "// " + it->name + ".js\n\n";
            // Init bodies may `return`, so each runs as its own function after load.
            chunk += "initScripts.push(() => {" + it->init + "});\n";
            std::string content = it->content;
            content.replace(it->declStart, it->declEnd - it->declStart, "\n");
            util::replaceAll(content, "Modules.complete('" + it->name + "')", "\n");
            util::replaceAll(content, "Modules.complete(\"" + it->name + "\")", "\n");
            chunk += content;
            util::replaceAll(chunk, "SoundHowler.", "window.SoundHowler.");
            util::replaceAll(chunk, "window.window.SoundHowler.", "window.SoundHowler.");
            text += chunk;
            text += "\n";
            it = modules.erase(it);
        }
        if (modules.size() == before) {
            std::string names;
            for (const auto& mod : modules) {
                if (!names.empty()) names += ", ";
                names += mod.name;
            }
            err = "unsatisfiable module dependencies: " + names;
            return false;
        }
    }
    out = std::move(text);
    return true;
}

bool findLanguageBlock(const std::string& scripts, LanguageBlock& out, std::string& err) {
    const std::string head = "Languages.requestFiles([";
    auto pos = scripts.find(head);
    if (pos == std::string::npos) {
        err = "language loading block not found";
        return false;
    }
    size_t listStart = pos + head.size();
    size_t listEnd = scripts.find(']', listStart);
    if (listEnd == std::string::npos) {
        err = "language file list is not closed";
        return false;
    }
    std::string list = "[" + scripts.substr(listStart, listEnd - listStart) + "]";
    std::replace(list.begin(), list.end(), '\'', '"');
    mini::Array files;
    if (!mini::parse(list, files)) {
        err = "language file list is not an array";
        return false;
    }
    LanguageBlock block;
    for (const auto& f : files) {
        if (f.isString()) block.files.push_back(f.str);
    }
    size_t i = skipSpaces(scripts, listEnd + 1);
    if (scripts.compare(i, 1, ",") != 0) {
        err = "language block has no callback";
        return false;
    }
    i = skipSpaces(scripts, i + 1);
    if (scripts.compare(i, 8, "function") != 0) {
        err = "language block has no callback";
        return false;
    }
    i = skipSpaces(scripts, i + 8);
    if (scripts.compare(i, 2, "()") != 0) {
        err = "language callback takes arguments";
        return false;
    }
    i = skipSpaces(scripts, i + 2);
    if (i >= scripts.size() || scripts[i] != '{') {
        err = "language callback has no body";
        return false;
    }
    size_t bodyStart = i + 1;
    size_t bodyEnd = scripts.find("});", bodyStart);
    if (bodyEnd == std::string::npos) {
        err = "language callback is not closed";
        return false;
    }
    block.callback = scripts.substr(bodyStart, bodyEnd - bodyStart);
    util::trim(block.callback);
    block.start = pos;
    block.end = bodyEnd + 3;
    out = std::move(block);
    return true;
}

void mergeJson(mini::Value& into, const mini::Value& from) {
    if (into.isObject() && from.isObject()) {
        for (const auto& kv : from.object) {
            auto it = into.object.find(kv.first);
            if (it == into.object.end()) {
                into.object.emplace(kv.first, kv.second);
            } else {
                mergeJson(it->second, kv.second);
            }
        }
        return;
    }
    into = from;
}

bool inlineLanguage(std::string& scripts, const LanguageBlock& block, const mini::Value& lang, std::string& err) {
    if (block.end > scripts.size() || block.start >= block.end) {
        err = "language block position is stale";
        return false;
    }
    scripts.replace(block.start, block.end - block.start,
                    "Languages.requestFiles([], function(){});\n" + block.callback + "\n");
    const std::string decl = "var lang = new Object();";
    auto pos = scripts.find(decl);
    if (pos == std::string::npos) {
        err = "language object declaration not found";
        return false;
    }
    scripts.replace(pos, decl.size(), "var lang = " + mini::dump(lang) + ";");
    return true;
}

size_t removeAnalytics(std::string& player) {
    size_t removed = 0;
    size_t pos = 0;
    while ((pos = player.find("<script", pos)) != std::string::npos) {
        size_t close = player.find("</script>", pos);
        if (close == std::string::npos) break;
        close += 9;
        const std::string block = player.substr(pos, close - pos);
        if (block.find("UA-") != std::string::npos || block.find("googletagmanager") != std::string::npos ||
            block.find("google-analytics") != std::string::npos) {
            player.erase(pos, close - pos);
            ++removed;
        } else {
            pos = close;
        }
    }
    return removed;
}

std::string absolutizeCssUrls(const std::string& css, const std::string& cssUrl, HttpHandling handling) {
    std::string out;
    out.reserve(css.size());
    size_t pos = 0;
    while (true) {
        size_t at = css.find("url(", pos);
        if (at == std::string::npos) break;
        bool boundary = at > 0 && (css[at - 1] == ':' || css[at - 1] == ',' ||
                                   std::isspace(static_cast<unsigned char>(css[at - 1])));
        size_t i = skipSpaces(css, at + 4);
        char quote = 0;
        if (i < css.size() && (css[i] == '"' || css[i] == '\'')) quote = css[i++];
        size_t valueEnd = quote ? css.find(quote, i) : css.find(')', i);
        if (!boundary || valueEnd == std::string::npos) {
            out.append(css, pos, at + 4 - pos);
            pos = at + 4;
            continue;
        }
        std::string value = css.substr(i, valueEnd - i);
        util::trim(value);
        std::string absolute;
        std::string err;
        out.append(css, pos, i - pos);
        if (!value.empty() && value[0] != '#' && !util::startsWith(util::toLower(value), "data:") &&
            canonicalizeUrl(value, cssUrl, handling, absolute, err)) {
            out += absolute;
        } else {
            out.append(css, i, valueEnd - i);
        }
        pos = valueEnd;
    }
    out.append(css, pos, std::string::npos);
    return out;
}

bool setHtml5Audio(std::string& scripts, bool html5) {
    const std::string opt = kPreloadOption;
    auto pos = scripts.find(opt);
    if (pos == std::string::npos) return false;
    size_t after = pos + opt.size();
    if (scripts.compare(after, 8, ", html5:") == 0) return true;
    scripts.insert(after, std::string(", html5: ") + (html5 ? "true" : "false"));
    return true;
}

std::string templateUrl(const std::string& version, const std::string& path) {
    return std::string(kTemplateRepoBase) + "/" + version + "/" + path;
}

std::string moduleUrl(const std::string& version, const std::string& name) {
    if (name == "default_data") return originUrl(kDefaultDataPath);
    if (name == "trial") return templateUrl(version, "trial.js.php");
    return templateUrl(version, "Javascript/" + name + ".js");
}

TemplateFetcher::TemplateFetcher(HttpClient& client, HttpHandling handling)
    : client_(client), handling_(handling) {}

bool TemplateFetcher::fetchText(const std::string& url, std::string& body, ErrorInfo& info) {
    HttpResponse resp;
    if (!client_.get(url, resp, info, ErrorCategory::Resolution)) {
        info.detail += " (" + url + ")";
        return false;
    }
    body = std::move(resp.body);
    return true;
}

bool TemplateFetcher::fetchModules(PlayerTemplate& tpl, const std::string& defaultDataText,
                                   std::string& combined, ErrorInfo& info) {
    std::vector<JsModule> modules;
    std::unordered_set<std::string> seen{"page_loaded", "dom_loaded"};
    std::deque<std::string> queue{"player"};
    seen.insert("player");
    while (!queue.empty()) {
        if (client_.cancelled()) {
            info = classifyError("cancelled while fetching player modules", ErrorCategory::Resolution);
            return false;
        }
        const std::string name = queue.front();
        queue.pop_front();
        std::string text;
        if (name == "default_data") {
            text = defaultDataText;
        } else if (!fetchText(moduleUrl(tpl.version, name), text, info)) {
            logError("Could not fetch player module " + name + ": " + info.detail, "TPL");
            return false;
        }
        JsModule mod;
        std::string err;
        if (!parseJsModule(text, mod, err)) {
            info = parseFailure("module " + name + ": " + err);
            return false;
        }
        if (mod.name != name) {
            info = parseFailure("module " + name + " declares itself as " + mod.name);
            return false;
        }
        for (const auto& dep : mod.deps) {
            if (seen.insert(dep).second) queue.push_back(dep);
        }
        logDebug("Module " + name + " (" + std::to_string(mod.deps.size()) + " deps)", "TPL");
        modules.push_back(std::move(mod));
    }
    std::string err;
    if (!combineJsModules(std::move(modules), combined, err)) {
        info = parseFailure(err);
        return false;
    }
    return true;
}

bool TemplateFetcher::inlineStylesheets(PlayerTemplate& tpl, ErrorInfo& info) {
    static const std::regex linkRe(R"re(<link rel="stylesheet" type="text/css" href="([^"]+\.css)"\s*/>)re");
    std::string player;
    auto begin = std::sregex_iterator(tpl.player.begin(), tpl.player.end(), linkRe);
    auto end = std::sregex_iterator();
    size_t last = 0;
    for (auto it = begin; it != end; ++it) {
        const auto& m = *it;
        player.append(tpl.player, last, static_cast<size_t>(m.position(0)) - last);
        last = static_cast<size_t>(m.position(0) + m.length(0));
        std::string url;
        std::string err;
        std::string css;
        ErrorInfo fetchErr;
        if (!canonicalizeUrl(m[1].str(), std::string(kOriginBase) + "/", handling_, url, err) ||
            !fetchText(url, css, fetchErr)) {
            logWarn("Could not inline stylesheet " + m[1].str() + ", skipping: " +
                    (err.empty() ? fetchErr.detail : err), "TPL");
            player += m[0].str();
            continue;
        }
        player += "<style>" + absolutizeCssUrls(css, url, handling_) + "</style>";
    }
    player.append(tpl.player, last, std::string::npos);
    tpl.player = std::move(player);

    // Dynamic includeStyle('name'); calls move into the head as static styles.
    std::string headStyles;
    for (std::string* doc : {&tpl.player, &tpl.scripts}) {
        size_t pos = 0;
        while ((pos = doc->find("includeStyle(", pos)) != std::string::npos) {
            size_t i = pos + 13;
            if (i >= doc->size() || (doc->at(i) != '\'' && doc->at(i) != '"')) {
                pos = i;
                continue;
            }
            const char quote = doc->at(i);
            size_t nameEnd = doc->find(quote, i + 1);
            if (nameEnd == std::string::npos || doc->compare(nameEnd + 1, 2, ");") != 0) {
                pos = i;
                continue;
            }
            const std::string name = doc->substr(i + 1, nameEnd - i - 1);
            const std::string url = originUrl("CSS/" + name + ".css");
            std::string css;
            ErrorInfo fetchErr;
            if (!fetchText(url, css, fetchErr)) {
                if (client_.cancelled()) {
                    info = fetchErr;
                    return false;
                }
                logWarn("Could not fetch style " + name + ", skipping: " + fetchErr.detail, "TPL");
                pos = nameEnd;
                continue;
            }
            headStyles += "\n<style>" + absolutizeCssUrls(css, url, handling_) + "</style>";
            doc->erase(pos, nameEnd + 3 - pos);
        }
    }
    if (!headStyles.empty()) {
        auto head = tpl.player.find("</head>");
        if (head == std::string::npos) {
            info = parseFailure("player markup has no </head>");
            return false;
        }
        tpl.player.insert(head, headStyles);
    }
    return true;
}

bool TemplateFetcher::inlineLanguageFiles(PlayerTemplate& tpl, ErrorInfo& info) {
    LanguageBlock block;
    std::string err;
    if (!findLanguageBlock(tpl.scripts, block, err)) {
        info = parseFailure(err);
        return false;
    }
    mini::Value lang;
    lang.type = mini::Value::Type::Object;
    for (const auto& file : block.files) {
        const std::string url = originUrl(tpl.paths.langDir + "/" + tpl.language + "/" + file + ".js");
        std::string text;
        if (!fetchText(url, text, info)) {
            logError("Could not fetch language file " + file + " for language " + tpl.language, "TPL");
            return false;
        }
        mini::Value part;
        if (!mini::parse(text, part)) {
            info = parseFailure("language file " + file + " is not valid JSON");
            return false;
        }
        mergeJson(lang, part);
    }
    if (!inlineLanguage(tpl.scripts, block, lang, err)) {
        info = parseFailure(err);
        return false;
    }
    return true;
}

void TemplateFetcher::inlineHowler(PlayerTemplate& tpl) {
    const std::string head = kHowlerHead;
    auto pos = tpl.scripts.find(head);
    if (pos == std::string::npos) {
        logWarn("Could not find Howler.js include in scripts, skipping", "TPL");
        return;
    }
    size_t bodyStart = pos + head.size();
    size_t bodyEnd = tpl.scripts.find('}', bodyStart);
    if (bodyEnd == std::string::npos || tpl.scripts.compare(bodyEnd, 3, "});") != 0) {
        logWarn("Howler.js include has an unexpected shape, skipping", "TPL");
        return;
    }
    std::string howler;
    ErrorInfo err;
    if (!fetchText(templateUrl(tpl.version, "Javascript/howler.js/howler.min.js"), howler, err)) {
        logWarn("Could not fetch Howler.js, skipping: " + err.detail, "TPL");
        return;
    }
    std::string callback = tpl.scripts.substr(bodyStart, bodyEnd - bodyStart);
    tpl.scripts.replace(pos, bodyEnd + 3 - pos, howler + "\n" + callback);
}

size_t patchImageSizes(std::string& scripts) {
    const std::string head = kImageLoadHead;
    const std::string fix = kImageSizeFix;
    size_t patched = 0;
    size_t pos = 0;
    while ((pos = scripts.find(head, pos)) != std::string::npos) {
        size_t brace = pos + head.size();
        while (brace < scripts.size() && std::isspace(static_cast<unsigned char>(scripts[brace]))) ++brace;
        pos = brace;
        if (brace >= scripts.size() || scripts[brace] != '{') continue;
        if (scripts.compare(brace + 1, fix.size(), fix) == 0) continue;
        scripts.insert(brace + 1, fix);
        pos = brace + 1 + fix.size();
        ++patched;
    }
    return patched;
}

bool TemplateFetcher::fetch(const std::string& version, const std::string& language,
                            PlayerTemplate& out, ErrorInfo& info) {
    PlayerTemplate tpl;
    tpl.version = version.empty() ? std::string(kDefaultPlayerVersion) : version;
    tpl.language = language;
    logInfo("Fetching player template " + tpl.version + " (" + language + ")", "TPL");

    std::string bridge;
    std::string err;
    if (!fetchText(originUrl(kBridgePath), bridge, info)) return false;
    if (!parseSiteConfig(bridge, tpl.siteConfig, err) || !parseSitePaths(tpl.siteConfig, tpl.paths, err)) {
        info = parseFailure(err);
        return false;
    }

    std::string defaultDataText;
    if (!fetchText(moduleUrl(tpl.version, "default_data"), defaultDataText, info)) return false;
    if (!parseDefaultData(defaultDataText, tpl.defaults, err)) {
        info = parseFailure(err);
        return false;
    }

    if (!fetchText(templateUrl(tpl.version, "player.php"), tpl.player, info)) return false;
    std::string common;
    if (!fetchText(templateUrl(tpl.version, "Javascript/common.js"), common, info)) return false;
    std::string modules;
    if (!fetchModules(tpl, defaultDataText, modules, info)) return false;

    tpl.scripts = "var cfg = " + mini::dump(tpl.siteConfig) + ";\n"
                  "function getFileVersion(path_components)\n"
                  "{\n"
                  "    return '';\n"
                  "}\n" +
                  common +
                  "\n\nlet initScripts = [];\n" +
                  modules +
                  "window.addEventListener('load', function() {\n"
                  "    initScripts.forEach((x) => x());\n"
                  "}, false);\n";

    if (removeAnalytics(tpl.player) == 0) {
        logWarn("Could not find Google Analytics tag in player, skipping", "TPL");
    }
    if (!inlineStylesheets(tpl, info)) return false;
    if (!inlineLanguageFiles(tpl, info)) return false;
    inlineHowler(tpl);
    // Assets are local already; preloading every default place only produces misses.
    if (util::replaceAll(tpl.scripts, kPreloadPlaces, "return;") == 0) {
        logWarn("Could not find default place preloading in scripts, skipping", "TPL");
    }
    if (patchImageSizes(tpl.scripts) == 0) {
        logWarn("Could not find image handling code, skipping", "TPL");
    }

    logInfo("Player template " + tpl.version + " ready (" + std::to_string(tpl.scripts.size()) + " bytes of script)", "TPL");
    out = std::move(tpl);
    return true;
}

TemplateCache::TemplateCache(TemplateFetcher& fetcher) : fetcher_(fetcher) {}

bool TemplateCache::get(const std::string& version, const std::string& language,
                        std::shared_ptr<const PlayerTemplate>& out, ErrorInfo& info) {
    const std::string key = (version.empty() ? std::string(kDefaultPlayerVersion) : version) + "|" + language;
    std::shared_ptr<Entry> entry;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            entry = std::make_shared<Entry>();
            entries_.emplace(key, entry);
            owner = true;
            ++fetches_;
        } else {
            entry = it->second;
        }
    }

    if (owner) {
        auto tpl = std::make_shared<PlayerTemplate>();
        ErrorInfo err;
        bool ok = fetcher_.fetch(version, language, *tpl, err);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entry->done = true;
            entry->ok = ok;
            if (ok) entry->tpl = tpl;
            else entry->error = err;
        }
        cv_.notify_all();
    }

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&] { return entry->done; });
    if (!entry->ok) {
        info = entry->error;
        return false;
    }
    out = entry->tpl;
    return true;
}

size_t TemplateCache::fetchCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetches_;
}

} // namespace aao
