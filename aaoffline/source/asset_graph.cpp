#include "aao/asset_graph.hpp"
#include "aao/constants.hpp"
#include "aao/logger.hpp"
#include "aao/url.hpp"
#include "aao/util.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

namespace aao {

namespace {

const char* const kAllowedExtensions[] = {
    "png", "jpg", "jpeg", "gif", "webp", "bmp", "ico", "svg",
    "mp3", "ogg", "opus", "wav", "m4a", "flac",
    "woff", "woff2", "ttf", "otf", "eot",
    "css", "js",
};

const char* const kMediaHosts[] = {
    "aaonline.fr",
    "aceattorney.sparklin.org",
    "bitbucket.org",
    "photobucket.com",
    "imgur.com",
    "googleusercontent.com",
    "discordapp.com",
    "discordapp.net",
    "catbox.moe",
};

const char* const kSpriteKinds[] = {"talking", "still", "startup"};
const char* const kVoiceExtensions[] = {"opus", "wav", "mp3"};

std::string itemPointer(const std::string& list, size_t i, const std::string& field) {
    return "/" + list + "/" + std::to_string(i) + "/" + field;
}

// Flags arrive as true/false or 1/0 depending on the case's age.
bool flagValue(const mini::Value* v, bool fallback) {
    if (!v) return fallback;
    if (v->isBool()) return v->boolean;
    if (v->isNumber()) return v->number == 1;
    return fallback;
}

std::string idText(const mini::Value* v) {
    if (!v) return {};
    if (v->isNumber() || v->isString()) return v->str;
    return {};
}

bool isUrlChar(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    if (std::isspace(u)) return false;
    return c != '"' && c != '\'' && c != '(' && c != ')' && c != '<' && c != '>' && c != '\\' && c != '`';
}

std::string joinPath(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& p : parts) {
        if (p.empty()) continue;
        if (!out.empty()) out += "/";
        out += p;
    }
    return out;
}

OccurrenceSite pointerSite(DocumentKind doc, const std::string& ptr, const std::string& flag = "") {
    OccurrenceSite s;
    s.kind = SiteKind::JsonPointer;
    s.document = doc;
    s.location = ptr;
    s.externalFlag = flag;
    return s;
}

OccurrenceSite keyedSite(const std::string& key) {
    OccurrenceSite s;
    s.kind = SiteKind::Keyed;
    s.document = DocumentKind::Scripts;
    s.location = key;
    return s;
}

} // namespace

std::string assetUrl(const std::string& value,
                     const std::vector<std::string>& dirs,
                     bool external,
                     const std::string& defaultExt) {
    std::string file = value;
    util::trim(file);
    std::string name = file.substr(0, file.find_first_of("?#"));
    auto slash = name.rfind('/');
    std::string last = slash == std::string::npos ? name : name.substr(slash + 1);
    if (!defaultExt.empty() && last.find('.') == std::string::npos) {
        file = name + "." + defaultExt + file.substr(name.size());
    }
    std::string url;
    if (!external) {
        url = std::string(kOriginBase) + "/" + joinPath(dirs) + "/" + file;
    } else if (util::startsWith(util::toLower(file), "http") || util::startsWith(file, "//")) {
        url = file;
    } else {
        url = std::string(kOriginBase) + "/" + file;
    }
    return collapseSlashes(url);
}

std::vector<std::string> scanTextReferences(const std::string& text) {
    std::vector<std::string> out;
    auto quotedAfter = [&](size_t i) -> std::pair<size_t, size_t> {
        if (i >= text.size() || (text[i] != '"' && text[i] != '\'')) return {std::string::npos, 0};
        size_t end = text.find(text[i], i + 1);
        if (end == std::string::npos || end - i - 1 > 2048) return {std::string::npos, 0};
        return {i + 1, end - i - 1};
    };

    // src="..." and .src = '...'
    size_t pos = 0;
    while ((pos = text.find("src", pos)) != std::string::npos) {
        size_t i = pos + 3;
        bool dotted = pos > 0 && text[pos - 1] == '.';
        while (dotted && i < text.size() && (text[i] == ' ' || text[i] == '\t')) ++i;
        if (i < text.size() && text[i] == '=') {
            ++i;
            while (dotted && i < text.size() && (text[i] == ' ' || text[i] == '\t')) ++i;
            auto q = quotedAfter(i);
            if (q.first != std::string::npos && q.second > 0) out.push_back(text.substr(q.first, q.second));
        }
        pos += 3;
    }

    // url(...) in inline styles
    pos = 0;
    while ((pos = text.find("url(", pos)) != std::string::npos) {
        bool boundary = pos > 0 && (text[pos - 1] == ':' || text[pos - 1] == ',' ||
                                    std::isspace(static_cast<unsigned char>(text[pos - 1])));
        size_t i = pos + 4;
        pos = i;
        if (!boundary) continue;
        if (i < text.size() && (text[i] == '"' || text[i] == '\'')) {
            auto q = quotedAfter(i);
            if (q.first != std::string::npos && q.second > 0) out.push_back(text.substr(q.first, q.second));
        } else {
            size_t end = text.find(')', i);
            if (end != std::string::npos && end > i && end - i < 2048) out.push_back(text.substr(i, end - i));
        }
    }

    // bare absolute URLs
    pos = 0;
    while ((pos = text.find("http", pos)) != std::string::npos) {
        size_t schemeEnd = std::string::npos;
        if (text.compare(pos, 7, "http://") == 0) schemeEnd = pos + 7;
        else if (text.compare(pos, 8, "https://") == 0) schemeEnd = pos + 8;
        if (schemeEnd == std::string::npos || (pos > 0 && std::isalnum(static_cast<unsigned char>(text[pos - 1])))) {
            pos += 4;
            continue;
        }
        size_t end = schemeEnd;
        while (end < text.size() && isUrlChar(text[end])) ++end;
        std::string url = text.substr(pos, end - pos);
        while (!url.empty() && (url.back() == '.' || url.back() == ',' || url.back() == ';')) url.pop_back();
        if (url.size() > static_cast<size_t>(schemeEnd - pos)) out.push_back(url);
        pos = end;
    }
    return out;
}

bool isAllowedTextReference(const std::string& canonicalUrl) {
    const std::string ext = urlExtension(canonicalUrl);
    bool extOk = std::any_of(std::begin(kAllowedExtensions), std::end(kAllowedExtensions),
                             [&](const char* e) { return ext == e; });
    if (!extOk) return false;
    const std::string host = urlHost(canonicalUrl);
    return std::any_of(std::begin(kMediaHosts), std::end(kMediaHosts),
                       [&](const char* h) { return hostMatches(host, h); });
}

AssetRole roleForExtension(const std::string& ext) {
    if (ext == "css" || ext == "woff" || ext == "woff2" || ext == "ttf" || ext == "otf" || ext == "eot") {
        return AssetRole::Style;
    }
    if (ext == "js") return AssetRole::Script;
    if (ext == "mp3" || ext == "ogg" || ext == "opus" || ext == "wav" || ext == "m4a" || ext == "flac") {
        return AssetRole::Sound;
    }
    if (ext == "html" || ext == "htm") return AssetRole::Markup;
    return AssetRole::Other;
}

const std::vector<std::string>& psycheLockFiles() {
    static const std::vector<std::string> files{"fg_chains_appear", "jfa_lock_appears", "jfa_lock_explodes",
                                                "fg_chains_disappear"};
    return files;
}

size_t maxPsycheLocks(const mini::Value& data) {
    size_t most = 0;
    const mini::Value* scenes = mini::get(data, "scenes");
    if (!scenes || !scenes->isArray()) return 0;
    for (const auto& scene : scenes->array) {
        const mini::Value* dialogues = mini::get(scene, "dialogues");
        if (!dialogues || !dialogues->isArray()) continue;
        for (const auto& dialogue : dialogues->array) {
            const mini::Value* locks = mini::get(dialogue, "locks");
            const mini::Value* shown = locks ? mini::get(*locks, "locks_to_display") : nullptr;
            if (shown && shown->isArray()) most = std::max(most, shown->array.size());
        }
    }
    return most;
}

AssetGraph::AssetGraph(HttpHandling handling) : handling_(handling) {}

void AssetGraph::add(const std::string& rawUrl, AssetRole role, const OccurrenceSite& site) {
    std::string url;
    std::string err;
    bool insecure = false;
    if (!canonicalizeUrl(rawUrl, std::string(kOriginBase) + "/", handling_, url, err)) {
        // A refused http:// reference still has to show up as a failed asset.
        if (handling_ == HttpHandling::Disallow &&
            canonicalizeUrl(rawUrl, std::string(kOriginBase) + "/", HttpHandling::AllowInsecure, url, err) &&
            util::startsWith(url, "http://")) {
            insecure = true;
        } else {
            logWarn("Skipping reference " + util::ellipsize(rawUrl, 80) + ": " + err, "GRAPH");
            ++discarded_;
            return;
        }
    }
    auto it = refs_.find(url);
    if (it == refs_.end()) {
        AssetReference ref;
        ref.url = url;
        ref.role = role;
        ref.extensionHint = urlExtension(url);
        ref.insecure = insecure;
        it = refs_.emplace(url, std::move(ref)).first;
    }
    it->second.addSite(site);
}

void AssetGraph::walkProfiles(const mini::Value& data, const PlayerTemplate& tpl) {
    const mini::Value* profiles = mini::get(data, "profiles");
    if (!profiles || !profiles->isArray()) return;

    std::map<std::string, std::string> baseById;
    for (size_t i = 0; i < profiles->array.size(); ++i) {
        const mini::Value& profile = profiles->array[i];
        if (!profile.isObject()) continue;
        const std::string base = mini::getString(profile, "base");
        const std::string id = idText(mini::get(profile, "id"));
        if (!id.empty() && !base.empty()) baseById[id] = base;

        std::string icon = mini::getString(profile, "icon");
        if (icon.empty() && !base.empty()) {
            // No custom icon: the player falls back to the base character's icon.
            icon = tpl.paths.pictureDir + "/" + tpl.paths.iconSubdir + "/" + base + ".png";
        }
        if (!icon.empty()) {
            add(assetUrl(icon, {}, true, "png"), AssetRole::Icon,
                pointerSite(DocumentKind::CaseData, itemPointer("profiles", i, "icon")));
        }

        const mini::Value* customs = mini::get(profile, "custom_sprites");
        if (!customs || !customs->isArray()) continue;
        for (size_t j = 0; j < customs->array.size(); ++j) {
            const mini::Value& custom = customs->array[j];
            if (!custom.isObject()) continue;
            for (const char* kind : kSpriteKinds) {
                const std::string value = mini::getString(custom, kind);
                if (value.empty()) continue;
                add(assetUrl(value, {}, true, "gif"), AssetRole::Sprite,
                    pointerSite(DocumentKind::CaseData,
                                itemPointer("profiles", i, "custom_sprites/" + std::to_string(j) + "/" + kind)));
            }
        }
    }

    // Default sprites are referenced from frames by negative sprite ids.
    std::set<std::pair<std::string, std::string>> used;
    const mini::Value* frames = mini::get(data, "frames");
    if (frames && frames->isArray()) {
        for (const auto& frame : frames->array) {
            const mini::Value* chars = mini::get(frame, "characters");
            if (!chars || !chars->isArray()) continue;
            for (const auto& c : chars->array) {
                const mini::Value* profileId = mini::get(c, "profile_id");
                const mini::Value* spriteId = mini::get(c, "sprite_id");
                if (!profileId || !spriteId || !spriteId->isNumber() || spriteId->number >= 0) continue;
                auto base = baseById.find(idText(profileId));
                if (base == baseById.end()) continue;
                used.emplace(base->second, std::to_string(-spriteId->number));
            }
        }
    }
    for (const auto& u : used) {
        for (const char* kind : kSpriteKinds) {
            if (std::string(kind) == "startup" && !tpl.defaults.profilesStartup.count(u.first + "/" + u.second)) {
                continue;
            }
            add(assetUrl(u.second + ".gif", {tpl.paths.pictureDir, tpl.paths.spriteSubdir(kind), u.first}, false, ""),
                AssetRole::Sprite, keyedSite("sprite:" + u.first + ":" + u.second + ":" + kind));
        }
    }
}

void AssetGraph::walkEvidence(const mini::Value& data, const PlayerTemplate& tpl) {
    const mini::Value* evidence = mini::get(data, "evidence");
    if (!evidence || !evidence->isArray()) return;
    for (size_t i = 0; i < evidence->array.size(); ++i) {
        const mini::Value& ev = evidence->array[i];
        if (!ev.isObject()) continue;
        const std::string icon = mini::getString(ev, "icon");
        if (!icon.empty()) {
            bool external = flagValue(mini::get(ev, "icon_external"), true);
            add(assetUrl(icon, {tpl.paths.pictureDir, tpl.paths.evidenceSubdir}, external, "png"),
                AssetRole::Evidence,
                pointerSite(DocumentKind::CaseData, itemPointer("evidence", i, "icon"),
                            itemPointer("evidence", i, "icon_external")));
        }
        const mini::Value* checks = mini::get(ev, "check_button_data");
        if (!checks || !checks->isArray()) continue;
        for (size_t j = 0; j < checks->array.size(); ++j) {
            const mini::Value& check = checks->array[j];
            const std::string type = mini::getString(check, "type", "text");
            const std::string content = mini::getString(check, "content");
            if (type == "text" || content.empty()) continue;
            add(assetUrl(content, {}, true, ""), AssetRole::Evidence,
                pointerSite(DocumentKind::CaseData,
                            itemPointer("evidence", i, "check_button_data/" + std::to_string(j) + "/content")));
        }
    }
}

void AssetGraph::walkPlace(const mini::Value& place, DocumentKind doc, const std::string& prefix,
                           const PlayerTemplate& tpl) {
    if (!place.isObject()) return;
    const mini::Value* background = mini::get(place, "background");
    if (background && background->isObject()) {
        // Default places may only carry a colour.
        const std::string image = mini::getString(*background, "image");
        if (!image.empty()) {
            bool external = flagValue(mini::get(*background, "external"), false);
            add(assetUrl(image, {tpl.paths.pictureDir, tpl.paths.bgSubdir}, external, "jpg"),
                AssetRole::Background,
                pointerSite(doc, prefix + "/background/image", prefix + "/background/external"));
        }
    }
    for (const char* list : {"background_objects", "foreground_objects"}) {
        const mini::Value* objects = mini::get(place, list);
        if (!objects || !objects->isArray()) continue;
        for (size_t k = 0; k < objects->array.size(); ++k) {
            const mini::Value& obj = objects->array[k];
            const std::string image = mini::getString(obj, "image");
            if (image.empty()) continue;
            if (!flagValue(mini::get(obj, "external"), false)) {
                logWarn("Place object " + prefix + "/" + list + "/" + std::to_string(k) +
                        " is not external, skipping", "GRAPH");
                continue;
            }
            add(assetUrl(image, {}, true, ""), AssetRole::Background,
                pointerSite(doc, prefix + "/" + list + "/" + std::to_string(k) + "/image"));
        }
    }
}

void AssetGraph::walkMedia(const mini::Value& data, const char* listName, const char* field,
                           const std::vector<std::string>& dirs, const std::string& defaultExt, AssetRole role) {
    const mini::Value* list = mini::get(data, listName);
    if (!list || !list->isArray()) return;
    for (size_t i = 0; i < list->array.size(); ++i) {
        const mini::Value& item = list->array[i];
        const std::string path = mini::getString(item, field);
        if (path.empty()) continue;
        bool external = flagValue(mini::get(item, "external"), false);
        add(assetUrl(path, dirs, external, defaultExt), role,
            pointerSite(DocumentKind::CaseData, itemPointer(listName, i, field), itemPointer(listName, i, "external")));
    }
}

void AssetGraph::walkDefaultPlaces(const mini::Value& data, const PlayerTemplate& tpl) {
    if (!tpl.defaults.places.isObject()) return;
    std::set<std::string> usedPlaces;
    const mini::Value* frames = mini::get(data, "frames");
    if (frames && frames->isArray()) {
        for (const auto& frame : frames->array) {
            std::string id = idText(mini::get(frame, "place"));
            if (!id.empty()) usedPlaces.insert(id);
        }
    }
    for (const auto& id : usedPlaces) {
        auto it = tpl.defaults.places.object.find(id);
        if (it == tpl.defaults.places.object.end()) continue;
        walkPlace(it->second, DocumentKind::DefaultPlaces, "/" + mini::escape_pointer_token(id), tpl);
    }
}

void AssetGraph::addVoices(const PlayerTemplate& tpl) {
    for (int i = 1; i <= 3; ++i) {
        for (const char* ext : kVoiceExtensions) {
            const std::string file = "voice_singleblip_" + std::to_string(i) + "." + ext;
            add(assetUrl(file, {tpl.paths.voicesDir}, false, ""), AssetRole::Voice,
                keyedSite("voice:" + std::to_string(i) + ":" + ext));
        }
    }
}

void AssetGraph::addPsycheLocks(const mini::Value& data, const PlayerTemplate& tpl) {
    if (maxPsycheLocks(data) == 0) return;
    if (tpl.paths.locksSubdir.empty()) {
        logWarn("Case shows psyche locks but the site config has no locks_subdir", "GRAPH");
        return;
    }
    for (const auto& name : psycheLockFiles()) {
        add(assetUrl(name, {tpl.paths.pictureDir, tpl.paths.locksSubdir}, false, "gif"), AssetRole::Lock,
            keyedSite("lock:" + name));
    }
}

void AssetGraph::scanDocument(const std::string& text, DocumentKind doc) {
    for (const auto& literal : scanTextReferences(text)) {
        if (util::startsWith(util::toLower(literal), "data:")) continue;
        std::string url;
        std::string err;
        // Insecure literals are kept here; add() decides how to record them.
        const HttpHandling lenient = handling_ == HttpHandling::Disallow ? HttpHandling::AllowInsecure : handling_;
        if (!canonicalizeUrl(literal, std::string(kOriginBase) + "/", lenient, url, err) ||
            !isAllowedTextReference(url)) {
            ++discarded_;
            continue;
        }
        OccurrenceSite site;
        site.kind = SiteKind::Text;
        site.document = doc;
        site.location = literal;
        add(url, roleForExtension(urlExtension(url)), site);
    }
}

std::vector<AssetReference> AssetGraph::enumerate(const CaseManifest& manifest, const PlayerTemplate& tpl) {
    refs_.clear();
    discarded_ = 0;
    const mini::Value& data = manifest.data;

    walkProfiles(data, tpl);
    walkEvidence(data, tpl);
    const mini::Value* places = mini::get(data, "places");
    if (places && places->isArray()) {
        for (size_t i = 0; i < places->array.size(); ++i) {
            walkPlace(places->array[i], DocumentKind::CaseData, "/places/" + std::to_string(i), tpl);
        }
    }
    walkDefaultPlaces(data, tpl);
    walkMedia(data, "popups", "path", {tpl.paths.pictureDir, tpl.paths.popupsSubdir}, "gif", AssetRole::Popup);
    walkMedia(data, "music", "path", {tpl.paths.musicDir}, "mp3", AssetRole::Music);
    walkMedia(data, "sounds", "path", {tpl.paths.soundsDir}, "mp3", AssetRole::Sound);
    addVoices(tpl);
    addPsycheLocks(data, tpl);
    scanDocument(tpl.player, DocumentKind::Player);
    scanDocument(tpl.scripts, DocumentKind::Scripts);

    std::vector<AssetReference> out;
    out.reserve(refs_.size());
    size_t sites = 0;
    for (auto& kv : refs_) {
        sites += kv.second.sites.size();
        out.push_back(std::move(kv.second));
    }
    refs_.clear();
    logInfo("Case " + manifest.caseId + ": " + std::to_string(out.size()) + " assets, " +
            std::to_string(sites) + " occurrence sites, " + std::to_string(discarded_) + " references discarded", "GRAPH");
    return out;
}

} // namespace aao
