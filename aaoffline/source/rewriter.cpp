#include "aao/rewriter.hpp"
#include "aao/asset_graph.hpp"
#include "aao/constants.hpp"
#include "aao/logger.hpp"
#include "aao/util.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace aao {

namespace {

const char* const kVoiceSignature = "function getVoiceUrl(voice_id, ext)";
const char* const kSpriteSignature = "getDefaultSpriteUrl(base, sprite_id, status)";
const char* const kLockDirHead = "cfg.picture_dir";
const char* const kLockSubdir = "cfg.locks_subdir";

bool isOpeningBoundary(char c) {
    return c == '"' || c == '\'' || c == '(' || c == '=' || std::isspace(static_cast<unsigned char>(c));
}

bool isClosingBoundary(char c) {
    return c == '"' || c == '\'' || c == ')' || std::isspace(static_cast<unsigned char>(c));
}

mini::Value* documentRoot(CaseDocuments& docs, DocumentKind kind) {
    switch (kind) {
        case DocumentKind::CaseData: return &docs.data;
        case DocumentKind::DefaultPlaces: return &docs.defaultPlaces;
        default: return nullptr;
    }
}

std::string* documentText(CaseDocuments& docs, DocumentKind kind) {
    switch (kind) {
        case DocumentKind::Player: return &docs.player;
        case DocumentKind::Scripts: return &docs.scripts;
        default: return nullptr;
    }
}

// Set `ptr` to true, creating the member when the parent object lacks it.
bool setFlag(mini::Value& root, const std::string& ptr) {
    auto slash = ptr.rfind('/');
    if (slash == std::string::npos) return false;
    mini::Value* parent = slash == 0 ? &root : mini::pointer(root, ptr.substr(0, slash));
    if (!parent || !parent->isObject()) return false;
    std::string key = ptr.substr(slash + 1);
    util::replaceAll(key, "~1", "/");
    util::replaceAll(key, "~0", "~");
    parent->object[key] = mini::Value::makeBool(true);
    return true;
}

std::string voiceBody(const std::map<std::string, std::string>& keyed) {
    std::string body = "\n";
    for (const auto& kv : keyed) {
        const auto parts = util::split(kv.first, ':');
        if (parts.size() != 3 || parts[0] != "voice") continue;
        body += "if (-voice_id === " + parts[1] + " && ext === '" + parts[2] + "') return '" +
                util::jsSingleQuoted(kv.second) + "';\n";
    }
    return body + "return 'data:audio/wav;base64,';\n";
}

std::string spriteBody(const std::map<std::string, std::string>& keyed) {
    std::string body = "\n";
    for (const auto& kv : keyed) {
        if (!util::startsWith(kv.first, "sprite:")) continue;
        // sprite:<base>:<id>:<status>; the base is the only part that may hold ':'.
        const std::string& key = kv.first;
        auto statusSep = key.rfind(':');
        if (statusSep == std::string::npos || statusSep <= 7) continue;
        auto idSep = key.rfind(':', statusSep - 1);
        if (idSep == std::string::npos || idSep <= 7) continue;
        const std::string base = key.substr(7, idSep - 7);
        const std::string id = key.substr(idSep + 1, statusSep - idSep - 1);
        const std::string status = key.substr(statusSep + 1);
        body += "if (base === '" + util::jsSingleQuoted(base) + "' && sprite_id === " + id +
                " && status === '" + status + "') return '" + util::jsSingleQuoted(kv.second) + "';\n";
    }
    return body + "return 'data:image/gif;base64,';\n";
}

} // namespace

CaseDocuments makeDocuments(const CaseManifest& manifest, const PlayerTemplate& tpl) {
    CaseDocuments docs;
    docs.caseId = manifest.caseId;
    docs.title = manifest.info.title;
    docs.player = tpl.player;
    docs.scripts = tpl.scripts;
    docs.information = manifest.information;
    docs.data = manifest.data;
    docs.defaultPlaces = tpl.defaults.places;
    return docs;
}

std::string localForm(const AssetRecord& rec, OutputMode mode) {
    if (mode == OutputMode::SingleFile) {
        const std::string mime = rec.mime.empty() ? "application/octet-stream" : rec.mime;
        return "data:" + mime + ";base64," + util::base64Encode(rec.bytes);
    }
    return "assets/" + rec.localName;
}

size_t replaceLiteral(std::string& text, const std::string& literal, const std::string& replacement) {
    if (literal.empty()) return 0;
    size_t count = 0;
    size_t pos = 0;
    while ((pos = text.find(literal, pos)) != std::string::npos) {
        const size_t end = pos + literal.size();
        bool before = pos == 0 || isOpeningBoundary(text[pos - 1]);
        bool after = end == text.size() || isClosingBoundary(text[end]);
        if (!before || !after) {
            ++pos;
            continue;
        }
        text.replace(pos, literal.size(), replacement);
        pos += replacement.size();
        ++count;
    }
    return count;
}

bool replaceFunctionBody(std::string& scripts, const std::string& signature, const std::string& body) {
    auto pos = scripts.find(signature);
    if (pos == std::string::npos) return false;
    auto open = scripts.find('{', pos + signature.size());
    if (open == std::string::npos) return false;
    for (size_t i = pos + signature.size(); i < open; ++i) {
        if (!std::isspace(static_cast<unsigned char>(scripts[i]))) return false;
    }
    auto close = scripts.find('}', open + 1);
    if (close == std::string::npos) return false;
    scripts.replace(open + 1, close - open - 1, body);
    return true;
}

size_t rewriteLockPaths(std::string& scripts, const std::map<std::string, std::string>& locals, OutputMode mode) {
    static const std::regex lockPath(
        R"(cfg\.picture_dir\s*\+\s*cfg\.locks_subdir\s*\+\s*'([A-Za-z0-9_]+)\.gif\?id='\s*\+\s*([A-Za-z_$][A-Za-z0-9_$.]*))");
    const std::string subdir = kLockSubdir;
    size_t count = 0;
    size_t pos = 0;
    while ((pos = scripts.find(subdir, pos)) != std::string::npos) {
        const size_t from = pos < 64 ? 0 : pos - 64;
        const size_t head = scripts.rfind(kLockDirHead, pos);
        pos += subdir.size();
        if (head == std::string::npos || head < from) continue;

        const std::string window = scripts.substr(head, 256);
        std::smatch m;
        if (!std::regex_search(window, m, lockPath, std::regex_constants::match_continuous)) continue;
        auto local = locals.find(m[1].str());
        if (local == locals.end()) continue;
        const std::string id = m[2].str();

        std::string replacement;
        if (mode == OutputMode::SingleFile) {
            const std::string& uri = local->second;
            const size_t semi = uri.find(';');
            if (semi == std::string::npos) continue;
            replacement = "'" + uri.substr(0, semi) + "' + " + id + " + '" + uri.substr(semi) + "'";
        } else {
            replacement = "'" + std::string(kAssetDir) + "/" + local->first + "_' + " + id + " + '.gif'";
        }
        scripts.replace(head, static_cast<size_t>(m.length(0)), replacement);
        pos = head + replacement.size();
        ++count;
    }
    return count;
}

Rewriter::Rewriter(OutputMode mode, bool html5Audio) : mode_(mode), html5Audio_(html5Audio) {}

bool Rewriter::rewritePointer(CaseDocuments& docs, const OccurrenceSite& site, const std::string& local) const {
    mini::Value* root = documentRoot(docs, site.document);
    if (!root) return false;
    mini::Value* target = mini::pointer(*root, site.location);
    if (!target) {
        // A profile without an icon gets one; its parent still exists.
        if (!setFlag(*root, site.location)) return false;
        target = mini::pointer(*root, site.location);
        if (!target) return false;
    }
    *target = mini::Value::makeString(local);
    if (!site.externalFlag.empty() && !setFlag(*root, site.externalFlag)) {
        logDebug("No parent for flag " + site.externalFlag, "RW");
    }
    return true;
}

void Rewriter::rewriteKeyed(CaseDocuments& docs, const std::map<std::string, std::string>& keyed) const {
    if (!replaceFunctionBody(docs.scripts, kVoiceSignature, voiceBody(keyed))) {
        logWarn("getVoiceUrl not found in scripts; voices will load from the network", "RW");
    }
    if (!replaceFunctionBody(docs.scripts, kSpriteSignature, spriteBody(keyed))) {
        logWarn("getDefaultSpriteUrl not found in scripts; some sprites may be missing", "RW");
    }

    std::map<std::string, std::string> locks;
    for (const auto& kv : keyed) {
        if (util::startsWith(kv.first, "lock:")) locks[kv.first.substr(5)] = kv.second;
    }
    if (locks.empty()) return;
    if (rewriteLockPaths(docs.scripts, locks, mode_) == 0) {
        logWarn("Could not find psyche locks in scripts; locks will load from the network", "RW");
    }
    if (mode_ != OutputMode::Directory) return;
    // The player asks for one file per lock id; each gets a copy of the shared image.
    const size_t copies = maxPsycheLocks(docs.data);
    const std::string prefix = std::string(kAssetDir) + "/";
    for (const auto& lock : locks) {
        for (size_t i = 1; i <= copies; ++i) {
            docs.assetAliases[lock.first + "_" + std::to_string(i) + ".gif"] = lock.second.substr(prefix.size());
        }
    }
}

RewriteResult Rewriter::rewrite(CaseDocuments& docs,
                                const std::vector<AssetReference>& refs,
                                const std::vector<AssetRecord>& records) const {
    RewriteResult result;
    std::map<std::string, const AssetRecord*> byUrl;
    for (const auto& rec : records) byUrl[rec.url] = &rec;

    struct TextEdit {
        DocumentKind doc;
        std::string literal;
        std::string local;
    };
    std::vector<TextEdit> textEdits;
    std::map<std::string, std::string> keyed;

    for (const auto& ref : refs) {
        auto it = byUrl.find(ref.url);
        if (it == byUrl.end() || it->second->status != AssetStatus::Fetched) {
            result.missing.push_back(ref.url);
            continue;
        }
        const std::string local = localForm(*it->second, mode_);
        for (const auto& site : ref.sites) {
            switch (site.kind) {
                case SiteKind::JsonPointer:
                    if (rewritePointer(docs, site, local)) {
                        ++result.sitesRewritten;
                    } else {
                        logWarn("Occurrence " + site.location + " of " + ref.url + " no longer exists", "RW");
                    }
                    break;
                case SiteKind::Text:
                    textEdits.push_back(TextEdit{site.document, site.location, local});
                    break;
                case SiteKind::Keyed:
                    keyed[site.location] = local;
                    ++result.sitesRewritten;
                    break;
            }
        }
    }

    // Longer literals first so a URL never clobbers a longer one it prefixes.
    std::stable_sort(textEdits.begin(), textEdits.end(), [](const TextEdit& a, const TextEdit& b) {
        return a.literal.size() > b.literal.size();
    });
    for (const auto& edit : textEdits) {
        std::string* text = documentText(docs, edit.doc);
        if (!text) continue;
        result.sitesRewritten += replaceLiteral(*text, edit.literal, edit.local);
    }

    rewriteKeyed(docs, keyed);

    size_t start = 0, end = 0;
    if (findDefaultPlacesSpan(docs.scripts, start, end)) {
        docs.scripts.replace(start, end - start, mini::dump(docs.defaultPlaces));
    } else if (docs.defaultPlaces.isObject() && !docs.defaultPlaces.object.empty()) {
        logWarn("default_places not found in scripts", "RW");
    }

    if (mode_ == OutputMode::Directory) setHtml5Audio(docs.scripts, html5Audio_);

    std::sort(result.missing.begin(), result.missing.end());
    logInfo("Case " + docs.caseId + ": rewrote " + std::to_string(result.sitesRewritten) + " sites, " +
            std::to_string(result.missing.size()) + " assets missing", "RW");
    return result;
}

} // namespace aao
