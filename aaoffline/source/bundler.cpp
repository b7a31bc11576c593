#include "aao/bundler.hpp"
#include "aao/constants.hpp"
#include "aao/filesystem.hpp"
#include "aao/logger.hpp"
#include "aao/raii.hpp"
#include "aao/util.hpp"
#include <algorithm>
#include <set>

namespace aao {

namespace {

const char* const kCommonRender = "include('common_render.php');";
const char* const kTrialBlock = "var trial_information;";
const char* const kLanguageEcho = "echo language_backend(";
const char* const kBridgeInclude = "include('bridge.js.php');";
const char* const kTitleEcho = "echo 'Ace Attorney Online - Trial Player (Loading)';";
const char* const kHeadingEcho = "echo 'Loading trial ...';";

bool contains(const std::string& s, const char* needle) {
    return s.find(needle) != std::string::npos;
}

struct Replacement {
    size_t start;
    size_t end;
    std::string text;
};

// Built directly: details carry titles and URLs that must not steer classification.
ErrorInfo bundleError(ErrorCode code, const std::string& detail) {
    ErrorInfo info;
    info.category = ErrorCategory::Bundle;
    info.code = code;
    info.detail = detail;
    switch (code) {
        case ErrorCode::MissingAssets: info.userMessage = "Some assets could not be downloaded."; break;
        case ErrorCode::OutputExists: info.userMessage = "Output already exists."; break;
        case ErrorCode::Cancelled: info.userMessage = "Operation was cancelled."; break;
        case ErrorCode::ParseFailure: info.userMessage = "Player template could not be composed."; break;
        default: info.userMessage = "Failed to write output."; break;
    }
    return info;
}

void applyReplacements(std::string& text, std::vector<Replacement> reps) {
    std::sort(reps.begin(), reps.end(), [](const Replacement& a, const Replacement& b) { return a.start > b.start; });
    for (const auto& r : reps) text.replace(r.start, r.end - r.start, r.text);
}

} // namespace

std::map<std::string, OutputPlan> planOutputs(const std::vector<std::pair<std::string, std::string>>& cases,
                                              OutputMode mode) {
    std::map<std::string, OutputPlan> out;
    std::set<std::string> taken; // lowercase, for case-insensitive filesystems
    for (const auto& c : cases) {
        if (out.count(c.first)) continue;
        std::string stem = util::safeName(c.second, "case_" + c.first);
        if (taken.count(util::toLower(stem))) stem += "_" + c.first;
        taken.insert(util::toLower(stem));
        OutputPlan plan;
        if (mode == OutputMode::Directory) {
            plan.name = stem;
            plan.documentPath = stem + "/" + kIndexFile;
        } else {
            plan.name = stem + ".html";
            plan.documentPath = plan.name;
        }
        out[c.first] = plan;
    }
    return out;
}

std::vector<PhpBlock> findPhpBlocks(const std::string& text) {
    std::vector<PhpBlock> out;
    size_t pos = 0;
    while ((pos = text.find("<?php", pos)) != std::string::npos) {
        size_t close = text.find("?>", pos + 5);
        if (close == std::string::npos) break;
        PhpBlock b;
        b.start = pos;
        b.end = close + 2;
        b.code = text.substr(pos + 5, close - pos - 5);
        out.push_back(std::move(b));
        pos = close + 2;
    }
    return out;
}

bool composeScripts(std::string& scripts, const CaseDocuments& docs, std::string& err) {
    std::vector<Replacement> reps;
    bool trial = false;
    for (const auto& b : findPhpBlocks(scripts)) {
        if (contains(b.code, kCommonRender)) {
            reps.push_back({b.start, b.end, ""});
        } else if (contains(b.code, kTrialBlock) && !trial) {
            trial = true;
            reps.push_back({b.start, b.end,
                            "var trial_information = " + mini::dump(docs.information) + ";\n" +
                            "var initial_trial_data = " + mini::dump(docs.data) + ";\n"});
        } else {
            logWarn("Unexpected PHP block in scripts at " + std::to_string(b.start) + ", removing", "BNDL");
            reps.push_back({b.start, b.end, ""});
        }
    }
    if (!trial) {
        err = "trial data slot not found in scripts";
        return false;
    }
    applyReplacements(scripts, std::move(reps));
    return true;
}

bool composePlayer(std::string& player, const std::string& scripts, const std::string& title,
                   const std::string& language, std::string& err) {
    std::vector<Replacement> reps;
    bool bridge = false;
    const std::string escapedTitle = util::htmlEscape(title);
    for (const auto& b : findPhpBlocks(player)) {
        if (contains(b.code, kCommonRender)) {
            reps.push_back({b.start, b.end, ""});
        } else if (contains(b.code, kLanguageEcho)) {
            reps.push_back({b.start, b.end, util::htmlEscape(language)});
        } else if (contains(b.code, kBridgeInclude) && !bridge) {
            bridge = true;
            reps.push_back({b.start, b.end, scripts});
        } else if (contains(b.code, kTitleEcho) || contains(b.code, kHeadingEcho)) {
            reps.push_back({b.start, b.end, escapedTitle});
        } else {
            logWarn("Unexpected PHP block in player at " + std::to_string(b.start) + ", removing", "BNDL");
            reps.push_back({b.start, b.end, ""});
        }
    }
    if (!bridge) {
        err = "script slot not found in player";
        return false;
    }
    applyReplacements(player, std::move(reps));
    return true;
}

void appendUserscripts(std::string& html, const std::vector<std::string>& userscripts) {
    if (userscripts.empty()) return;
    std::string joined;
    for (const auto& s : userscripts) {
        if (!joined.empty()) joined += "\n\n";
        joined += s;
    }
    const std::string block = "<script type=\"text/javascript\">" + joined + "</script>\n</html>";
    auto pos = html.rfind("</html>");
    if (pos == std::string::npos) {
        html += block;
    } else {
        html.replace(pos, 7, block);
    }
}

Bundler::Bundler(BundleOptions options) : options_(std::move(options)) {}

bool Bundler::compose(const CaseDocuments& docs, std::string& html, ErrorInfo& info) const {
    std::string scripts = docs.scripts;
    std::string err;
    if (!composeScripts(scripts, docs, err)) {
        info = bundleError(ErrorCode::ParseFailure, "Composing case " + docs.caseId + " failed: " + err);
        return false;
    }
    std::string player = docs.player;
    if (!composePlayer(player, scripts, docs.title, options_.language, err)) {
        info = bundleError(ErrorCode::ParseFailure, "Composing case " + docs.caseId + " failed: " + err);
        return false;
    }
    appendUserscripts(player, options_.userscripts);
    html = std::move(player);
    return true;
}

bool Bundler::write(const CaseDocuments& docs,
                    const std::vector<AssetRecord>& records,
                    const std::vector<std::string>& missing,
                    const OutputPlan& plan,
                    const CancelToken* cancel,
                    std::string& outPath,
                    ErrorInfo& info) const {
    const std::string finalPath = joinPath(options_.outputRoot, plan.name);
    if (!missing.empty() && !options_.continueOnAssetError) {
        std::string list;
        for (size_t i = 0; i < missing.size() && i < 10; ++i) list += (i ? ", " : "") + missing[i];
        if (missing.size() > 10) list += ", ...";
        info = bundleError(ErrorCode::MissingAssets,
                           "Missing assets (" + std::to_string(missing.size()) + "): " + list);
        logError("Not writing case " + docs.caseId + ": " + info.detail, "BNDL");
        return false;
    }
    if (fileExists(finalPath) && !options_.replaceExisting) {
        info = bundleError(ErrorCode::OutputExists, "Output already exists: " + finalPath);
        logError(info.detail, "BNDL");
        return false;
    }

    std::string html;
    if (!compose(docs, html, info)) {
        logError(info.detail, "BNDL");
        return false;
    }
    if (!ensureDirectory(options_.outputRoot)) {
        info = bundleError(ErrorCode::WriteFailure, "Write failed: cannot create " + options_.outputRoot);
        return false;
    }

    const std::string partial = joinPath(options_.outputRoot, "." + plan.name + ".partial");
    std::string err;
    if (!removePath(partial, err)) {
        info = bundleError(ErrorCode::WriteFailure, "Write failed: " + err);
        return false;
    }
    auto cleanup = make_scope_guard([&] {
        std::string ignored;
        if (!removePath(partial, ignored)) logWarn(ignored, "BNDL");
    });
    auto fail = [&](ErrorCode code, const std::string& detail) {
        info = bundleError(code, detail);
        logError("Case " + docs.caseId + ": " + detail, "BNDL");
        return false;
    };

    if (options_.mode == OutputMode::SingleFile) {
        if (!writeFile(partial, html, err)) return fail(ErrorCode::WriteFailure, "Write failed: " + err);
    } else {
        const std::string assetDir = joinPath(partial, kAssetDir);
        if (!ensureDirectory(assetDir)) return fail(ErrorCode::WriteFailure, "Write failed: cannot create " + assetDir);
        for (const auto& rec : records) {
            if (cancel && cancel->cancelled()) return fail(ErrorCode::Cancelled, "cancelled while writing assets");
            if (rec.status != AssetStatus::Fetched || rec.localName.empty()) continue;
            if (!writeFile(joinPath(assetDir, rec.localName), rec.bytes, err)) {
                return fail(ErrorCode::WriteFailure, "Write failed: " + err);
            }
        }
        for (const auto& alias : docs.assetAliases) {
            auto rec = std::find_if(records.begin(), records.end(), [&](const AssetRecord& r) {
                return r.status == AssetStatus::Fetched && r.localName == alias.second;
            });
            if (rec == records.end()) {
                logWarn("No asset " + alias.second + " to copy to " + alias.first, "BNDL");
                continue;
            }
            if (!writeFile(joinPath(assetDir, alias.first), rec->bytes, err)) {
                return fail(ErrorCode::WriteFailure, "Write failed: " + err);
            }
        }
        if (!writeFile(joinPath(partial, kIndexFile), html, err)) {
            return fail(ErrorCode::WriteFailure, "Write failed: " + err);
        }
    }
    if (cancel && cancel->cancelled()) return fail(ErrorCode::Cancelled, "cancelled before publishing output");
    if (!movePath(partial, finalPath, options_.replaceExisting, err)) {
        if (util::startsWith(err, "Output already exists")) return fail(ErrorCode::OutputExists, err);
        return fail(ErrorCode::WriteFailure, "Rename failed: " + err);
    }
    cleanup.dismiss();
    outPath = finalPath;
    logInfo("Wrote case " + docs.caseId + " to " + finalPath, "BNDL");
    return true;
}

} // namespace aao
