#include "aao/sequence_linker.hpp"
#include "aao/constants.hpp"
#include "aao/logger.hpp"
#include "aao/util.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace aao {

namespace {

const char* const kTriggerHead = "player.php?trial_id=";

// Origin prefixes that may precede a trigger inside case data.
const char* const kTriggerPrefixes[] = {
    "https://www.aaonline.fr/",
    "https://aaonline.fr/",
    "http://www.aaonline.fr/",
    "http://aaonline.fr/",
    "//aaonline.fr/",
};

const char* const kSwitchMarker = "switch (Number.parseInt(";

size_t rewriteString(std::string& s, const std::map<std::string, std::string>& targets) {
    const std::string head = kTriggerHead;
    size_t count = 0;
    size_t pos = 0;
    while ((pos = s.find(head, pos)) != std::string::npos) {
        size_t idStart = pos + head.size();
        size_t idEnd = idStart;
        while (idEnd < s.size() && std::isdigit(static_cast<unsigned char>(s[idEnd]))) ++idEnd;
        auto it = targets.find(s.substr(idStart, idEnd - idStart));
        if (idEnd == idStart || it == targets.end()) {
            pos = idEnd;
            continue;
        }
        size_t start = pos;
        for (const char* prefix : kTriggerPrefixes) {
            const size_t n = std::char_traits<char>::length(prefix);
            if (start >= n && s.compare(start - n, n, prefix) == 0) {
                start -= n;
                break;
            }
        }
        // Same page name on some other host.
        if (start == pos && start > 0 && s[start - 1] == '/') {
            pos = idEnd;
            continue;
        }
        std::string replacement = it->second;
        size_t end = idEnd;
        // The remaining parameters become the target's own query string.
        if (end < s.size() && s[end] == '&') {
            replacement += "?";
            ++end;
        }
        s.replace(start, end - start, replacement);
        pos = start + replacement.size();
        ++count;
    }
    return count;
}

size_t rewriteValue(mini::Value& v, const std::map<std::string, std::string>& targets) {
    size_t count = 0;
    if (v.isString()) {
        count += rewriteString(v.str, targets);
    } else if (v.isArray()) {
        for (auto& item : v.array) count += rewriteValue(item, targets);
    } else if (v.isObject()) {
        for (auto& kv : v.object) count += rewriteValue(kv.second, targets);
    }
    return count;
}

} // namespace

std::string relativeTargetPath(const std::string& outputPath, OutputMode mode) {
    // Directory outputs sit one level down (<title>/index.html).
    return mode == OutputMode::Directory ? "../" + outputPath : outputPath;
}

size_t rewriteTriggerLiterals(mini::Value& data, const std::map<std::string, std::string>& targets) {
    if (targets.empty()) return 0;
    return rewriteValue(data, targets);
}

bool rewriteRedirect(std::string& scripts, const std::map<std::string, std::string>& targets) {
    if (targets.empty()) return false;
    static const std::regex redirect(
        R"(window\.location\.href\s*=\s*'player\.php\?trial_id='\s*\+\s*([^+;]+?)\s*\+\s*'&([^;]*);)");
    const std::string anchor = "window.location.href";
    size_t at = 0;
    while ((at = scripts.find(anchor, at)) != std::string::npos) {
        // Already wrapped by an earlier pass.
        if (at >= 9 && scripts.compare(at - 9, 9, "default: ") == 0) {
            at += anchor.size();
            continue;
        }
        const std::string window = scripts.substr(at, 512);
        std::smatch m;
        if (!std::regex_search(window, m, redirect, std::regex_constants::match_continuous)) {
            at += anchor.size();
            continue;
        }
        std::string out = std::string(kSwitchMarker) + m[1].str() + ")) {\n";
        for (const auto& kv : targets) {
            out += "case " + kv.first + ": window.location.href = '" + util::jsSingleQuoted(kv.second) +
                   "' + '?" + m[2].str() + ";\nbreak;\n";
        }
        out += "default: " + m[0].str() + "\n}";
        scripts.replace(at, static_cast<size_t>(m.length(0)), out);
        return true;
    }
    return false;
}

bool SequenceLinker::addEdge(const std::string& from, const std::string& to, ErrorInfo& err) {
    if (from == to) {
        err = classifyError("Sequence self-link: case " + from + " continues to itself", ErrorCategory::Sequence);
        logWarn(err.detail, "SEQ");
        return false;
    }
    auto key = std::make_pair(from, to);
    if (links_.count(key)) return true;
    SequenceLink link;
    link.from = from;
    link.to = to;
    link.trigger = std::string(kTriggerHead) + to;
    links_.emplace(key, link);
    return true;
}

void SequenceLinker::addCase(const CaseManifest& manifest, std::vector<ErrorInfo>& errors) {
    if (!manifest.inSequence()) return;
    ErrorInfo err;
    const std::string next = manifest.nextCaseId();
    if (!next.empty() && !addEdge(manifest.caseId, next, err)) errors.push_back(err);
    for (const auto& entry : manifest.info.sequence) {
        // Skip ourselves here; only an explicit next-self edge is an error.
        if (entry.id == manifest.caseId) continue;
        if (!addEdge(manifest.caseId, entry.id, err)) errors.push_back(err);
    }
}

size_t SequenceLinker::link(const std::map<std::string, LinkTarget>& batch, OutputMode mode,
                            std::vector<ErrorInfo>& errors) {
    size_t linked = 0;
    for (auto& kv : links_) {
        SequenceLink& link = kv.second;
        if (link.state == LinkState::Linked) continue;
        auto target = batch.find(link.to);
        if (target == batch.end()) {
            logDebug("Case " + link.to + " is not in this batch; " + link.from + " keeps its live redirect", "SEQ");
            continue;
        }
        const auto& seq = target->second.sequence;
        if (!seq.empty() && std::find(seq.begin(), seq.end(), link.from) == seq.end()) {
            ErrorInfo err = classifyError("Inconsistent sequence: case " + link.to + " does not list case " +
                                              link.from, ErrorCategory::Sequence);
            logWarn(err.detail, "SEQ");
            errors.push_back(err);
            continue;
        }
        link.state = LinkState::Linked;
        link.targetPath = relativeTargetPath(target->second.outputPath, mode);
        ++linked;
    }
    if (linked) logInfo("Linked " + std::to_string(linked) + " sequence edges", "SEQ");
    return linked;
}

std::vector<std::string> SequenceLinker::unlinkTarget(const std::string& to) {
    std::vector<std::string> sources;
    for (auto& kv : links_) {
        SequenceLink& link = kv.second;
        if (link.to != to || link.state != LinkState::Linked) continue;
        link.state = LinkState::Unlinked;
        link.targetPath.clear();
        sources.push_back(link.from);
    }
    if (!sources.empty()) {
        logInfo("Case " + to + " has no output; " + std::to_string(sources.size()) +
                " part(s) keep the live redirect to it", "SEQ");
    }
    return sources;
}

size_t SequenceLinker::apply(CaseDocuments& docs) const {
    std::map<std::string, std::string> targets;
    for (const auto& link : linksFrom(docs.caseId)) {
        if (link.state == LinkState::Linked) targets[link.to] = link.targetPath;
    }
    if (targets.empty()) return 0;
    size_t count = rewriteTriggerLiterals(docs.data, targets);
    if (rewriteRedirect(docs.scripts, targets)) {
        ++count;
    } else if (docs.scripts.find(kSwitchMarker) == std::string::npos) {
        logWarn("End-of-case redirect not found in scripts for case " + docs.caseId, "SEQ");
    }
    return count;
}

std::vector<SequenceLink> SequenceLinker::linksFrom(const std::string& from) const {
    std::vector<SequenceLink> out;
    for (auto it = links_.lower_bound(std::make_pair(from, std::string())); it != links_.end(); ++it) {
        if (it->first.first != from) break;
        out.push_back(it->second);
    }
    return out;
}

const SequenceLink* SequenceLinker::find(const std::string& from, const std::string& to) const {
    auto it = links_.find(std::make_pair(from, to));
    return it == links_.end() ? nullptr : &it->second;
}

} // namespace aao
