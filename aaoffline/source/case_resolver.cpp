#include "aao/case_resolver.hpp"
#include "aao/constants.hpp"
#include "aao/logger.hpp"
#include "aao/url.hpp"
#include "aao/util.hpp"
#include <algorithm>
#include <cctype>

namespace aao {

namespace {

bool allDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

std::string queryParam(const std::string& query, const std::string& key) {
    for (const auto& pair : util::split(query, '&')) {
        auto eq = pair.find('=');
        if (eq == std::string::npos) continue;
        if (pair.substr(0, eq) == key) return pair.substr(eq + 1);
    }
    return {};
}

// Numbers and strings both show up as ids depending on the endpoint.
std::string scalarText(const mini::Value* v) {
    if (!v) return {};
    if (v->isString() || v->isNumber()) return v->str;
    return {};
}

} // namespace

bool parseCaseId(const std::string& input, std::string& outId, std::string& err) {
    std::string text = input;
    util::trim(text);
    if (allDigits(text)) {
        outId = text;
        return true;
    }
    ParsedUrl u;
    std::string urlErr;
    if (!parseUrl(text, u, urlErr)) {
        err = "Malformed case id: " + util::ellipsize(text, 80);
        return false;
    }
    std::string id;
    if ((u.host == kOriginHost || u.host == std::string("www.") + kOriginHost) && u.path == "/player.php") {
        id = queryParam(u.query, "trial_id");
    } else if (u.host == kLegacyHost && u.path == "/jeu.php") {
        id = queryParam(u.query, "id_proces");
    }
    if (!allDigits(id)) {
        err = "Malformed case id: " + util::ellipsize(text, 80);
        return false;
    }
    outId = id;
    return true;
}

std::string trialScriptUrl(const std::string& caseId) {
    return std::string(kOriginBase) + "/trial.js.php?trial_id=" + caseId;
}

bool extractJsonLiteral(const std::string& script, const std::string& varName,
                        std::string& outJson, bool& found, std::string& err) {
    found = false;
    const std::string head = "var " + varName + " = JSON.parse(";
    auto pos = script.find(head);
    if (pos == std::string::npos) return true;
    found = true;
    size_t i = pos + head.size();
    if (i >= script.size() || (script[i] != '"' && script[i] != '\'')) {
        err = "Malformed " + varName + " declaration: expected string literal";
        return false;
    }
    const char quote = script[i++];
    size_t start = i;
    while (i < script.size() && script[i] != quote) {
        if (script[i] == '\\') ++i;
        ++i;
    }
    if (i >= script.size()) {
        err = "Malformed " + varName + " declaration: unterminated string literal";
        return false;
    }
    outJson = util::unescapeJsString(script.substr(start, i - start));
    return true;
}

bool caseInfoFromJson(const mini::Value& v, CaseInfo& out, std::string& err) {
    if (!v.isObject()) {
        err = "trial_information is not a JSON object";
        return false;
    }
    out = CaseInfo{};
    out.id = scalarText(mini::get(v, "id"));
    out.title = mini::getString(v, "title");
    out.author = mini::getString(v, "author");
    out.authorId = scalarText(mini::get(v, "author_id"));
    out.language = mini::getString(v, "language");
    out.format = scalarText(mini::get(v, "format"));
    out.lastEditDate = scalarText(mini::get(v, "last_edit_date"));
    out.canRead = mini::getBool(v, "can_read");
    out.canWrite = mini::getBool(v, "can_write");
    if (out.id.empty()) {
        err = "trial_information has no id";
        return false;
    }
    const mini::Value* seq = mini::get(v, "sequence");
    if (seq && seq->isObject()) {
        out.sequenceTitle = mini::getString(*seq, "title");
        const mini::Value* list = mini::get(*seq, "list");
        if (list && list->isArray()) {
            for (const auto& item : list->array) {
                SequenceEntry e;
                e.id = scalarText(mini::get(item, "id"));
                e.title = mini::getString(item, "title");
                if (!e.id.empty()) out.sequence.push_back(std::move(e));
            }
        }
    }
    return true;
}

bool parseTrialScript(const std::string& caseId, const std::string& script,
                      CaseManifest& out, ErrorInfo& info) {
    std::string infoJson;
    std::string dataJson;
    bool found = false;
    std::string err;
    if (!extractJsonLiteral(script, "trial_information", infoJson, found, err)) {
        info = classifyError("Parse failure: " + err, ErrorCategory::Resolution);
        return false;
    }
    if (!found) {
        // The site answers unknown and private ids with an empty declaration.
        if (script.find("var trial_information;") != std::string::npos) {
            info = classifyError("Case not found: " + caseId, ErrorCategory::Resolution);
        } else {
            info = classifyError("Parse failure: trial script has no trial_information", ErrorCategory::Resolution);
        }
        return false;
    }
    if (!extractJsonLiteral(script, "initial_trial_data", dataJson, found, err) || !found) {
        if (err.empty()) err = "trial script has no initial_trial_data";
        info = classifyError("Parse failure: " + err, ErrorCategory::Resolution);
        return false;
    }

    CaseManifest m;
    m.caseId = caseId;
    if (!mini::parse(infoJson, m.information)) {
        info = classifyError("Parse failure: trial_information is not valid JSON", ErrorCategory::Resolution);
        return false;
    }
    if (!mini::parse(dataJson, m.data) || !m.data.isObject()) {
        info = classifyError("Parse failure: initial_trial_data is not valid JSON", ErrorCategory::Resolution);
        return false;
    }
    if (!caseInfoFromJson(m.information, m.info, err)) {
        info = classifyError("Parse failure: " + err, ErrorCategory::Resolution);
        return false;
    }
    if (m.info.id != caseId) {
        logWarn("Case " + caseId + " reports id " + m.info.id, "CASE");
    }
    out = std::move(m);
    return true;
}

CaseResolver::CaseResolver(HttpClient& client) : client_(client) {}

bool CaseResolver::resolve(const std::string& idOrUrl, CaseManifest& out, ErrorInfo& info) {
    std::string caseId;
    std::string err;
    if (!parseCaseId(idOrUrl, caseId, err)) {
        info = classifyError(err, ErrorCategory::Resolution);
        return false;
    }

    HttpResponse resp;
    const std::string url = trialScriptUrl(caseId);
    logDebug("Fetching " + url, "CASE");
    if (!client_.get(url, resp, info, ErrorCategory::Resolution)) {
        if (info.httpStatus == 404 || info.httpStatus == 410) {
            info = classifyError("Case not found: " + caseId + " (HTTP " + std::to_string(info.httpStatus) + ")",
                                 ErrorCategory::Resolution);
        }
        logError("Could not resolve case " + caseId + ": " + info.detail, "CASE");
        return false;
    }
    if (!parseTrialScript(caseId, resp.body, out, info)) {
        logError("Could not resolve case " + caseId + ": " + info.detail, "CASE");
        return false;
    }
    logInfo("Resolved case " + caseId + ": \"" + out.info.title + "\" by " + out.info.author, "CASE");
    return true;
}

std::vector<std::string> CaseResolver::expandSequence(const CaseManifest& manifest) const {
    std::vector<std::string> ids = manifest.sequenceIds();
    if (!ids.empty()) {
        logInfo("Case " + manifest.caseId + " is part of \"" + manifest.info.sequenceTitle + "\" (" +
                std::to_string(ids.size() + 1) + " parts)", "CASE");
    }
    return ids;
}

} // namespace aao
