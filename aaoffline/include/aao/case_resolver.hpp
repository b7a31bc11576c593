#pragma once

#include <string>
#include <vector>
#include "aao/errors.hpp"
#include "aao/http_client.hpp"
#include "aao/models.hpp"

namespace aao {

// Accepts a bare numeric id, an aaonline.fr player.php?trial_id= URL, or a
// legacy sparklin jeu.php?id_proces= URL.
bool parseCaseId(const std::string& input, std::string& outId, std::string& err);

std::string trialScriptUrl(const std::string& caseId);

// Locate `var <name> = JSON.parse("...");` and return the decoded JSON text.
// found=false when the declaration is absent; false return when it is malformed.
bool extractJsonLiteral(const std::string& script, const std::string& varName,
                        std::string& outJson, bool& found, std::string& err);

bool caseInfoFromJson(const mini::Value& v, CaseInfo& out, std::string& err);

// Parse a trial.js.php response. A bare `var trial_information;` is NotFound.
bool parseTrialScript(const std::string& caseId, const std::string& script,
                      CaseManifest& out, ErrorInfo& info);

class CaseResolver {
public:
    explicit CaseResolver(HttpClient& client);

    bool resolve(const std::string& idOrUrl, CaseManifest& out, ErrorInfo& info);

    // Other parts of the case's sequence, in sequence order.
    std::vector<std::string> expandSequence(const CaseManifest& manifest) const;

private:
    HttpClient& client_;
};

} // namespace aao
