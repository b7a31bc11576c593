#include "aao/models.hpp"
#include <algorithm>
#include <tuple>

namespace aao {

std::vector<std::string> CaseManifest::sequenceIds() const {
    std::vector<std::string> out;
    for (const auto& e : info.sequence) {
        if (e.id != caseId) out.push_back(e.id);
    }
    return out;
}

std::string CaseManifest::nextCaseId() const {
    for (size_t i = 0; i < info.sequence.size(); ++i) {
        if (info.sequence[i].id == caseId) {
            return i + 1 < info.sequence.size() ? info.sequence[i + 1].id : std::string();
        }
    }
    return {};
}

const char* assetRoleLabel(AssetRole role) {
    switch (role) {
        case AssetRole::Sprite: return "sprite";
        case AssetRole::Sound: return "sound";
        case AssetRole::Music: return "music";
        case AssetRole::Voice: return "voice";
        case AssetRole::Background: return "background";
        case AssetRole::Evidence: return "evidence";
        case AssetRole::Icon: return "icon";
        case AssetRole::Popup: return "popup";
        case AssetRole::Lock: return "lock";
        case AssetRole::Script: return "script";
        case AssetRole::Markup: return "markup";
        case AssetRole::Style: return "style";
        default: return "other";
    }
}

bool OccurrenceSite::operator<(const OccurrenceSite& o) const {
    return std::tie(document, kind, location, externalFlag) <
           std::tie(o.document, o.kind, o.location, o.externalFlag);
}

bool OccurrenceSite::operator==(const OccurrenceSite& o) const {
    return kind == o.kind && document == o.document && location == o.location && externalFlag == o.externalFlag;
}

void AssetReference::addSite(const OccurrenceSite& site) {
    auto it = std::lower_bound(sites.begin(), sites.end(), site);
    if (it != sites.end() && *it == site) return;
    sites.insert(it, site);
}

const char* caseOutcomeLabel(CaseOutcome outcome) {
    switch (outcome) {
        case CaseOutcome::Succeeded: return "succeeded";
        case CaseOutcome::Partial: return "partial";
        case CaseOutcome::Cancelled: return "cancelled";
        default: return "failed";
    }
}

const char* runStatusLabel(RunStatus status) {
    switch (status) {
        case RunStatus::Succeeded: return "Succeeded";
        case RunStatus::SucceededWithWarnings: return "SucceededWithWarnings";
        case RunStatus::Cancelled: return "Cancelled";
        default: return "Failed";
    }
}

} // namespace aao
