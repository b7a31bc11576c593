#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "aao/errors.hpp"
#include "mini/json.hpp"

namespace aao {

struct SequenceEntry {
    std::string id;
    std::string title;
};

// trial_information as published by the origin host.
struct CaseInfo {
    std::string id;
    std::string title;
    std::string author;
    std::string authorId;
    std::string language;
    std::string format;
    std::string lastEditDate;
    bool canRead{false};
    bool canWrite{false};
    std::string sequenceTitle;
    std::vector<SequenceEntry> sequence; // empty when the case is standalone
};

// Everything CaseResolver learned about one case. Not modified after resolve().
struct CaseManifest {
    std::string caseId;
    CaseInfo info;
    mini::Value information; // raw trial_information
    mini::Value data;        // raw initial_trial_data

    bool inSequence() const { return !info.sequence.empty(); }
    // Ids of the other parts, in sequence order.
    std::vector<std::string> sequenceIds() const;
    // The part right after this one, or "" at the end of the sequence.
    std::string nextCaseId() const;
};

enum class AssetRole {
    Sprite,
    Sound,
    Music,
    Voice,
    Background,
    Evidence,
    Icon,
    Popup,
    Lock,
    Script,
    Markup,
    Style,
    Other
};

const char* assetRoleLabel(AssetRole role);

// Documents an occurrence can live in. Each case gets its own copy of all four.
enum class DocumentKind { CaseData, DefaultPlaces, Player, Scripts };

enum class SiteKind {
    JsonPointer, // location is an RFC 6901 pointer to a string value
    Text,        // location is the literal as it appears in the document
    Keyed        // location is a lookup key ("voice:1:opus", "sprite:Phoenix:2:talking")
};

struct OccurrenceSite {
    SiteKind kind{SiteKind::Text};
    DocumentKind document{DocumentKind::Scripts};
    std::string location;
    // JsonPointer only: sibling flag set to true once the value is local.
    std::string externalFlag;

    bool operator<(const OccurrenceSite& o) const;
    bool operator==(const OccurrenceSite& o) const;
};

struct AssetReference {
    std::string url; // canonical, dedup key
    AssetRole role{AssetRole::Other};
    std::string extensionHint; // from the reference, lowercase, may be empty
    std::vector<OccurrenceSite> sites; // sorted, unique
    bool insecure{false}; // plain http:// under http_handling=disallow; recorded as a failure, never requested

    void addSite(const OccurrenceSite& site);
};

enum class AssetStatus { Pending, Fetched, Failed };

struct AssetRecord {
    std::string url;
    AssetRole role{AssetRole::Other};
    std::string bytes;
    std::string mime;
    std::string extension;
    std::string localName;
    AssetStatus status{AssetStatus::Pending};
    ErrorInfo error;
    bool watermarkStripped{false};
    // Stem suggested by Content-Disposition, if any.
    std::string dispositionStem;
};

enum class OutputMode { Directory, SingleFile };

enum class LinkState { Unlinked, Linked };

struct SequenceLink {
    std::string from;
    std::string to;
    std::string trigger; // "player.php?trial_id=<to>"
    LinkState state{LinkState::Unlinked};
    std::string targetPath; // relative to from's document, set when Linked
};

// Mutable per-case documents that the Rewriter and Bundler work on.
struct CaseDocuments {
    std::string caseId;
    std::string title;
    std::string player;
    std::string scripts;
    mini::Value information;
    mini::Value data;
    mini::Value defaultPlaces;
    // Extra files under assets/ (name -> local name of the record they copy).
    std::map<std::string, std::string> assetAliases;
};

enum class CaseOutcome { Succeeded, Partial, Failed, Cancelled };

const char* caseOutcomeLabel(CaseOutcome outcome);

struct CaseReport {
    std::string input;
    std::string caseId;
    std::string title;
    CaseOutcome outcome{CaseOutcome::Failed};
    std::string outputPath;
    size_t assetsTotal{0};
    size_t assetsFetched{0};
    size_t watermarksStripped{0};
    std::vector<std::string> missingAssets;
    ErrorInfo error;
};

enum class RunStatus { Succeeded, SucceededWithWarnings, Failed, Cancelled };

const char* runStatusLabel(RunStatus status);

struct RunReport {
    RunStatus status{RunStatus::Succeeded};
    std::vector<CaseReport> cases;
    std::vector<ErrorInfo> sequenceErrors;
    uint64_t requestsIssued{0};
    int peakInFlight{0};
};

} // namespace aao
