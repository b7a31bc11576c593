#pragma once

#include <map>
#include <string>
#include <vector>
#include "aao/config.hpp"
#include "aao/models.hpp"
#include "aao/player_template.hpp"

namespace aao {

// Absolute URL for a value from the case data. Non-external values live under
// `dirs` on the origin host; `defaultExt` is appended when the file has none.
std::string assetUrl(const std::string& value,
                     const std::vector<std::string>& dirs,
                     bool external,
                     const std::string& defaultExt);

// Candidate references in template text: src="...", .src = '...', url(...)
// and absolute http(s) URLs. Literals are returned as they appear.
std::vector<std::string> scanTextReferences(const std::string& text);

// Extension and host filter applied to references found by text scanning.
bool isAllowedTextReference(const std::string& canonicalUrl);

AssetRole roleForExtension(const std::string& ext);

// Lock animations under picture_dir/locks_subdir, without extension.
const std::vector<std::string>& psycheLockFiles();
// Most psyche locks any dialogue shows at once; 0 when the case has none.
size_t maxPsycheLocks(const mini::Value& data);

class AssetGraph {
public:
    explicit AssetGraph(HttpHandling handling);

    // Every asset the case and its template need, deduplicated by canonical
    // URL and sorted by it.
    std::vector<AssetReference> enumerate(const CaseManifest& manifest, const PlayerTemplate& tpl);

    size_t discardedCount() const { return discarded_; }

private:
    void add(const std::string& rawUrl, AssetRole role, const OccurrenceSite& site);
    void walkProfiles(const mini::Value& data, const PlayerTemplate& tpl);
    void walkEvidence(const mini::Value& data, const PlayerTemplate& tpl);
    void walkPlace(const mini::Value& place, DocumentKind doc, const std::string& prefix,
                   const PlayerTemplate& tpl);
    void walkMedia(const mini::Value& data, const char* listName, const char* field,
                   const std::vector<std::string>& dirs, const std::string& defaultExt, AssetRole role);
    void walkDefaultPlaces(const mini::Value& data, const PlayerTemplate& tpl);
    void addVoices(const PlayerTemplate& tpl);
    void addPsycheLocks(const mini::Value& data, const PlayerTemplate& tpl);
    void scanDocument(const std::string& text, DocumentKind doc);

    HttpHandling handling_;
    std::map<std::string, AssetReference> refs_;
    size_t discarded_{0};
};

} // namespace aao
