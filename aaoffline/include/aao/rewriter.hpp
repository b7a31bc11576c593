#pragma once

#include <map>
#include <string>
#include <vector>
#include "aao/models.hpp"
#include "aao/player_template.hpp"

namespace aao {

// Fresh per-case copies of the template documents and the case data.
CaseDocuments makeDocuments(const CaseManifest& manifest, const PlayerTemplate& tpl);

// Relative path (directory mode) or data URI (single-file mode) for a record.
std::string localForm(const AssetRecord& rec, OutputMode mode);

// Replace `literal` where it stands as a whole token: preceded by a quote,
// '(', '=' or whitespace and followed by a quote, ')' or whitespace.
size_t replaceLiteral(std::string& text, const std::string& literal, const std::string& replacement);

// Replace the body of `<signature> {...}` (up to the first '}') in scripts.
bool replaceFunctionBody(std::string& scripts, const std::string& signature, const std::string& body);

// Point `cfg.picture_dir + cfg.locks_subdir + '<name>.gif?id=' + <id>` at the
// local lock files. `locals` maps lock names to local forms. Directory mode uses
// one copy per lock id (`assets/<name>_<id>.gif`); single-file mode folds the id
// into the data URI's media type so every lock image stays distinct.
size_t rewriteLockPaths(std::string& scripts, const std::map<std::string, std::string>& locals, OutputMode mode);

struct RewriteResult {
    size_t sitesRewritten{0};
    std::vector<std::string> missing; // URLs of failed records, sorted
};

class Rewriter {
public:
    Rewriter(OutputMode mode, bool html5Audio);

    // Point every occurrence site of a fetched record at its local form.
    // Sites of failed records are left untouched and reported. Running it
    // again with the same records changes nothing.
    RewriteResult rewrite(CaseDocuments& docs,
                          const std::vector<AssetReference>& refs,
                          const std::vector<AssetRecord>& records) const;

private:
    bool rewritePointer(CaseDocuments& docs, const OccurrenceSite& site, const std::string& local) const;
    void rewriteKeyed(CaseDocuments& docs, const std::map<std::string, std::string>& keyed) const;

    OutputMode mode_;
    bool html5Audio_;
};

} // namespace aao
