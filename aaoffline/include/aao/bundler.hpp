#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>
#include "aao/errors.hpp"
#include "aao/http_client.hpp"
#include "aao/models.hpp"

namespace aao {

struct BundleOptions {
    OutputMode mode{OutputMode::Directory};
    std::string outputRoot{"."};
    std::string language{"en"};
    bool replaceExisting{false};
    bool continueOnAssetError{false};
    std::vector<std::string> userscripts;
};

// Where one case lands, decided for the whole batch before anything is written.
struct OutputPlan {
    std::string name;         // entry under the output root ("Title" or "Title.html")
    std::string documentPath; // document relative to the output root ("Title/index.html")
};

// Sanitized, batch-unique names; a clash gets "_<case id>" appended.
// Input is (case id, title) in batch order.
std::map<std::string, OutputPlan> planOutputs(const std::vector<std::pair<std::string, std::string>>& cases,
                                              OutputMode mode);

struct PhpBlock {
    size_t start{0};
    size_t end{0}; // one past "?>"
    std::string code;
};

std::vector<PhpBlock> findPhpBlocks(const std::string& text);

// Resolve the PHP blocks of trial.js.php: the trial block becomes the
// serialized case, common_render goes away.
bool composeScripts(std::string& scripts, const CaseDocuments& docs, std::string& err);
// Resolve the PHP blocks of player.php around the composed scripts.
bool composePlayer(std::string& player, const std::string& scripts, const std::string& title,
                   const std::string& language, std::string& err);
// Userscripts go into one script tag right before the closing </html>.
void appendUserscripts(std::string& html, const std::vector<std::string>& userscripts);

class Bundler {
public:
    explicit Bundler(BundleOptions options);

    // Final HTML for one case.
    bool compose(const CaseDocuments& docs, std::string& html, ErrorInfo& info) const;

    // Compose and write one case. `missing` lists failed asset URLs; with
    // fail-fast they prevent the write. Output goes to a hidden partial
    // sibling first and is renamed into place; it is removed on failure.
    bool write(const CaseDocuments& docs,
               const std::vector<AssetRecord>& records,
               const std::vector<std::string>& missing,
               const OutputPlan& plan,
               const CancelToken* cancel,
               std::string& outPath,
               ErrorInfo& info) const;

    const BundleOptions& options() const { return options_; }

private:
    BundleOptions options_;
};

} // namespace aao
