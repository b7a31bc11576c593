#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>
#include "aao/errors.hpp"
#include "aao/models.hpp"

namespace aao {

// What the linker needs to know about a case that is part of this batch.
struct LinkTarget {
    std::string outputPath;            // relative to the output root, '/'-separated
    std::vector<std::string> sequence; // every part id the case itself lists, empty if standalone
};

// Path from one case's document to another case's output.
std::string relativeTargetPath(const std::string& outputPath, OutputMode mode);

// Replace `player.php?trial_id=<id>` (with or without the origin prefix) in
// every string of `data` whose id has a target. Returns the count.
size_t rewriteTriggerLiterals(mini::Value& data, const std::map<std::string, std::string>& targets);

// Turn the player's end-of-case redirect into a switch over the linked
// targets; the default branch keeps the live redirect.
bool rewriteRedirect(std::string& scripts, const std::map<std::string, std::string>& targets);

// Explicit per-pair state machine: every edge starts Unlinked and only moves
// to Linked when its target is part of the batch.
class SequenceLinker {
public:
    // False with a SequenceError for self edges. Repeated edges are no-ops.
    bool addEdge(const std::string& from, const std::string& to, ErrorInfo& err);
    // Edges from a case to the next part and to every other part.
    void addCase(const CaseManifest& manifest, std::vector<ErrorInfo>& errors);

    // Link every Unlinked edge whose target is in `batch`. Already linked
    // edges are left alone. Returns the number of new links.
    size_t link(const std::map<std::string, LinkTarget>& batch, OutputMode mode, std::vector<ErrorInfo>& errors);

    // Send every Linked edge into `to` back to Unlinked, for a target whose
    // output will not exist. Returns the sources that lost a link.
    std::vector<std::string> unlinkTarget(const std::string& to);

    // Rewrite the case's documents for its linked edges; no-op without any.
    size_t apply(CaseDocuments& docs) const;

    std::vector<SequenceLink> linksFrom(const std::string& from) const;
    const SequenceLink* find(const std::string& from, const std::string& to) const;
    size_t size() const { return links_.size(); }

private:
    std::map<std::pair<std::string, std::string>, SequenceLink> links_;
};

} // namespace aao
