#pragma once

#include <functional>
#include <string>
#include <vector>
#include "aao/http_client.hpp"
#include "aao/models.hpp"

namespace aao {

// Runs on the worker thread after a successful download (watermark removal).
using PostProcessFn = std::function<void(AssetRecord& rec)>;
// Progress notification; called under the fetcher's lock, once per record.
using RecordFn = std::function<void(const AssetRecord& rec, size_t done, size_t total)>;

class Fetcher {
public:
    Fetcher(HttpClient& client, int workers);

    void setPostProcess(PostProcessFn fn) { postProcess_ = std::move(fn); }
    void setOnRecord(RecordFn fn) { onRecord_ = std::move(fn); }

    // One record per reference, in the same order. Failures are recorded, not
    // thrown; local names are assigned before returning.
    std::vector<AssetRecord> fetchAll(const std::vector<AssetReference>& refs);

    // Single download without naming; used by fetchAll's workers.
    AssetRecord fetchOne(const AssetReference& ref);

private:
    HttpClient& client_;
    int workers_;
    PostProcessFn postProcess_;
    RecordFn onRecord_;
};

// Filesystem-safe stem for a record: Content-Disposition stem or URL file name.
std::string localStem(const AssetRecord& rec);

// Deterministic `<stem>-<hash>.<ext>` names, unique case-insensitively.
// Depends only on the URLs and resolved types, not on download order.
void assignLocalNames(std::vector<AssetRecord>& records);

} // namespace aao
