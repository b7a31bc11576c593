#include "aao/fetcher.hpp"
#include "aao/content_sniff.hpp"
#include "aao/http_common.hpp"
#include "aao/logger.hpp"
#include "aao/url.hpp"
#include "aao/util.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <numeric>
#include <set>
#include <thread>

namespace aao {

namespace {

constexpr size_t kMaxStemLength = 48;

std::string stripExtension(const std::string& name) {
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) return name;
    return name.substr(0, dot);
}

std::string extensionOf(const std::string& name) {
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot + 1 >= name.size()) return {};
    return util::toLower(name.substr(dot + 1));
}

} // namespace

Fetcher::Fetcher(HttpClient& client, int workers)
    : client_(client), workers_(std::max(1, workers)) {}

AssetRecord Fetcher::fetchOne(const AssetReference& ref) {
    AssetRecord rec;
    rec.url = ref.url;
    rec.role = ref.role;
    if (client_.cancelled()) {
        rec.status = AssetStatus::Failed;
        rec.error = classifyError("cancelled before download", ErrorCategory::Asset);
        return rec;
    }
    if (ref.insecure) {
        rec.status = AssetStatus::Failed;
        rec.error = classifyError("Insecure http:// URL disallowed: " + ref.url, ErrorCategory::Asset);
        logWarn("Not fetching " + ref.url + ": insecure downloads are disallowed", "FETCH");
        return rec;
    }

    HttpResponse resp;
    ErrorInfo info;
    if (!client_.get(ref.url, resp, info, ErrorCategory::Asset)) {
        rec.status = AssetStatus::Failed;
        rec.error = info;
        rec.error.category = ErrorCategory::Asset;
        logWarn("Failed to fetch " + ref.url + ": " + info.detail, "FETCH");
        return rec;
    }
    if (resp.body.empty()) {
        rec.status = AssetStatus::Failed;
        rec.error = classifyError("Empty payload from " + ref.url, ErrorCategory::Asset);
        logWarn("Empty payload from " + ref.url, "FETCH");
        return rec;
    }

    const ContentType type = resolveContentType(resp.contentType, resp.body, ref.extensionHint);
    rec.mime = type.mime;
    rec.extension = type.extension;
    const std::string disposition = dispositionFilename(resp.contentDisposition);
    if (!disposition.empty()) rec.dispositionStem = stripExtension(disposition);
    rec.bytes = std::move(resp.body);
    rec.status = AssetStatus::Fetched;
    if (postProcess_) postProcess_(rec);
    logDebug("Fetched " + ref.url + " (" + std::to_string(rec.bytes.size()) + " bytes, " + rec.mime + ")", "FETCH");
    return rec;
}

std::vector<AssetRecord> Fetcher::fetchAll(const std::vector<AssetReference>& refs) {
    std::vector<AssetRecord> records(refs.size());
    std::atomic<size_t> next{0};
    std::mutex mutex;
    size_t done = 0;

    auto worker = [&]() {
        for (;;) {
            const size_t i = next.fetch_add(1);
            if (i >= refs.size()) return;
            AssetRecord rec = fetchOne(refs[i]);
            std::lock_guard<std::mutex> lock(mutex);
            records[i] = std::move(rec);
            ++done;
            if (onRecord_) onRecord_(records[i], done, refs.size());
        }
    };

    const size_t count = std::min(refs.size(), static_cast<size_t>(workers_));
    std::vector<std::thread> threads;
    threads.reserve(count);
    for (size_t t = 0; t < count; ++t) threads.emplace_back(worker);
    for (auto& t : threads) t.join();

    assignLocalNames(records);
    return records;
}

std::string localStem(const AssetRecord& rec) {
    std::string raw = rec.dispositionStem;
    if (raw.empty()) raw = stripExtension(urlFileName(rec.url));
    std::string out;
    out.reserve(raw.size());
    for (unsigned char c : util::toLower(raw)) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        out.push_back(ok ? static_cast<char>(c) : '_');
        if (out.size() >= kMaxStemLength) break;
    }
    while (!out.empty() && (out.back() == '.' || out.back() == '_')) out.pop_back();
    size_t lead = 0;
    while (lead < out.size() && (out[lead] == '.' || out[lead] == '_')) ++lead;
    out = out.substr(lead);
    return out.empty() ? "asset" : out;
}

void assignLocalNames(std::vector<AssetRecord>& records) {
    std::vector<size_t> order(records.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) { return records[a].url < records[b].url; });

    std::set<std::string> taken; // lowercase
    for (size_t i : order) {
        AssetRecord& rec = records[i];
        if (rec.status != AssetStatus::Fetched) {
            rec.localName.clear();
            continue;
        }
        // Keep the URL's spelling when it agrees with what the bytes turned out to be.
        std::string ext = extensionOf(urlFileName(rec.url));
        if (ext.empty() || !extensionsEquivalent(ext, rec.extension) ||
            ext.find_first_not_of("abcdefghijklmnopqrstuvwxyz0123456789") != std::string::npos) {
            ext = rec.extension.empty() ? "bin" : rec.extension;
        }
        const std::string base = localStem(rec) + "-" + util::hex64(util::fnv1a64(rec.url)).substr(0, 12);
        std::string name = base + "." + ext;
        for (int n = 2; taken.count(util::toLower(name)); ++n) {
            name = base + "-" + std::to_string(n) + "." + ext;
        }
        taken.insert(util::toLower(name));
        rec.localName = name;
    }
}

} // namespace aao
