#include "aao/pipeline.hpp"
#include "aao/asset_graph.hpp"
#include "aao/bundler.hpp"
#include "aao/case_resolver.hpp"
#include "aao/fetcher.hpp"
#include "aao/logger.hpp"
#include "aao/player_template.hpp"
#include "aao/rewriter.hpp"
#include "aao/sequence_linker.hpp"
#include "aao/watermark.hpp"
#include <algorithm>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <thread>

namespace aao {

namespace {

// Run fn(0..n-1) on at most `limit` threads.
void runBounded(size_t n, int limit, const std::function<void(size_t)>& fn) {
    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (;;) {
            const size_t i = next.fetch_add(1);
            if (i >= n) return;
            fn(i);
        }
    };
    const size_t count = std::min(n, static_cast<size_t>(std::max(1, limit)));
    std::vector<std::thread> threads;
    threads.reserve(count);
    for (size_t t = 0; t < count; ++t) threads.emplace_back(worker);
    for (auto& t : threads) t.join();
}

struct CaseSlot {
    std::string input;
    std::string caseId;
    bool resolved{false};
    CaseManifest manifest;
    CaseReport report;
    // Filled once the case's assets are fetched and its documents rewritten.
    bool prepared{false};
    CaseDocuments docs; // before sequence links are applied
    std::vector<AssetRecord> records;
    bool written{false};
};

bool isCancellation(const ErrorInfo& info) {
    return info.code == ErrorCode::Cancelled;
}

} // namespace

RunStatus summarizeRun(const RunReport& report, bool cancelled) {
    if (cancelled) return RunStatus::Cancelled;
    bool warnings = !report.sequenceErrors.empty();
    for (const auto& c : report.cases) {
        if (c.outcome == CaseOutcome::Failed) return RunStatus::Failed;
        if (c.outcome == CaseOutcome::Cancelled) return RunStatus::Cancelled;
        if (c.outcome == CaseOutcome::Partial) warnings = true;
    }
    return warnings ? RunStatus::SucceededWithWarnings : RunStatus::Succeeded;
}

std::string formatReport(const RunReport& report) {
    std::ostringstream out;
    out << "Run " << runStatusLabel(report.status) << ": " << report.cases.size() << " case(s), "
        << report.requestsIssued << " requests, peak " << report.peakInFlight << " in flight\n";
    for (const auto& c : report.cases) {
        out << "  [" << caseOutcomeLabel(c.outcome) << "] ";
        out << (c.caseId.empty() ? c.input : c.caseId);
        if (!c.title.empty()) out << " \"" << c.title << "\"";
        if (c.outcome == CaseOutcome::Succeeded || c.outcome == CaseOutcome::Partial) {
            out << " -> " << c.outputPath << " (" << c.assetsFetched << "/" << c.assetsTotal << " assets";
            if (c.watermarksStripped) out << ", " << c.watermarksStripped << " watermarks removed";
            out << ")";
        }
        if (c.outcome == CaseOutcome::Failed || c.outcome == CaseOutcome::Cancelled) {
            out << ": " << errorCategoryLabel(c.error.category) << " " << errorCodeLabel(c.error.code);
            if (!c.error.detail.empty()) out << " (" << c.error.detail << ")";
        }
        out << "\n";
        for (const auto& url : c.missingAssets) out << "      missing " << url << "\n";
    }
    for (const auto& e : report.sequenceErrors) {
        out << "  [sequence] " << e.detail << "\n";
    }
    return out.str();
}

Pipeline::Pipeline(Config cfg, Transport transport)
    : cfg_(std::move(cfg)), transport_(std::move(transport)) {}

RunReport Pipeline::run(const std::vector<std::string>& inputs, CancelToken& cancel) {
    RunReport report;
    RequestLimiter limiter(cfg_.concurrency);
    HttpClient client(transport_, retryPolicyFromConfig(cfg_), limiter, clientOptionsFromConfig(cfg_), &cancel);
    CaseResolver resolver(client);
    TemplateFetcher templateFetcher(client, cfg_.httpHandling);
    TemplateCache templates(templateFetcher);
    const OutputMode mode = cfg_.oneHtmlFile ? OutputMode::SingleFile : OutputMode::Directory;

    // Normalize inputs first so duplicates resolve once.
    std::vector<std::unique_ptr<CaseSlot>> slots;
    std::set<std::string> known;
    for (const auto& input : inputs) {
        auto slot = std::make_unique<CaseSlot>();
        slot->input = input;
        slot->report.input = input;
        std::string err;
        if (!parseCaseId(input, slot->caseId, err)) {
            slot->report.outcome = CaseOutcome::Failed;
            slot->report.error = classifyError(err, ErrorCategory::Resolution);
            logError(err, "RUN");
        } else if (!known.insert(slot->caseId).second) {
            logInfo("Case " + slot->caseId + " requested more than once", "RUN");
            continue;
        }
        slot->report.caseId = slot->caseId;
        slots.push_back(std::move(slot));
    }

    auto resolveSlots = [&](size_t from) {
        runBounded(slots.size() - from, cfg_.concurrency, [&](size_t k) {
            CaseSlot& slot = *slots[from + k];
            if (slot.caseId.empty()) return;
            ErrorInfo info;
            if (resolver.resolve(slot.caseId, slot.manifest, info)) {
                slot.resolved = true;
                slot.report.title = slot.manifest.info.title;
            } else {
                slot.report.outcome = isCancellation(info) ? CaseOutcome::Cancelled : CaseOutcome::Failed;
                slot.report.error = info;
            }
        });
    };

    resolveSlots(0);
    if (cfg_.sequenceMode == SequenceMode::Every && !cancel.cancelled()) {
        const size_t before = slots.size();
        for (size_t i = 0; i < before; ++i) {
            if (!slots[i]->resolved) continue;
            for (const auto& id : resolver.expandSequence(slots[i]->manifest)) {
                if (!known.insert(id).second) continue;
                auto slot = std::make_unique<CaseSlot>();
                slot->input = id;
                slot->caseId = id;
                slot->report.input = "sequence of " + slots[i]->caseId;
                slot->report.caseId = id;
                slots.push_back(std::move(slot));
            }
        }
        if (slots.size() > before) {
            logInfo("Fetching " + std::to_string(slots.size() - before) + " more sequence parts", "RUN");
            resolveSlots(before);
        }
    }

    // Every output location is fixed before anything is linked or written.
    std::vector<std::pair<std::string, std::string>> titles;
    for (const auto& slot : slots) {
        if (slot->resolved) titles.emplace_back(slot->caseId, slot->manifest.info.title);
    }
    const std::map<std::string, OutputPlan> plans = planOutputs(titles, mode);

    SequenceLinker linker;
    std::map<std::string, LinkTarget> batch;
    for (const auto& slot : slots) {
        if (!slot->resolved) continue;
        linker.addCase(slot->manifest, report.sequenceErrors);
        LinkTarget target;
        target.outputPath = plans.at(slot->caseId).documentPath;
        for (const auto& e : slot->manifest.info.sequence) target.sequence.push_back(e.id);
        batch[slot->caseId] = target;
    }
    linker.link(batch, mode, report.sequenceErrors);

    BundleOptions bundleOptions;
    bundleOptions.mode = mode;
    bundleOptions.outputRoot = cfg_.output;
    bundleOptions.language = cfg_.language;
    bundleOptions.replaceExisting = cfg_.replaceExisting;
    bundleOptions.continueOnAssetError = cfg_.continueOnAssetError;
    bundleOptions.userscripts = cfg_.userscripts;
    const Bundler bundler(bundleOptions);
    const WatermarkStripper stripper(cfg_.removeWatermarks, !cfg_.disablePhotobucketFix);
    const Rewriter rewriter(mode, !cfg_.disableHtml5Audio);

    auto failSlot = [&](CaseSlot& slot, const ErrorInfo& info) {
        slot.report.error = info;
        slot.report.outcome =
            isCancellation(info) || cancel.cancelled() ? CaseOutcome::Cancelled : CaseOutcome::Failed;
    };

    // Fetch and rewrite every case before anything is written, so links only
    // go to parts that will have an output.
    runBounded(slots.size(), cfg_.concurrency, [&](size_t i) {
        CaseSlot& slot = *slots[i];
        if (!slot.resolved) return;
        CaseReport& rep = slot.report;

        std::shared_ptr<const PlayerTemplate> tpl;
        ErrorInfo info;
        if (!templates.get(cfg_.playerVersion, cfg_.language, tpl, info)) {
            failSlot(slot, info);
            return;
        }

        AssetGraph graph(cfg_.httpHandling);
        const std::vector<AssetReference> refs = graph.enumerate(slot.manifest, *tpl);
        Fetcher fetcher(client, cfg_.concurrency);
        fetcher.setPostProcess([&stripper](AssetRecord& rec) { stripper.strip(rec); });
        fetcher.setOnRecord([&](const AssetRecord&, size_t done, size_t total) {
            if (done == total || done % 50 == 0) {
                logInfo("Case " + slot.caseId + ": " + std::to_string(done) + "/" + std::to_string(total) +
                        " assets", "FETCH");
            }
        });
        slot.records = fetcher.fetchAll(refs);
        rep.assetsTotal = slot.records.size();
        for (const auto& rec : slot.records) {
            if (rec.status == AssetStatus::Fetched) ++rep.assetsFetched;
            if (rec.watermarkStripped) ++rep.watermarksStripped;
        }
        if (cancel.cancelled()) {
            failSlot(slot, classifyError("cancelled before bundling", ErrorCategory::Bundle));
            return;
        }

        slot.docs = makeDocuments(slot.manifest, *tpl);
        RewriteResult rewritten = rewriter.rewrite(slot.docs, refs, slot.records);
        rep.missingAssets = rewritten.missing;
        slot.prepared = true;
    });

    // Fail-fast cases with missing assets will not be written either.
    for (const auto& slot : slots) {
        if (!slot->resolved) continue;
        const bool blocked = !slot->report.missingAssets.empty() && !cfg_.continueOnAssetError;
        if (!slot->prepared || blocked) linker.unlinkTarget(slot->caseId);
    }

    auto writeSlot = [&](CaseSlot& slot, const Bundler& writer, const CancelToken* stop) {
        CaseDocuments docs = slot.docs;
        linker.apply(docs);
        ErrorInfo info;
        if (!writer.write(docs, slot.records, slot.report.missingAssets, plans.at(slot.caseId), stop,
                          slot.report.outputPath, info)) {
            failSlot(slot, info);
            slot.written = false;
            return;
        }
        slot.written = true;
        slot.report.outcome = slot.report.missingAssets.empty() ? CaseOutcome::Succeeded : CaseOutcome::Partial;
    };

    runBounded(slots.size(), cfg_.concurrency, [&](size_t i) {
        CaseSlot& slot = *slots[i];
        if (slot.prepared) writeSlot(slot, bundler, &cancel);
    });

    // A write can still fail (existing output, disk errors). Parts already
    // written with a link to it are written again with the live redirect.
    BundleOptions rewriteOptions = bundleOptions;
    rewriteOptions.replaceExisting = true;
    const Bundler rewriteBundler(rewriteOptions);
    std::map<std::string, CaseSlot*> byId;
    for (auto& slot : slots) {
        if (slot->resolved) byId[slot->caseId] = slot.get();
    }
    std::vector<std::string> pending;
    for (const auto& slot : slots) {
        if (slot->prepared && !slot->written) pending.push_back(slot->caseId);
    }
    while (!pending.empty()) {
        const std::string id = pending.back();
        pending.pop_back();
        for (const auto& source : linker.unlinkTarget(id)) {
            CaseSlot* from = byId.at(source);
            if (!from->written) continue;
            logInfo("Rewriting case " + source + " without its link to case " + id, "RUN");
            // Runs to completion even after cancellation; the output on disk must not keep a dead link.
            writeSlot(*from, rewriteBundler, nullptr);
            if (!from->written) pending.push_back(source);
        }
    }
    for (auto& slot : slots) slot->records.clear();

    for (auto& slot : slots) {
        if (cancel.cancelled() && slot->report.outcome != CaseOutcome::Succeeded &&
            slot->report.outcome != CaseOutcome::Partial && slot->report.error.code == ErrorCode::None) {
            slot->report.outcome = CaseOutcome::Cancelled;
            slot->report.error = classifyError("cancelled", ErrorCategory::Internal);
        }
        report.cases.push_back(std::move(slot->report));
    }
    report.requestsIssued = client.requestsIssued();
    report.peakInFlight = limiter.peak();
    report.status = summarizeRun(report, cancel.cancelled());
    logInfo(std::string("Run finished: ") + runStatusLabel(report.status), "RUN");
    return report;
}

} // namespace aao
