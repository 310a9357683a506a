#include "cli/commands.hpp"
#include "cli/argsHelpers.hpp"
#include "cli/signals.hpp"
#include "config/ConfigRegistry.hpp"
#include "fs/FileCollector.hpp"
#include "api/HttpAssetApi.hpp"
#include "upload/SequencePlanner.hpp"
#include "util/bytes.hpp"
#include "log/Registry.hpp"

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

using namespace cw::cli;
using namespace cw::upload;
using namespace cw::upload::model;
using namespace cw::config;
using namespace cw::log;

namespace stdfs = std::filesystem;

namespace {

std::vector<FileInfo> collectFiles(const CommandCall& call) {
    if (call.positionals.empty()) throw std::invalid_argument("at least one file or directory is required");

    std::vector<stdfs::path> roots(call.positionals.begin(), call.positionals.end());
    auto files = cw::fs::FileCollector().collect(roots);
    if (const auto preview = optVal(call, "preview")) files.push_back(cw::fs::FileCollector::assetPreview(*preview));
    return files;
}

UploadConfig uploadConfigFor(const CommandCall& call) {
    auto cfg = ConfigRegistry::get().upload;
    if (const auto parallel = optValAny(call, {"parallel", "j"})) {
        const auto n = parseUInt(*parallel);
        if (!n || *n == 0) throw std::invalid_argument(fmt::format("--parallel expects a positive integer, got '{}'", *parallel));
        cfg.max_concurrent_uploads = *n;
    }
    return cfg;
}

void appendLinks(std::vector<AssetLinkSpec>& links, const std::optional<std::string>& ids, const AssetLinkSpec::Role role) {
    if (!ids) return;
    for (auto& id : splitList(*ids)) links.push_back({.role = role, .assetId = std::move(id)});
}

std::string describeSequence(const UploadSequence& seq) {
    return fmt::format("  sequence {:>3}: {:>4} file(s) {:>12} {:>6} part(s){}\n",
                       seq.sequenceId, seq.files.size(), cw::util::formatFileSize(seq.totalSize), seq.totalParts,
                       seq.isAssetPreview() ? "  [asset preview]" : seq.isPreview() ? "  [preview]" : "");
}

std::string renderResult(const UploadResult& r) {
    std::string out = fmt::format("asset {}: {}\n", r.assetId.empty() ? "<none>" : r.assetId, r.summary());
    for (const auto& w : r.warnings) out += fmt::format("warning: {}\n", w);
    for (const auto& e : r.errors) out += fmt::format("error: {}\n", e);
    return out;
}

}

namespace cw::cli {

void registerCommands(Router& router) {
    router.registerCommand("upload", {
        .usage = "upload <path...> --database <id> [--asset <id> | --name <name>] [--description <text>] "
                 "[--tags a,b] [--metadata k=v,...] [--parent ids] [--child ids] [--related ids] "
                 "[--preview <file>] [--parallel <n>] [--retries <n>] [--skip-failed] [--dry-run]",
        .description = "Upload files and directories into a new or existing asset",
        .handler = handleUpload,
        .aliases = {"up", "push"}
    });
    router.registerCommand("plan", {
        .usage = "plan <path...> [--preview <file>]",
        .description = "Show how files would be split into upload sequences",
        .handler = handlePlan,
        .aliases = {"dry-run"}
    });
    router.registerCommand("config", {
        .usage = "config",
        .description = "Print the effective configuration as JSON",
        .handler = handleConfig,
        .aliases = {"cfg"}
    });

    router.registerSwitch("dry-run");
    router.registerSwitch("skip-failed");
    router.registerSwitch("private");
}

UploadRequest buildUploadRequest(const CommandCall& call) {
    UploadRequest req;

    const auto db = optValAny(call, {"database", "d"});
    if (!db || db->empty()) throw std::invalid_argument("--database is required");
    req.databaseId = *db;

    if (const auto asset = optValAny(call, {"asset", "a"}); asset && !asset->empty()) req.existingAssetId = *asset;

    req.files = collectFiles(call);

    if (const auto name = optValAny(call, {"name", "n"}); name && !name->empty()) req.assetName = *name;
    else {
        auto root = stdfs::path(call.positionals.front()).lexically_normal();
        if (!root.has_filename()) root = root.parent_path();   // "model/" names the asset "model"
        req.assetName = root.filename().string();
    }
    if (req.assetName.empty()) req.assetName = "upload";

    req.description = optVal(call, "description").value_or(req.assetName);
    req.isDistributable = !hasFlag(call, "private");
    if (const auto tags = optVal(call, "tags")) req.tags = splitList(*tags);

    if (const auto meta = optValAny(call, {"metadata", "m"})) {
        for (const auto& kv : splitList(*meta)) {
            const auto eq = kv.find('=');
            if (eq == std::string::npos || eq == 0)
                throw std::invalid_argument(fmt::format("--metadata expects key=value pairs, got '{}'", kv));
            req.metadata[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
    }

    appendLinks(req.links, optVal(call, "parent"), AssetLinkSpec::Role::PARENT);
    appendLinks(req.links, optVal(call, "child"), AssetLinkSpec::Role::CHILD);
    appendLinks(req.links, optVal(call, "related"), AssetLinkSpec::Role::RELATED);

    return req;
}

std::optional<Stage> firstFailedStage(const WorkflowStatus& status) {
    for (const auto& st : status.stages)
        if (st.status == StageStatus::FAILED) return st.stage;
    return std::nullopt;
}

RecoveryPolicy::RecoveryPolicy(const unsigned int retriesPerStage, const bool skipFailed)
    : retriesPerStage_(retriesPerStage), skipFailed_(skipFailed) {}

RecoveryStep RecoveryPolicy::next(const WorkflowStatus& status) {
    const auto failed = firstFailedStage(status);
    if (!failed) return {};

    if (auto& used = retriesUsed_[*failed]; used < retriesPerStage_) {
        ++used;
        return {.action = RecoveryStep::Action::RETRY, .stage = *failed};
    }
    if (skipFailed_ && *failed != Stage::ASSET_CREATION) return {.action = RecoveryStep::Action::SKIP, .stage = *failed};
    return {.action = RecoveryStep::Action::STOP, .stage = *failed};
}

CommandResult handleUpload(const CommandCall& call) {
    UploadRequest req;
    Config cfg = ConfigRegistry::get();
    unsigned int retries = 1;
    try {
        cfg.upload = uploadConfigFor(call);
        req = buildUploadRequest(call);
        if (const auto r = optVal(call, "retries")) {
            const auto n = parseUInt(*r);
            if (!n) throw std::invalid_argument(fmt::format("--retries expects a non-negative integer, got '{}'", *r));
            retries = *n;
        }
    } catch (const std::exception& e) {
        return invalid(fmt::format("upload: {}", e.what()));
    }

    if (hasFlag(call, "dry-run")) return handlePlan(call);

    if (cfg.api.auth_token.empty())
        Registry::chunkwise()->warn("[upload] No API token configured; set CHUNKWISE_API_TOKEN or api.auth_token");

    std::mutex printMutex;
    Workflow::Callbacks callbacks{
        .onStage = [](const Stage stage, const StageStatus status) {
            Registry::chunkwise()->info("[upload] {}: {}", toString(stage), toString(status));
        },
        .onProgress = [&printMutex](const uint64_t done, const uint64_t total) {
            std::scoped_lock lock(printMutex);
            const double pct = total ? 100.0 * static_cast<double>(done) / static_cast<double>(total) : 100.0;
            fmt::print(stderr, "\r  {} / {} parts ({:.1f}%)", done, total, pct);
            if (done == total) fmt::print(stderr, "\n");
        },
        .onSequence = [](const unsigned int id, const SequenceStatus status) {
            Registry::chunkwise()->debug("[upload] sequence {}: {}", id, toString(status));
        }
    };

    auto api = std::make_shared<api::HttpAssetApi>(cfg.api);
    auto transport = std::make_shared<api::CurlPartTransport>(cfg.api);
    Workflow workflow(cfg, std::move(api), std::move(transport), std::move(req), std::move(callbacks));

    std::jthread watcher([&workflow](const std::stop_token& stop) {
        while (!stop.stop_requested()) {
            if (interruptRequested()) {
                workflow.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });

    RecoveryPolicy recovery(retries, hasFlag(call, "skip-failed"));
    auto status = workflow.run();

    while (status.needsAttention()) {
        if (interruptRequested()) {
            workflow.cancel();
            status = workflow.run();
            continue;
        }

        const auto step = recovery.next(status);
        if (step.action == RecoveryStep::Action::RETRY) status = workflow.retryStage(step.stage);
        else if (step.action == RecoveryStep::Action::SKIP) status = workflow.skipStage(step.stage);
        else break;
    }

    watcher.request_stop();

    const auto result = workflow.result();
    if (!result) {
        std::string err = "upload stopped:\n";
        for (const auto& st : status.stages)
            for (const auto& e : st.errors) err += fmt::format("  {}: {}\n", toString(st.stage), e);
        return {1, "", err};
    }

    return {result->overallSuccess ? 0 : 1, renderResult(*result), ""};
}

CommandResult handlePlan(const CommandCall& call) {
    try {
        const SequencePlanner planner(uploadConfigFor(call));
        const auto files = collectFiles(call);

        if (const auto report = planner.validate(files); !report.ok()) {
            std::string err = "plan: the upload would be rejected:\n";
            for (const auto& e : report.errors) err += fmt::format("  {}\n", e);
            return {1, "", err};
        }

        const auto sequences = planner.plan(files);
        std::string out = fmt::format("{} sequence(s):\n", sequences.size());
        for (const auto& seq : sequences) out += describeSequence(seq);
        out += fmt::format("total: {}\n", SequencePlanner::summarize(sequences).toString());
        if (planner.needsMultiSequence(files)) out += "note: the upload spans several sequences\n";
        return ok(out);
    } catch (const std::exception& e) {
        return invalid(fmt::format("plan: {}", e.what()));
    }
}

CommandResult handleConfig(const CommandCall&) {
    const nlohmann::json j = ConfigRegistry::get();
    return ok(j.dump(2) + "\n");
}

}
