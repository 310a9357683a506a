#include "upload/Workflow.hpp"
#include "api/AssetApi.hpp"
#include "api/PartTransport.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <array>
#include <ranges>
#include <stdexcept>
#include <fmt/core.h>
#include <fmt/ranges.h>

using namespace cw::upload;
using namespace cw::upload::model;
using namespace cw::api::model;
using namespace cw::log;

namespace {

constexpr std::array kStages{
    Stage::ASSET_CREATION, Stage::METADATA, Stage::ASSET_LINKS, Stage::PLANNING,
    Stage::SEQUENCE_INIT, Stage::PART_UPLOAD, Stage::SEQUENCE_COMPLETION, Stage::FINALIZE
};

struct RunningGuard {
    std::atomic<bool>& flag;
    ~RunningGuard() { flag = false; }
};

}

std::string_view cw::upload::toString(const Stage s) noexcept {
    switch (s) {
        case Stage::ASSET_CREATION: return "asset-creation";
        case Stage::METADATA: return "metadata";
        case Stage::ASSET_LINKS: return "asset-links";
        case Stage::PLANNING: return "planning";
        case Stage::SEQUENCE_INIT: return "sequence-init";
        case Stage::PART_UPLOAD: return "part-upload";
        case Stage::SEQUENCE_COMPLETION: return "sequence-completion";
        case Stage::FINALIZE: return "finalize";
        default: return "unknown";
    }
}

std::string_view cw::upload::toString(const StageStatus s) noexcept {
    switch (s) {
        case StageStatus::PENDING: return "pending";
        case StageStatus::IN_PROGRESS: return "in-progress";
        case StageStatus::COMPLETED: return "completed";
        case StageStatus::FAILED: return "failed";
        case StageStatus::SKIPPED: return "skipped";
        default: return "unknown";
    }
}

std::string UploadResult::summary() const {
    auto line = fmt::format("{} of {} files uploaded", uploadedFiles, totalFiles);
    if (cancelledFiles) line += fmt::format("; {} cancelled", cancelledFiles);
    if (failedFiles) line += fmt::format("; {} failed", failedFiles);
    if (skippedFiles) line += fmt::format("; {} skipped", skippedFiles);
    return line;
}

const StageState& WorkflowStatus::stage(const Stage s) const {
    const auto it = std::ranges::find(stages, s, &StageState::stage);
    if (it == stages.end()) throw std::out_of_range(fmt::format("no state for stage {}", toString(s)));
    return *it;
}

// ####################################################################################################
// ################################ Construction ######################################################
// ####################################################################################################

Workflow::Workflow(const config::Config& cfg,
                   std::shared_ptr<api::AssetApi> api,
                   std::shared_ptr<api::PartTransport> transport,
                   UploadRequest request,
                   Callbacks callbacks,
                   Sleeper sleeper)
    : request_(std::move(request)),
      callbacks_(std::move(callbacks)),
      api_(std::move(api)),
      requestPolicy_(RetryPolicy::forRequests(cfg.retry, sleeper)),
      planner_(cfg.upload),
      coordinator_(api_, planner_.parts(), requestPolicy_) {
    if (request_.databaseId.empty()) throw std::invalid_argument("UploadRequest requires a database id");

    for (const auto s : kStages) stages_[s] = StageState{.stage = s};

    PartUploadEngine::Callbacks engineCallbacks{
        .onProgress = [this](const uint64_t done, const uint64_t total) {
            if (callbacks_.onProgress) callbacks_.onProgress(done, total);
        },
        .onFileProgress = [this](const unsigned int file, const double pct) {
            if (callbacks_.onFileProgress) callbacks_.onFileProgress(file, pct);
        },
        .onSequenceComplete = [this](unsigned int) { pushEvent(Event::SEQUENCE_READY); },
        .onIdle = [this] { pushEvent(Event::ENGINE_IDLE); }
    };

    engine_ = std::make_unique<PartUploadEngine>(std::move(transport),
                                                 cfg.upload.max_concurrent_uploads,
                                                 RetryPolicy::forParts(cfg.retry, std::move(sleeper)),
                                                 std::move(engineCallbacks));
}

Workflow::~Workflow() {
    if (engine_) engine_->stop();
}

// ####################################################################################################
// ################################ Driver ############################################################
// ####################################################################################################

WorkflowStatus Workflow::run() {
    if (running_.exchange(true)) throw std::logic_error("Workflow::run() is already active");
    RunningGuard guard{running_};

    if (finalFired_) return status();

    // Once planning is done a cancel settles through drive() so cancelled files are still reported.
    const auto cancelledBeforeUpload = [this] {
        if (!cancelled_ || stageStatus(Stage::PLANNING) == StageStatus::COMPLETED) return false;
        skipRemainingForCancel();
        finalize();
        return true;
    };

    if (cancelledBeforeUpload()) return status();
    if (!stageSettled(Stage::ASSET_CREATION)) {
        if (stageStatus(Stage::ASSET_CREATION) == StageStatus::FAILED || !runAssetCreation()) return status();
    }

    if (cancelledBeforeUpload()) return status();
    if (stageStatus(Stage::METADATA) == StageStatus::PENDING) runMetadata();

    if (cancelledBeforeUpload()) return status();
    if (stageStatus(Stage::ASSET_LINKS) == StageStatus::PENDING) runAssetLinks();

    if (cancelledBeforeUpload()) return status();
    if (!stageSettled(Stage::PLANNING)) {
        if (stageStatus(Stage::PLANNING) == StageStatus::FAILED || !runPlanning()) return status();
    }

    if (stageStatus(Stage::PLANNING) == StageStatus::SKIPPED) {
        if (!sideStageFailed()) finalize();
        return status();
    }

    if (stageStatus(Stage::SEQUENCE_INIT) == StageStatus::PENDING) runSequenceInit();

    drive();
    return status();
}

bool Workflow::runAssetCreation() {
    if (request_.existingAssetId) {
        {
            std::scoped_lock lock(mutex_);
            assetId_ = *request_.existingAssetId;
        }
        coordinator_.setAsset(*request_.existingAssetId, request_.databaseId);
        Registry::workflow()->info("[Workflow] Uploading into existing asset {}", *request_.existingAssetId);
        setStage(Stage::ASSET_CREATION, StageStatus::SKIPPED);
        return true;
    }

    setStage(Stage::ASSET_CREATION, StageStatus::IN_PROGRESS);
    try {
        const CreateAssetRequest req{
            .databaseId = request_.databaseId,
            .assetName = request_.assetName,
            .description = request_.description,
            .isDistributable = request_.isDistributable,
            .tags = request_.tags
        };
        const auto res = withRetry(Phase::Request, requestPolicy_, "create asset", [&] {
            return api_->createAsset(req);
        });
        if (res.assetId.empty()) throw std::runtime_error("backend returned an empty asset id");

        {
            std::scoped_lock lock(mutex_);
            assetId_ = res.assetId;
        }
        coordinator_.setAsset(res.assetId, request_.databaseId);
        Registry::workflow()->info("[Workflow] Created asset {} in database {}", res.assetId, request_.databaseId);
        setStage(Stage::ASSET_CREATION, StageStatus::COMPLETED);
        return true;
    } catch (const std::exception& e) {
        Registry::workflow()->error("[Workflow] Asset creation failed: {}", e.what());
        setStage(Stage::ASSET_CREATION, StageStatus::FAILED, {e.what()});
        return false;
    }
}

void Workflow::runMetadata() {
    if (request_.metadata.empty()) {
        setStage(Stage::METADATA, StageStatus::SKIPPED);
        return;
    }

    setStage(Stage::METADATA, StageStatus::IN_PROGRESS);
    try {
        const auto id = assetId();
        withRetry(Phase::Request, requestPolicy_, "add metadata", [&] {
            api_->addMetadata(request_.databaseId, id, request_.metadata);
        });
        Registry::workflow()->info("[Workflow] Attached {} metadata field(s)", request_.metadata.size());
        setStage(Stage::METADATA, StageStatus::COMPLETED);
    } catch (const std::exception& e) {
        Registry::workflow()->error("[Workflow] Metadata attachment failed: {}", e.what());
        setStage(Stage::METADATA, StageStatus::FAILED, {e.what()});
    }
}

void Workflow::runAssetLinks() {
    if (request_.links.empty()) {
        setStage(Stage::ASSET_LINKS, StageStatus::SKIPPED);
        return;
    }

    setStage(Stage::ASSET_LINKS, StageStatus::IN_PROGRESS);
    const auto self = assetId();
    std::vector<std::string> errors;

    for (size_t i = 0; i < request_.links.size(); ++i) {
        const auto& link = request_.links[i];
        const auto otherDb = link.databaseId.empty() ? request_.databaseId : link.databaseId;

        std::string linkId;
        {
            std::scoped_lock lock(mutex_);
            if (const auto it = createdLinks_.find(i); it != createdLinks_.end()) linkId = it->second;
        }

        if (linkId.empty()) {
            CreateAssetLinkRequest req{.tags = link.tags};
            if (link.role == AssetLinkSpec::Role::PARENT) {
                req.fromAssetId = link.assetId;
                req.fromAssetDatabaseId = otherDb;
                req.toAssetId = self;
                req.toAssetDatabaseId = request_.databaseId;
            } else {
                req.fromAssetId = self;
                req.fromAssetDatabaseId = request_.databaseId;
                req.toAssetId = link.assetId;
                req.toAssetDatabaseId = otherDb;
            }
            req.relationshipType = link.role == AssetLinkSpec::Role::RELATED
                                       ? RelationshipType::Related
                                       : RelationshipType::ParentChild;

            try {
                const auto res = withRetry(Phase::Request, requestPolicy_, fmt::format("link asset {}", link.assetId), [&] {
                    return api_->createAssetLink(req);
                });
                linkId = res.assetLinkId;
                std::scoped_lock lock(mutex_);
                createdLinks_[i] = linkId;
            } catch (const std::exception& e) {
                errors.push_back(fmt::format("link to asset {}: {}", link.assetId, e.what()));
                continue;
            }
        }

        for (size_t m = 0; m < link.metadata.size(); ++m) {
            {
                std::scoped_lock lock(mutex_);
                if (linkMetadataDone_.contains({i, m})) continue;
            }
            const auto& entry = link.metadata[m];
            try {
                withRetry(Phase::Request, requestPolicy_, fmt::format("link metadata {}", entry.metadataKey), [&] {
                    api_->createAssetLinkMetadata(linkId, entry);
                });
                std::scoped_lock lock(mutex_);
                linkMetadataDone_.insert({i, m});
            } catch (const std::exception& e) {
                errors.push_back(fmt::format("metadata {} on link {}: {}", entry.metadataKey, linkId, e.what()));
            }
        }
    }

    if (errors.empty()) {
        Registry::workflow()->info("[Workflow] Created {} asset link(s)", request_.links.size());
        setStage(Stage::ASSET_LINKS, StageStatus::COMPLETED);
    } else {
        Registry::workflow()->error("[Workflow] {} asset link operation(s) failed", errors.size());
        setStage(Stage::ASSET_LINKS, StageStatus::FAILED, std::move(errors));
    }
}

bool Workflow::runPlanning() {
    setStage(Stage::PLANNING, StageStatus::IN_PROGRESS);

    const auto report = planner_.validate(request_.files);
    if (!report.ok()) {
        Registry::workflow()->error("[Workflow] Upload rejected: {}", fmt::join(report.errors, "; "));
        setStage(Stage::PLANNING, StageStatus::FAILED, report.errors);
        return false;
    }

    try {
        auto planned = planner_.plan(request_.files);
        for (const auto& seq : planned) coordinator_.registerSequence(seq);

        Registry::workflow()->info("[Workflow] {}", SequencePlanner::summarize(planned).toString());

        {
            std::scoped_lock lock(mutex_);
            for (const auto& seq : planned)
                for (const auto& f : seq.files) fileToSequence_[f.index] = seq.sequenceId;
            sequences_ = std::move(planned);
        }
        setStage(Stage::PLANNING, StageStatus::COMPLETED);
    } catch (const std::exception& e) {
        Registry::workflow()->error("[Workflow] Planning failed: {}", e.what());
        setStage(Stage::PLANNING, StageStatus::FAILED, {e.what()});
        return false;
    }

    if (sequencesCopy().empty()) {
        for (const auto s : {Stage::SEQUENCE_INIT, Stage::PART_UPLOAD, Stage::SEQUENCE_COMPLETION})
            setStage(s, StageStatus::SKIPPED);
    }
    return true;
}

void Workflow::runSequenceInit() {
    setStage(Stage::SEQUENCE_INIT, StageStatus::IN_PROGRESS);

    // One at a time to bound backend load.
    for (const auto& seq : sequencesCopy()) {
        if (cancelled_) break;
        if (coordinator_.status(seq.sequenceId) != SequenceStatus::PENDING) continue;

        if (coordinator_.initializeSequence(seq))
            engine_->addSequence(seq, *coordinator_.record(seq.sequenceId).init);
        notifySequence(seq.sequenceId);
    }

    std::vector<std::string> errors;
    for (const auto& rec : coordinator_.records())
        if (rec.status == SequenceStatus::INIT_FAILED)
            errors.push_back(fmt::format("sequence {}: {}", rec.sequenceId, rec.error));

    if (!errors.empty()) setStage(Stage::SEQUENCE_INIT, StageStatus::FAILED, std::move(errors));
    else if (cancelled_) setStage(Stage::SEQUENCE_INIT, StageStatus::SKIPPED);
    else setStage(Stage::SEQUENCE_INIT, StageStatus::COMPLETED);
}

void Workflow::drive() {
    for (const auto s : {Stage::PART_UPLOAD, Stage::SEQUENCE_COMPLETION})
        if (stageStatus(s) != StageStatus::SKIPPED) setStage(s, StageStatus::IN_PROGRESS);

    while (true) {
        drainEvents();
        // Sampled before the scan: an idle engine cannot move a sequence while we look at it.
        const bool idle = engine_->isIdle();

        if (cancelled_) skipRemainingForCancel();

        const bool progressed = completeReadySequences();

        if (allSequencesSettled()) {
            if (sideStageFailed()) {
                refreshUploadStages();
                Registry::workflow()->warn("[Workflow] Files are settled but metadata or links failed");
                return;
            }
            finalize();
            return;
        }
        if (progressed) continue;

        if (idle) {
            if (eventsPending()) continue;
            refreshUploadStages();
            Registry::workflow()->warn("[Workflow] Upload paused; a failed stage needs a retry or skip");
            return;
        }

        waitForEvent();
    }
}

bool Workflow::completeReadySequences() {
    bool progressed = false;
    for (const auto& seq : sequencesCopy()) {
        const auto id = seq.sequenceId;
        if (coordinator_.status(id) != SequenceStatus::INIT_COMPLETED) continue;
        if (!engine_->isSequenceTerminal(id)) continue;

        if (!coordinator_.canComplete(seq)) {
            coordinator_.deferUntilBarrier(id, [this] { pushEvent(Event::BARRIER_OPENED); });
            continue;
        }

        coordinator_.completeSequence(seq, engine_->partsForSequence(id), engine_->cancelledFiles());
        notifySequence(id);
        progressed = true;
    }
    return progressed;
}

void Workflow::refreshUploadStages() {
    if (stageStatus(Stage::PART_UPLOAD) != StageStatus::SKIPPED) {
        std::vector<std::string> errors;
        for (const auto file : engine_->filesWithFailedParts()) {
            const auto parts = engine_->partsForFile(file);
            const auto failed = std::ranges::count_if(parts, [](const FilePart& p) {
                return p.status == FilePart::Status::FAILED;
            });
            const auto last = std::ranges::find(parts, FilePart::Status::FAILED, &FilePart::status);
            errors.push_back(fmt::format("file {}: {} part(s) failed ({})", file, failed,
                                         last != parts.end() ? last->lastError : "unknown error"));
        }
        if (errors.empty()) setStage(Stage::PART_UPLOAD, StageStatus::COMPLETED);
        else setStage(Stage::PART_UPLOAD, StageStatus::FAILED, std::move(errors));
    }

    if (stageStatus(Stage::SEQUENCE_COMPLETION) != StageStatus::SKIPPED) {
        std::vector<std::string> errors;
        for (const auto& rec : coordinator_.records())
            if (rec.status == SequenceStatus::FAILED)
                errors.push_back(fmt::format("sequence {}: {}", rec.sequenceId, rec.error));

        if (!errors.empty()) setStage(Stage::SEQUENCE_COMPLETION, StageStatus::FAILED, std::move(errors));
        else if (allSequencesSettled()) setStage(Stage::SEQUENCE_COMPLETION, StageStatus::COMPLETED);
        else setStage(Stage::SEQUENCE_COMPLETION, StageStatus::PENDING);
    }
}

// Metadata and links gate nothing downstream, but the result waits for a decision on them.
bool Workflow::sideStageFailed() const {
    return !cancelled_ && (stageStatus(Stage::METADATA) == StageStatus::FAILED ||
                           stageStatus(Stage::ASSET_LINKS) == StageStatus::FAILED);
}

bool Workflow::allSequencesSettled() const {
    return std::ranges::all_of(coordinator_.records(), &SequenceRecord::isSettled);
}

void Workflow::skipRemainingForCancel() {
    for (const auto& rec : coordinator_.records()) {
        switch (rec.status) {
            case SequenceStatus::PENDING:
            case SequenceStatus::INIT_FAILED:
            case SequenceStatus::FAILED:
                coordinator_.skip(rec.sequenceId);
                notifySequence(rec.sequenceId);
                break;
            default:
                break;
        }
    }

    const bool uploading = stageStatus(Stage::PLANNING) == StageStatus::COMPLETED && !sequencesCopy().empty();
    for (const auto s : kStages) {
        if (s == Stage::FINALIZE) continue;
        if (uploading && (s == Stage::PART_UPLOAD || s == Stage::SEQUENCE_COMPLETION)) continue;
        const auto st = stageStatus(s);
        if (st == StageStatus::PENDING || st == StageStatus::FAILED) setStage(s, StageStatus::SKIPPED);
    }
}

void Workflow::finalize() {
    if (finalFired_.exchange(true)) return;

    if (stageStatus(Stage::PLANNING) == StageStatus::COMPLETED) refreshUploadStages();
    setStage(Stage::FINALIZE, StageStatus::IN_PROGRESS);

    const auto result = buildResult();
    {
        std::scoped_lock lock(mutex_);
        result_ = result;
    }
    setStage(Stage::FINALIZE, StageStatus::COMPLETED);

    if (result.overallSuccess) Registry::workflow()->info("[Workflow] Upload finished: {}", result.summary());
    else Registry::workflow()->warn("[Workflow] Upload finished with problems: {}", result.summary());
    for (const auto& w : result.warnings) Registry::workflow()->warn("[Workflow] {}", w);

    if (callbacks_.onComplete) callbacks_.onComplete(result);
}

UploadResult Workflow::buildResult() const {
    UploadResult r;
    r.sequences = coordinator_.records();

    std::map<unsigned int, const SequenceRecord*> bySequence;
    for (const auto& rec : r.sequences) bySequence[rec.sequenceId] = &rec;

    std::scoped_lock lock(mutex_);
    r.assetId = assetId_;
    r.totalFiles = request_.files.size();

    for (const auto& file : request_.files) {
        if (userCancelled_.contains(file.index)) { ++r.cancelledFiles; continue; }
        if (skippedFiles_.contains(file.index)) { ++r.skippedFiles; continue; }

        const auto seq = fileToSequence_.find(file.index);
        if (seq == fileToSequence_.end()) {
            ++(cancelled_ ? r.cancelledFiles : r.failedFiles);
            continue;
        }

        const auto& rec = *bySequence.at(seq->second);
        switch (rec.status) {
            case SequenceStatus::COMPLETED: {
                if (rec.cancelledFiles.contains(file.index)) { ++r.cancelledFiles; break; }
                const auto key = file.relativeKey();
                const auto fr = std::ranges::find(rec.fileResults, key, &FileResult::relativeKey);
                if (fr != rec.fileResults.end() && !fr->success) ++r.failedFiles;
                else ++r.uploadedFiles;
                break;
            }
            case SequenceStatus::SKIPPED:
                ++(cancelled_ ? r.cancelledFiles : r.skippedFiles);
                break;
            default:
                ++r.failedFiles;
                break;
        }
    }

    for (const auto& rec : r.sequences) {
        if (rec.ambiguousSuccess) {
            r.ambiguousSuccess = true;
            r.warnings.push_back(fmt::format(
                "sequence {}: completion timed out (503); the upload may still have succeeded, verify the asset",
                rec.sequenceId));
        }
        if (rec.asynchronousProcessing) {
            r.asynchronousProcessing = true;
            r.warnings.push_back(fmt::format(
                "sequence {}: large files are still being processed by the backend", rec.sequenceId));
        }
        for (const auto& fr : rec.fileResults)
            if (!fr.success)
                r.errors.push_back(fmt::format("{}: {}", fr.relativeKey, fr.error.value_or("upload failed")));
    }

    bool stageFailed = false;
    for (const auto& st : stages_ | std::views::values) {
        if (st.status == StageStatus::FAILED) stageFailed = true;
        for (const auto& e : st.errors) r.errors.push_back(fmt::format("{}: {}", toString(st.stage), e));
    }

    r.overallSuccess = !stageFailed && r.failedFiles == 0 && r.skippedFiles == 0 && !r.assetId.empty();
    return r;
}

// ####################################################################################################
// ################################ Stage actions #####################################################
// ####################################################################################################

WorkflowStatus Workflow::retryStage(const Stage stage) {
    if (running_) throw std::logic_error("retryStage() called while the workflow is running");
    if (finalFired_) throw std::logic_error("workflow has already finished");
    if (stage == Stage::FINALIZE) throw std::invalid_argument("finalize cannot be retried");
    if (stageStatus(stage) != StageStatus::FAILED)
        throw std::logic_error(fmt::format("stage {} has not failed", toString(stage)));

    Registry::workflow()->info("[Workflow] Retrying stage {}", toString(stage));

    switch (stage) {
        case Stage::SEQUENCE_INIT:
            for (const auto& rec : coordinator_.records())
                if (rec.status == SequenceStatus::INIT_FAILED) coordinator_.resetForRetry(rec.sequenceId);
            break;
        case Stage::PART_UPLOAD:
            engine_->retryFailedParts();
            break;
        case Stage::SEQUENCE_COMPLETION:
            for (const auto& rec : coordinator_.records())
                if (rec.status == SequenceStatus::FAILED) coordinator_.resetForRetry(rec.sequenceId);
            break;
        default:
            break;
    }

    setStage(stage, StageStatus::PENDING);
    return run();
}

WorkflowStatus Workflow::skipStage(const Stage stage) {
    if (running_) throw std::logic_error("skipStage() called while the workflow is running");
    if (finalFired_) throw std::logic_error("workflow has already finished");
    if (stage == Stage::FINALIZE) throw std::invalid_argument("finalize cannot be skipped");

    const auto st = stageStatus(stage);
    if (st != StageStatus::FAILED && st != StageStatus::PENDING)
        throw std::logic_error(fmt::format("stage {} is {} and cannot be skipped", toString(stage), toString(st)));

    switch (stage) {
        case Stage::ASSET_CREATION:
            throw std::invalid_argument("asset creation cannot be skipped without an existing asset id");
        case Stage::PLANNING: {
            std::scoped_lock lock(mutex_);
            for (const auto& f : request_.files) skippedFiles_.insert(f.index);
            break;
        }
        case Stage::SEQUENCE_INIT:
            for (const auto& rec : coordinator_.records())
                if (rec.status == SequenceStatus::INIT_FAILED || rec.status == SequenceStatus::PENDING) {
                    coordinator_.skip(rec.sequenceId);
                    notifySequence(rec.sequenceId);
                }
            break;
        case Stage::PART_UPLOAD:
            for (const auto file : engine_->filesWithFailedParts()) {
                {
                    std::scoped_lock lock(mutex_);
                    skippedFiles_.insert(file);
                }
                engine_->cancelFile(file);
            }
            break;
        case Stage::SEQUENCE_COMPLETION:
            for (const auto& rec : coordinator_.records())
                if (rec.status == SequenceStatus::FAILED) {
                    coordinator_.skip(rec.sequenceId);
                    notifySequence(rec.sequenceId);
                }
            break;
        default:
            break;
    }

    Registry::workflow()->warn("[Workflow] Skipping stage {}", toString(stage));
    setStage(stage, StageStatus::SKIPPED);
    if (stage == Stage::PLANNING)
        for (const auto s : {Stage::SEQUENCE_INIT, Stage::PART_UPLOAD, Stage::SEQUENCE_COMPLETION})
            setStage(s, StageStatus::SKIPPED);

    return run();
}

void Workflow::cancelFile(const unsigned int fileIndex) {
    if (std::ranges::find(request_.files, fileIndex, &FileInfo::index) == std::ranges::end(request_.files))
        throw std::invalid_argument(fmt::format("unknown file index {}", fileIndex));

    {
        std::scoped_lock lock(mutex_);
        if (const auto seq = fileToSequence_.find(fileIndex); seq != fileToSequence_.end()
            && coordinator_.record(seq->second).isSettled()) {
            Registry::workflow()->warn("[Workflow] File {} belongs to a finished sequence; cancel ignored", fileIndex);
            return;
        }
        userCancelled_.insert(fileIndex);
    }

    Registry::workflow()->info("[Workflow] Cancelling file {}", fileIndex);
    engine_->cancelFile(fileIndex);
    pushEvent(Event::WAKE);
}

size_t Workflow::retryFailedParts(const std::optional<unsigned int> fileIndex) {
    const auto requeued = engine_->retryFailedParts(fileIndex);
    if (requeued) pushEvent(Event::WAKE);
    return requeued;
}

void Workflow::cancel() {
    if (cancelled_.exchange(true)) return;
    Registry::workflow()->warn("[Workflow] Cancelling upload of {} file(s)", request_.files.size());
    for (const auto& f : request_.files) engine_->cancelFile(f.index);
    pushEvent(Event::WAKE);
}

// ####################################################################################################
// ################################ State #############################################################
// ####################################################################################################

WorkflowStatus Workflow::status() const {
    WorkflowStatus s;
    {
        std::scoped_lock lock(mutex_);
        for (const auto& st : stages_ | std::views::values) s.stages.push_back(st);
    }
    s.sequences = coordinator_.records();

    const auto parts = engine_->snapshot();
    s.totalParts = parts.size();
    s.completedParts = std::ranges::count(parts, FilePart::Status::COMPLETED, &FilePart::status);

    s.running = running_;
    s.finished = finalFired_;
    s.cancelled = cancelled_;
    return s;
}

std::optional<UploadResult> Workflow::result() const {
    std::scoped_lock lock(mutex_);
    return result_;
}

std::vector<UploadSequence> Workflow::sequences() const {
    return sequencesCopy();
}

std::string Workflow::assetId() const {
    std::scoped_lock lock(mutex_);
    return assetId_;
}

std::vector<UploadSequence> Workflow::sequencesCopy() const {
    std::scoped_lock lock(mutex_);
    return sequences_;
}

void Workflow::setStage(const Stage stage, const StageStatus status, std::vector<std::string> errors) {
    bool changed;
    {
        std::scoped_lock lock(mutex_);
        auto& st = stages_.at(stage);
        changed = st.status != status;
        st.status = status;
        if (status == StageStatus::IN_PROGRESS || status == StageStatus::PENDING) st.errors.clear();
        if (!errors.empty()) st.errors = std::move(errors);
    }
    if (!changed) return;

    Registry::workflow()->debug("[Workflow] Stage {} -> {}", toString(stage), toString(status));
    if (callbacks_.onStage) callbacks_.onStage(stage, status);
}

StageStatus Workflow::stageStatus(const Stage stage) const {
    std::scoped_lock lock(mutex_);
    return stages_.at(stage).status;
}

bool Workflow::stageSettled(const Stage stage) const {
    const auto st = stageStatus(stage);
    return st == StageStatus::COMPLETED || st == StageStatus::SKIPPED;
}

void Workflow::notifySequence(const unsigned int sequenceId) {
    if (callbacks_.onSequence) callbacks_.onSequence(sequenceId, coordinator_.status(sequenceId));
}

// ####################################################################################################
// ################################ Events ############################################################
// ####################################################################################################

void Workflow::pushEvent(const Event e) {
    {
        std::scoped_lock lock(eventMutex_);
        events_.push_back(e);
    }
    eventCv_.notify_all();
}

void Workflow::waitForEvent() {
    std::unique_lock lock(eventMutex_);
    eventCv_.wait(lock, [this] { return !events_.empty(); });
}

void Workflow::drainEvents() {
    std::scoped_lock lock(eventMutex_);
    events_.clear();
}

bool Workflow::eventsPending() {
    std::scoped_lock lock(eventMutex_);
    return !events_.empty();
}
