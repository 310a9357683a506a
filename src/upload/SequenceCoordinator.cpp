#include "upload/SequenceCoordinator.hpp"
#include "api/AssetApi.hpp"
#include "api/HttpError.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <ranges>
#include <stdexcept>
#include <fmt/core.h>
#include <fmt/ranges.h>

using namespace cw::upload;
using namespace cw::upload::model;
using namespace cw::api::model;
using namespace cw::log;

std::string_view cw::upload::toString(const SequenceStatus s) noexcept {
    switch (s) {
        case SequenceStatus::PENDING: return "pending";
        case SequenceStatus::INIT_IN_PROGRESS: return "init-in-progress";
        case SequenceStatus::INIT_COMPLETED: return "init-completed";
        case SequenceStatus::INIT_FAILED: return "init-failed";
        case SequenceStatus::COMPLETION_IN_PROGRESS: return "completion-in-progress";
        case SequenceStatus::COMPLETED: return "completed";
        case SequenceStatus::FAILED: return "failed";
        case SequenceStatus::SKIPPED: return "skipped";
        default: return "unknown";
    }
}

SequenceCoordinator::SequenceCoordinator(std::shared_ptr<api::AssetApi> api, const PartPlanner& planner, RetryPolicy policy)
    : api_(std::move(api)), planner_(planner), policy_(std::move(policy)) {
    if (!api_) throw std::invalid_argument("SequenceCoordinator requires an AssetApi");
}

void SequenceCoordinator::setAsset(std::string assetId, std::string databaseId) {
    std::scoped_lock lock(mutex_);
    assetId_ = std::move(assetId);
    databaseId_ = std::move(databaseId);
}

void SequenceCoordinator::registerSequence(const UploadSequence& sequence) {
    {
        std::scoped_lock lock(mutex_);
        if (records_.contains(sequence.sequenceId))
            throw std::invalid_argument(fmt::format("sequence {} already registered", sequence.sequenceId));
        records_[sequence.sequenceId] = SequenceRecord{
            .sequenceId = sequence.sequenceId,
            .preview = sequence.isPreview()
        };
    }
    if (!sequence.isPreview()) barrier_.expect(sequence.sequenceId);
}

InitializeUploadRequest SequenceCoordinator::buildInitRequest(const UploadSequence& sequence) const {
    InitializeUploadRequest req;
    {
        std::scoped_lock lock(mutex_);
        req.assetId = assetId_;
        req.databaseId = databaseId_;
    }
    req.uploadType = sequence.isAssetPreview() ? UploadType::AssetPreview : UploadType::AssetFile;
    req.files.reserve(sequence.files.size());
    for (const auto& f : sequence.files)
        req.files.push_back({
            .relativeKey = f.relativeKey(),
            .file_size = f.size,
            .num_parts = planner_.countParts(f.size)
        });
    return req;
}

bool SequenceCoordinator::initializeSequence(const UploadSequence& sequence) {
    const auto id = sequence.sequenceId;
    setStatus(id, SequenceStatus::INIT_IN_PROGRESS);

    try {
        const auto req = buildInitRequest(sequence);
        const auto res = withRetry(Phase::SequenceInit, policy_, fmt::format("initialize sequence {}", id), [&] {
            return api_->initializeUpload(req);
        });

        SequenceInitResult init{.uploadId = res.uploadId};
        for (const auto& f : sequence.files) {
            const auto key = f.relativeKey();
            const auto it = std::ranges::find(res.files, key, &UploadFileResponse::relativeKey);
            if (it == res.files.end())
                throw std::runtime_error(fmt::format("initialize response has no entry for {}", key));

            FileUploadTarget target{
                .relativeKey = key,
                .uploadIdS3 = it->uploadIdS3,
                .numParts = it->numParts
            };
            for (const auto& url : it->partUploadUrls) target.partUrls[url.partNumber] = url.uploadUrl;

            const auto& planned = sequence.parts.at(f.index);
            if (target.partUrls.size() != planned.size())
                throw std::runtime_error(fmt::format("{}: expected {} upload url(s), backend returned {}",
                                                     key, planned.size(), target.partUrls.size()));
            for (const auto& p : planned)
                if (!target.partUrls.contains(p.partNumber))
                    throw std::runtime_error(fmt::format("{}: backend returned no url for part {}", key, p.partNumber));
            init.files[f.index] = std::move(target);
        }

        {
            std::scoped_lock lock(mutex_);
            auto& rec = recordLocked(id);
            rec.init = std::move(init);
            rec.status = SequenceStatus::INIT_COMPLETED;
            rec.error.clear();
        }
        Registry::sequence()->info("[SequenceCoordinator] Sequence {} initialized (uploadId {}, {} file(s))",
                                   id, res.uploadId, sequence.files.size());
        return true;
    } catch (const std::exception& e) {
        Registry::sequence()->error("[SequenceCoordinator] Sequence {} failed to initialize: {}", id, e.what());
        setStatus(id, SequenceStatus::INIT_FAILED, e.what());
        return false;
    }
}

std::vector<CompleteFileRequest> SequenceCoordinator::buildFileParts(const UploadSequence& sequence,
                                                                     const std::vector<FilePart>& parts,
                                                                     const std::set<unsigned int>& cancelledFiles) const {
    const auto rec = record(sequence.sequenceId);
    if (!rec.init) throw std::logic_error(fmt::format("sequence {} has not been initialized", sequence.sequenceId));

    std::vector<CompleteFileRequest> files;
    files.reserve(sequence.files.size());

    for (const auto& f : sequence.files) {
        const auto& target = rec.init->files.at(f.index);
        CompleteFileRequest file{.relativeKey = target.relativeKey, .uploadIdS3 = target.uploadIdS3};

        if (!cancelledFiles.contains(f.index)) {
            for (const auto& p : parts)
                if (p.fileIndex == f.index && p.status == FilePart::Status::COMPLETED)
                    file.parts.push_back({.partNumber = p.partNumber, .etag = p.etag});
            std::ranges::sort(file.parts, {}, &CompletedPart::partNumber);
        }

        files.push_back(std::move(file));
    }
    return files;
}

bool SequenceCoordinator::canComplete(const UploadSequence& sequence) const {
    return !sequence.isPreview() || barrier_.isOpen();
}

bool SequenceCoordinator::completeSequence(const UploadSequence& sequence,
                                           const std::vector<FilePart>& parts,
                                           const std::set<unsigned int>& cancelledFiles) {
    const auto id = sequence.sequenceId;
    if (!canComplete(sequence)) {
        Registry::sequence()->debug("[SequenceCoordinator] Preview sequence {} waits for the barrier", id);
        return false;
    }

    const auto rec = record(id);
    if (rec.status != SequenceStatus::INIT_COMPLETED)
        throw std::logic_error(fmt::format("sequence {} cannot complete from status {}", id, toString(rec.status)));

    setStatus(id, SequenceStatus::COMPLETION_IN_PROGRESS);

    CompleteUploadRequest req;
    {
        std::scoped_lock lock(mutex_);
        req.assetId = assetId_;
        req.databaseId = databaseId_;
    }
    req.uploadType = sequence.isAssetPreview() ? UploadType::AssetPreview : UploadType::AssetFile;

    bool completed = false;
    try {
        req.files = buildFileParts(sequence, parts, cancelledFiles);
        const auto res = withRetry(Phase::SequenceComplete, policy_, fmt::format("complete sequence {}", id), [&] {
            return api_->completeUpload(rec.init->uploadId, req);
        });

        {
            std::scoped_lock lock(mutex_);
            auto& r = recordLocked(id);
            r.status = SequenceStatus::COMPLETED;
            r.fileResults = res.fileResults;
            r.asynchronousProcessing = res.largeFileAsynchronousHandling;
            r.cancelledFiles = cancelledFiles;
            r.deferred = false;
            if (!res.overallSuccess) r.error = res.message;
        }

        if (res.overallSuccess)
            Registry::sequence()->info("[SequenceCoordinator] Sequence {} completed", id);
        else
            Registry::sequence()->warn("[SequenceCoordinator] Sequence {} completed with file errors: {}", id, res.message);
        completed = true;
    } catch (const api::HttpError& e) {
        if (classify(e.status(), Phase::SequenceComplete) == ErrorClass::AmbiguousTimeout) {
            Registry::sequence()->warn("[SequenceCoordinator] Sequence {} completion returned 503; "
                                       "treating as success, verify the asset later", id);
            std::scoped_lock lock(mutex_);
            auto& r = recordLocked(id);
            r.status = SequenceStatus::COMPLETED;
            r.ambiguousSuccess = true;
            r.asynchronousProcessing = true;
            r.cancelledFiles = cancelledFiles;
            r.deferred = false;
            completed = true;
        } else {
            setStatus(id, SequenceStatus::FAILED, e.what());
        }
    } catch (const std::exception& e) {
        Registry::sequence()->error("[SequenceCoordinator] Sequence {} failed to complete: {}", id, e.what());
        setStatus(id, SequenceStatus::FAILED, e.what());
    }

    if (completed && !rec.preview) barrier_.signal(id);
    return completed;
}

void SequenceCoordinator::deferUntilBarrier(const unsigned int sequenceId, CompletionBarrier::Listener resume) {
    {
        std::scoped_lock lock(mutex_);
        auto& r = recordLocked(sequenceId);
        if (r.deferred) return;
        r.deferred = true;
    }
    Registry::sequence()->info("[SequenceCoordinator] Preview sequence {} deferred until sequence(s) {} complete",
                               sequenceId, fmt::join(barrier_.outstanding(), ", "));
    barrier_.subscribe(std::move(resume));
}

void SequenceCoordinator::skip(const unsigned int sequenceId) {
    bool preview;
    {
        std::scoped_lock lock(mutex_);
        auto& r = recordLocked(sequenceId);
        if (r.status == SequenceStatus::COMPLETED) return;
        r.status = SequenceStatus::SKIPPED;
        r.deferred = false;
        preview = r.preview;
    }
    Registry::sequence()->warn("[SequenceCoordinator] Sequence {} skipped", sequenceId);
    if (!preview) barrier_.signal(sequenceId);
}

bool SequenceCoordinator::resetForRetry(const unsigned int sequenceId) {
    std::scoped_lock lock(mutex_);
    auto& r = recordLocked(sequenceId);
    switch (r.status) {
        case SequenceStatus::INIT_FAILED:
            r.status = SequenceStatus::PENDING;
            break;
        case SequenceStatus::FAILED:
            r.status = SequenceStatus::INIT_COMPLETED;
            break;
        default:
            return false;
    }
    r.error.clear();
    return true;
}

SequenceStatus SequenceCoordinator::status(const unsigned int sequenceId) const {
    std::scoped_lock lock(mutex_);
    const auto it = records_.find(sequenceId);
    if (it == records_.end()) throw std::out_of_range(fmt::format("unknown sequence {}", sequenceId));
    return it->second.status;
}

SequenceRecord SequenceCoordinator::record(const unsigned int sequenceId) const {
    std::scoped_lock lock(mutex_);
    const auto it = records_.find(sequenceId);
    if (it == records_.end()) throw std::out_of_range(fmt::format("unknown sequence {}", sequenceId));
    return it->second;
}

std::vector<SequenceRecord> SequenceCoordinator::records() const {
    std::scoped_lock lock(mutex_);
    std::vector<SequenceRecord> out;
    out.reserve(records_.size());
    for (const auto& r : records_ | std::views::values) out.push_back(r);
    return out;
}

void SequenceCoordinator::setStatus(const unsigned int sequenceId, const SequenceStatus status, std::string error) {
    std::scoped_lock lock(mutex_);
    auto& r = recordLocked(sequenceId);
    r.status = status;
    if (!error.empty()) r.error = std::move(error);
}

SequenceRecord& SequenceCoordinator::recordLocked(const unsigned int sequenceId) {
    const auto it = records_.find(sequenceId);
    if (it == records_.end()) throw std::out_of_range(fmt::format("unknown sequence {}", sequenceId));
    return it->second;
}
