#pragma once

#include "upload/CompletionBarrier.hpp"
#include "upload/PartPlanner.hpp"
#include "upload/model/FilePart.hpp"
#include "upload/model/SequenceInitResult.hpp"
#include "upload/model/UploadSequence.hpp"
#include "upload/retry.hpp"
#include "api/model/Upload.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace cw::api { class AssetApi; }

namespace cw::upload {

enum class SequenceStatus : uint8_t {
    PENDING,
    INIT_IN_PROGRESS,
    INIT_COMPLETED,
    INIT_FAILED,
    COMPLETION_IN_PROGRESS,
    COMPLETED,
    FAILED,
    SKIPPED
};

std::string_view toString(SequenceStatus s) noexcept;

struct SequenceRecord {
    unsigned int sequenceId = 0;
    bool preview = false;
    SequenceStatus status = SequenceStatus::PENDING;
    std::optional<model::SequenceInitResult> init;
    bool ambiguousSuccess = false;          // 503 on completion, may have succeeded server-side
    bool asynchronousProcessing = false;    // backend finishes large files in the background
    bool deferred = false;                  // preview waiting on the barrier
    std::string error;
    std::vector<api::model::FileResult> fileResults;
    std::set<unsigned int> cancelledFiles;

    // Completed or skipped; the workflow will not touch it again.
    [[nodiscard]] bool isSettled() const {
        return status == SequenceStatus::COMPLETED || status == SequenceStatus::SKIPPED;
    }
};

// Init/complete lifecycle for every sequence of one upload. Sole writer of sequence status.
class SequenceCoordinator {
public:
    SequenceCoordinator(std::shared_ptr<api::AssetApi> api, const PartPlanner& planner, RetryPolicy policy);

    void setAsset(std::string assetId, std::string databaseId);

    // Non-preview sequences become part of the preview barrier.
    void registerSequence(const model::UploadSequence& sequence);

    [[nodiscard]] api::model::InitializeUploadRequest buildInitRequest(const model::UploadSequence& sequence) const;

    // True on init-completed. Failures are recorded on the sequence, not thrown.
    bool initializeSequence(const model::UploadSequence& sequence);

    // Per-file {PartNumber, ETag} lists. Cancelled files get an empty list, never an omitted entry.
    [[nodiscard]] std::vector<api::model::CompleteFileRequest> buildFileParts(
        const model::UploadSequence& sequence,
        const std::vector<model::FilePart>& parts,
        const std::set<unsigned int>& cancelledFiles) const;

    // Previews report false without contacting the backend while the barrier is closed.
    [[nodiscard]] bool canComplete(const model::UploadSequence& sequence) const;

    // True when the sequence ends COMPLETED (ambiguous 503 included).
    bool completeSequence(const model::UploadSequence& sequence,
                          const std::vector<model::FilePart>& parts,
                          const std::set<unsigned int>& cancelledFiles);

    // Registers a one-shot callback for when the barrier opens and flags the sequence as deferred.
    void deferUntilBarrier(unsigned int sequenceId, CompletionBarrier::Listener resume);

    // User chose to continue without this sequence. Releases the barrier for it.
    void skip(unsigned int sequenceId);

    // INIT_FAILED -> PENDING, FAILED -> INIT_COMPLETED. Returns false for any other status.
    bool resetForRetry(unsigned int sequenceId);

    [[nodiscard]] SequenceStatus status(unsigned int sequenceId) const;
    [[nodiscard]] SequenceRecord record(unsigned int sequenceId) const;
    [[nodiscard]] std::vector<SequenceRecord> records() const;

    CompletionBarrier& barrier() { return barrier_; }

private:
    std::shared_ptr<api::AssetApi> api_;
    const PartPlanner& planner_;
    RetryPolicy policy_;
    std::string assetId_;
    std::string databaseId_;

    mutable std::mutex mutex_;
    std::map<unsigned int, SequenceRecord> records_;
    CompletionBarrier barrier_;

    void setStatus(unsigned int sequenceId, SequenceStatus status, std::string error = {});
    SequenceRecord& recordLocked(unsigned int sequenceId);
};

}
