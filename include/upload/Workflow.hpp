#pragma once

#include "upload/SequencePlanner.hpp"
#include "upload/SequenceCoordinator.hpp"
#include "upload/PartUploadEngine.hpp"
#include "upload/retry.hpp"
#include "api/model/Asset.hpp"
#include "config/Config.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace cw::api {
class AssetApi;
class PartTransport;
}

namespace cw::upload {

struct AssetLinkSpec {
    enum class Role : uint8_t {
        PARENT,     // the other asset is the parent of the uploaded one
        CHILD,      // the other asset is a child of the uploaded one
        RELATED
    };

    Role role = Role::RELATED;
    std::string assetId;
    std::string databaseId;
    std::vector<std::string> tags;
    std::vector<api::model::LinkMetadataEntry> metadata;
};

struct UploadRequest {
    std::string databaseId;
    std::optional<std::string> existingAssetId;
    std::string assetName;
    std::string description;
    bool isDistributable = true;
    std::vector<std::string> tags;
    api::model::Metadata metadata;
    std::vector<AssetLinkSpec> links;
    std::vector<model::FileInfo> files;
};

enum class Stage : uint8_t {
    ASSET_CREATION,
    METADATA,
    ASSET_LINKS,
    PLANNING,
    SEQUENCE_INIT,
    PART_UPLOAD,
    SEQUENCE_COMPLETION,
    FINALIZE
};

enum class StageStatus : uint8_t {
    PENDING,
    IN_PROGRESS,
    COMPLETED,
    FAILED,
    SKIPPED
};

std::string_view toString(Stage s) noexcept;
std::string_view toString(StageStatus s) noexcept;

struct StageState {
    Stage stage = Stage::ASSET_CREATION;
    StageStatus status = StageStatus::PENDING;
    std::vector<std::string> errors;
};

struct UploadResult {
    std::string assetId;
    size_t totalFiles = 0;
    size_t uploadedFiles = 0;
    size_t cancelledFiles = 0;
    size_t failedFiles = 0;
    size_t skippedFiles = 0;
    bool overallSuccess = false;
    bool ambiguousSuccess = false;
    bool asynchronousProcessing = false;
    std::vector<SequenceRecord> sequences;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;

    // e.g. "7 of 8 files uploaded; 1 cancelled"
    [[nodiscard]] std::string summary() const;
};

struct WorkflowStatus {
    std::vector<StageState> stages;
    std::vector<SequenceRecord> sequences;
    uint64_t completedParts = 0;
    uint64_t totalParts = 0;
    bool running = false;
    bool finished = false;
    bool cancelled = false;

    [[nodiscard]] const StageState& stage(Stage s) const;
    // Finished is false and nothing is running: a stage needs a retry or a skip.
    [[nodiscard]] bool needsAttention() const { return !running && !finished; }
};

// Drives one upload end to end. run() returns when the upload has finished or when it cannot make
// progress without a retry/skip decision; retryStage()/skipStage() apply the decision and resume.
class Workflow {
public:
    struct Callbacks {
        std::function<void(Stage, StageStatus)> onStage;
        std::function<void(uint64_t completedParts, uint64_t totalParts)> onProgress;
        std::function<void(unsigned int fileIndex, double percent)> onFileProgress;
        std::function<void(unsigned int sequenceId, SequenceStatus)> onSequence;
        std::function<void(const UploadResult&)> onComplete;   // exactly once
    };

    Workflow(const config::Config& cfg,
             std::shared_ptr<api::AssetApi> api,
             std::shared_ptr<api::PartTransport> transport,
             UploadRequest request,
             Callbacks callbacks = {},
             Sleeper sleeper = realSleep);

    ~Workflow();

    Workflow(const Workflow&) = delete;
    Workflow& operator=(const Workflow&) = delete;

    WorkflowStatus run();

    // Both throw std::logic_error while run() is active.
    WorkflowStatus retryStage(Stage stage);
    WorkflowStatus skipStage(Stage stage);

    // Safe to call from any thread, including while run() is active.
    void cancelFile(unsigned int fileIndex);
    size_t retryFailedParts(std::optional<unsigned int> fileIndex = std::nullopt);
    void cancel();

    [[nodiscard]] WorkflowStatus status() const;
    [[nodiscard]] std::optional<UploadResult> result() const;
    [[nodiscard]] std::vector<model::UploadSequence> sequences() const;
    [[nodiscard]] std::string assetId() const;

private:
    enum class Event : uint8_t { SEQUENCE_READY, BARRIER_OPENED, ENGINE_IDLE, WAKE };

    UploadRequest request_;
    Callbacks callbacks_;
    std::shared_ptr<api::AssetApi> api_;
    RetryPolicy requestPolicy_;
    SequencePlanner planner_;
    SequenceCoordinator coordinator_;

    mutable std::mutex mutex_;
    std::map<Stage, StageState> stages_;
    std::vector<model::UploadSequence> sequences_;
    std::map<unsigned int, unsigned int> fileToSequence_;
    std::string assetId_;
    std::map<size_t, std::string> createdLinks_;                 // index into request_.links -> asset link id
    std::set<std::pair<size_t, size_t>> linkMetadataDone_;
    std::set<unsigned int> userCancelled_;
    std::set<unsigned int> skippedFiles_;
    std::optional<UploadResult> result_;

    std::atomic<bool> running_{false};
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> finalFired_{false};

    std::mutex eventMutex_;
    std::condition_variable eventCv_;
    std::deque<Event> events_;

    // Last member: its workers call back into the event queue above.
    std::unique_ptr<PartUploadEngine> engine_;

    void setStage(Stage stage, StageStatus status, std::vector<std::string> errors = {});
    [[nodiscard]] StageStatus stageStatus(Stage stage) const;
    [[nodiscard]] bool stageSettled(Stage stage) const;

    bool runAssetCreation();
    void runMetadata();
    void runAssetLinks();
    bool runPlanning();
    void runSequenceInit();
    void drive();
    bool completeReadySequences();
    void refreshUploadStages();
    [[nodiscard]] bool allSequencesSettled() const;
    [[nodiscard]] bool sideStageFailed() const;
    void skipRemainingForCancel();
    void finalize();
    [[nodiscard]] UploadResult buildResult() const;
    [[nodiscard]] std::vector<model::UploadSequence> sequencesCopy() const;
    void notifySequence(unsigned int sequenceId);

    void pushEvent(Event e);
    void waitForEvent();
    void drainEvents();
    [[nodiscard]] bool eventsPending();
};

}
