#pragma once

#include "upload/model/FilePart.hpp"
#include "upload/model/UploadSequence.hpp"
#include "upload/model/SequenceInitResult.hpp"
#include "upload/retry.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace cw::api { class PartTransport; }
namespace cw::concurrency { class ThreadPool; }

namespace cw::upload {

namespace tasks { struct PartUpload; }

// A worker's report for one ledger key. The engine is the only writer of FilePart state.
struct PartTransition {
    model::PartKey key;
    model::FilePart::Status to = model::FilePart::Status::PENDING;
    std::string etag;
    std::string error;
};

class PartUploadEngine {
public:
    struct Callbacks {
        std::function<void(uint64_t completedParts, uint64_t totalParts)> onProgress;
        std::function<void(unsigned int fileIndex, double percent)> onFileProgress;
        std::function<void(unsigned int sequenceId)> onSequenceComplete;   // once per sequence
        std::function<void()> onIdle;   // nothing pending and nothing in flight
    };

    PartUploadEngine(std::shared_ptr<api::PartTransport> transport,
                     unsigned int poolSize,
                     RetryPolicy policy,
                     Callbacks callbacks = {});

    ~PartUploadEngine();

    PartUploadEngine(const PartUploadEngine&) = delete;
    PartUploadEngine& operator=(const PartUploadEngine&) = delete;

    // Creates the sequence's parts in PENDING and starts scheduling them.
    // Throws std::invalid_argument when the init result lacks a url for a planned part.
    void addSequence(const model::UploadSequence& sequence, const model::SequenceInitResult& init);

    // PENDING, IN_PROGRESS and FAILED parts of the file become CANCELLED. No network traffic.
    void cancelFile(unsigned int fileIndex);

    // FAILED parts go back to PENDING; siblings are untouched. Returns the number re-queued.
    size_t retryFailedParts(std::optional<unsigned int> fileIndex = std::nullopt);

    void waitIdle();
    bool waitIdleFor(std::chrono::milliseconds timeout);

    [[nodiscard]] bool isIdle() const;
    [[nodiscard]] bool isFileCancelled(unsigned int fileIndex) const;
    [[nodiscard]] bool isSequenceTerminal(unsigned int sequenceId) const;

    [[nodiscard]] std::vector<model::FilePart> snapshot() const;
    [[nodiscard]] std::vector<model::FilePart> partsForFile(unsigned int fileIndex) const;
    [[nodiscard]] std::vector<model::FilePart> partsForSequence(unsigned int sequenceId) const;
    [[nodiscard]] std::set<unsigned int> cancelledFiles() const;
    [[nodiscard]] std::set<unsigned int> filesWithFailedParts() const;

    [[nodiscard]] unsigned int poolSize() const { return poolSize_; }
    [[nodiscard]] unsigned int inFlight() const;
    [[nodiscard]] unsigned int peakInFlight() const;

    // Cancels nothing; drops queued work and joins the workers.
    void stop();

private:
    friend struct tasks::PartUpload;

    struct SequenceState {
        std::vector<model::PartKey> keys;
        std::set<unsigned int> files;
        bool completionFired = false;
    };

    std::shared_ptr<api::PartTransport> transport_;
    unsigned int poolSize_;
    RetryPolicy policy_;
    Callbacks callbacks_;
    std::unique_ptr<concurrency::ThreadPool> pool_;

    mutable std::mutex mutex_;
    std::condition_variable idleCv_;
    std::map<model::PartKey, model::FilePart> parts_;
    std::map<unsigned int, std::shared_ptr<const fs::FileHandle>> handles_;
    std::map<unsigned int, std::deque<model::PartKey>> pendingBySequence_;   // lowest id drains first
    std::map<unsigned int, SequenceState> sequences_;
    std::map<unsigned int, unsigned int> fileToSequence_;
    std::set<unsigned int> cancelledFiles_;
    std::set<model::PartKey> running_;   // claimed by a worker, result not yet applied
    size_t pendingCount_ = 0;
    unsigned int peakInFlight_ = 0;
    bool stopped_ = false;

    // Notifications gathered under the lock and delivered after it is released.
    struct Outbox {
        std::vector<unsigned int> completedSequences;
        std::map<unsigned int, double> filePercents;
        std::optional<std::pair<uint64_t, uint64_t>> progress;
        bool idle = false;
    };

    void apply(const PartTransition& t);
    void pumpLocked();
    void checkSequenceLocked(unsigned int sequenceId, Outbox& out);
    void touchFileLocked(unsigned int fileIndex, Outbox& out) const;
    void finishLocked(Outbox& out);
    void deliver(const Outbox& out);

    [[nodiscard]] bool idleLocked() const;
    [[nodiscard]] double filePercentLocked(unsigned int fileIndex) const;
    [[nodiscard]] std::pair<uint64_t, uint64_t> progressLocked() const;
};

}
