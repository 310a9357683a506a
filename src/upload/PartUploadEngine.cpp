#include "upload/PartUploadEngine.hpp"
#include "upload/tasks/PartUpload.hpp"
#include "concurrency/ThreadPool.hpp"
#include "api/PartTransport.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <ranges>
#include <stdexcept>
#include <fmt/core.h>

using namespace cw::upload;
using namespace cw::upload::model;
using namespace cw::log;

using Status = FilePart::Status;

PartUploadEngine::PartUploadEngine(std::shared_ptr<api::PartTransport> transport,
                                   const unsigned int poolSize,
                                   RetryPolicy policy,
                                   Callbacks callbacks)
    : transport_(std::move(transport)),
      poolSize_(poolSize),
      policy_(std::move(policy)),
      callbacks_(std::move(callbacks)) {
    if (!transport_) throw std::invalid_argument("PartUploadEngine requires a transport");
    if (poolSize_ == 0) throw std::invalid_argument("PartUploadEngine pool size must be at least 1");
    pool_ = std::make_unique<concurrency::ThreadPool>(poolSize_);
}

PartUploadEngine::~PartUploadEngine() {
    stop();
}

void PartUploadEngine::stop() {
    {
        std::scoped_lock lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
    }
    pool_->stop();
    idleCv_.notify_all();
}

void PartUploadEngine::addSequence(const UploadSequence& sequence, const SequenceInitResult& init) {
    Outbox out;
    {
        std::scoped_lock lock(mutex_);
        if (stopped_) throw std::runtime_error("PartUploadEngine::addSequence called after stop()");
        if (sequences_.contains(sequence.sequenceId))
            throw std::invalid_argument(fmt::format("sequence {} already registered", sequence.sequenceId));

        // Validate everything before touching the ledger.
        for (const auto& file : sequence.files) {
            const auto& planned = sequence.parts.at(file.index);
            if (planned.empty()) continue;
            if (!file.handle)
                throw std::invalid_argument(fmt::format("file {} ({}) has no file handle", file.index, file.name));
            const auto target = init.files.find(file.index);
            if (target == init.files.end())
                throw std::invalid_argument(fmt::format("no upload target for file {} ({})", file.index, file.name));
            for (const auto& p : planned)
                if (!target->second.partUrls.contains(p.partNumber))
                    throw std::invalid_argument(fmt::format("no upload url for file {} part {}", file.index, p.partNumber));
        }

        auto& st = sequences_[sequence.sequenceId];
        for (const auto& file : sequence.files) {
            st.files.insert(file.index);
            fileToSequence_[file.index] = sequence.sequenceId;
            handles_[file.index] = file.handle;

            // A file cancelled before its sequence was initialized never gets scheduled.
            const bool cancelled = cancelledFiles_.contains(file.index);
            for (const auto& p : sequence.parts.at(file.index)) {
                const PartKey key{file.index, p.partNumber};
                parts_[key] = FilePart{
                    .fileIndex = file.index,
                    .partNumber = p.partNumber,
                    .startByte = p.startByte,
                    .endByte = p.endByte,
                    .uploadUrl = init.files.at(file.index).partUrls.at(p.partNumber),
                    .status = cancelled ? Status::CANCELLED : Status::PENDING,
                    .sequenceId = sequence.sequenceId
                };
                st.keys.push_back(key);
                if (cancelled) continue;
                pendingBySequence_[sequence.sequenceId].push_back(key);
                ++pendingCount_;
            }
            touchFileLocked(file.index, out);
        }

        Registry::engine()->debug("[PartUploadEngine] Sequence {} registered with {} part(s)",
                                  sequence.sequenceId, st.keys.size());

        // A sequence of zero-byte files is terminal before anything is scheduled.
        checkSequenceLocked(sequence.sequenceId, out);
        pumpLocked();
        finishLocked(out);
    }
    deliver(out);
}

void PartUploadEngine::apply(const PartTransition& t) {
    Outbox out;
    {
        std::scoped_lock lock(mutex_);
        const auto it = parts_.find(t.key);
        if (it == parts_.end()) {
            Registry::engine()->error("[PartUploadEngine] Transition for unknown part file={} part={}",
                                      t.key.fileIndex, t.key.partNumber);
            return;
        }
        auto& part = it->second;

        if (t.to == Status::IN_PROGRESS) {
            // Retry bookkeeping from a worker that still owns the key.
            if (part.status != Status::IN_PROGRESS) return;
            ++part.retryCount;
            part.lastError = t.error;
            return;
        }

        running_.erase(t.key);

        if (part.status == Status::CANCELLED) {
            Registry::engine()->debug("[PartUploadEngine] Ignoring {} result for cancelled part file={} part={}",
                                      FilePart::toString(t.to), t.key.fileIndex, t.key.partNumber);
        } else {
            part.status = t.to;
            if (t.to == Status::COMPLETED) {
                part.etag = t.etag;
                part.lastError.clear();
            } else if (t.to == Status::FAILED) {
                part.lastError = t.error;
            }
            touchFileLocked(t.key.fileIndex, out);
        }

        checkSequenceLocked(part.sequenceId, out);
        pumpLocked();
        finishLocked(out);
    }
    deliver(out);
}

void PartUploadEngine::cancelFile(const unsigned int fileIndex) {
    Outbox out;
    {
        std::scoped_lock lock(mutex_);
        cancelledFiles_.insert(fileIndex);

        size_t cancelled = 0;
        for (auto it = parts_.lower_bound({fileIndex, 0}); it != parts_.end() && it->first.fileIndex == fileIndex; ++it) {
            auto& part = it->second;
            if (part.status == Status::PENDING) --pendingCount_;
            if (part.status == Status::PENDING || part.status == Status::IN_PROGRESS || part.status == Status::FAILED) {
                part.status = Status::CANCELLED;
                ++cancelled;
            }
        }

        Registry::engine()->info("[PartUploadEngine] File {} cancelled ({} part(s))", fileIndex, cancelled);

        if (const auto seq = fileToSequence_.find(fileIndex); seq != fileToSequence_.end()) {
            touchFileLocked(fileIndex, out);
            checkSequenceLocked(seq->second, out);
        }
        pumpLocked();
        finishLocked(out);
    }
    deliver(out);
}

size_t PartUploadEngine::retryFailedParts(const std::optional<unsigned int> fileIndex) {
    Outbox out;
    size_t requeued = 0;
    {
        std::scoped_lock lock(mutex_);
        for (auto& [key, part] : parts_) {
            if (fileIndex && key.fileIndex != *fileIndex) continue;
            if (part.status != Status::FAILED) continue;
            part.status = Status::PENDING;
            pendingBySequence_[part.sequenceId].push_back(key);
            ++pendingCount_;
            ++requeued;
            touchFileLocked(key.fileIndex, out);
        }

        if (requeued)
            Registry::engine()->info("[PartUploadEngine] Re-queued {} failed part(s){}", requeued,
                                     fileIndex ? fmt::format(" of file {}", *fileIndex) : std::string{});
        pumpLocked();
        finishLocked(out);
    }
    deliver(out);
    return requeued;
}

void PartUploadEngine::pumpLocked() {
    while (!stopped_ && running_.size() < poolSize_ && pendingCount_ > 0) {
        // Lowest sequence id with a live pending entry wins the slot.
        std::optional<PartKey> next;
        for (auto it = pendingBySequence_.begin(); it != pendingBySequence_.end() && !next;) {
            auto& queue = it->second;
            while (!queue.empty()) {
                const auto key = queue.front();
                queue.pop_front();
                if (parts_.at(key).status == Status::PENDING) {
                    next = key;
                    break;
                }
            }
            if (queue.empty()) it = pendingBySequence_.erase(it);
            else ++it;
        }
        if (!next) break;

        auto& part = parts_.at(*next);
        part.status = Status::IN_PROGRESS;
        --pendingCount_;
        running_.insert(*next);
        peakInFlight_ = std::max(peakInFlight_, static_cast<unsigned int>(running_.size()));

        pool_->submit(std::make_shared<tasks::PartUpload>(*this, transport_, handles_.at(part.fileIndex), part, policy_));
    }
}

void PartUploadEngine::checkSequenceLocked(const unsigned int sequenceId, Outbox& out) {
    const auto it = sequences_.find(sequenceId);
    if (it == sequences_.end() || it->second.completionFired) return;

    const bool terminal = std::ranges::all_of(it->second.keys, [this](const PartKey& k) {
        return parts_.at(k).isTerminal();
    });
    if (!terminal) return;

    it->second.completionFired = true;
    out.completedSequences.push_back(sequenceId);
    Registry::engine()->debug("[PartUploadEngine] Sequence {} reached a terminal state", sequenceId);
}

void PartUploadEngine::touchFileLocked(const unsigned int fileIndex, Outbox& out) const {
    out.filePercents[fileIndex] = filePercentLocked(fileIndex);
    out.progress = progressLocked();
}

void PartUploadEngine::finishLocked(Outbox& out) {
    out.idle = idleLocked();
    if (out.idle) idleCv_.notify_all();
}

void PartUploadEngine::deliver(const Outbox& out) {
    if (callbacks_.onProgress && out.progress) callbacks_.onProgress(out.progress->first, out.progress->second);
    if (callbacks_.onFileProgress)
        for (const auto& [file, pct] : out.filePercents) callbacks_.onFileProgress(file, pct);
    if (callbacks_.onSequenceComplete)
        for (const auto id : out.completedSequences) callbacks_.onSequenceComplete(id);
    if (callbacks_.onIdle && out.idle) callbacks_.onIdle();
}

bool PartUploadEngine::idleLocked() const {
    return running_.empty() && pendingCount_ == 0;
}

double PartUploadEngine::filePercentLocked(const unsigned int fileIndex) const {
    uint64_t total = 0, done = 0;
    for (auto it = parts_.lower_bound({fileIndex, 0}); it != parts_.end() && it->first.fileIndex == fileIndex; ++it) {
        total += it->second.size();
        if (it->second.status == Status::COMPLETED) done += it->second.size();
    }
    // Zero-byte files have nothing to transfer.
    if (total == 0) return 100.0;
    return 100.0 * static_cast<double>(done) / static_cast<double>(total);
}

std::pair<uint64_t, uint64_t> PartUploadEngine::progressLocked() const {
    const auto done = std::ranges::count_if(parts_, [](const auto& kv) {
        return kv.second.status == Status::COMPLETED;
    });
    return {static_cast<uint64_t>(done), parts_.size()};
}

void PartUploadEngine::waitIdle() {
    std::unique_lock lock(mutex_);
    idleCv_.wait(lock, [this] { return stopped_ || idleLocked(); });
}

bool PartUploadEngine::waitIdleFor(const std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return idleCv_.wait_for(lock, timeout, [this] { return stopped_ || idleLocked(); }) && idleLocked();
}

bool PartUploadEngine::isIdle() const {
    std::scoped_lock lock(mutex_);
    return idleLocked();
}

bool PartUploadEngine::isFileCancelled(const unsigned int fileIndex) const {
    std::scoped_lock lock(mutex_);
    return cancelledFiles_.contains(fileIndex);
}

bool PartUploadEngine::isSequenceTerminal(const unsigned int sequenceId) const {
    std::scoped_lock lock(mutex_);
    const auto it = sequences_.find(sequenceId);
    if (it == sequences_.end()) return false;
    return std::ranges::all_of(it->second.keys, [this](const PartKey& k) { return parts_.at(k).isTerminal(); });
}

std::vector<FilePart> PartUploadEngine::snapshot() const {
    std::scoped_lock lock(mutex_);
    std::vector<FilePart> out;
    out.reserve(parts_.size());
    for (const auto& part : parts_ | std::views::values) out.push_back(part);
    return out;
}

std::vector<FilePart> PartUploadEngine::partsForFile(const unsigned int fileIndex) const {
    std::scoped_lock lock(mutex_);
    std::vector<FilePart> out;
    for (auto it = parts_.lower_bound({fileIndex, 0}); it != parts_.end() && it->first.fileIndex == fileIndex; ++it)
        out.push_back(it->second);
    return out;
}

std::vector<FilePart> PartUploadEngine::partsForSequence(const unsigned int sequenceId) const {
    std::scoped_lock lock(mutex_);
    std::vector<FilePart> out;
    const auto it = sequences_.find(sequenceId);
    if (it == sequences_.end()) return out;
    for (const auto& k : it->second.keys) out.push_back(parts_.at(k));
    return out;
}

std::set<unsigned int> PartUploadEngine::cancelledFiles() const {
    std::scoped_lock lock(mutex_);
    return cancelledFiles_;
}

std::set<unsigned int> PartUploadEngine::filesWithFailedParts() const {
    std::scoped_lock lock(mutex_);
    std::set<unsigned int> out;
    for (const auto& [key, part] : parts_)
        if (part.status == Status::FAILED) out.insert(key.fileIndex);
    return out;
}

unsigned int PartUploadEngine::inFlight() const {
    std::scoped_lock lock(mutex_);
    return static_cast<unsigned int>(running_.size());
}

unsigned int PartUploadEngine::peakInFlight() const {
    std::scoped_lock lock(mutex_);
    return peakInFlight_;
}
