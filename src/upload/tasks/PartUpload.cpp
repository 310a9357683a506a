#include "upload/tasks/PartUpload.hpp"
#include "upload/PartUploadEngine.hpp"
#include "api/PartTransport.hpp"
#include "api/HttpError.hpp"
#include "fs/FileHandle.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

using namespace cw::upload;
using namespace cw::upload::tasks;
using namespace cw::upload::model;
using namespace cw::log;

PartUpload::PartUpload(PartUploadEngine& engine,
                       std::shared_ptr<api::PartTransport> transport,
                       std::shared_ptr<const fs::FileHandle> handle,
                       const FilePart& part,
                       const RetryPolicy& policy)
    : engine(engine), transport(std::move(transport)), handle(std::move(handle)),
      key{part.fileIndex, part.partNumber}, sequenceId(part.sequenceId),
      startByte(part.startByte), endByte(part.endByte), url(part.uploadUrl), policy(policy) {}

void PartUpload::operator()() {
    for (unsigned int attempt = 0;; ++attempt) {
        if (engine.isFileCancelled(key.fileIndex)) {
            engine.apply({.key = key, .to = FilePart::Status::CANCELLED});
            return;
        }

        try {
            auto etag = transport->putPart(url, {.file = handle, .start = startByte, .end = endByte});
            Registry::engine()->debug("[PartUpload] file={} part={} seq={} uploaded ({} bytes, etag {})",
                                      key.fileIndex, key.partNumber, sequenceId, endByte - startByte, etag);
            engine.apply({.key = key, .to = FilePart::Status::COMPLETED, .etag = std::move(etag)});
            return;
        } catch (const api::HttpError& e) {
            if (attempt + 1 >= policy.maxAttempts) {
                Registry::engine()->error("[PartUpload] file={} part={} failed after {} attempt(s): {}",
                                          key.fileIndex, key.partNumber, attempt + 1, e.what());
                engine.apply({.key = key, .to = FilePart::Status::FAILED, .error = e.what()});
                return;
            }

            const auto cls = classify(e.status(), Phase::PartUpload);
            const auto delay = policy.delayFor(cls, attempt);
            Registry::engine()->warn("[PartUpload] file={} part={} attempt {}/{} failed ({}): {}, retrying in {}ms",
                                     key.fileIndex, key.partNumber, attempt + 1, policy.maxAttempts,
                                     toString(cls), e.what(), delay.count());
            engine.apply({.key = key, .to = FilePart::Status::IN_PROGRESS, .error = e.what()});
            policy.sleep(delay);
        } catch (const std::exception& e) {
            // Local read failures do not get better with retries.
            Registry::engine()->error("[PartUpload] file={} part={} could not be read from {}: {}",
                                      key.fileIndex, key.partNumber, handle->describe(), e.what());
            engine.apply({.key = key, .to = FilePart::Status::FAILED, .error = e.what()});
            return;
        }
    }
}

std::string PartUpload::describe() const {
    return fmt::format("part {} of file {} (sequence {})", key.partNumber, key.fileIndex, sequenceId);
}
