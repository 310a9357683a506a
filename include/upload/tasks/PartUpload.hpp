#pragma once

#include "concurrency/Task.hpp"
#include "upload/model/FilePart.hpp"
#include "upload/retry.hpp"

#include <memory>
#include <string>

namespace cw::api { class PartTransport; }
namespace cw::fs { class FileHandle; }

namespace cw::upload {
class PartUploadEngine;
}

namespace cw::upload::tasks {

// Uploads one byte range with its own retry budget and reports the outcome to the engine.
struct PartUpload final : concurrency::Task {
    PartUploadEngine& engine;
    std::shared_ptr<api::PartTransport> transport;
    std::shared_ptr<const fs::FileHandle> handle;
    model::PartKey key;
    unsigned int sequenceId;
    uint64_t startByte;
    uint64_t endByte;
    std::string url;
    const RetryPolicy& policy;

    PartUpload(PartUploadEngine& engine,
               std::shared_ptr<api::PartTransport> transport,
               std::shared_ptr<const fs::FileHandle> handle,
               const model::FilePart& part,
               const RetryPolicy& policy);

    void operator()() override;
    [[nodiscard]] std::string describe() const override;
};

}
