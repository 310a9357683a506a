#pragma once

#include "upload/model/PartInfo.hpp"
#include "config/Config.hpp"

#include <cstdint>
#include <vector>

namespace cw::upload {

class PartPlanner {
public:
    explicit PartPlanner(const config::UploadConfig& cfg);

    [[nodiscard]] uint64_t chunkSizeFor(uint64_t fileSize) const;
    [[nodiscard]] uint64_t countParts(uint64_t fileSize) const;
    [[nodiscard]] std::vector<model::PartInfo> plan(uint64_t fileSize) const;

private:
    uint64_t partSize_;
    uint64_t largePartSize_;
    uint64_t largeFileThreshold_;
};

}
