#include "upload/PartPlanner.hpp"

#include <algorithm>
#include <stdexcept>

using namespace cw::upload;
using namespace cw::upload::model;

PartPlanner::PartPlanner(const config::UploadConfig& cfg)
    : partSize_(cfg.part_size), largePartSize_(cfg.large_part_size), largeFileThreshold_(cfg.large_file_threshold) {
    if (partSize_ == 0 || largePartSize_ == 0) throw std::invalid_argument("PartPlanner: part sizes must be non-zero");
}

uint64_t PartPlanner::chunkSizeFor(const uint64_t fileSize) const {
    return fileSize >= largeFileThreshold_ ? largePartSize_ : partSize_;
}

uint64_t PartPlanner::countParts(const uint64_t fileSize) const {
    if (fileSize == 0) return 0;
    const auto chunk = chunkSizeFor(fileSize);
    return (fileSize + chunk - 1) / chunk;
}

std::vector<PartInfo> PartPlanner::plan(const uint64_t fileSize) const {
    std::vector<PartInfo> parts;
    if (fileSize == 0) return parts;

    const auto chunk = chunkSizeFor(fileSize);
    parts.reserve(countParts(fileSize));

    unsigned int partNumber = 1;
    for (uint64_t start = 0; start < fileSize; start += chunk) {
        const uint64_t end = std::min(start + chunk, fileSize);
        parts.push_back({
            .partNumber = partNumber++,
            .startByte = start,
            .endByte = end,
            .size = end - start
        });
    }
    return parts;
}
