#pragma once

#include "upload/model/FileInfo.hpp"
#include "upload/model/PartInfo.hpp"

#include <algorithm>
#include <map>
#include <vector>

namespace cw::upload::model {

struct UploadSequence {
    unsigned int sequenceId = 0;
    std::vector<FileInfo> files;
    uint64_t totalSize = 0;
    uint64_t totalParts = 0;
    std::map<unsigned int, std::vector<PartInfo>> parts;   // file index -> parts

    // Preview-class sequences hold only inline or asset-level preview files.
    [[nodiscard]] bool isPreview() const {
        return !files.empty() && std::ranges::all_of(files, [](const FileInfo& f) {
            return f.isPreviewFile || f.assetPreview();
        });
    }

    [[nodiscard]] bool isAssetPreview() const {
        return !files.empty() && std::ranges::all_of(files, [](const FileInfo& f) { return f.assetPreview(); });
    }

    [[nodiscard]] const FileInfo* file(const unsigned int index) const {
        const auto it = std::ranges::find(files, index, &FileInfo::index);
        return it == files.end() ? nullptr : &*it;
    }

    bool operator==(const UploadSequence&) const = default;
};

}
