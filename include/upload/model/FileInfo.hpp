#pragma once

#include "fs/FileHandle.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace cw::upload::model {

// Index reserved for the single asset-level preview file.
constexpr static unsigned int kAssetPreviewIndex = 99999;

struct FileInfo {
    unsigned int index = 0;
    std::string name;
    uint64_t size = 0;
    std::string relativePath;
    bool isPreviewFile = false;
    bool isAssetPreview = false;
    std::shared_ptr<const fs::FileHandle> handle;

    [[nodiscard]] bool assetPreview() const { return isAssetPreview || index == kAssetPreviewIndex; }

    // Key sent to the backend: the asset-level preview is addressed by its bare name.
    [[nodiscard]] const std::string& relativeKey() const { return assetPreview() ? name : relativePath; }

    bool operator==(const FileInfo& o) const {
        return index == o.index && name == o.name && size == o.size && relativePath == o.relativePath &&
               isPreviewFile == o.isPreviewFile && isAssetPreview == o.isAssetPreview;
    }
};

}
