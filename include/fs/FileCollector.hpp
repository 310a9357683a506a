#pragma once

#include "upload/model/FileInfo.hpp"

#include <filesystem>
#include <functional>
#include <vector>

namespace cw::fs {

// Turns command-line paths into indexed FileInfo entries. Directories contribute every regular
// file below them with a path relative to the directory; plain files use their own name.
class FileCollector {
public:
    explicit FileCollector(bool recursive = true);

    [[nodiscard]] std::vector<upload::model::FileInfo> collect(
        const std::vector<std::filesystem::path>& roots,
        const std::function<bool(const std::filesystem::directory_entry&)>& filter = nullptr) const;

    // The single asset-level preview, addressed by the reserved index.
    [[nodiscard]] static upload::model::FileInfo assetPreview(const std::filesystem::path& path);

private:
    bool recursive_;
};

}
