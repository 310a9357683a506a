#include "fs/FileCollector.hpp"
#include "fs/FileHandle.hpp"
#include "upload/SequencePlanner.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <fmt/core.h>

using namespace cw::fs;
using namespace cw::upload;
using namespace cw::upload::model;
using namespace cw::log;

namespace stdfs = std::filesystem;

namespace {

FileInfo makeInfo(const stdfs::path& path, const std::string& relative, const unsigned int index) {
    auto handle = std::make_shared<const LocalFileHandle>(path);
    const auto name = path.filename().string();
    return FileInfo{
        .index = index,
        .name = name,
        .size = handle->size(),
        .relativePath = relative,
        .isPreviewFile = SequencePlanner::isPreviewFileName(name),
        .handle = std::move(handle)
    };
}

}

FileCollector::FileCollector(const bool recursive) : recursive_(recursive) {}

std::vector<FileInfo> FileCollector::collect(
    const std::vector<stdfs::path>& roots,
    const std::function<bool(const stdfs::directory_entry&)>& filter) const {
    std::vector<FileInfo> files;
    unsigned int index = 0;

    for (const auto& root : roots) {
        if (!stdfs::exists(root)) throw std::invalid_argument(fmt::format("no such file or directory: {}", root.string()));

        if (stdfs::is_regular_file(root)) {
            files.push_back(makeInfo(root, root.filename().string(), index++));
            continue;
        }

        if (!stdfs::is_directory(root))
            throw std::invalid_argument(fmt::format("not a regular file or directory: {}", root.string()));

        std::vector<stdfs::path> found;
        const auto visit = [&](const stdfs::directory_entry& entry) {
            if (!entry.is_regular_file()) return;
            if (filter && !filter(entry)) return;
            found.push_back(entry.path());
        };

        if (recursive_)
            for (const auto& entry : stdfs::recursive_directory_iterator(root, stdfs::directory_options::skip_permission_denied))
                visit(entry);
        else
            for (const auto& entry : stdfs::directory_iterator(root)) visit(entry);

        // With several roots, keys carry the directory name so textures/README and meshes/README stay apart.
        std::string prefix;
        if (roots.size() > 1) {
            auto base = root.lexically_normal();
            if (!base.has_filename()) base = base.parent_path();
            prefix = base.filename().generic_string() + "/";
        }

        // Directory iteration order is unspecified; keep indices stable between runs.
        std::ranges::sort(found);
        for (const auto& path : found)
            files.push_back(makeInfo(path, prefix + path.lexically_relative(root).generic_string(), index++));
    }

    Registry::chunkwise()->debug("[FileCollector] Collected {} file(s) from {} root(s)", files.size(), roots.size());
    return files;
}

FileInfo FileCollector::assetPreview(const stdfs::path& path) {
    if (!stdfs::is_regular_file(path))
        throw std::invalid_argument(fmt::format("preview is not a regular file: {}", path.string()));
    auto info = makeInfo(path, path.filename().string(), kAssetPreviewIndex);
    info.isPreviewFile = false;
    info.isAssetPreview = true;
    return info;
}
