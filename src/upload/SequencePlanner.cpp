#include "upload/SequencePlanner.hpp"
#include "log/Registry.hpp"
#include "util/bytes.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>
#include <fmt/core.h>
#include <fmt/ranges.h>

using namespace cw::upload;
using namespace cw::upload::model;
using namespace cw::log;

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

enum class FileClass : uint8_t { Regular, Preview, AssetPreview };

FileClass classify(const FileInfo& f) {
    if (f.assetPreview()) return FileClass::AssetPreview;
    if (f.isPreviewFile) return FileClass::Preview;
    return FileClass::Regular;
}

}

std::string UploadSummary::toString() const {
    return fmt::format("{} file(s), {}, {} part(s) in {} sequence(s) ({} preview)",
                       totalFiles, util::formatFileSize(totalSize), totalParts,
                       sequenceCount, previewSequenceCount);
}

SequencePlanner::SequencePlanner(config::UploadConfig cfg) : cfg_(std::move(cfg)), parts_(cfg_) {
    if (cfg_.max_files_per_request == 0 || cfg_.max_parts_per_request == 0 || cfg_.max_sequence_size == 0)
        throw std::invalid_argument("SequencePlanner: request limits must be non-zero");
}

std::vector<UploadSequence> SequencePlanner::plan(const std::span<const FileInfo> files) const {
    std::vector<UploadSequence> sequences;
    unsigned int nextId = 1;

    UploadSequence current;
    const auto flush = [&] {
        if (current.files.empty()) return;
        current.sequenceId = nextId++;
        Registry::planner()->debug("[SequencePlanner] Sequence {}: {} file(s), {} part(s), {}",
                                   current.sequenceId, current.files.size(), current.totalParts,
                                   util::formatFileSize(current.totalSize));
        sequences.push_back(std::move(current));
        current = UploadSequence{};
    };

    const auto add = [&](const FileInfo& f, const uint64_t partCount) {
        current.files.push_back(f);
        current.totalSize += f.size;
        current.totalParts += partCount;
        current.parts[f.index] = parts_.plan(f.size);
    };

    for (const auto cls : {FileClass::Regular, FileClass::Preview, FileClass::AssetPreview}) {
        for (const auto& f : files) {
            if (classify(f) != cls) continue;

            const auto partCount = parts_.countParts(f.size);

            if (f.size >= cfg_.max_sequence_size) {
                flush();
                add(f, partCount);
                flush();
                continue;
            }

            const bool overSize = current.totalSize + f.size > cfg_.max_sequence_size;
            const bool overFiles = current.files.size() >= cfg_.max_files_per_request;
            const bool overParts = current.totalParts + partCount > cfg_.max_parts_per_request;
            if (!current.files.empty() && (overSize || overFiles || overParts)) flush();

            add(f, partCount);
        }
        flush();
    }

    return sequences;
}

bool SequencePlanner::needsMultiSequence(const std::span<const FileInfo> files) const {
    bool hasPreview = false, hasRegular = false;
    uint64_t totalParts = 0;

    for (const auto& f : files) {
        if (classify(f) == FileClass::Regular) hasRegular = true;
        else hasPreview = true;
        if (f.size >= cfg_.max_sequence_size) return true;
        totalParts += parts_.countParts(f.size);
    }

    return (hasPreview && hasRegular) ||
           files.size() > cfg_.max_files_per_request ||
           totalParts > cfg_.max_parts_per_request;
}

ValidationReport SequencePlanner::validate(const std::span<const FileInfo> files) const {
    ValidationReport report;
    size_t assetPreviews = 0;
    std::unordered_map<std::string, size_t> keys;
    std::unordered_map<unsigned int, size_t> indices;

    for (const auto& f : files) {
        const auto partCount = parts_.countParts(f.size);
        if (partCount > cfg_.max_parts_per_file)
            report.errors.push_back(fmt::format("{}: {} parts exceeds the per-file limit of {}",
                                                f.relativeKey(), partCount, cfg_.max_parts_per_file));

        // Files below the sequence cap share request batches, so they must fit in one.
        if (f.size < cfg_.max_sequence_size && partCount > cfg_.max_parts_per_request)
            report.errors.push_back(fmt::format("{}: {} parts exceeds the per-request limit of {}; raise the part size",
                                                f.relativeKey(), partCount, cfg_.max_parts_per_request));

        // Server responses are matched back to files by key and by index.
        if (!f.assetPreview() && ++keys[f.relativeKey()] == 2)
            report.errors.push_back(fmt::format("{}: relative path supplied more than once", f.relativeKey()));
        if (!f.assetPreview() && ++indices[f.index] == 2)
            report.errors.push_back(fmt::format("file index {} is used more than once", f.index));

        if (!f.handle && f.size > 0)
            report.errors.push_back(fmt::format("{}: no file handle", f.relativeKey()));
        else if (f.handle && f.handle->size() != f.size)
            report.errors.push_back(fmt::format("{}: size changed from {} to {} bytes",
                                                f.relativeKey(), f.size, f.handle->size()));

        if (f.assetPreview()) {
            ++assetPreviews;
            if (!hasAllowedPreviewExtension(f.name))
                report.errors.push_back(fmt::format("{}: asset preview must be one of {}",
                                                    f.name, fmt::join(cfg_.preview_extensions, ", ")));
        } else if (f.isPreviewFile) {
            if (!isPreviewFileName(f.relativePath))
                report.errors.push_back(fmt::format("{}: preview files must be named <file>.previewFile.<ext>",
                                                    f.relativePath));
            else if (!hasAllowedPreviewExtension(f.relativePath))
                report.errors.push_back(fmt::format("{}: preview extension must be one of {}",
                                                    f.relativePath, fmt::join(cfg_.preview_extensions, ", ")));
        }

        if ((f.assetPreview() || f.isPreviewFile) && f.size > cfg_.max_preview_file_size)
            report.errors.push_back(fmt::format("{}: preview is {} (limit {})", f.relativeKey(),
                                                util::formatFileSize(f.size),
                                                util::formatFileSize(cfg_.max_preview_file_size)));
    }

    if (assetPreviews > 1)
        report.errors.push_back(fmt::format("{} asset preview files supplied, at most one is allowed", assetPreviews));

    for (const auto& e : report.errors) Registry::planner()->warn("[SequencePlanner] {}", e);
    return report;
}

UploadSummary SequencePlanner::summarize(const std::span<const UploadSequence> sequences) {
    UploadSummary s;
    s.sequenceCount = sequences.size();
    for (const auto& seq : sequences) {
        s.totalFiles += seq.files.size();
        s.totalSize += seq.totalSize;
        s.totalParts += seq.totalParts;
        if (seq.isPreview()) ++s.previewSequenceCount;
        s.largestSequenceSize = std::max(s.largestSequenceSize, seq.totalSize);
    }
    return s;
}

bool SequencePlanner::isPreviewFileName(const std::string_view name) {
    static constexpr std::string_view marker = ".previewFile.";
    const auto pos = name.find(marker);
    return pos != std::string_view::npos && pos > 0 && pos + marker.size() < name.size();
}

bool SequencePlanner::hasAllowedPreviewExtension(const std::string_view name) const {
    const auto ext = lower(std::filesystem::path(name).extension().string());
    return std::ranges::any_of(cfg_.preview_extensions, [&](const std::string& allowed) {
        return lower(allowed) == ext;
    });
}
