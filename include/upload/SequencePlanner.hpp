#pragma once

#include "upload/PartPlanner.hpp"
#include "upload/model/UploadSequence.hpp"
#include "config/Config.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cw::upload {

struct ValidationReport {
    std::vector<std::string> errors;
    [[nodiscard]] bool ok() const { return errors.empty(); }
};

struct UploadSummary {
    size_t totalFiles = 0;
    uint64_t totalSize = 0;
    uint64_t totalParts = 0;
    size_t sequenceCount = 0;
    size_t previewSequenceCount = 0;
    uint64_t largestSequenceSize = 0;

    [[nodiscard]] std::string toString() const;
};

// Greedy batching of files into backend-sized sequences. Holds no state beyond its limits.
class SequencePlanner {
public:
    explicit SequencePlanner(config::UploadConfig cfg);

    [[nodiscard]] std::vector<model::UploadSequence> plan(std::span<const model::FileInfo> files) const;

    [[nodiscard]] bool needsMultiSequence(std::span<const model::FileInfo> files) const;

    [[nodiscard]] ValidationReport validate(std::span<const model::FileInfo> files) const;

    [[nodiscard]] static UploadSummary summarize(std::span<const model::UploadSequence> sequences);

    [[nodiscard]] const PartPlanner& parts() const { return parts_; }
    [[nodiscard]] const config::UploadConfig& limits() const { return cfg_; }

    // "<base>.previewFile.<ext>" naming convention for inline previews.
    [[nodiscard]] static bool isPreviewFileName(std::string_view name);
    [[nodiscard]] bool hasAllowedPreviewExtension(std::string_view name) const;

private:
    config::UploadConfig cfg_;
    PartPlanner parts_;
};

}
