#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace cw::api::model {

enum class UploadType : uint8_t {
    AssetFile,
    AssetPreview
};

std::string_view toString(UploadType t) noexcept;

// ####################################
// ######## Initialize Upload #########
// ####################################

struct UploadFileRequest {
    std::string relativeKey;
    uint64_t file_size = 0;
    uint64_t num_parts = 0;
};

struct InitializeUploadRequest {
    std::string assetId;
    std::string databaseId;
    UploadType uploadType = UploadType::AssetFile;
    std::vector<UploadFileRequest> files;
};

struct PartUploadUrl {
    unsigned int partNumber = 0;
    std::string uploadUrl;
};

struct UploadFileResponse {
    std::string relativeKey;
    std::string uploadIdS3;
    unsigned int numParts = 0;
    std::vector<PartUploadUrl> partUploadUrls;
};

struct InitializeUploadResponse {
    std::string uploadId;
    std::vector<UploadFileResponse> files;
    std::string message;
};

// ####################################
// ######### Complete Upload ##########
// ####################################

struct CompletedPart {
    unsigned int partNumber = 0;
    std::string etag;

    bool operator==(const CompletedPart&) const = default;
};

struct CompleteFileRequest {
    std::string relativeKey;
    std::string uploadIdS3;
    std::vector<CompletedPart> parts;   // empty tells the backend to discard the file
};

struct CompleteUploadRequest {
    std::string assetId;
    std::string databaseId;
    UploadType uploadType = UploadType::AssetFile;
    std::vector<CompleteFileRequest> files;
};

struct FileResult {
    std::string relativeKey;
    bool success = false;
    std::optional<std::string> error;
};

struct CompleteUploadResponse {
    std::string assetId;
    std::string uploadId;
    std::string message;
    std::vector<FileResult> fileResults;
    bool overallSuccess = true;
    bool largeFileAsynchronousHandling = false;
};

void to_json(nlohmann::json& j, const UploadFileRequest& r);
void to_json(nlohmann::json& j, const InitializeUploadRequest& r);
void from_json(const nlohmann::json& j, PartUploadUrl& p);
void from_json(const nlohmann::json& j, UploadFileResponse& r);
void from_json(const nlohmann::json& j, InitializeUploadResponse& r);
void to_json(nlohmann::json& j, const CompletedPart& p);
void to_json(nlohmann::json& j, const CompleteFileRequest& r);
void to_json(nlohmann::json& j, const CompleteUploadRequest& r);
void from_json(const nlohmann::json& j, FileResult& r);
void from_json(const nlohmann::json& j, CompleteUploadResponse& r);

}
