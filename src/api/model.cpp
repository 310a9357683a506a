#include "api/model/Asset.hpp"
#include "api/model/Upload.hpp"

#include <nlohmann/json.hpp>

namespace cw::api::model {

std::string_view toString(const RelationshipType t) noexcept {
    switch (t) {
        case RelationshipType::ParentChild: return "parentChild";
        case RelationshipType::Related: return "related";
        default: return "unknown";
    }
}

std::string_view toString(const UploadType t) noexcept {
    switch (t) {
        case UploadType::AssetFile: return "assetFile";
        case UploadType::AssetPreview: return "assetPreview";
        default: return "unknown";
    }
}

void to_json(nlohmann::json& j, const CreateAssetRequest& r) {
    j = {
        {"databaseId", r.databaseId},
        {"assetName", r.assetName},
        {"description", r.description},
        {"isDistributable", r.isDistributable},
        {"tags", r.tags}
    };
    if (r.assetId) j["assetId"] = *r.assetId;
}

void from_json(const nlohmann::json& j, CreateAssetResponse& r) {
    j.at("assetId").get_to(r.assetId);
    r.message = j.value("message", "");
}

void to_json(nlohmann::json& j, const CreateAssetLinkRequest& r) {
    j = {
        {"fromAssetId", r.fromAssetId},
        {"fromAssetDatabaseId", r.fromAssetDatabaseId},
        {"toAssetId", r.toAssetId},
        {"toAssetDatabaseId", r.toAssetDatabaseId},
        {"relationshipType", std::string(toString(r.relationshipType))},
        {"tags", r.tags}
    };
}

void from_json(const nlohmann::json& j, CreateAssetLinkResponse& r) {
    j.at("assetLinkId").get_to(r.assetLinkId);
    r.message = j.value("message", "");
}

void to_json(nlohmann::json& j, const LinkMetadataEntry& e) {
    j = {
        {"metadataKey", e.metadataKey},
        {"metadataValue", e.metadataValue},
        {"metadataValueType", e.metadataValueType}
    };
}

void to_json(nlohmann::json& j, const UploadFileRequest& r) {
    j = {
        {"relativeKey", r.relativeKey},
        {"file_size", r.file_size},
        {"num_parts", r.num_parts}
    };
}

void to_json(nlohmann::json& j, const InitializeUploadRequest& r) {
    j = {
        {"assetId", r.assetId},
        {"databaseId", r.databaseId},
        {"uploadType", std::string(toString(r.uploadType))},
        {"files", r.files}
    };
}

void from_json(const nlohmann::json& j, PartUploadUrl& p) {
    j.at("PartNumber").get_to(p.partNumber);
    j.at("UploadUrl").get_to(p.uploadUrl);
}

void from_json(const nlohmann::json& j, UploadFileResponse& r) {
    j.at("relativeKey").get_to(r.relativeKey);
    r.uploadIdS3 = j.value("uploadIdS3", "");
    r.numParts = j.value("numParts", 0u);
    if (j.contains("partUploadUrls")) j.at("partUploadUrls").get_to(r.partUploadUrls);
}

void from_json(const nlohmann::json& j, InitializeUploadResponse& r) {
    j.at("uploadId").get_to(r.uploadId);
    if (j.contains("files")) j.at("files").get_to(r.files);
    r.message = j.value("message", "");
}

void to_json(nlohmann::json& j, const CompletedPart& p) {
    j = {
        {"PartNumber", p.partNumber},
        {"ETag", p.etag}
    };
}

void to_json(nlohmann::json& j, const CompleteFileRequest& r) {
    j = {
        {"relativeKey", r.relativeKey},
        {"uploadIdS3", r.uploadIdS3},
        {"parts", nlohmann::json::array()}
    };
    for (const auto& p : r.parts) j["parts"].push_back(p);
}

void to_json(nlohmann::json& j, const CompleteUploadRequest& r) {
    j = {
        {"assetId", r.assetId},
        {"databaseId", r.databaseId},
        {"uploadType", std::string(toString(r.uploadType))},
        {"files", r.files}
    };
}

void from_json(const nlohmann::json& j, FileResult& r) {
    j.at("relativeKey").get_to(r.relativeKey);
    r.success = j.value("success", false);
    if (j.contains("error") && j.at("error").is_string()) r.error = j.at("error").get<std::string>();
}

void from_json(const nlohmann::json& j, CompleteUploadResponse& r) {
    r.assetId = j.value("assetId", "");
    r.uploadId = j.value("uploadId", "");
    r.message = j.value("message", "");
    if (j.contains("fileResults")) j.at("fileResults").get_to(r.fileResults);
    r.overallSuccess = j.value("overallSuccess", true);
    r.largeFileAsynchronousHandling = j.value("largeFileAsynchronousHandling", false);
}

}
