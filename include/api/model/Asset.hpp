#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace cw::api::model {

using Metadata = std::map<std::string, std::string>;

struct CreateAssetRequest {
    std::string databaseId;
    std::optional<std::string> assetId;
    std::string assetName;
    std::string description;
    bool isDistributable = true;
    std::vector<std::string> tags;
};

struct CreateAssetResponse {
    std::string assetId;
    std::string message;
};

enum class RelationshipType : uint8_t {
    ParentChild,
    Related
};

std::string_view toString(RelationshipType t) noexcept;

struct CreateAssetLinkRequest {
    std::string fromAssetId;
    std::string fromAssetDatabaseId;
    std::string toAssetId;
    std::string toAssetDatabaseId;
    RelationshipType relationshipType = RelationshipType::Related;
    std::vector<std::string> tags;
};

struct CreateAssetLinkResponse {
    std::string assetLinkId;
    std::string message;
};

struct LinkMetadataEntry {
    std::string metadataKey;
    std::string metadataValue;
    std::string metadataValueType = "string";
};

void to_json(nlohmann::json& j, const CreateAssetRequest& r);
void from_json(const nlohmann::json& j, CreateAssetResponse& r);
void to_json(nlohmann::json& j, const CreateAssetLinkRequest& r);
void from_json(const nlohmann::json& j, CreateAssetLinkResponse& r);
void to_json(nlohmann::json& j, const LinkMetadataEntry& e);

}
