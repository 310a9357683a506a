#pragma once

#include "api/AssetApi.hpp"
#include "api/PartTransport.hpp"
#include "config/Config.hpp"

#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace cw::api {

class HttpAssetApi final : public AssetApi {
public:
    explicit HttpAssetApi(config::ApiConfig cfg);

    model::CreateAssetResponse createAsset(const model::CreateAssetRequest& req) override;
    void addMetadata(const std::string& databaseId, const std::string& assetId,
                     const model::Metadata& metadata) override;
    model::CreateAssetLinkResponse createAssetLink(const model::CreateAssetLinkRequest& req) override;
    void createAssetLinkMetadata(const std::string& assetLinkId, const model::LinkMetadataEntry& entry) override;
    model::InitializeUploadResponse initializeUpload(const model::InitializeUploadRequest& req) override;
    model::CompleteUploadResponse completeUpload(const std::string& uploadId,
                                                 const model::CompleteUploadRequest& req) override;

private:
    config::ApiConfig cfg_;

    nlohmann::json sendJson(const char* method, const std::string& path, const nlohmann::json* body) const;
    [[nodiscard]] std::string escape(const std::string& segment) const;
};

class CurlPartTransport final : public PartTransport {
public:
    explicit CurlPartTransport(config::ApiConfig cfg);

    std::string putPart(const std::string& url, const PartBody& body) override;

private:
    config::ApiConfig cfg_;
};

}
