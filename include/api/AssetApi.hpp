#pragma once

#include "api/model/Asset.hpp"
#include "api/model/Upload.hpp"

#include <string>
#include <vector>

namespace cw::api {

// Backend the orchestrator talks to. Every call throws HttpError on failure.
class AssetApi {
public:
    virtual ~AssetApi() = default;

    virtual model::CreateAssetResponse createAsset(const model::CreateAssetRequest& req) = 0;

    virtual void addMetadata(const std::string& databaseId, const std::string& assetId,
                             const model::Metadata& metadata) = 0;

    virtual model::CreateAssetLinkResponse createAssetLink(const model::CreateAssetLinkRequest& req) = 0;

    virtual void createAssetLinkMetadata(const std::string& assetLinkId,
                                         const model::LinkMetadataEntry& entry) = 0;

    virtual model::InitializeUploadResponse initializeUpload(const model::InitializeUploadRequest& req) = 0;

    virtual model::CompleteUploadResponse completeUpload(const std::string& uploadId,
                                                         const model::CompleteUploadRequest& req) = 0;
};

}
