#include <gtest/gtest.h>
#include "api/model/Asset.hpp"
#include "api/model/Upload.hpp"

#include <nlohmann/json.hpp>

using namespace cw::api::model;
using json = nlohmann::json;

TEST(ApiModelTest, CreateAssetRequestFields) {
    const json j = CreateAssetRequest{
        .databaseId = "db-1",
        .assetName = "Model",
        .description = "desc",
        .isDistributable = false,
        .tags = {"a", "b"}
    };

    EXPECT_EQ(j.at("databaseId"), "db-1");
    EXPECT_EQ(j.at("assetName"), "Model");
    EXPECT_FALSE(j.at("isDistributable").get<bool>());
    EXPECT_EQ(j.at("tags").size(), 2u);
    EXPECT_FALSE(j.contains("assetId"));
}

TEST(ApiModelTest, AssetLinkRequestUsesWireNames) {
    const json j = CreateAssetLinkRequest{
        .fromAssetId = "p1",
        .fromAssetDatabaseId = "db-1",
        .toAssetId = "c1",
        .toAssetDatabaseId = "db-2",
        .relationshipType = RelationshipType::ParentChild
    };
    EXPECT_EQ(j.at("relationshipType"), "parentChild");
    EXPECT_EQ(j.at("toAssetDatabaseId"), "db-2");

    const json meta = LinkMetadataEntry{.metadataKey = "k", .metadataValue = "v"};
    EXPECT_EQ(meta.at("metadataValueType"), "string");
}

TEST(ApiModelTest, InitializeRequestCarriesSizesAndCounts) {
    const json j = InitializeUploadRequest{
        .assetId = "asset-1",
        .databaseId = "db-1",
        .uploadType = UploadType::AssetPreview,
        .files = {{.relativeKey = "cover.png", .file_size = 1234, .num_parts = 1}}
    };

    EXPECT_EQ(j.at("uploadType"), "assetPreview");
    ASSERT_EQ(j.at("files").size(), 1u);
    EXPECT_EQ(j.at("files")[0].at("relativeKey"), "cover.png");
    EXPECT_EQ(j.at("files")[0].at("file_size").get<uint64_t>(), 1234u);
    EXPECT_EQ(j.at("files")[0].at("num_parts").get<uint64_t>(), 1u);
}

TEST(ApiModelTest, ParsesInitializeResponse) {
    const auto j = json::parse(R"({
        "uploadId": "u-1",
        "files": [{
            "relativeKey": "dir/a.bin",
            "uploadIdS3": "s3-1",
            "numParts": 2,
            "partUploadUrls": [
                {"PartNumber": 1, "UploadUrl": "https://s3/1?sig=x"},
                {"PartNumber": 2, "UploadUrl": "https://s3/2?sig=y"}
            ]
        }, {
            "relativeKey": "empty.txt",
            "uploadIdS3": "s3-2",
            "numParts": 0
        }]
    })");

    const auto res = j.get<InitializeUploadResponse>();
    EXPECT_EQ(res.uploadId, "u-1");
    ASSERT_EQ(res.files.size(), 2u);
    ASSERT_EQ(res.files[0].partUploadUrls.size(), 2u);
    EXPECT_EQ(res.files[0].partUploadUrls[1].partNumber, 2u);
    EXPECT_EQ(res.files[0].partUploadUrls[1].uploadUrl, "https://s3/2?sig=y");
    EXPECT_TRUE(res.files[1].partUploadUrls.empty());
}

TEST(ApiModelTest, CompleteRequestAlwaysHasPartsArray) {
    const json j = CompleteUploadRequest{
        .assetId = "asset-1",
        .databaseId = "db-1",
        .files = {
            {.relativeKey = "a.bin", .uploadIdS3 = "s3-a", .parts = {{1, "\"e1\""}, {2, "\"e2\""}}},
            {.relativeKey = "cancelled.bin", .uploadIdS3 = "s3-c"}
        }
    };

    EXPECT_EQ(j.at("uploadType"), "assetFile");
    const auto& files = j.at("files");
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].at("parts")[1].at("PartNumber"), 2);
    EXPECT_EQ(files[0].at("parts")[1].at("ETag"), "\"e2\"");
    ASSERT_TRUE(files[1].at("parts").is_array());
    EXPECT_TRUE(files[1].at("parts").empty());
}

TEST(ApiModelTest, ParsesCompleteResponse) {
    const auto res = json::parse(R"({
        "assetId": "asset-1",
        "uploadId": "u-1",
        "message": "partial",
        "overallSuccess": false,
        "largeFileAsynchronousHandling": true,
        "fileResults": [
            {"relativeKey": "a.bin", "success": true},
            {"relativeKey": "b.bin", "success": false, "error": "checksum mismatch"}
        ]
    })").get<CompleteUploadResponse>();

    EXPECT_FALSE(res.overallSuccess);
    EXPECT_TRUE(res.largeFileAsynchronousHandling);
    ASSERT_EQ(res.fileResults.size(), 2u);
    EXPECT_FALSE(res.fileResults[0].error);
    EXPECT_EQ(res.fileResults[1].error, "checksum mismatch");
}

TEST(ApiModelTest, CompleteResponseDefaults) {
    const auto res = json::parse(R"({"uploadId": "u-1"})").get<CompleteUploadResponse>();
    EXPECT_TRUE(res.overallSuccess);
    EXPECT_FALSE(res.largeFileAsynchronousHandling);
    EXPECT_TRUE(res.fileResults.empty());
}

TEST(ApiModelTest, MissingRequiredFieldThrows) {
    EXPECT_THROW(json::parse(R"({"message": "x"})").get<CreateAssetResponse>(), json::out_of_range);
}
