#include <gtest/gtest.h>
#include "upload/Workflow.hpp"
#include "fakes.hpp"

#include <algorithm>
#include <mutex>
#include <thread>

using namespace cw::upload;
using namespace cw::upload::model;
using namespace cw::api::model;
using namespace cw::test;
using namespace std::chrono_literals;

class WorkflowTest : public ::testing::Test {
protected:
    cw::config::Config cfg = smallConfig();
    std::shared_ptr<FakeAssetApi> api = std::make_shared<FakeAssetApi>();
    std::shared_ptr<FakePartTransport> transport = std::make_shared<FakePartTransport>();

    std::mutex mutex;
    unsigned int completeCount = 0;
    std::optional<UploadResult> lastResult;
    std::vector<std::pair<unsigned int, SequenceStatus>> sequenceEvents;
    std::pair<uint64_t, uint64_t> maxProgress{0, 0};

    static UploadRequest request(std::vector<FileInfo> files) {
        return UploadRequest{
            .databaseId = "db-1",
            .assetName = "Model",
            .description = "A model",
            .tags = {"scan"},
            .files = std::move(files)
        };
    }

    std::unique_ptr<Workflow> make(UploadRequest req) {
        Workflow::Callbacks callbacks{
            .onProgress = [this](const uint64_t done, const uint64_t total) {
                std::scoped_lock lock(mutex);
                maxProgress = std::max(maxProgress, std::pair{done, total});
            },
            .onSequence = [this](const unsigned int id, const SequenceStatus s) {
                std::scoped_lock lock(mutex);
                sequenceEvents.emplace_back(id, s);
            },
            .onComplete = [this](const UploadResult& r) {
                std::scoped_lock lock(mutex);
                ++completeCount;
                lastResult = r;
            }
        };
        return std::make_unique<Workflow>(cfg, api, transport, std::move(req), std::move(callbacks), noSleep());
    }

    static std::vector<FileInfo> twoFiles() {
        return {memFile(0, "a.bin", 12), memFile(1, "b.bin", 8)};
    }

    static const CompleteFileRequest& sentFile(const FakeAssetApi::Completion& c, const std::string& key) {
        const auto it = std::ranges::find(c.request.files, key, &CompleteFileRequest::relativeKey);
        if (it == c.request.files.end()) throw std::out_of_range(key);
        return *it;
    }
};

TEST_F(WorkflowTest, UploadsNewAssetEndToEnd) {
    auto wf = make(request({memFile(0, "a.bin", 10), memFile(1, "dir/b.bin", 5), memFile(2, "empty.txt", 0)}));
    const auto status = wf->run();

    EXPECT_TRUE(status.finished);
    EXPECT_FALSE(status.needsAttention());
    EXPECT_EQ(status.totalParts, 5u);
    EXPECT_EQ(status.completedParts, 5u);
    EXPECT_EQ(status.stage(Stage::ASSET_CREATION).status, StageStatus::COMPLETED);
    EXPECT_EQ(status.stage(Stage::METADATA).status, StageStatus::SKIPPED);
    EXPECT_EQ(status.stage(Stage::ASSET_LINKS).status, StageStatus::SKIPPED);
    EXPECT_EQ(status.stage(Stage::PART_UPLOAD).status, StageStatus::COMPLETED);
    EXPECT_EQ(status.stage(Stage::SEQUENCE_COMPLETION).status, StageStatus::COMPLETED);
    EXPECT_EQ(status.stage(Stage::FINALIZE).status, StageStatus::COMPLETED);

    ASSERT_EQ(api->createRequests.size(), 1u);
    EXPECT_EQ(api->createRequests[0].assetName, "Model");
    EXPECT_EQ(api->createRequests[0].tags, (std::vector<std::string>{"scan"}));
    EXPECT_TRUE(api->metadataCalls.empty());

    const auto sent = api->completionsSnapshot();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sentFile(sent[0], "a.bin").parts.size(), 3u);
    EXPECT_EQ(sentFile(sent[0], "dir/b.bin").parts.size(), 2u);
    EXPECT_TRUE(sentFile(sent[0], "empty.txt").parts.empty());

    const auto result = wf->result();
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->overallSuccess);
    EXPECT_EQ(result->assetId, "asset-1");
    EXPECT_EQ(result->summary(), "3 of 3 files uploaded");

    std::scoped_lock lock(mutex);
    EXPECT_EQ(completeCount, 1u);
    EXPECT_EQ(maxProgress, (std::pair<uint64_t, uint64_t>{5, 5}));
    ASSERT_FALSE(sequenceEvents.empty());
    EXPECT_EQ(sequenceEvents.back(), (std::pair{1u, SequenceStatus::COMPLETED}));
}

TEST_F(WorkflowTest, ExistingAssetSkipsCreation) {
    auto req = request(twoFiles());
    req.existingAssetId = "asset-9";
    auto wf = make(std::move(req));
    const auto status = wf->run();

    EXPECT_TRUE(status.finished);
    EXPECT_EQ(status.stage(Stage::ASSET_CREATION).status, StageStatus::SKIPPED);
    EXPECT_TRUE(api->createRequests.empty());
    ASSERT_EQ(api->initRequests.size(), 1u);
    EXPECT_EQ(api->initRequests[0].assetId, "asset-9");
    EXPECT_EQ(wf->result()->assetId, "asset-9");
}

TEST_F(WorkflowTest, AttachesMetadataToCreatedAsset) {
    auto req = request(twoFiles());
    req.metadata = {{"scanner", "lidar"}, {"site", "north"}};
    auto wf = make(std::move(req));
    const auto status = wf->run();

    EXPECT_EQ(status.stage(Stage::METADATA).status, StageStatus::COMPLETED);
    ASSERT_EQ(api->metadataCalls.size(), 1u);
    EXPECT_EQ(api->metadataCalls[0].databaseId, "db-1");
    EXPECT_EQ(api->metadataCalls[0].assetId, "asset-1");
    EXPECT_EQ(api->metadataCalls[0].metadata.at("scanner"), "lidar");
}

TEST_F(WorkflowTest, CreatesLinksInTheRightDirection) {
    auto req = request(twoFiles());
    req.links = {
        {.role = AssetLinkSpec::Role::PARENT, .assetId = "p1"},
        {.role = AssetLinkSpec::Role::CHILD, .assetId = "c1", .databaseId = "db-2"},
        {.role = AssetLinkSpec::Role::RELATED, .assetId = "r1",
         .metadata = {{.metadataKey = "reason", .metadataValue = "same site"}}}
    };
    auto wf = make(std::move(req));
    const auto status = wf->run();

    EXPECT_EQ(status.stage(Stage::ASSET_LINKS).status, StageStatus::COMPLETED);
    ASSERT_EQ(api->linkRequests.size(), 3u);

    const auto& parent = api->linkRequests[0];
    EXPECT_EQ(parent.fromAssetId, "p1");
    EXPECT_EQ(parent.toAssetId, "asset-1");
    EXPECT_EQ(parent.relationshipType, RelationshipType::ParentChild);

    const auto& child = api->linkRequests[1];
    EXPECT_EQ(child.fromAssetId, "asset-1");
    EXPECT_EQ(child.toAssetId, "c1");
    EXPECT_EQ(child.toAssetDatabaseId, "db-2");
    EXPECT_EQ(child.relationshipType, RelationshipType::ParentChild);

    const auto& related = api->linkRequests[2];
    EXPECT_EQ(related.fromAssetId, "asset-1");
    EXPECT_EQ(related.toAssetDatabaseId, "db-1");
    EXPECT_EQ(related.relationshipType, RelationshipType::Related);

    ASSERT_EQ(api->linkMetadata.size(), 1u);
    EXPECT_EQ(api->linkMetadata[0].first, "link-3");
    EXPECT_EQ(api->linkMetadata[0].second.metadataKey, "reason");
}

TEST_F(WorkflowTest, FailedLinkIsNotRecreatedOnRetry) {
    auto req = request(twoFiles());
    req.links = {
        {.role = AssetLinkSpec::Role::RELATED, .assetId = "r1"},
        {.role = AssetLinkSpec::Role::RELATED, .assetId = "r2"}
    };
    api->failNext("createAssetLink", {0, 0, 0});   // exhausts the first link's attempts
    auto wf = make(std::move(req));

    auto status = wf->run();
    EXPECT_EQ(status.stage(Stage::ASSET_LINKS).status, StageStatus::FAILED);
    EXPECT_FALSE(status.finished);
    EXPECT_TRUE(status.needsAttention());
    // Files upload regardless of the link failure.
    EXPECT_EQ(api->completionsSnapshot().size(), 1u);

    const auto before = api->calls("createAssetLink");
    status = wf->retryStage(Stage::ASSET_LINKS);
    EXPECT_TRUE(status.finished);
    EXPECT_EQ(status.stage(Stage::ASSET_LINKS).status, StageStatus::COMPLETED);
    EXPECT_EQ(api->calls("createAssetLink"), before + 1);
    EXPECT_TRUE(wf->result()->overallSuccess);
}

TEST_F(WorkflowTest, AssetCreationFailureHaltsEverything) {
    api->failNext("createAsset", {500});
    auto wf = make(request(twoFiles()));

    auto status = wf->run();
    EXPECT_EQ(status.stage(Stage::ASSET_CREATION).status, StageStatus::FAILED);
    EXPECT_FALSE(status.stage(Stage::ASSET_CREATION).errors.empty());
    EXPECT_EQ(status.stage(Stage::PLANNING).status, StageStatus::PENDING);
    EXPECT_TRUE(status.needsAttention());
    EXPECT_TRUE(api->initRequests.empty());
    EXPECT_FALSE(wf->result());
    EXPECT_THROW(wf->skipStage(Stage::ASSET_CREATION), std::invalid_argument);

    status = wf->retryStage(Stage::ASSET_CREATION);
    EXPECT_TRUE(status.finished);
    EXPECT_EQ(api->calls("createAsset"), 2u);
    EXPECT_TRUE(wf->result()->overallSuccess);
}

TEST_F(WorkflowTest, MetadataFailurePausesBeforeFinalize) {
    auto req = request(twoFiles());
    req.metadata = {{"k", "v"}};
    api->failNext("addMetadata", {500});
    auto wf = make(std::move(req));

    auto status = wf->run();
    EXPECT_EQ(status.stage(Stage::METADATA).status, StageStatus::FAILED);
    EXPECT_FALSE(status.finished);
    EXPECT_EQ(api->completionsSnapshot().size(), 1u);
    {
        std::scoped_lock lock(mutex);
        EXPECT_EQ(completeCount, 0u);
    }

    status = wf->retryStage(Stage::METADATA);
    EXPECT_TRUE(status.finished);
    EXPECT_EQ(status.stage(Stage::METADATA).status, StageStatus::COMPLETED);
    EXPECT_EQ(api->metadataCalls.size(), 2u);
    EXPECT_EQ(api->completionsSnapshot().size(), 1u);
}

TEST_F(WorkflowTest, PlanningRejectsInvalidPreview) {
    auto wf = make(request({memFile(0, "a.bin", 4), previewFile(1, "a.bin.thumb.png", 4)}));

    auto status = wf->run();
    EXPECT_EQ(status.stage(Stage::PLANNING).status, StageStatus::FAILED);
    EXPECT_TRUE(api->initRequests.empty());
    EXPECT_TRUE(wf->sequences().empty());

    status = wf->skipStage(Stage::PLANNING);
    EXPECT_TRUE(status.finished);
    EXPECT_EQ(status.stage(Stage::SEQUENCE_INIT).status, StageStatus::SKIPPED);
    EXPECT_EQ(wf->result()->summary(), "0 of 2 files uploaded; 2 skipped");
    EXPECT_FALSE(wf->result()->overallSuccess);
}

TEST_F(WorkflowTest, EmptyUploadStillCreatesAsset) {
    auto wf = make(request({}));
    const auto status = wf->run();

    EXPECT_TRUE(status.finished);
    EXPECT_EQ(status.stage(Stage::PART_UPLOAD).status, StageStatus::SKIPPED);
    EXPECT_EQ(api->createRequests.size(), 1u);
    EXPECT_TRUE(api->initRequests.empty());
    EXPECT_EQ(wf->result()->summary(), "0 of 0 files uploaded");
    EXPECT_TRUE(wf->result()->overallSuccess);
}

TEST_F(WorkflowTest, SequenceInitFailureCanBeRetried) {
    api->failNext("initializeUpload", {500});
    auto wf = make(request(twoFiles()));

    auto status = wf->run();
    EXPECT_EQ(status.stage(Stage::SEQUENCE_INIT).status, StageStatus::FAILED);
    EXPECT_FALSE(status.finished);
    ASSERT_EQ(status.sequences.size(), 1u);
    EXPECT_EQ(status.sequences[0].status, SequenceStatus::INIT_FAILED);

    status = wf->retryStage(Stage::SEQUENCE_INIT);
    EXPECT_TRUE(status.finished);
    EXPECT_EQ(api->initRequests.size(), 2u);
    EXPECT_EQ(wf->result()->summary(), "2 of 2 files uploaded");
}

TEST_F(WorkflowTest, SkippingSequenceInitSkipsItsFiles) {
    api->failNext("initializeUpload", {500});
    auto wf = make(request(twoFiles()));
    wf->run();

    const auto status = wf->skipStage(Stage::SEQUENCE_INIT);
    EXPECT_TRUE(status.finished);
    EXPECT_EQ(status.sequences[0].status, SequenceStatus::SKIPPED);
    EXPECT_TRUE(api->completionsSnapshot().empty());
    EXPECT_EQ(wf->result()->summary(), "0 of 2 files uploaded; 2 skipped");
}

TEST_F(WorkflowTest, FailedPartPausesUntilRetried) {
    const auto bad = FakeAssetApi::partUrl("a.bin", 2);
    transport->failAlways(bad);
    auto wf = make(request(twoFiles()));

    auto status = wf->run();
    EXPECT_FALSE(status.finished);
    EXPECT_EQ(status.stage(Stage::PART_UPLOAD).status, StageStatus::FAILED);
    ASSERT_EQ(status.stage(Stage::PART_UPLOAD).errors.size(), 1u);
    EXPECT_EQ(status.sequences[0].status, SequenceStatus::INIT_COMPLETED);
    EXPECT_TRUE(api->completionsSnapshot().empty());
    EXPECT_EQ(status.completedParts, 4u);

    transport->heal(bad);
    status = wf->retryStage(Stage::PART_UPLOAD);
    EXPECT_TRUE(status.finished);
    EXPECT_EQ(status.stage(Stage::PART_UPLOAD).status, StageStatus::COMPLETED);
    EXPECT_EQ(transport->calls(FakeAssetApi::partUrl("a.bin", 1)), 1u);

    const auto sent = api->completionsSnapshot();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sentFile(sent[0], "a.bin").parts.size(), 3u);
    EXPECT_TRUE(wf->result()->overallSuccess);
}

TEST_F(WorkflowTest, RetryFailedPartsForOneFileResumesDriver) {
    const auto bad = FakeAssetApi::partUrl("b.bin", 1);
    transport->failAlways(bad);
    auto wf = make(request(twoFiles()));
    wf->run();

    transport->heal(bad);
    EXPECT_EQ(wf->retryFailedParts(1), 1u);
    const auto status = wf->run();
    EXPECT_TRUE(status.finished);
    EXPECT_EQ(wf->result()->summary(), "2 of 2 files uploaded");
}

TEST_F(WorkflowTest, SkippingPartUploadCompletesWithoutTheFile) {
    transport->failAlways(FakeAssetApi::partUrl("a.bin", 3));
    auto wf = make(request(twoFiles()));
    wf->run();

    const auto status = wf->skipStage(Stage::PART_UPLOAD);
    EXPECT_TRUE(status.finished);

    const auto sent = api->completionsSnapshot();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_TRUE(sentFile(sent[0], "a.bin").parts.empty());
    EXPECT_EQ(sentFile(sent[0], "b.bin").parts.size(), 2u);

    const auto result = wf->result();
    EXPECT_EQ(result->summary(), "1 of 2 files uploaded; 1 skipped");
    EXPECT_FALSE(result->overallSuccess);
}

TEST_F(WorkflowTest, CancelledFileIsReportedNotFailed) {
    const auto gate = FakeAssetApi::partUrl("a.bin", 1);
    transport->hold(gate);
    auto wf = make(request(twoFiles()));

    std::thread runner([&] { wf->run(); });
    ASSERT_TRUE(transport->waitForHeld(1));
    wf->cancelFile(0);
    transport->release(gate);
    runner.join();

    const auto result = wf->result();
    ASSERT_TRUE(result);
    EXPECT_EQ(result->summary(), "1 of 2 files uploaded; 1 cancelled");
    EXPECT_TRUE(result->overallSuccess);

    const auto sent = api->completionsSnapshot();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_TRUE(sentFile(sent[0], "a.bin").parts.empty());
    EXPECT_EQ(sentFile(sent[0], "b.bin").parts.size(), 2u);
}

TEST_F(WorkflowTest, CancelBeforeRunCreatesNothing) {
    auto wf = make(request(twoFiles()));
    wf->cancel();
    const auto status = wf->run();

    EXPECT_TRUE(status.finished);
    EXPECT_TRUE(status.cancelled);
    EXPECT_TRUE(api->createRequests.empty());
    EXPECT_EQ(wf->result()->summary(), "0 of 2 files uploaded; 2 cancelled");

    std::scoped_lock lock(mutex);
    EXPECT_EQ(completeCount, 1u);
}

TEST_F(WorkflowTest, PreviewSequencesCompleteLast) {
    const auto gate = FakeAssetApi::partUrl("model.glb", 1);
    transport->hold(gate);
    auto wf = make(request({
        memFile(0, "model.glb", 8),
        previewFile(1, "model.glb.previewFile.png", 4),
        assetPreviewFile("cover.jpg", 4)
    }));

    std::thread runner([&] { wf->run(); });
    ASSERT_TRUE(transport->waitForHeld(1));
    EXPECT_TRUE(api->completionsSnapshot().empty());
    transport->release(gate);
    runner.join();

    // The two preview sequences may finish in either order, but never before the regular one.
    const auto sent = api->completionsSnapshot();
    ASSERT_EQ(sent.size(), 3u);
    EXPECT_EQ(sent[0].uploadId, "upload-1");
    EXPECT_EQ(sent[0].request.uploadType, UploadType::AssetFile);

    const auto cover = std::ranges::find(sent, std::string("upload-3"), &FakeAssetApi::Completion::uploadId);
    ASSERT_NE(cover, sent.end());
    EXPECT_NE(cover, sent.begin());
    EXPECT_EQ(cover->request.uploadType, UploadType::AssetPreview);
    EXPECT_EQ(cover->request.files[0].relativeKey, "cover.jpg");
    EXPECT_EQ(wf->result()->summary(), "3 of 3 files uploaded");
}

TEST_F(WorkflowTest, AmbiguousCompletionIsSuccessWithWarning) {
    api->failNext("completeUpload", {503});
    auto wf = make(request(twoFiles()));
    wf->run();

    const auto result = wf->result();
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->overallSuccess);
    EXPECT_TRUE(result->ambiguousSuccess);
    EXPECT_FALSE(result->warnings.empty());
    EXPECT_EQ(result->uploadedFiles, 2u);
}

TEST_F(WorkflowTest, BackendRejectionCountsAsFailedFile) {
    api->rejectedKeys.insert("b.bin");
    auto wf = make(request(twoFiles()));
    const auto status = wf->run();

    EXPECT_TRUE(status.finished);
    const auto result = wf->result();
    EXPECT_EQ(result->summary(), "1 of 2 files uploaded; 1 failed");
    EXPECT_FALSE(result->overallSuccess);
    EXPECT_TRUE(std::ranges::find(result->errors, std::string("b.bin: rejected")) != std::ranges::end(result->errors));
}

TEST_F(WorkflowTest, CompletionFiresOnceAcrossSequences) {
    std::vector<FileInfo> files;
    for (unsigned int i = 0; i < 60; ++i) files.push_back(memFile(i, fmt::format("f{:02}.bin", i), 6));
    auto wf = make(request(std::move(files)));

    auto status = wf->run();
    EXPECT_TRUE(status.finished);
    EXPECT_EQ(status.sequences.size(), 2u);
    EXPECT_EQ(api->completionsSnapshot().size(), 2u);

    status = wf->run();
    EXPECT_TRUE(status.finished);

    std::scoped_lock lock(mutex);
    EXPECT_EQ(completeCount, 1u);
    EXPECT_EQ(lastResult->summary(), "60 of 60 files uploaded");
}

TEST_F(WorkflowTest, StageActionsValidateState) {
    auto wf = make(request(twoFiles()));
    EXPECT_THROW(wf->retryStage(Stage::FINALIZE), std::invalid_argument);
    EXPECT_THROW(wf->retryStage(Stage::METADATA), std::logic_error);
    EXPECT_THROW(wf->cancelFile(42), std::invalid_argument);

    wf->run();
    EXPECT_THROW(wf->retryStage(Stage::PART_UPLOAD), std::logic_error);
    EXPECT_THROW(wf->skipStage(Stage::PART_UPLOAD), std::logic_error);

    // Cancelling a file whose sequence is settled changes nothing.
    wf->cancelFile(0);
    EXPECT_EQ(wf->result()->summary(), "2 of 2 files uploaded");
}

TEST_F(WorkflowTest, RequiresDatabaseId) {
    auto req = request(twoFiles());
    req.databaseId.clear();
    EXPECT_THROW(make(std::move(req)), std::invalid_argument);
}
