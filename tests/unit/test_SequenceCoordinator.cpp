#include <gtest/gtest.h>
#include "upload/SequenceCoordinator.hpp"
#include "upload/SequencePlanner.hpp"
#include "fakes.hpp"

using namespace cw::upload;
using namespace cw::upload::model;
using namespace cw::api::model;
using namespace cw::test;

class SequenceCoordinatorTest : public ::testing::Test {
protected:
    cw::config::Config cfg = smallConfig();
    std::shared_ptr<FakeAssetApi> api = std::make_shared<FakeAssetApi>();
    PartPlanner parts{cfg.upload};
    SequenceCoordinator coordinator{api, parts, RetryPolicy::forRequests(cfg.retry, noSleep())};

    void SetUp() override { coordinator.setAsset("asset-1", "db-1"); }

    std::vector<UploadSequence> planAndRegister(const std::vector<FileInfo>& files) {
        auto sequences = SequencePlanner(cfg.upload).plan(files);
        for (const auto& s : sequences) coordinator.registerSequence(s);
        return sequences;
    }

    // Every planned part as uploaded, with a predictable etag.
    static std::vector<FilePart> uploaded(const UploadSequence& seq) {
        std::vector<FilePart> out;
        for (const auto& [file, planned] : seq.parts)
            for (const auto& p : planned)
                out.push_back({
                    .fileIndex = file,
                    .partNumber = p.partNumber,
                    .startByte = p.startByte,
                    .endByte = p.endByte,
                    .status = FilePart::Status::COMPLETED,
                    .etag = fmt::format("\"etag-{}-{}\"", file, p.partNumber),
                    .sequenceId = seq.sequenceId
                });
        return out;
    }
};

TEST_F(SequenceCoordinatorTest, InitRequestDescribesEveryFile) {
    const auto seqs = planAndRegister({memFile(0, "dir/a.bin", 10), memFile(1, "empty.txt", 0)});
    const auto req = coordinator.buildInitRequest(seqs[0]);

    EXPECT_EQ(req.assetId, "asset-1");
    EXPECT_EQ(req.databaseId, "db-1");
    EXPECT_EQ(req.uploadType, UploadType::AssetFile);
    ASSERT_EQ(req.files.size(), 2u);
    EXPECT_EQ(req.files[0].relativeKey, "dir/a.bin");
    EXPECT_EQ(req.files[0].file_size, 10u);
    EXPECT_EQ(req.files[0].num_parts, 3u);
    EXPECT_EQ(req.files[1].num_parts, 0u);
}

TEST_F(SequenceCoordinatorTest, AssetPreviewUsesPreviewUploadType) {
    const auto seqs = planAndRegister({memFile(0, "a.bin", 4), assetPreviewFile("cover.png", 5)});
    ASSERT_EQ(seqs.size(), 2u);

    const auto req = coordinator.buildInitRequest(seqs[1]);
    EXPECT_EQ(req.uploadType, UploadType::AssetPreview);
    ASSERT_EQ(req.files.size(), 1u);
    EXPECT_EQ(req.files[0].relativeKey, "cover.png");
}

TEST_F(SequenceCoordinatorTest, InitializeStoresUploadTargets) {
    const auto seqs = planAndRegister({memFile(0, "a.bin", 10), memFile(1, "b.txt", 0)});

    ASSERT_TRUE(coordinator.initializeSequence(seqs[0]));
    EXPECT_EQ(coordinator.status(1), SequenceStatus::INIT_COMPLETED);

    const auto rec = coordinator.record(1);
    ASSERT_TRUE(rec.init);
    EXPECT_EQ(rec.init->uploadId, "upload-1");
    EXPECT_EQ(rec.init->files.at(0).uploadIdS3, "s3-a.bin");
    EXPECT_EQ(rec.init->files.at(0).partUrls.at(3), FakeAssetApi::partUrl("a.bin", 3));
    EXPECT_TRUE(rec.init->files.at(1).partUrls.empty());
}

TEST_F(SequenceCoordinatorTest, InitializeRetriesTransientErrors) {
    const auto seqs = planAndRegister({memFile(0, "a.bin", 4)});
    api->failNext("initializeUpload", {400, 429});

    EXPECT_TRUE(coordinator.initializeSequence(seqs[0]));
    EXPECT_EQ(api->calls("initializeUpload"), 3u);
}

TEST_F(SequenceCoordinatorTest, InitializeServiceUnavailableIsAFailure) {
    const auto seqs = planAndRegister({memFile(0, "a.bin", 4)});
    api->failNext("initializeUpload", {503});

    EXPECT_FALSE(coordinator.initializeSequence(seqs[0]));
    EXPECT_EQ(api->calls("initializeUpload"), 1u);

    const auto rec = coordinator.record(1);
    EXPECT_EQ(rec.status, SequenceStatus::INIT_FAILED);
    EXPECT_FALSE(rec.error.empty());

    ASSERT_TRUE(coordinator.resetForRetry(1));
    EXPECT_EQ(coordinator.status(1), SequenceStatus::PENDING);
    EXPECT_TRUE(coordinator.initializeSequence(seqs[0]));
    EXPECT_TRUE(coordinator.record(1).error.empty());
}

TEST_F(SequenceCoordinatorTest, FilePartsAreSortedAndCancelledFilesEmpty) {
    const auto seqs = planAndRegister({memFile(0, "a.bin", 12), memFile(1, "b.bin", 8), memFile(2, "c.txt", 0)});
    ASSERT_TRUE(coordinator.initializeSequence(seqs[0]));

    auto done = uploaded(seqs[0]);
    std::ranges::reverse(done);
    const auto files = coordinator.buildFileParts(seqs[0], done, {1});

    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].relativeKey, "a.bin");
    EXPECT_EQ(files[0].uploadIdS3, "s3-a.bin");
    ASSERT_EQ(files[0].parts.size(), 3u);
    EXPECT_EQ(files[0].parts[0], (CompletedPart{1, "\"etag-0-1\""}));
    EXPECT_EQ(files[0].parts[2], (CompletedPart{3, "\"etag-0-3\""}));
    EXPECT_TRUE(files[1].parts.empty());
    EXPECT_TRUE(files[2].parts.empty());
}

TEST_F(SequenceCoordinatorTest, UnfinishedPartsAreLeftOut) {
    const auto seqs = planAndRegister({memFile(0, "a.bin", 8)});
    ASSERT_TRUE(coordinator.initializeSequence(seqs[0]));

    auto done = uploaded(seqs[0]);
    done[1].status = FilePart::Status::FAILED;
    const auto files = coordinator.buildFileParts(seqs[0], done, {});
    ASSERT_EQ(files[0].parts.size(), 1u);
    EXPECT_EQ(files[0].parts[0].partNumber, 1u);
}

TEST_F(SequenceCoordinatorTest, CompleteSendsPartsAndRecordsResults) {
    const auto seqs = planAndRegister({memFile(0, "a.bin", 8)});
    ASSERT_TRUE(coordinator.initializeSequence(seqs[0]));

    EXPECT_TRUE(coordinator.completeSequence(seqs[0], uploaded(seqs[0]), {}));

    const auto sent = api->completionsSnapshot();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].uploadId, "upload-1");
    EXPECT_EQ(sent[0].request.assetId, "asset-1");
    EXPECT_EQ(sent[0].request.files[0].parts.size(), 2u);

    const auto rec = coordinator.record(1);
    EXPECT_EQ(rec.status, SequenceStatus::COMPLETED);
    ASSERT_EQ(rec.fileResults.size(), 1u);
    EXPECT_TRUE(rec.fileResults[0].success);
    EXPECT_FALSE(rec.ambiguousSuccess);
}

TEST_F(SequenceCoordinatorTest, CompletionServiceUnavailableIsAmbiguousSuccess) {
    const auto seqs = planAndRegister({memFile(0, "a.bin", 8)});
    ASSERT_TRUE(coordinator.initializeSequence(seqs[0]));
    api->failNext("completeUpload", {503});

    EXPECT_TRUE(coordinator.completeSequence(seqs[0], uploaded(seqs[0]), {}));
    EXPECT_EQ(api->calls("completeUpload"), 1u);

    const auto rec = coordinator.record(1);
    EXPECT_EQ(rec.status, SequenceStatus::COMPLETED);
    EXPECT_TRUE(rec.ambiguousSuccess);
    EXPECT_TRUE(rec.asynchronousProcessing);
    EXPECT_TRUE(coordinator.barrier().isOpen());
}

TEST_F(SequenceCoordinatorTest, CompletionFailureCanBeRetried) {
    const auto seqs = planAndRegister({memFile(0, "a.bin", 8)});
    ASSERT_TRUE(coordinator.initializeSequence(seqs[0]));
    api->failNext("completeUpload", {500});

    EXPECT_FALSE(coordinator.completeSequence(seqs[0], uploaded(seqs[0]), {}));
    EXPECT_EQ(coordinator.status(1), SequenceStatus::FAILED);
    EXPECT_FALSE(coordinator.barrier().isOpen());

    ASSERT_TRUE(coordinator.resetForRetry(1));
    EXPECT_EQ(coordinator.status(1), SequenceStatus::INIT_COMPLETED);
    EXPECT_TRUE(coordinator.completeSequence(seqs[0], uploaded(seqs[0]), {}));
    EXPECT_FALSE(coordinator.resetForRetry(1));
}

TEST_F(SequenceCoordinatorTest, RejectedFilesStillCompleteTheSequence) {
    const auto seqs = planAndRegister({memFile(0, "good.bin", 4), memFile(1, "bad.bin", 4)});
    ASSERT_TRUE(coordinator.initializeSequence(seqs[0]));
    api->rejectedKeys.insert("bad.bin");

    EXPECT_TRUE(coordinator.completeSequence(seqs[0], uploaded(seqs[0]), {}));
    const auto rec = coordinator.record(1);
    EXPECT_EQ(rec.status, SequenceStatus::COMPLETED);
    ASSERT_EQ(rec.fileResults.size(), 2u);
    EXPECT_FALSE(rec.fileResults[1].success);
    EXPECT_EQ(rec.fileResults[1].error, "rejected");
}

TEST_F(SequenceCoordinatorTest, PreviewWaitsForRegularSequences) {
    const auto seqs = planAndRegister({memFile(0, "model.glb", 8), previewFile(1, "model.glb.previewFile.png", 4)});
    ASSERT_EQ(seqs.size(), 2u);
    ASSERT_TRUE(coordinator.initializeSequence(seqs[0]));
    ASSERT_TRUE(coordinator.initializeSequence(seqs[1]));

    EXPECT_FALSE(coordinator.canComplete(seqs[1]));
    EXPECT_FALSE(coordinator.completeSequence(seqs[1], uploaded(seqs[1]), {}));
    EXPECT_EQ(api->calls("completeUpload"), 0u);
    EXPECT_EQ(coordinator.status(2), SequenceStatus::INIT_COMPLETED);

    bool resumed = false;
    coordinator.deferUntilBarrier(2, [&] { resumed = true; });
    EXPECT_TRUE(coordinator.record(2).deferred);
    EXPECT_FALSE(resumed);

    ASSERT_TRUE(coordinator.completeSequence(seqs[0], uploaded(seqs[0]), {}));
    EXPECT_TRUE(resumed);
    EXPECT_TRUE(coordinator.canComplete(seqs[1]));

    ASSERT_TRUE(coordinator.completeSequence(seqs[1], uploaded(seqs[1]), {}));
    EXPECT_FALSE(coordinator.record(2).deferred);

    const auto sent = api->completionsSnapshot();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0].uploadId, "upload-1");
    EXPECT_EQ(sent[1].uploadId, "upload-2");
}

TEST_F(SequenceCoordinatorTest, SkippingRegularSequenceReleasesPreviews) {
    const auto seqs = planAndRegister({memFile(0, "a.bin", 8), previewFile(1, "a.bin.previewFile.png", 4)});
    EXPECT_FALSE(coordinator.canComplete(seqs[1]));

    coordinator.skip(1);
    EXPECT_EQ(coordinator.status(1), SequenceStatus::SKIPPED);
    EXPECT_TRUE(coordinator.record(1).isSettled());
    EXPECT_TRUE(coordinator.canComplete(seqs[1]));
}

TEST_F(SequenceCoordinatorTest, CompletingBeforeInitIsALogicError) {
    const auto seqs = planAndRegister({memFile(0, "a.bin", 8)});
    EXPECT_THROW(coordinator.completeSequence(seqs[0], {}, {}), std::logic_error);
}

TEST_F(SequenceCoordinatorTest, UnknownAndDuplicateSequences) {
    const auto seqs = planAndRegister({memFile(0, "a.bin", 8)});
    EXPECT_THROW(coordinator.registerSequence(seqs[0]), std::invalid_argument);
    EXPECT_THROW(static_cast<void>(coordinator.status(42)), std::out_of_range);
    EXPECT_EQ(coordinator.records().size(), 1u);
}
