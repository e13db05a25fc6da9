#include <gtest/gtest.h>
#include "memory_storage_backend.hpp"
#include "../common/config.hpp"
#include "../common/logger.hpp"
#include "../transfer/disk_transfer_service.hpp"

class TransferFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setLevel(LogLevel::ERROR);
        storage.addFile("/src/a.txt", "hello");
        storage.addFolder("/dst");
    }

    MemoryStorageBackend storage;
    DiskTransferService service{storage};
};

TEST_F(TransferFileTest, HardLinkSharesDataWithSource) {
    auto result = service.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::HardLink);

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.data, TransferMode::HardLink);
    EXPECT_TRUE(storage.sharesData("/src/a.txt", "/dst/a.txt"));
    EXPECT_EQ(storage.content("/src/a.txt"), "hello");
    EXPECT_EQ(storage.copyCalls, 0);
    EXPECT_EQ(storage.moveCalls, 0);
}

TEST_F(TransferFileTest, SamePathFailsWithoutTouchingStorage) {
    for (const char* target : {"/src/a.txt", "/src//a.txt", "/src/./a.txt", "/dst/../src/a.txt"}) {
        auto result = service.transferFile("/src/a.txt", target, TransferMode::Copy);
        EXPECT_FALSE(result.success) << target;
        EXPECT_EQ(result.error, ErrorCode::SamePath) << target;
    }
    EXPECT_EQ(storage.mutations, 0);
    EXPECT_EQ(storage.hardLinkCalls, 0);
}

TEST_F(TransferFileTest, SamePathIgnoresCaseOnCaseInsensitiveStorage) {
    MemoryStorageBackend insensitive(false);
    insensitive.addFile("/src/a.txt", "hello");
    DiskTransferService caseless(insensitive);

    auto result = caseless.transferFile("/Src/A.TXT", "/src/a.txt", TransferMode::Move);

    EXPECT_EQ(result.error, ErrorCode::SamePath);
    EXPECT_EQ(insensitive.mutations, 0);
}

TEST_F(TransferFileTest, CaseVariantsAreDistinctOnCaseSensitiveStorage) {
    auto result = service.transferFile("/src/a.txt", "/src/A.txt", TransferMode::Copy);

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_TRUE(storage.fileExists("/src/A.txt"));
}

TEST_F(TransferFileTest, InvalidPathsAreRejected) {
    const std::string withNul("/dst/a\0b", 8);
    for (const std::string& target : {std::string(), std::string("dst/a.txt"), withNul}) {
        auto result = service.transferFile("/src/a.txt", target, TransferMode::Copy);
        EXPECT_EQ(result.error, ErrorCode::InvalidPath);
    }

    auto relativeSource = service.transferFile("src/a.txt", "/dst/a.txt", TransferMode::Copy);
    EXPECT_EQ(relativeSource.error, ErrorCode::InvalidPath);
    EXPECT_EQ(storage.mutations, 0);
}

TEST_F(TransferFileTest, DestinationInsideSourceIsRejected) {
    auto result = service.transferFile("/src/a.txt", "/src/a.txt/inner", TransferMode::Copy);

    EXPECT_EQ(result.error, ErrorCode::DestinationInsideSource);
    EXPECT_EQ(storage.mutations, 0);
}

TEST_F(TransferFileTest, EmptyModeIsRejected) {
    auto result = service.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::None);

    EXPECT_EQ(result.error, ErrorCode::InvalidMode);
    EXPECT_FALSE(storage.fileExists("/dst/a.txt"));
}

TEST_F(TransferFileTest, MissingSourceIsReported) {
    auto result = service.transferFile("/src/missing.txt", "/dst/a.txt", TransferMode::Copy);

    EXPECT_EQ(result.error, ErrorCode::SourceNotFound);
}

TEST_F(TransferFileTest, ExistingTargetIsKeptWithoutOverwrite) {
    storage.addFile("/dst/a.txt", "old");

    auto result = service.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::Copy);

    EXPECT_EQ(result.error, ErrorCode::TargetExists);
    EXPECT_EQ(storage.content("/dst/a.txt"), "old");
}

TEST_F(TransferFileTest, OverwriteReplacesExistingTarget) {
    storage.addFile("/dst/a.txt", "old");

    auto result = service.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::Copy, true);

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(storage.content("/dst/a.txt"), "hello");
}

TEST_F(TransferFileTest, OverwriteFailsLoudlyWhenTargetCannotBeDeleted) {
    storage.addFile("/dst/a.txt", "old");
    storage.undeletableFiles.insert("/dst/a.txt");

    auto result = service.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::Copy, true);

    EXPECT_EQ(result.error, ErrorCode::StorageFailure);
    EXPECT_EQ(storage.copyCalls, 0);
    EXPECT_EQ(storage.content("/dst/a.txt"), "old");
}

TEST_F(TransferFileTest, HardLinkFailureWithoutCopyFails) {
    storage.hardLinksSupported = false;

    auto result = service.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::HardLink);

    EXPECT_EQ(result.error, ErrorCode::HardLinkFailed);
    EXPECT_FALSE(storage.fileExists("/dst/a.txt"));
}

TEST_F(TransferFileTest, HardLinkFailureWithMoveButNoCopyFails) {
    storage.hardLinksSupported = false;

    auto result = service.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::HardLink | TransferMode::Move);

    EXPECT_EQ(result.error, ErrorCode::HardLinkFailed);
    EXPECT_TRUE(storage.fileExists("/src/a.txt"));
}

TEST_F(TransferFileTest, HardLinkFallsBackToCopy) {
    storage.hardLinksSupported = false;

    auto result = service.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::HardLinkOrCopy);

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.data, TransferMode::Copy);
    EXPECT_FALSE(storage.sharesData("/src/a.txt", "/dst/a.txt"));
    EXPECT_EQ(storage.content("/dst/a.txt"), "hello");
}

TEST_F(TransferFileTest, UnverifiedCopyTrustsSingleAttempt) {
    storage.truncatedCopies = 1;

    auto result = service.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::Copy, false, false);

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.data, TransferMode::Copy);
    EXPECT_EQ(storage.copyCalls, 1);
    EXPECT_EQ(storage.content("/dst/a.txt"), "hell");
}

TEST_F(TransferFileTest, UnverifiedCopyErrorIsTransferFailure) {
    storage.failingCopies = 1;

    auto result = service.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::Copy, false, false);

    EXPECT_EQ(result.error, ErrorCode::TransferFailed);
    EXPECT_EQ(storage.copyCalls, 1);
}

TEST_F(TransferFileTest, UnverifiedMoveUsesSingleBackendMove) {
    auto result = service.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::Move, false, false);

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.data, TransferMode::Move);
    EXPECT_EQ(storage.moveCalls, 1);
    EXPECT_EQ(storage.hardLinkCalls, 0);
    EXPECT_FALSE(storage.fileExists("/src/a.txt"));
    EXPECT_EQ(storage.content("/dst/a.txt"), "hello");
}

TEST_F(TransferFileTest, VerifiedCopyRetriesUntilSizesMatch) {
    storage.truncatedCopies = 2;

    auto result = service.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::Copy);

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.data, TransferMode::Copy);
    EXPECT_EQ(storage.copyCalls, 3);
    EXPECT_EQ(storage.getFileSize("/dst/a.txt").data, storage.getFileSize("/src/a.txt").data);
    EXPECT_EQ(storage.content("/src/a.txt"), "hello");
}

TEST_F(TransferFileTest, VerifiedCopyRetriesBackendErrors) {
    storage.failingCopies = 1;

    auto result = service.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::Copy);

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(storage.copyCalls, 2);
}

TEST_F(TransferFileTest, VerifiedCopyGivesUpAfterRetryBudget) {
    storage.truncatedCopies = -1;

    auto result = service.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::Copy);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorCode::TransferFailed);
    EXPECT_EQ(storage.copyCalls, Config::RETRY_COUNT + 1);
    EXPECT_FALSE(storage.fileExists("/dst/a.txt"));
    EXPECT_EQ(storage.content("/src/a.txt"), "hello");
}

TEST_F(TransferFileTest, RetryBudgetIsConfigurable) {
    storage.truncatedCopies = -1;
    DiskTransferService once(storage, 0);

    auto result = once.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::Copy);

    EXPECT_EQ(result.error, ErrorCode::TransferFailed);
    EXPECT_EQ(storage.copyCalls, 1);
}

TEST_F(TransferFileTest, VerifiedMoveUsesHardlinkedBackup) {
    auto result = service.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::Move);

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.data, TransferMode::Move);
    EXPECT_EQ(storage.hardLinkCalls, 1);
    EXPECT_EQ(storage.moveCalls, 1);
    EXPECT_EQ(storage.copyCalls, 0);
    EXPECT_FALSE(storage.fileExists("/src/a.txt"));
    EXPECT_FALSE(storage.fileExists("/src/a.txt.movebackup"));
    EXPECT_EQ(storage.content("/dst/a.txt"), "hello");
}

TEST_F(TransferFileTest, VerifiedMoveRemovesStaleBackup) {
    storage.addFile("/src/a.txt.movebackup", "left over from a crash");

    auto result = service.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::Move);

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_FALSE(storage.fileExists("/src/a.txt.movebackup"));
    EXPECT_EQ(storage.content("/dst/a.txt"), "hello");
}

TEST_F(TransferFileTest, VerifiedMoveCopiesWhenHardlinksAreUnsupported) {
    storage.hardLinksSupported = false;

    auto result = service.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::Move);

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.data, TransferMode::Move);
    EXPECT_EQ(storage.moveCalls, 0);
    EXPECT_EQ(storage.copyCalls, 1);
    EXPECT_FALSE(storage.fileExists("/src/a.txt"));
    EXPECT_EQ(storage.content("/dst/a.txt"), "hello");
}

TEST_F(TransferFileTest, VerifiedMoveCopiesWhenMovedBackupIsShort) {
    storage.truncatedMoves = 1;

    auto result = service.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::Move);

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.data, TransferMode::Move);
    EXPECT_EQ(storage.moveCalls, 1);
    EXPECT_EQ(storage.copyCalls, 1);
    EXPECT_EQ(storage.content("/dst/a.txt"), "hello");
    EXPECT_FALSE(storage.fileExists("/src/a.txt"));
    EXPECT_FALSE(storage.fileExists("/src/a.txt.movebackup"));
}

TEST_F(TransferFileTest, BackupIsRemovedWhenItsMoveFails) {
    storage.failingMoves = 1;

    auto result = service.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::Move);

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(storage.copyCalls, 1);
    EXPECT_FALSE(storage.fileExists("/src/a.txt.movebackup"));
    EXPECT_FALSE(storage.fileExists("/src/a.txt"));
    EXPECT_EQ(storage.content("/dst/a.txt"), "hello");
}

TEST_F(TransferFileTest, FailedVerifiedMovePreservesSource) {
    storage.hardLinksSupported = false;
    storage.truncatedCopies = -1;

    auto result = service.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::Move);

    EXPECT_EQ(result.error, ErrorCode::TransferFailed);
    EXPECT_EQ(storage.content("/src/a.txt"), "hello");
    EXPECT_FALSE(storage.fileExists("/dst/a.txt"));
    EXPECT_FALSE(storage.fileExists("/src/a.txt.movebackup"));
}

TEST_F(TransferFileTest, SourceThatCannotBeDeletedAfterMoveIsReported) {
    storage.undeletableFiles.insert("/src/a.txt");

    auto result = service.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::Move);

    EXPECT_EQ(result.error, ErrorCode::StorageFailure);
    EXPECT_EQ(storage.content("/dst/a.txt"), "hello");
    EXPECT_FALSE(storage.fileExists("/src/a.txt.movebackup"));
}

TEST_F(TransferFileTest, CopyOrMoveTriesMoveAfterCopyIsExhausted) {
    storage.truncatedCopies = Config::RETRY_COUNT + 1;

    auto result = service.transferFile("/src/a.txt", "/dst/a.txt", TransferMode::Copy | TransferMode::Move);

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.data, TransferMode::Move);
    EXPECT_EQ(storage.copyCalls, Config::RETRY_COUNT + 1);
    EXPECT_FALSE(storage.fileExists("/src/a.txt"));
}

TEST_F(TransferFileTest, RequestDispatchesFilesToFileTransfer) {
    TransferRequest request;
    request.sourcePath = "/src/a.txt";
    request.targetPath = "/dst/b.txt";
    request.mode = TransferMode::HardLinkOrCopy;

    auto result = service.transfer(request);

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.data, TransferMode::HardLink);
    EXPECT_TRUE(storage.sharesData("/src/a.txt", "/dst/b.txt"));
}
