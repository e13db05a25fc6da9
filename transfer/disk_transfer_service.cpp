#include "disk_transfer_service.hpp"
#include "../common/path_utils.hpp"
#include <algorithm>
#include <set>

namespace {

// Owns the ".movebackup" hardlink for the duration of one move attempt and
// removes it on every way out of the scope.
class ScopedMoveBackup {
public:
    ScopedMoveBackup(StorageBackend& storage, const std::string& backupPath, const Logger& logger)
        : storage_(storage), backupPath_(backupPath), logger_(logger) {}

    ~ScopedMoveBackup() {
        if (!storage_.fileExists(backupPath_)) return;

        Result<void> removed = storage_.deleteFile(backupPath_);
        if (!removed.success) {
            logger_.error("Failed to remove move backup [" + backupPath_ + "]: " + removed.message);
        }
    }

    ScopedMoveBackup(const ScopedMoveBackup&) = delete;
    ScopedMoveBackup& operator=(const ScopedMoveBackup&) = delete;

    const std::string& path() const { return backupPath_; }

private:
    StorageBackend& storage_;
    std::string backupPath_;
    const Logger& logger_;
};

bool isMoveBackupOf(const std::string& name, const std::set<std::string>& siblings) {
    const std::string suffix = Config::MOVE_BACKUP_SUFFIX;
    if (name.size() <= suffix.size()) return false;
    if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) return false;
    return siblings.count(name.substr(0, name.size() - suffix.size())) > 0;
}

}  // namespace

DiskTransferService::DiskTransferService(StorageBackend& storage, int retryCount)
    : storage_(storage), retryCount_(std::max(0, retryCount)), logger_("Transfer") {}

Result<TransferMode> DiskTransferService::transfer(const TransferRequest& request) {
    if (storage_.folderExists(request.sourcePath)) {
        return transferFolder(request.sourcePath, request.targetPath, request.mode, request.verified);
    }
    return transferFile(request.sourcePath, request.targetPath, request.mode, request.overwrite, request.verified);
}

Result<void> DiskTransferService::validatePaths(const std::string& sourcePath, const std::string& targetPath,
                                                TransferMode mode) const {
    if (!PathUtils::isValidPath(sourcePath)) {
        return Result<void>::Error(ErrorCode::InvalidPath, "Invalid source path [" + sourcePath + "]");
    }
    if (!PathUtils::isValidPath(targetPath)) {
        return Result<void>::Error(ErrorCode::InvalidPath, "Invalid target path [" + targetPath + "]");
    }

    bool caseSensitive = storage_.isCaseSensitive();

    if (PathUtils::pathEquals(sourcePath, targetPath, caseSensitive)) {
        return Result<void>::Error(ErrorCode::SamePath, "Source and destination can't be the same [" + sourcePath + "]");
    }
    if (PathUtils::isParentPath(sourcePath, targetPath, caseSensitive)) {
        return Result<void>::Error(ErrorCode::DestinationInsideSource,
                                   "Destination cannot be a child of the source [" + sourcePath + "] => [" + targetPath + "]");
    }
    if (mode == TransferMode::None) {
        return Result<void>::Error(ErrorCode::InvalidMode, "No transfer mode requested for [" + sourcePath + "]");
    }
    return Result<void>::Ok();
}

Result<TransferMode> DiskTransferService::transferFolder(const std::string& sourcePath, const std::string& targetPath,
                                                         TransferMode mode, bool verified) {
    Result<void> valid = validatePaths(sourcePath, targetPath, mode);
    if (!valid.success) {
        return Result<TransferMode>::Error(valid.error, valid.message);
    }
    if (!storage_.folderExists(sourcePath)) {
        return Result<TransferMode>::Error(ErrorCode::SourceNotFound, "Source folder does not exist [" + sourcePath + "]");
    }

    logger_.debug(toString(mode) + " folder [" + sourcePath + "] > [" + targetPath + "]");

    if (!storage_.folderExists(targetPath)) {
        Result<void> created = storage_.createFolder(targetPath);
        if (!created.success) {
            return Result<TransferMode>::Error(ErrorCode::StorageFailure, created.message);
        }
    }

    TransferMode result = mode;

    Result<std::vector<FileEntry>> subDirs = storage_.listSubdirectories(sourcePath);
    if (!subDirs.success) {
        return Result<TransferMode>::Error(ErrorCode::StorageFailure, subDirs.message);
    }
    for (const FileEntry& subDir : subDirs.data) {
        Result<TransferMode> child = transferFolder(subDir.fullPath, PathUtils::combine(targetPath, subDir.name), mode, verified);
        if (!child.success) return child;
        result &= child.data;
    }

    Result<std::vector<FileEntry>> files = storage_.listFiles(sourcePath);
    if (!files.success) {
        return Result<TransferMode>::Error(ErrorCode::StorageFailure, files.message);
    }
    std::set<std::string> names;
    for (const FileEntry& sourceFile : files.data) {
        names.insert(sourceFile.name);
    }
    for (const FileEntry& sourceFile : files.data) {
        if (isMoveBackupOf(sourceFile.name, names)) {
            // stray artifact of an interrupted move, cleared when its base file is moved
            logger_.debug("Skipping backup artifact [" + sourceFile.fullPath + "]");
            continue;
        }
        std::string destFile = PathUtils::combine(targetPath, sourceFile.name);
        Result<TransferMode> child = transferFile(sourceFile.fullPath, destFile, mode, true, verified);
        if (!child.success) return child;
        result &= child.data;
    }

    if (hasFlag(mode, TransferMode::Move)) {
        Result<void> removed = storage_.deleteFolder(sourcePath, true);
        if (!removed.success) {
            return Result<TransferMode>::Error(ErrorCode::StorageFailure, removed.message);
        }
    }

    return Result<TransferMode>::Ok(result);
}

Result<TransferMode> DiskTransferService::transferFile(const std::string& sourcePath, const std::string& targetPath,
                                                       TransferMode mode, bool overwrite, bool verified) {
    Result<void> valid = validatePaths(sourcePath, targetPath, mode);
    if (!valid.success) {
        return Result<TransferMode>::Error(valid.error, valid.message);
    }
    if (!storage_.fileExists(sourcePath)) {
        return Result<TransferMode>::Error(ErrorCode::SourceNotFound, "Source file does not exist [" + sourcePath + "]");
    }

    logger_.debug(toString(mode) + " [" + sourcePath + "] > [" + targetPath + "]");

    if (storage_.fileExists(targetPath)) {
        if (!overwrite) {
            return Result<TransferMode>::Error(ErrorCode::TargetExists, "Destination already exists [" + targetPath + "]");
        }
        Result<void> removed = storage_.deleteFile(targetPath);
        if (!removed.success) {
            return Result<TransferMode>::Error(ErrorCode::StorageFailure, removed.message);
        }
    }

    if (hasFlag(mode, TransferMode::HardLink)) {
        if (storage_.tryCreateHardLink(sourcePath, targetPath)) {
            return Result<TransferMode>::Ok(TransferMode::HardLink);
        }
        if (!hasFlag(mode, TransferMode::Copy)) {
            return Result<TransferMode>::Error(ErrorCode::HardLinkFailed,
                                               "Hardlinking from '" + sourcePath + "' to '" + targetPath + "' failed.");
        }
        logger_.debug("Hardlink failed, falling back to copy for [" + sourcePath + "]");
    }

    if (!verified) {
        if (hasFlag(mode, TransferMode::Copy)) {
            Result<void> copied = storage_.copyFile(sourcePath, targetPath);
            if (!copied.success) {
                return Result<TransferMode>::Error(ErrorCode::TransferFailed, copied.message);
            }
            return Result<TransferMode>::Ok(TransferMode::Copy);
        }

        if (hasFlag(mode, TransferMode::Move)) {
            Result<void> moved = storage_.moveFile(sourcePath, targetPath);
            if (!moved.success) {
                return Result<TransferMode>::Error(ErrorCode::TransferFailed, moved.message);
            }
            return Result<TransferMode>::Ok(TransferMode::Move);
        }

        return Result<TransferMode>::Error(ErrorCode::TransferFailed,
                                           "No copy or move requested for [" + sourcePath + "]");
    }

    std::string failure = "Failed to completely transfer [" + sourcePath + "] to [" + targetPath + "], aborting.";

    if (hasFlag(mode, TransferMode::Copy)) {
        Result<void> copied = tryCopyFile(sourcePath, targetPath);
        if (copied.success) {
            return Result<TransferMode>::Ok(TransferMode::Copy);
        }
        if (copied.error != ErrorCode::TransferFailed) {
            return Result<TransferMode>::Error(copied.error, copied.message);
        }
    }

    if (hasFlag(mode, TransferMode::Move)) {
        Result<void> moved = tryMoveFile(sourcePath, targetPath);
        if (moved.success) {
            return Result<TransferMode>::Ok(TransferMode::Move);
        }
        if (moved.error != ErrorCode::TransferFailed) {
            return Result<TransferMode>::Error(moved.error, moved.message);
        }
    }

    return Result<TransferMode>::Error(ErrorCode::TransferFailed, failure);
}

Result<void> DiskTransferService::tryCopyFile(const std::string& sourcePath, const std::string& targetPath) {
    Result<uint64_t> originalSize = storage_.getFileSize(sourcePath);
    if (!originalSize.success) {
        return Result<void>::Error(ErrorCode::StorageFailure, originalSize.message);
    }

    for (int i = 0; i <= retryCount_; i++) {
        Result<void> copied = storage_.copyFile(sourcePath, targetPath);

        if (copied.success && storage_.fileExists(targetPath)) {
            Result<uint64_t> targetSize = storage_.getFileSize(targetPath);
            if (targetSize.success && targetSize.data == originalSize.data) {
                return Result<void>::Ok();
            }
        } else if (!copied.success) {
            logger_.debug(copied.message);
        }

        // partial or corrupt copy
        if (storage_.fileExists(targetPath)) {
            Result<void> removed = storage_.deleteFile(targetPath);
            if (!removed.success) {
                return Result<void>::Error(ErrorCode::StorageFailure, removed.message);
            }
        }

        if (i == retryCount_) {
            logger_.error("Failed to completely transfer [" + sourcePath + "] to [" + targetPath + "], aborting.");
        } else {
            logger_.warn("Failed to completely transfer [" + sourcePath + "] to [" + targetPath + "], retrying [" +
                         std::to_string(i + 1) + "/" + std::to_string(retryCount_) + "].");
        }
    }

    return Result<void>::Error(ErrorCode::TransferFailed,
                               "Failed to completely transfer [" + sourcePath + "] to [" + targetPath + "] after " +
                               std::to_string(retryCount_ + 1) + " attempts");
}

Result<void> DiskTransferService::tryMoveFile(const std::string& sourcePath, const std::string& targetPath) {
    Result<uint64_t> originalSize = storage_.getFileSize(sourcePath);
    if (!originalSize.success) {
        return Result<void>::Error(ErrorCode::StorageFailure, originalSize.message);
    }

    std::string backupPath = sourcePath + Config::MOVE_BACKUP_SUFFIX;

    if (storage_.fileExists(backupPath)) {
        logger_.trace("Removing old backup.");
        Result<void> removed = storage_.deleteFile(backupPath);
        if (!removed.success) {
            return Result<void>::Error(ErrorCode::StorageFailure, removed.message);
        }
    }

    {
        ScopedMoveBackup backup(storage_, backupPath, logger_);

        logger_.trace("Attempting to move hardlinked backup.");
        if (storage_.tryCreateHardLink(sourcePath, backup.path())) {
            Result<void> moved = storage_.moveFile(backup.path(), targetPath);

            if (moved.success) {
                Result<uint64_t> targetSize = storage_.getFileSize(targetPath);
                if (targetSize.success && targetSize.data == originalSize.data) {
                    logger_.trace("Hardlink move succeeded, deleting source.");
                    Result<void> removed = storage_.deleteFile(sourcePath);
                    if (!removed.success) {
                        return Result<void>::Error(ErrorCode::StorageFailure, removed.message);
                    }
                    return Result<void>::Ok();
                }
            } else {
                logger_.debug(moved.message);
            }

            // the copy below needs the target slot free again
            if (storage_.fileExists(targetPath)) {
                Result<void> removed = storage_.deleteFile(targetPath);
                if (!removed.success) {
                    return Result<void>::Error(ErrorCode::StorageFailure, removed.message);
                }
            }
        }
    }

    logger_.trace("Hardlink move failed, reverting to copy.");
    Result<void> copied = tryCopyFile(sourcePath, targetPath);
    if (!copied.success) {
        logger_.trace("Copy failed.");
        return copied;
    }

    logger_.trace("Copy succeeded, deleting source.");
    Result<void> removed = storage_.deleteFile(sourcePath);
    if (!removed.success) {
        return Result<void>::Error(ErrorCode::StorageFailure, removed.message);
    }
    return Result<void>::Ok();
}
